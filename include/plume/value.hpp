#ifndef PLUME_VALUE_HPP
#define PLUME_VALUE_HPP

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "plume/util/assert.hpp"
#include "plume/util/result.hpp"
#include "plume/util/to_chars.hpp"

#include "plume/fwd.hpp"
#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"

namespace plume {

/// @brief A symbolic empty class indicating an absent value.
struct Null {
    friend bool operator==(Null, Null) = default;
};

enum struct Value_Kind : Default_Underlying {
    null,
    boolean,
    integer,
    big_integer,
    floating,
    /// @brief Raw text, which is escaped whenever it flows into HTML.
    string,
    /// @brief Text which is already safe for HTML.
    safe_text,
    list,
    dict,
    /// @brief A user-defined value implementing the `Object` interface.
    object,
};

[[nodiscard]]
constexpr std::u8string_view value_kind_name(Value_Kind kind) noexcept
{
    using enum Value_Kind;
    switch (kind) {
        PLUME_ENUM_STRING_CASE8(null);
        PLUME_ENUM_STRING_CASE8(boolean);
        PLUME_ENUM_STRING_CASE8(integer);
        PLUME_ENUM_STRING_CASE8(big_integer);
        PLUME_ENUM_STRING_CASE8(floating);
        PLUME_ENUM_STRING_CASE8(string);
        PLUME_ENUM_STRING_CASE8(safe_text);
        PLUME_ENUM_STRING_CASE8(list);
        PLUME_ENUM_STRING_CASE8(dict);
        PLUME_ENUM_STRING_CASE8(object);
    }
    return u8"???";
}

/// @brief A dynamically typed value,
/// which is what the escaping and formatting operations accept as "arbitrary values".
///
/// Values are immutable.
/// Lists, dicts, and objects are shared between copies,
/// which makes copying a `Value` cheap except for strings and big integers.
struct Value {
private:
    using Variant = std::variant<
        Null,
        bool,
        Integer,
        Big_Integer,
        Float,
        std::u8string,
        Safe_Text,
        std::shared_ptr<const List>,
        std::shared_ptr<const Dict>,
        std::shared_ptr<const Object>>;

    Variant m_value;

    template <typename T>
    [[nodiscard]]
    explicit Value(std::in_place_type_t<T> type, T&& value)
        : m_value { type, std::move(value) }
    {
    }

public:
    /// @brief The null value.
    static const Value null;
    static const Value true_;
    static const Value false_;

    /// @brief Constructs the null value.
    [[nodiscard]]
    Value() noexcept
        = default;

    [[nodiscard]]
    static Value boolean(bool value)
    {
        return Value { std::in_place_type<bool>, std::move(value) };
    }
    [[nodiscard]]
    static Value integer(Integer value)
    {
        return Value { std::in_place_type<Integer>, std::move(value) };
    }
    /// @brief Creates an integer value with arbitrary precision.
    /// Values which fit into `Integer` are still big integers,
    /// but format and compare like other integers.
    [[nodiscard]]
    static Value big_integer(Big_Integer value)
    {
        return Value { std::in_place_type<Big_Integer>, std::move(value) };
    }
    [[nodiscard]]
    static Value floating(Float value)
    {
        return Value { std::in_place_type<Float>, std::move(value) };
    }
    [[nodiscard]]
    static Value string(std::u8string_view value)
    {
        return Value { std::in_place_type<std::u8string>, std::u8string { value } };
    }
    [[nodiscard]]
    static Value string(std::u8string&& value)
    {
        return Value { std::in_place_type<std::u8string>, std::move(value) };
    }
    [[nodiscard]]
    static Value string(const char8_t* value)
    {
        return string(std::u8string_view { value });
    }
    [[nodiscard]]
    static Value safe_text(Safe_Text value)
    {
        return Value { std::in_place_type<Safe_Text>, std::move(value) };
    }
    [[nodiscard]]
    static Value list(std::vector<Value> items);
    [[nodiscard]]
    static Value list(std::initializer_list<Value> items);
    [[nodiscard]]
    static Value dict(std::vector<std::pair<std::u8string, Value>> entries);
    [[nodiscard]]
    static Value object(std::shared_ptr<const Object> object);

    [[nodiscard]]
    Value_Kind get_kind() const noexcept
    {
        return Value_Kind(m_value.index());
    }

    [[nodiscard]]
    bool is_null() const noexcept
    {
        return get_kind() == Value_Kind::null;
    }
    [[nodiscard]]
    bool is_string() const noexcept
    {
        return get_kind() == Value_Kind::string;
    }
    [[nodiscard]]
    bool is_safe_text() const noexcept
    {
        return get_kind() == Value_Kind::safe_text;
    }
    /// @brief Returns `true` iff this is a string or `Safe_Text`.
    [[nodiscard]]
    bool is_textual() const noexcept
    {
        return is_string() || is_safe_text();
    }
    /// @brief Returns `true` iff this is a boolean, integer, big integer, or floating-point number.
    /// Numbers never contain markup characters when converted to text.
    [[nodiscard]]
    bool is_numeric() const noexcept
    {
        const Value_Kind kind = get_kind();
        return kind == Value_Kind::boolean || kind == Value_Kind::integer
            || kind == Value_Kind::big_integer || kind == Value_Kind::floating;
    }

    [[nodiscard]]
    bool as_boolean() const
    {
        PLUME_DEBUG_ASSERT(get_kind() == Value_Kind::boolean);
        return *std::get_if<bool>(&m_value);
    }
    [[nodiscard]]
    Integer as_integer() const
    {
        PLUME_DEBUG_ASSERT(get_kind() == Value_Kind::integer);
        return *std::get_if<Integer>(&m_value);
    }
    [[nodiscard]]
    const Big_Integer& as_big_integer() const
    {
        PLUME_DEBUG_ASSERT(get_kind() == Value_Kind::big_integer);
        return *std::get_if<Big_Integer>(&m_value);
    }
    [[nodiscard]]
    Float as_float() const
    {
        PLUME_DEBUG_ASSERT(get_kind() == Value_Kind::floating);
        return *std::get_if<Float>(&m_value);
    }
    [[nodiscard]]
    std::u8string_view as_string() const
    {
        PLUME_DEBUG_ASSERT(get_kind() == Value_Kind::string);
        return *std::get_if<std::u8string>(&m_value);
    }
    [[nodiscard]]
    const Safe_Text& as_safe_text() const
    {
        PLUME_DEBUG_ASSERT(get_kind() == Value_Kind::safe_text);
        return *std::get_if<Safe_Text>(&m_value);
    }
    /// @brief Returns the text of a string, or the (already escaped) text of `Safe_Text`.
    [[nodiscard]]
    std::u8string_view as_text() const
    {
        PLUME_DEBUG_ASSERT(is_textual());
        return is_string() ? as_string() : as_safe_text().get_text();
    }
    [[nodiscard]]
    const List& as_list() const
    {
        PLUME_DEBUG_ASSERT(get_kind() == Value_Kind::list);
        return **std::get_if<std::shared_ptr<const List>>(&m_value);
    }
    [[nodiscard]]
    const Dict& as_dict() const
    {
        PLUME_DEBUG_ASSERT(get_kind() == Value_Kind::dict);
        return **std::get_if<std::shared_ptr<const Dict>>(&m_value);
    }
    [[nodiscard]]
    const Object& as_object() const
    {
        PLUME_DEBUG_ASSERT(get_kind() == Value_Kind::object);
        return **std::get_if<std::shared_ptr<const Object>>(&m_value);
    }
};

struct List {
    std::vector<Value> items;
};

/// @brief A mapping from strings to values which preserves insertion order.
/// Lookup is linear, which is fine for the small mappings used for formatting.
struct Dict {
    std::vector<std::pair<std::u8string, Value>> entries;

    /// @brief Returns the value for `key`, or a null pointer if there is none.
    /// If a key appears multiple times, the last entry wins.
    [[nodiscard]]
    const Value* find(std::u8string_view key) const;

    [[nodiscard]]
    bool contains(std::u8string_view key) const
    {
        return find(key) != nullptr;
    }
};

/// @brief A user-defined value with its own conversions.
/// This is the extension point for application types which appear
/// as formatting arguments or accumulator fragments.
///
/// Every hook may fail, and failures propagate unchanged through escaping and formatting.
struct Object {
    virtual ~Object() = default;

    /// @brief Returns the diagnostic representation of this object,
    /// which shall be a string or `Safe_Text`.
    [[nodiscard]]
    virtual Result<Value, Text_Error> representation() const
        = 0;

    /// @brief Returns the text of this object, which shall be a string or `Safe_Text`.
    /// By default, this is the representation.
    [[nodiscard]]
    virtual Result<Value, Text_Error> to_text() const
    {
        return representation();
    }

    /// @brief Returns the item for `key`, like `object[key]`.
    /// By default, objects have no items.
    [[nodiscard]]
    virtual Result<Value, Text_Error> get_item(const Value& key) const
    {
        (void)key;
        return Text_Error::format_argument_type;
    }

    /// @brief Returns the attribute named `name`, like `object.name`.
    /// By default, objects have no attributes.
    [[nodiscard]]
    virtual Result<Value, Text_Error> get_attribute(std::u8string_view name) const
    {
        (void)name;
        return Text_Error::format_key;
    }
};

/// @brief Returns `container[key]`.
/// Lists are indexed by integers (negative indices count from the end),
/// dicts by strings, strings by integers (yielding a single code point),
/// and objects through `Object::get_item`.
/// `Safe_Text` cannot be indexed because an index could split an entity.
/// Missing keys and indices out of range are `Text_Error::format_key`;
/// containers which cannot be indexed by `key` are `Text_Error::format_argument_type`.
[[nodiscard]]
Result<Value, Text_Error> get_item(const Value& container, const Value& key);

/// @brief Returns `value.name`.
/// Only objects have attributes; anything else is `Text_Error::format_key`.
[[nodiscard]]
Result<Value, Text_Error> get_attribute(const Value& value, std::u8string_view name);

} // namespace plume

#endif
