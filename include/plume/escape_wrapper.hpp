#ifndef PLUME_ESCAPE_WRAPPER_HPP
#define PLUME_ESCAPE_WRAPPER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "plume/util/result.hpp"
#include "plume/util/to_chars.hpp"

#include "plume/fwd.hpp"
#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {

/// @brief A proxy around a raw value which escapes every conversion
/// that the formatting engine performs on it.
///
/// Wrappers exist only for the duration of a single formatting call.
/// Item and attribute access produce new wrapped arguments,
/// so that `{user.name}` or `%(key)s` are escaped no matter how deep the access goes.
struct Escape_Wrapper {
private:
    Value m_value;

public:
    [[nodiscard]]
    explicit Escape_Wrapper(Value value) noexcept
        : m_value { std::move(value) }
    {
    }

    [[nodiscard]]
    const Value& get_value() const noexcept
    {
        return m_value;
    }

    /// @brief Returns the escaped text conversion of the value.
    /// `Safe_Text` from `Object::to_text` is not escaped again.
    [[nodiscard]]
    Result<std::u8string, Text_Error> to_text() const;

    /// @brief Returns `escape(representation(value))`.
    [[nodiscard]]
    Result<std::u8string, Text_Error> to_representation(bool ascii_only = false) const;

    /// @brief Returns `wrap(value[key])`.
    [[nodiscard]]
    Result<Wrapped_Argument, Text_Error> get_item(const Value& key) const;

    /// @brief Returns `wrap(value.name)`.
    [[nodiscard]]
    Result<Wrapped_Argument, Text_Error> get_attribute(std::u8string_view name) const;
};

/// @brief An argument of the formatting engine after wrapping.
///
/// This is either trusted `Safe_Text`, a number (which never needs escaping),
/// or an `Escape_Wrapper` around any other value.
struct Wrapped_Argument {
private:
    std::variant<Safe_Text, bool, Integer, Big_Integer, Float, Escape_Wrapper> m_value;

public:
    [[nodiscard]]
    explicit Wrapped_Argument(Safe_Text text) noexcept
        : m_value { std::in_place_type<Safe_Text>, std::move(text) }
    {
    }
    [[nodiscard]]
    explicit Wrapped_Argument(Escape_Wrapper wrapper) noexcept
        : m_value { std::in_place_type<Escape_Wrapper>, std::move(wrapper) }
    {
    }
    [[nodiscard]]
    static Wrapped_Argument boolean(bool value);
    [[nodiscard]]
    static Wrapped_Argument integer(Integer value);
    [[nodiscard]]
    static Wrapped_Argument big_integer(Big_Integer value);
    [[nodiscard]]
    static Wrapped_Argument floating(Float value);

private:
    template <typename T>
    [[nodiscard]]
    Wrapped_Argument(std::in_place_type_t<T> type, T&& value)
        : m_value { type, std::move(value) }
    {
    }

public:
    /// @brief Returns the trusted text, or a null pointer if this is not trusted text.
    [[nodiscard]]
    const Safe_Text* as_trusted() const noexcept
    {
        return std::get_if<Safe_Text>(&m_value);
    }

    /// @brief Returns the wrapper, or a null pointer if this is not a wrapper.
    [[nodiscard]]
    const Escape_Wrapper* as_wrapper() const noexcept
    {
        return std::get_if<Escape_Wrapper>(&m_value);
    }

    [[nodiscard]]
    bool is_number() const noexcept
    {
        return !as_trusted() && !as_wrapper();
    }

    [[nodiscard]]
    bool is_floating() const noexcept
    {
        return std::holds_alternative<Float>(m_value);
    }

    /// @brief Returns this argument as an integer if it is numeric,
    /// where floating-point numbers are truncated toward zero.
    /// Infinities and NaN yield no value.
    [[nodiscard]]
    std::optional<Big_Integer> to_integer() const;

    /// @brief Returns this argument as an integer if it is an integer or boolean,
    /// but not if it is a floating-point number.
    [[nodiscard]]
    std::optional<Big_Integer> to_exact_integer() const;

    /// @brief Returns this argument as a floating-point number if it is numeric.
    [[nodiscard]]
    std::optional<Float> to_float() const;

    /// @brief Returns the text of this argument.
    /// Trusted text yields its buffer, numbers their decimal form,
    /// and wrappers their escaped text conversion.
    [[nodiscard]]
    Result<std::u8string, Text_Error> to_text() const;

    /// @brief Returns the representation of this argument.
    /// For trusted text, this is the single-quoted representation of its buffer,
    /// which cannot introduce markup.
    [[nodiscard]]
    Result<std::u8string, Text_Error> to_representation(bool ascii_only = false) const;

    /// @brief Returns the item for `key`.
    /// Only wrappers have items;
    /// anything else is `Text_Error::format_argument_type`.
    [[nodiscard]]
    Result<Wrapped_Argument, Text_Error> get_item(const Value& key) const;

    /// @brief Returns the attribute named `name`.
    /// Only wrappers have attributes;
    /// anything else is `Text_Error::format_key`.
    [[nodiscard]]
    Result<Wrapped_Argument, Text_Error> get_attribute(std::u8string_view name) const;
};

/// @brief Wraps `value` as a formatting argument:
/// `Safe_Text` is trusted as-is, numbers are kept,
/// and everything else is put into an `Escape_Wrapper`.
[[nodiscard]]
Wrapped_Argument wrap(const Value& value);

/// @brief Like `wrap`, but every value which is not a number is converted to text
/// (see `stringify`) and trusted as-is.
/// This is used to substitute values verbatim,
/// such as when rendering plain text where nothing is escaped.
[[nodiscard]]
Result<Wrapped_Argument, Text_Error> wrap_verbatim(const Value& value);

} // namespace plume

#endif
