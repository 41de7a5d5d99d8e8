#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "plume/util/assert.hpp"
#include "plume/util/result.hpp"
#include "plume/util/unicode.hpp"

#include "plume/fwd.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {

const Value Value::null {};
const Value Value::true_ = Value::boolean(true);
const Value Value::false_ = Value::boolean(false);

Value Value::list(std::vector<Value> items)
{
    auto list = std::make_shared<const List>(List { .items = std::move(items) });
    return Value { std::in_place_type<std::shared_ptr<const List>>, std::move(list) };
}

Value Value::list(std::initializer_list<Value> items)
{
    return list(std::vector<Value>(items));
}

Value Value::dict(std::vector<std::pair<std::u8string, Value>> entries)
{
    auto dict = std::make_shared<const Dict>(Dict { .entries = std::move(entries) });
    return Value { std::in_place_type<std::shared_ptr<const Dict>>, std::move(dict) };
}

Value Value::object(std::shared_ptr<const Object> object)
{
    PLUME_ASSERT(object);
    return Value { std::in_place_type<std::shared_ptr<const Object>>, std::move(object) };
}

const Value* Dict::find(std::u8string_view key) const
{
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (it->first == key) {
            return &it->second;
        }
    }
    return nullptr;
}

namespace {

/// @brief Returns `key` as an index, if it is an integer at all.
[[nodiscard]]
std::optional<Big_Integer> to_index(const Value& key)
{
    switch (key.get_kind()) {
    case Value_Kind::boolean: return Big_Integer(key.as_boolean() ? 1 : 0);
    case Value_Kind::integer: return Big_Integer(key.as_integer());
    case Value_Kind::big_integer: return key.as_big_integer();
    default: return {};
    }
}

/// @brief Resolves a possibly negative `index` into a sequence of the given `size`.
[[nodiscard]]
std::optional<std::size_t> resolve_index(const Big_Integer& index, std::size_t size)
{
    Big_Integer resolved = index;
    if (resolved < 0) {
        resolved += size;
    }
    if (resolved < 0 || resolved >= size) {
        return {};
    }
    return resolved.convert_to<std::size_t>();
}

[[nodiscard]]
Result<Value, Text_Error> get_code_point_at(std::u8string_view text, const Value& key)
{
    const std::optional<Big_Integer> index = to_index(key);
    if (!index) {
        return Text_Error::format_argument_type;
    }
    const std::optional<std::size_t> resolved
        = resolve_index(*index, utf8::count_code_points_or_replacement(text));
    if (!resolved) {
        return Text_Error::format_key;
    }
    const std::size_t begin = utf8::code_units_of_prefix(text, *resolved);
    const std::size_t length = utf8::code_units_of_prefix(text.substr(begin), 1);
    return Value::string(text.substr(begin, length));
}

} // namespace

Result<Value, Text_Error> get_item(const Value& container, const Value& key)
{
    switch (container.get_kind()) {
    case Value_Kind::list: {
        const std::optional<Big_Integer> index = to_index(key);
        if (!index) {
            return Text_Error::format_argument_type;
        }
        const std::vector<Value>& items = container.as_list().items;
        const std::optional<std::size_t> resolved = resolve_index(*index, items.size());
        if (!resolved) {
            return Text_Error::format_key;
        }
        return items[*resolved];
    }
    case Value_Kind::dict: {
        if (!key.is_string()) {
            return Text_Error::format_key;
        }
        const Value* const result = container.as_dict().find(key.as_string());
        if (!result) {
            return Text_Error::format_key;
        }
        return *result;
    }
    case Value_Kind::string: {
        return get_code_point_at(container.as_string(), key);
    }
    case Value_Kind::safe_text: {
        // Indexing into escaped text could split an entity,
        // so the result is only defined for raw strings.
        return Text_Error::format_argument_type;
    }
    case Value_Kind::object: {
        return container.as_object().get_item(key);
    }
    default: break;
    }
    return Text_Error::format_argument_type;
}

Result<Value, Text_Error> get_attribute(const Value& value, std::u8string_view name)
{
    if (value.get_kind() == Value_Kind::object) {
        return value.as_object().get_attribute(name);
    }
    return Text_Error::format_key;
}

} // namespace plume
