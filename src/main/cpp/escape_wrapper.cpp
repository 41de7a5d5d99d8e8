#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "plume/util/result.hpp"
#include "plume/util/to_chars.hpp"

#include "plume/escape.hpp"
#include "plume/escape_wrapper.hpp"
#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {

Result<std::u8string, Text_Error> Escape_Wrapper::to_text() const
{
    std::u8string text;
    if (auto r = append_stringified_escaped(text, m_value); !r) {
        return r.error();
    }
    return text;
}

Result<std::u8string, Text_Error> Escape_Wrapper::to_representation(bool ascii_only) const
{
    const Result<std::u8string, Text_Error> repr = representation(m_value, ascii_only);
    if (!repr) {
        return repr.error();
    }
    return escape(*repr);
}

Result<Wrapped_Argument, Text_Error> Escape_Wrapper::get_item(const Value& key) const
{
    const Result<Value, Text_Error> item = plume::get_item(m_value, key);
    if (!item) {
        return item.error();
    }
    return wrap(*item);
}

Result<Wrapped_Argument, Text_Error> Escape_Wrapper::get_attribute(std::u8string_view name) const
{
    const Result<Value, Text_Error> attribute = plume::get_attribute(m_value, name);
    if (!attribute) {
        return attribute.error();
    }
    return wrap(*attribute);
}

Wrapped_Argument Wrapped_Argument::boolean(bool value)
{
    return { std::in_place_type<bool>, std::move(value) };
}

Wrapped_Argument Wrapped_Argument::integer(Integer value)
{
    return { std::in_place_type<Integer>, std::move(value) };
}

Wrapped_Argument Wrapped_Argument::big_integer(Big_Integer value)
{
    return { std::in_place_type<Big_Integer>, std::move(value) };
}

Wrapped_Argument Wrapped_Argument::floating(Float value)
{
    return { std::in_place_type<Float>, std::move(value) };
}

std::optional<Big_Integer> Wrapped_Argument::to_exact_integer() const
{
    if (const auto* const b = std::get_if<bool>(&m_value)) {
        return Big_Integer(*b ? 1 : 0);
    }
    if (const auto* const i = std::get_if<Integer>(&m_value)) {
        return Big_Integer(*i);
    }
    if (const auto* const i = std::get_if<Big_Integer>(&m_value)) {
        return *i;
    }
    return {};
}

std::optional<Big_Integer> Wrapped_Argument::to_integer() const
{
    if (const auto* const f = std::get_if<Float>(&m_value)) {
        if (!std::isfinite(*f)) {
            return {};
        }
        return Big_Integer(std::trunc(*f));
    }
    return to_exact_integer();
}

std::optional<Float> Wrapped_Argument::to_float() const
{
    if (const auto* const b = std::get_if<bool>(&m_value)) {
        return *b ? 1.0 : 0.0;
    }
    if (const auto* const i = std::get_if<Integer>(&m_value)) {
        return Float(*i);
    }
    if (const auto* const i = std::get_if<Big_Integer>(&m_value)) {
        return i->convert_to<Float>();
    }
    if (const auto* const f = std::get_if<Float>(&m_value)) {
        return *f;
    }
    return {};
}

Result<std::u8string, Text_Error> Wrapped_Argument::to_text() const
{
    if (const Safe_Text* const trusted = as_trusted()) {
        return std::u8string { trusted->get_text() };
    }
    if (const Escape_Wrapper* const wrapper = as_wrapper()) {
        return wrapper->to_text();
    }

    std::u8string result;
    if (const auto* const b = std::get_if<bool>(&m_value)) {
        result = *b ? u8"True" : u8"False";
    }
    else if (const auto* const i = std::get_if<Integer>(&m_value)) {
        append_integer(result, *i);
    }
    else if (const auto* const i = std::get_if<Big_Integer>(&m_value)) {
        append_big_integer(result, *i);
    }
    else {
        append_float_shortest(result, *std::get_if<Float>(&m_value));
    }
    return result;
}

Result<std::u8string, Text_Error> Wrapped_Argument::to_representation(bool ascii_only) const
{
    if (const Safe_Text* const trusted = as_trusted()) {
        std::u8string result;
        append_string_representation(result, trusted->get_text(), Quote_Style::single, ascii_only);
        return result;
    }
    if (const Escape_Wrapper* const wrapper = as_wrapper()) {
        return wrapper->to_representation(ascii_only);
    }
    return to_text();
}

Result<Wrapped_Argument, Text_Error> Wrapped_Argument::get_item(const Value& key) const
{
    if (const Escape_Wrapper* const wrapper = as_wrapper()) {
        return wrapper->get_item(key);
    }
    return Text_Error::format_argument_type;
}

Result<Wrapped_Argument, Text_Error> Wrapped_Argument::get_attribute(std::u8string_view name) const
{
    if (const Escape_Wrapper* const wrapper = as_wrapper()) {
        return wrapper->get_attribute(name);
    }
    return Text_Error::format_key;
}

Wrapped_Argument wrap(const Value& value)
{
    switch (value.get_kind()) {
    case Value_Kind::safe_text: return Wrapped_Argument { value.as_safe_text() };
    case Value_Kind::boolean: return Wrapped_Argument::boolean(value.as_boolean());
    case Value_Kind::integer: return Wrapped_Argument::integer(value.as_integer());
    case Value_Kind::big_integer: return Wrapped_Argument::big_integer(value.as_big_integer());
    case Value_Kind::floating: return Wrapped_Argument::floating(value.as_float());
    default: break;
    }
    return Wrapped_Argument { Escape_Wrapper { value } };
}

Result<Wrapped_Argument, Text_Error> wrap_verbatim(const Value& value)
{
    if (value.is_numeric() || value.is_safe_text()) {
        return wrap(value);
    }
    Result<std::u8string, Text_Error> text = stringify(value);
    if (!text) {
        return text.error();
    }
    return Wrapped_Argument { Safe_Text::trusted(std::move(*text)) };
}

} // namespace plume
