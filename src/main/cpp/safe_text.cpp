#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "plume/util/case_transform.hpp"
#include "plume/util/result.hpp"
#include "plume/util/strings.hpp"
#include "plume/util/unicode.hpp"

#include "plume/escape.hpp"
#include "plume/escape_wrapper.hpp"
#include "plume/format.hpp"
#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {

Safe_Text Safe_Text::escaped(std::u8string_view text)
{
    return Safe_Text { escape(text) };
}

Result<Safe_Text, Text_Error> Safe_Text::from_raw(const Value& value)
{
    if (value.is_safe_text()) {
        return value.as_safe_text();
    }
    std::u8string text;
    if (auto r = append_stringified_escaped(text, value); !r) {
        return r.error();
    }
    return Safe_Text { std::move(text) };
}

std::size_t Safe_Text::length() const noexcept
{
    return utf8::count_code_points_or_replacement(m_text);
}

Safe_Text Safe_Text::repeat(Integer n) const
{
    if (n <= 0) {
        return {};
    }
    return Safe_Text { plume::repeat(m_text, std::size_t(n)) };
}

Result<Safe_Text, Text_Error> Safe_Text::join(std::span<const Value> parts) const
{
    std::u8string result;
    bool first = true;
    for (const Value& part : parts) {
        if (!first) {
            result += m_text;
        }
        first = false;
        switch (part.get_kind()) {
        case Value_Kind::safe_text: {
            result += part.as_safe_text().get_text();
            break;
        }
        case Value_Kind::string: {
            append_escaped(result, part.as_string());
            break;
        }
        default: return Text_Error::input_type;
        }
    }
    return Safe_Text { std::move(result) };
}

Result<Safe_Text, Text_Error> Safe_Text::join(const Value& parts) const
{
    if (parts.get_kind() != Value_Kind::list) {
        return Text_Error::input_type;
    }
    return join(parts.as_list().items);
}

namespace {

[[nodiscard]]
std::vector<Wrapped_Argument> wrap_all(std::span<const Value> args)
{
    std::vector<Wrapped_Argument> result;
    result.reserve(args.size());
    for (const Value& arg : args) {
        result.push_back(wrap(arg));
    }
    return result;
}

} // namespace

Result<Safe_Text, Text_Error> Safe_Text::format(std::span<const Value> args) const
{
    const std::vector<Wrapped_Argument> wrapped = wrap_all(args);
    std::u8string result;
    if (auto r = format_percent(result, m_text, wrapped); !r) {
        return r.error();
    }
    return Safe_Text { std::move(result) };
}

Result<Safe_Text, Text_Error> Safe_Text::format(const Value& args) const
{
    switch (args.get_kind()) {
    case Value_Kind::list: return format(std::span<const Value> { args.as_list().items });
    case Value_Kind::dict: return format_named(args.as_dict());
    default: return format(std::span<const Value> { &args, 1 });
    }
}

Result<Safe_Text, Text_Error> Safe_Text::format_named(const Dict& mapping) const
{
    const Wrapped_Argument wrapped = wrap(Value::dict(mapping.entries));
    std::u8string result;
    if (auto r = format_percent(result, m_text, { &wrapped, 1 }, &wrapped); !r) {
        return r.error();
    }
    return Safe_Text { std::move(result) };
}

Result<Safe_Text, Text_Error> Safe_Text::format_braced(std::span<const Value> args) const
{
    return format_braced(args, Dict {});
}

Result<Safe_Text, Text_Error>
Safe_Text::format_braced(std::span<const Value> args, const Dict& named_args) const
{
    const std::vector<Wrapped_Argument> wrapped = wrap_all(args);
    std::vector<Named_Argument> named;
    named.reserve(named_args.entries.size());
    for (const auto& [name, value] : named_args.entries) {
        named.push_back({ .name = name, .value = wrap(value) });
    }

    std::u8string result;
    if (auto r = plume::format_braced(result, m_text, wrapped, named); !r) {
        return r.error();
    }
    return Safe_Text { std::move(result) };
}

bool Safe_Text::starts_with(std::u8string_view raw) const
{
    return m_text.starts_with(escape(raw));
}

Result<bool, Text_Error> Safe_Text::starts_with(const Value& probe) const
{
    switch (probe.get_kind()) {
    case Value_Kind::safe_text: return starts_with(probe.as_safe_text());
    case Value_Kind::string: return starts_with(probe.as_string());
    default: return Text_Error::input_type;
    }
}

bool Safe_Text::ends_with(std::u8string_view raw) const
{
    return m_text.ends_with(escape(raw));
}

Result<bool, Text_Error> Safe_Text::ends_with(const Value& probe) const
{
    switch (probe.get_kind()) {
    case Value_Kind::safe_text: return ends_with(probe.as_safe_text());
    case Value_Kind::string: return ends_with(probe.as_string());
    default: return Text_Error::input_type;
    }
}

Safe_Text
Safe_Text::replace(std::u8string_view old_text, std::u8string_view new_text, long long limit) const
{
    return Safe_Text { replace_all(m_text, escape(old_text), escape(new_text), limit) };
}

namespace {

/// @brief Returns the text of a search or replacement operand in escaped form.
[[nodiscard]]
Result<std::u8string, Text_Error> escaped_operand(const Value& operand)
{
    switch (operand.get_kind()) {
    case Value_Kind::safe_text: return std::u8string { operand.as_safe_text().get_text() };
    case Value_Kind::string: return escape(operand.as_string());
    default: return Text_Error::input_type;
    }
}

} // namespace

Result<Safe_Text, Text_Error>
Safe_Text::replace(const Value& old_text, const Value& new_text, long long limit) const
{
    const Result<std::u8string, Text_Error> old_escaped = escaped_operand(old_text);
    if (!old_escaped) {
        return old_escaped.error();
    }
    const Result<std::u8string, Text_Error> new_escaped = escaped_operand(new_text);
    if (!new_escaped) {
        return new_escaped.error();
    }
    return Safe_Text { replace_all(m_text, *old_escaped, *new_escaped, limit) };
}

Safe_Text Safe_Text::lower() const
{
    std::u8string result;
    result.reserve(m_text.size());
    append_case_transformed(result, m_text, Text_Transformation::lowercase);
    return Safe_Text { std::move(result) };
}

Safe_Text Safe_Text::upper() const
{
    std::u8string result;
    result.reserve(m_text.size());
    append_case_transformed(result, m_text, Text_Transformation::uppercase);
    return Safe_Text { std::move(result) };
}

Safe_Text Safe_Text::capitalize() const
{
    std::u8string result;
    result.reserve(m_text.size());
    append_case_transformed(result, m_text, Text_Transformation::capitalize);
    return Safe_Text { std::move(result) };
}

std::u8string Safe_Text::representation() const
{
    std::u8string result = u8"<safe_text ";
    append_string_representation(result, m_text);
    result.push_back(u8'>');
    return result;
}

Safe_Text operator+(const Safe_Text& x, std::u8string_view y)
{
    std::u8string result;
    result.reserve(x.size() + y.size() + escaped_extra_length(y));
    result += x.m_text;
    append_escaped(result, y);
    return Safe_Text { std::move(result) };
}

Safe_Text operator+(std::u8string_view x, const Safe_Text& y)
{
    std::u8string result;
    result.reserve(x.size() + escaped_extra_length(x) + y.size());
    append_escaped(result, x);
    result += y.m_text;
    return Safe_Text { std::move(result) };
}

Result<Safe_Text, Text_Error> concat(const Value& x, const Value& y)
{
    if (x.is_safe_text()) {
        if (y.is_safe_text()) {
            return x.as_safe_text() + y.as_safe_text();
        }
        if (y.is_string()) {
            return x.as_safe_text() + y.as_string();
        }
    }
    else if (x.is_string() && y.is_safe_text()) {
        return x.as_string() + y.as_safe_text();
    }
    return Text_Error::unsupported_operation;
}

} // namespace plume
