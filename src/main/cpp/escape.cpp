#include <cstddef>
#include <string>
#include <string_view>

#include "plume/util/assert.hpp"
#include "plume/util/chars.hpp"
#include "plume/util/result.hpp"
#include "plume/util/to_chars.hpp"
#include "plume/util/unicode.hpp"

#include "plume/escape.hpp"
#include "plume/fwd.hpp"
#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {

Result<std::u8string, Text_Error> escape(const Value& value)
{
    if (!value.is_string()) {
        return Text_Error::input_type;
    }
    return escape(value.as_string());
}

namespace {

/// @brief Calls one of the text conversion hooks of an object
/// and appends the result to `out`.
template <typename Hook>
[[nodiscard]]
Result<void, Text_Error> append_object_text(std::u8string& out, Hook hook)
{
    const Result<Value, Text_Error> result = hook();
    if (!result || !result->is_textual()) {
        return Text_Error::conversion;
    }
    out += result->as_text();
    return {};
}

void append_hex_escape(std::u8string& out, char8_t prefix, char32_t value, int digits)
{
    out.push_back(u8'\\');
    out.push_back(prefix);
    for (int i = digits - 1; i >= 0; --i) {
        const auto nibble = int((value >> (4 * i)) & 0xf);
        out.push_back(nibble < 10 ? char8_t(u8'0' + nibble) : char8_t(u8'a' + nibble - 10));
    }
}

[[nodiscard]]
bool is_unprintable(char32_t c)
{
    // C0 controls, DEL, and C1 controls.
    return is_ascii_control(c) || (c >= 0x80 && c < 0xa0);
}

[[nodiscard]]
Result<void, Text_Error>
append_list_representation(std::u8string& out, const List& list, bool ascii_only)
{
    out.push_back(u8'[');
    bool first = true;
    for (const Value& item : list.items) {
        if (!first) {
            out += u8", ";
        }
        first = false;
        if (auto r = append_representation(out, item, ascii_only); !r) {
            return r;
        }
    }
    out.push_back(u8']');
    return {};
}

[[nodiscard]]
Result<void, Text_Error>
append_dict_representation(std::u8string& out, const Dict& dict, bool ascii_only)
{
    out.push_back(u8'{');
    bool first = true;
    for (const auto& [key, value] : dict.entries) {
        if (!first) {
            out += u8", ";
        }
        first = false;
        append_string_representation(out, key, Quote_Style::automatic, ascii_only);
        out += u8": ";
        if (auto r = append_representation(out, value, ascii_only); !r) {
            return r;
        }
    }
    out.push_back(u8'}');
    return {};
}

} // namespace

Result<void, Text_Error> append_stringified(std::u8string& out, const Value& value)
{
    switch (value.get_kind()) {
    case Value_Kind::string:
    case Value_Kind::safe_text: {
        out += value.as_text();
        return {};
    }
    case Value_Kind::object: {
        const Object& object = value.as_object();
        return append_object_text(out, [&] { return object.to_text(); });
    }
    case Value_Kind::list:
    case Value_Kind::dict: {
        return append_representation(out, value);
    }
    case Value_Kind::null:
    case Value_Kind::boolean:
    case Value_Kind::integer:
    case Value_Kind::big_integer:
    case Value_Kind::floating: {
        // Scalars have the same text conversion and representation.
        return append_representation(out, value);
    }
    }
    PLUME_ASSERT_UNREACHABLE(u8"Invalid value kind.");
}

Result<void, Text_Error> append_stringified_escaped(std::u8string& out, const Value& value)
{
    switch (value.get_kind()) {
    case Value_Kind::safe_text: {
        out += value.as_safe_text().get_text();
        return {};
    }
    case Value_Kind::string: {
        append_escaped(out, value.as_string());
        return {};
    }
    case Value_Kind::object: {
        const Result<Value, Text_Error> text = value.as_object().to_text();
        if (!text || !text->is_textual()) {
            return Text_Error::conversion;
        }
        if (text->is_safe_text()) {
            out += text->as_safe_text().get_text();
        }
        else {
            append_escaped(out, text->as_string());
        }
        return {};
    }
    default: break;
    }
    std::u8string text;
    if (auto r = append_stringified(text, value); !r) {
        return r;
    }
    append_escaped(out, text);
    return {};
}

Result<std::u8string, Text_Error> stringify(const Value& value)
{
    if (value.is_string()) {
        return std::u8string { value.as_string() };
    }
    std::u8string result;
    if (auto r = append_stringified(result, value); !r) {
        return r.error();
    }
    return result;
}

void append_string_representation(
    std::u8string& out,
    std::u8string_view str,
    Quote_Style quotes,
    bool ascii_only
)
{
    const char8_t quote = quotes == Quote_Style::automatic && str.contains(u8'\'')
            && !str.contains(u8'"')
        ? u8'"'
        : u8'\'';

    out.push_back(quote);
    while (!str.empty()) {
        const auto [code_point, length] = utf8::decode_and_length_or_replacement(str);
        const std::u8string_view units = str.substr(0, std::size_t(length));
        str.remove_prefix(std::size_t(length));

        if (!utf8::is_valid(units)) {
            for (const char8_t unit : units) {
                append_hex_escape(out, u8'x', char32_t(unit), 2);
            }
            continue;
        }
        switch (code_point) {
        case U'\\': out += u8"\\\\"; continue;
        case U'\n': out += u8"\\n"; continue;
        case U'\r': out += u8"\\r"; continue;
        case U'\t': out += u8"\\t"; continue;
        default: break;
        }
        if (code_point == char32_t(quote)) {
            out.push_back(u8'\\');
            out.push_back(quote);
        }
        else if (is_unprintable(code_point)
                 || (ascii_only && code_point >= 0x80 && code_point <= 0xff)) {
            append_hex_escape(out, u8'x', code_point, 2);
        }
        else if (ascii_only && code_point > 0xff) {
            if (code_point <= 0xffff) {
                append_hex_escape(out, u8'u', code_point, 4);
            }
            else {
                append_hex_escape(out, u8'U', code_point, 8);
            }
        }
        else {
            out += units;
        }
    }
    out.push_back(quote);
}

Result<void, Text_Error>
append_representation(std::u8string& out, const Value& value, bool ascii_only)
{
    switch (value.get_kind()) {
    case Value_Kind::null: {
        out += u8"None";
        return {};
    }
    case Value_Kind::boolean: {
        out += value.as_boolean() ? u8"True" : u8"False";
        return {};
    }
    case Value_Kind::integer: {
        append_integer(out, value.as_integer());
        return {};
    }
    case Value_Kind::big_integer: {
        append_big_integer(out, value.as_big_integer());
        return {};
    }
    case Value_Kind::floating: {
        append_float_shortest(out, value.as_float());
        return {};
    }
    case Value_Kind::string: {
        append_string_representation(out, value.as_string(), Quote_Style::automatic, ascii_only);
        return {};
    }
    case Value_Kind::safe_text: {
        out += u8"<safe_text ";
        append_string_representation(
            out, value.as_safe_text().get_text(), Quote_Style::automatic, ascii_only
        );
        out.push_back(u8'>');
        return {};
    }
    case Value_Kind::list:
    case Value_Kind::dict: {
        // Nested failures must leave out unchanged.
        std::u8string buffer;
        const Result<void, Text_Error> result = value.get_kind() == Value_Kind::list
            ? append_list_representation(buffer, value.as_list(), ascii_only)
            : append_dict_representation(buffer, value.as_dict(), ascii_only);
        if (!result) {
            return result;
        }
        out += buffer;
        return {};
    }
    case Value_Kind::object: {
        const Object& object = value.as_object();
        return append_object_text(out, [&] { return object.representation(); });
    }
    }
    PLUME_ASSERT_UNREACHABLE(u8"Invalid value kind.");
}

Result<std::u8string, Text_Error> representation(const Value& value, bool ascii_only)
{
    std::u8string result;
    if (auto r = append_representation(result, value, ascii_only); !r) {
        return r.error();
    }
    return result;
}

} // namespace plume
