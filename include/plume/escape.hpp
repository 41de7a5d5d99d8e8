#ifndef PLUME_ESCAPE_HPP
#define PLUME_ESCAPE_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "ulight/impl/ascii_algorithm.hpp"

#include "plume/util/chars.hpp"
#include "plume/util/result.hpp"

#include "plume/fwd.hpp"
#include "plume/text_error.hpp"

namespace plume {

/// @brief Returns the HTML entity which replaces `c` in escaped text,
/// or an empty string if `c` is not replaced.
/// @see is_html_markup_char
[[nodiscard]]
constexpr std::u8string_view html_entity_of(char8_t c) noexcept
{
    switch (c) {
    case u8'&': return u8"&amp;";
    case u8'<': return u8"&lt;";
    case u8'>': return u8"&gt;";
    case u8'"': return u8"&quot;";
    default: return {};
    }
}

/// @brief Returns the number of code units by which `text` grows when escaped.
template <typename Char>
[[nodiscard]]
constexpr std::size_t escaped_extra_length(std::basic_string_view<Char> text) noexcept
{
    std::size_t result = 0;
    for (const Char c : text) {
        if (is_html_markup_char(c)) {
            result += html_entity_of(char8_t(c)).size() - 1;
        }
    }
    return result;
}

/// @brief Returns `text` with `&`, `<`, `>`, and `"` replaced by their HTML entities.
/// The apostrophe is left alone.
///
/// This first computes the exact length of the result,
/// so that the result is allocated only once.
/// If nothing needs to be escaped, the result is a plain copy of `text`.
template <typename Char>
[[nodiscard]]
std::basic_string<Char> basic_escape(std::basic_string_view<Char> text)
{
    const std::size_t extra = escaped_extra_length(text);
    std::basic_string<Char> result;
    if (extra == 0) {
        result = text;
        return result;
    }
    result.reserve(text.size() + extra);
    for (const Char c : text) {
        if (!is_html_markup_char(c)) {
            result.push_back(c);
            continue;
        }
        for (const char8_t e : html_entity_of(char8_t(c))) {
            result.push_back(Char(e));
        }
    }
    return result;
}

[[nodiscard]]
inline std::u8string escape(std::u8string_view text)
{
    return basic_escape(text);
}

[[nodiscard]]
inline std::u16string escape(std::u16string_view text)
{
    return basic_escape(text);
}

[[nodiscard]]
inline std::u32string escape(std::u32string_view text)
{
    return basic_escape(text);
}

/// @brief Escapes a string value.
/// Fails with `Text_Error::input_type` if `value` is not a string.
/// Notably, `Safe_Text` is also rejected because escaping it a second time
/// would mangle its entities; use `Safe_Text::from_raw` to accept either.
[[nodiscard]]
Result<std::u8string, Text_Error> escape(const Value& value);

/// @brief Appends `text` to `out`, escaped.
/// Runs of code units which need no escaping are appended at once.
inline void append_escaped(std::u8string& out, std::u8string_view text)
{
    while (!text.empty()) {
        const std::size_t safe_length
            = ulight::ascii::length_if_not(text, [](char8_t c) { return is_html_markup_char(c); });
        if (safe_length != 0) {
            out.append(text.substr(0, safe_length));
            text.remove_prefix(safe_length);
            if (text.empty()) {
                break;
            }
        }
        out.append(html_entity_of(text.front()));
        text.remove_prefix(1);
    }
}

/// @brief Appends the text conversion of `value` to `out`.
/// See `stringify`.
/// On failure, nothing is appended.
[[nodiscard]]
Result<void, Text_Error> append_stringified(std::u8string& out, const Value& value);

/// @brief Appends the text conversion of `value` to `out` in escaped form.
/// `Safe_Text` is appended as-is,
/// including `Safe_Text` returned by `Object::to_text`.
/// Any other text is escaped.
/// On failure, nothing is appended.
[[nodiscard]]
Result<void, Text_Error> append_stringified_escaped(std::u8string& out, const Value& value);

/// @brief Converts `value` to text.
///
/// Strings are returned unchanged and `Safe_Text` yields its (escaped) text.
/// Other values use their own conversion:
/// null is `None`, booleans are `True` and `False`,
/// integers are decimal, floating-point numbers use the shortest representation that round-trips
/// (`10.0`, `1e+16`), and lists and dicts use their representation (see `representation`).
/// Objects use `Object::to_text`,
/// and fail with `Text_Error::conversion` if that fails or yields something other than text.
[[nodiscard]]
Result<std::u8string, Text_Error> stringify(const Value& value);

enum struct Quote_Style : Default_Underlying {
    /// @brief Single quotes, unless the string contains single quotes but no double quotes.
    automatic,
    /// @brief Always single quotes.
    /// The result then never contains a double quote which was not in the input.
    single,
};

/// @brief Appends a quoted and backslash-escaped representation of `str`, like `'a\n'`.
/// Control characters are written as `\xNN`.
/// If `ascii_only` is `true`, non-ASCII code points are written as `\xNN`, `\uNNNN`, or
/// `\UNNNNNNNN`.
/// Code units which do not form valid UTF-8 are written as `\xNN`.
void append_string_representation(
    std::u8string& out,
    std::u8string_view str,
    Quote_Style quotes = Quote_Style::automatic,
    bool ascii_only = false
);

/// @brief Appends the diagnostic representation of `value` to `out`.
/// On failure, nothing is appended.
[[nodiscard]]
Result<void, Text_Error>
append_representation(std::u8string& out, const Value& value, bool ascii_only = false);

/// @brief Returns the diagnostic representation of `value`,
/// which is meant for diagnostics and debugging:
/// strings are quoted (`'abc'`), lists are `[1, 'x']`, dicts are `{'k': None}`,
/// `Safe_Text` is `<safe_text 'a&amp;b'>`,
/// and objects use `Object::representation`.
/// The result is raw text and must be escaped before it is written as HTML.
[[nodiscard]]
Result<std::u8string, Text_Error> representation(const Value& value, bool ascii_only = false);

} // namespace plume

#endif
