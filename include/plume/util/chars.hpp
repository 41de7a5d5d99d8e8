#ifndef PLUME_CHARS_HPP
#define PLUME_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/unicode_chars.hpp"

namespace plume {

using ulight::code_point_max;
using ulight::is_ascii;
using ulight::is_ascii_alphanumeric;
using ulight::is_ascii_digit;
using ulight::is_scalar_value;
using ulight::to_ascii_lower;
using ulight::to_ascii_upper;

/// @brief Returns `true` if `c` is one of the characters which are replaced with
/// entities by `escape`, i.e. `&`, `<`, `>`, or `"`.
/// Notably, the apostrophe is not included;
/// attribute values are always written within double quotes.
template <typename Char>
[[nodiscard]]
constexpr bool is_html_markup_char(Char c) noexcept
{
    return c == Char(u8'&') || c == Char(u8'<') || c == Char(u8'>') || c == Char(u8'"');
}

/// @brief Returns `true` if `c` is an ASCII control character,
/// including DEL.
[[nodiscard]]
constexpr bool is_ascii_control(char32_t c) noexcept
{
    return c < U' ' || c == U'\x7f';
}

} // namespace plume

#endif
