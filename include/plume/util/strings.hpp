#ifndef PLUME_STRINGS_HPP
#define PLUME_STRINGS_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "plume/util/chars.hpp"

namespace plume {

// see is_ascii_digit
inline constexpr std::u8string_view all_ascii_digit8 = u8"0123456789";

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

/// @brief Returns `str` repeated `n` times.
/// If `n` is zero, returns an empty string.
/// Throws `std::bad_alloc` if the result would exceed the maximum string size.
[[nodiscard]]
std::u8string repeat(std::u8string_view str, std::size_t n);

/// @brief Replaces occurrences of `needle` within `haystack` with `replacement`,
/// from left to right, non-overlapping.
/// At most `limit` replacements take place, or all if `limit` is negative.
/// If `needle` is empty, `replacement` is inserted before every code point
/// and at the end of the string.
/// For example, `replace_all(u8"ab", u8"", u8"-")` yields `u8"-a-b-"`.
[[nodiscard]]
std::u8string replace_all(
    std::u8string_view haystack,
    std::u8string_view needle,
    std::u8string_view replacement,
    long long limit = -1
);

} // namespace plume

#endif
