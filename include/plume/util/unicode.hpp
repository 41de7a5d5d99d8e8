#ifndef PLUME_UNICODE_HPP
#define PLUME_UNICODE_HPP

#include <cstddef>
#include <string_view>

#include "ulight/impl/unicode.hpp"

namespace plume::utf8 {

using ulight::utf8::Code_Units_And_Length;
using ulight::utf8::decode_and_length_or_replacement;
using ulight::utf8::encode8_unchecked;
using ulight::utf8::is_valid;

/// @brief Returns the length of `str`, in code points.
/// Any illegal code units are counted as one code point,
/// which is consistent with treating them as a U+FFFD REPLACEMENT CHARACTER.
[[nodiscard]]
constexpr std::size_t count_code_points_or_replacement(std::u8string_view str) noexcept
{
    std::size_t result = 0;
    while (!str.empty()) {
        const auto [_, length] = decode_and_length_or_replacement(str);
        str.remove_prefix(std::size_t(length));
        ++result;
    }
    return result;
}

/// @brief Returns the length in code units of the longest prefix of `str`
/// which contains at most `n` code points.
[[nodiscard]]
constexpr std::size_t code_units_of_prefix(std::u8string_view str, std::size_t n) noexcept
{
    std::size_t result = 0;
    for (; n != 0 && result < str.size(); --n) {
        const auto [_, length] = decode_and_length_or_replacement(str.substr(result));
        result += std::size_t(length);
    }
    return result;
}

} // namespace plume::utf8

#endif
