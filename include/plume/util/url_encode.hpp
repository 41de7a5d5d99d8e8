#ifndef PLUME_URL_ENCODE_HPP
#define PLUME_URL_ENCODE_HPP

#include <string>
#include <string_view>
#include <type_traits>

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/chars.hpp"

#include "plume/util/chars.hpp"

namespace plume {

using ulight::is_ascii_alphanumeric_set;
using ulight::detail::to_charset256;

inline constexpr auto is_url_unreserved_set = is_ascii_alphanumeric_set | to_charset256(u8"-._~");

/// @brief The set of characters which `url_quote` leaves intact:
/// the unreserved characters plus the path separator.
inline constexpr auto is_url_quote_safe_set = is_url_unreserved_set | to_charset256(u8"/");

namespace detail {

[[nodiscard]]
constexpr char8_t to_upper_hex_digit(int value)
{
    return value < 10 ? char8_t(int(u8'0') + value) //
                      : char8_t(int(u8'A') + (value - 10));
}

} // namespace detail

/// @brief Percent-encodes every code unit `c` of `str` where `filter(c)` yields `true`,
/// using upper-case hexadecimal digits.
/// Non-ASCII code units are passed to `filter` like any other,
/// so a multi-byte UTF-8 sequence is encoded byte by byte (e.g. `%C3%A4`).
template <typename F>
    requires std::is_invocable_r_v<bool, F, char8_t>
void url_encode_if(std::u8string& out, std::u8string_view str, F filter)
{
    for (const char8_t c : str) {
        if (!filter(c)) {
            out.push_back(c);
            continue;
        }
        out.push_back(u8'%');
        out.push_back(detail::to_upper_hex_digit((c >> 4) & 0xf));
        out.push_back(detail::to_upper_hex_digit((c >> 0) & 0xf));
    }
}

} // namespace plume

#endif
