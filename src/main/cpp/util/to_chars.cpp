#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

#include <boost/multiprecision/cpp_int.hpp>

#include "plume/util/assert.hpp"
#include "plume/util/chars.hpp"
#include "plume/util/to_chars.hpp"

#include "plume/settings.hpp"

namespace plume {
namespace {

void append_chars(std::u8string& out, const char* first, const char* last)
{
    out.append(reinterpret_cast<const char8_t*>(first), reinterpret_cast<const char8_t*>(last));
}

[[nodiscard]]
bool append_non_finite(std::u8string& out, Float x, bool to_upper)
{
    if (std::isnan(x)) {
        out.append(to_upper ? u8"NAN" : u8"nan");
        return true;
    }
    if (std::isinf(x)) {
        if (x < 0) {
            out.push_back(u8'-');
        }
        out.append(to_upper ? u8"INF" : u8"inf");
        return true;
    }
    return false;
}

/// @brief The decomposition of a scientific-notation string like `-1.25e+03`.
struct Scientific_Parts {
    bool negative;
    /// @brief The significant digits, without decimal point, like `125`.
    std::string_view digits;
    /// @brief The decimal exponent, like `3`.
    int exponent;
};

[[nodiscard]]
Scientific_Parts split_scientific(std::string_view str, char* digit_buffer)
{
    Scientific_Parts result { .negative = false, .digits = {}, .exponent = 0 };
    if (str.starts_with('-')) {
        result.negative = true;
        str.remove_prefix(1);
    }
    const std::size_t e_pos = str.find('e');
    PLUME_ASSERT(e_pos != std::string_view::npos);

    std::size_t digit_count = 0;
    for (const char c : str.substr(0, e_pos)) {
        if (c != '.') {
            digit_buffer[digit_count++] = c;
        }
    }
    result.digits = { digit_buffer, digit_count };

    std::string_view exponent = str.substr(e_pos + 1);
    if (exponent.starts_with('+')) {
        exponent.remove_prefix(1);
    }
    const std::from_chars_result parsed
        = std::from_chars(exponent.data(), exponent.data() + exponent.size(), result.exponent);
    PLUME_ASSERT(parsed.ec == std::errc {});
    return result;
}

void uppercase_ascii(std::u8string& out, std::size_t from)
{
    for (std::size_t i = from; i < out.size(); ++i) {
        out[i] = to_ascii_upper(out[i]);
    }
}

} // namespace

void append_integer(std::u8string& out, Integer x)
{
    char buffer[number_buffer_size];
    const std::to_chars_result result = std::to_chars(buffer, buffer + sizeof(buffer), x);
    PLUME_ASSERT(result.ec == std::errc {});
    append_chars(out, buffer, result.ptr);
}

void append_big_integer(std::u8string& out, const Big_Integer& x)
{
    const std::string digits = x.str();
    append_chars(out, digits.data(), digits.data() + digits.size());
}

void append_integer_magnitude(std::u8string& out, const Big_Integer& x, int base, bool to_upper)
{
    PLUME_ASSERT(base == 2 || base == 8 || base == 10 || base == 16);

    Big_Integer magnitude = boost::multiprecision::abs(x);
    if (base == 10) {
        append_big_integer(out, magnitude);
        return;
    }
    if (magnitude == 0) {
        out.push_back(u8'0');
        return;
    }

    const unsigned shift = base == 2 ? 1 : base == 8 ? 3 : 4;
    const unsigned mask = unsigned(base) - 1;
    const std::size_t begin = out.size();
    while (magnitude != 0) {
        const Big_Integer low = magnitude & mask;
        const auto digit = low.convert_to<unsigned>();
        out.push_back(
            digit < 10 ? char8_t(u8'0' + digit) : char8_t((to_upper ? u8'A' : u8'a') + digit - 10)
        );
        magnitude >>= shift;
    }
    std::reverse(out.begin() + std::ptrdiff_t(begin), out.end());
}

void append_float_shortest(std::u8string& out, Float x)
{
    if (append_non_finite(out, x, false)) {
        return;
    }

    char buffer[number_buffer_size];
    const std::to_chars_result result
        = std::to_chars(buffer, buffer + sizeof(buffer), x, std::chars_format::scientific);
    PLUME_ASSERT(result.ec == std::errc {});
    const std::string_view scientific { buffer, result.ptr };

    char digit_buffer[number_buffer_size];
    const Scientific_Parts parts = split_scientific(scientific, digit_buffer);
    const int exponent = parts.exponent;
    if (exponent < -4 || exponent >= 16) {
        append_chars(out, scientific.data(), scientific.data() + scientific.size());
        return;
    }

    const std::string_view digits = parts.digits;
    if (parts.negative) {
        out.push_back(u8'-');
    }

    if (exponent < 0) {
        out.append(u8"0.");
        out.append(std::size_t(-exponent - 1), u8'0');
        append_chars(out, digits.data(), digits.data() + digits.size());
        return;
    }

    const auto integer_digits = std::size_t(exponent) + 1;
    if (digits.size() <= integer_digits) {
        append_chars(out, digits.data(), digits.data() + digits.size());
        out.append(integer_digits - digits.size(), u8'0');
        out.append(u8".0");
        return;
    }
    append_chars(out, digits.data(), digits.data() + integer_digits);
    out.push_back(u8'.');
    append_chars(out, digits.data() + integer_digits, digits.data() + digits.size());
}

void append_float(
    std::u8string& out,
    Float x,
    Float_Notation notation,
    int precision,
    bool alternate,
    bool to_upper
)
{
    // %#g may ask for up to four more fractional digits than the format precision.
    PLUME_ASSERT(precision >= 0 && precision <= max_format_precision + 4);

    if (append_non_finite(out, x, to_upper)) {
        return;
    }

    const std::size_t begin = out.size();
    char buffer[number_buffer_size];

    if (notation == Float_Notation::general && alternate) {
        // %#g keeps trailing zeros, which std::to_chars cannot do for us,
        // so the choice between %e and %f is made by hand.
        const int p = precision == 0 ? 1 : precision;
        const std::to_chars_result probe = std::to_chars(
            buffer, buffer + sizeof(buffer), x, std::chars_format::scientific, p - 1
        );
        PLUME_ASSERT(probe.ec == std::errc {});
        char digit_buffer[number_buffer_size];
        const int exponent = split_scientific({ buffer, probe.ptr }, digit_buffer).exponent;
        if (exponent >= -4 && exponent < p) {
            append_float(out, x, Float_Notation::fixed, p - 1 - exponent, true, to_upper);
        }
        else {
            append_float(out, x, Float_Notation::scientific, p - 1, true, to_upper);
        }
        return;
    }

    const std::chars_format format = notation == Float_Notation::fixed ? std::chars_format::fixed
        : notation == Float_Notation::scientific                       ? std::chars_format::scientific
                                                                       : std::chars_format::general;
    const std::to_chars_result result
        = std::to_chars(buffer, buffer + sizeof(buffer), x, format, precision);
    PLUME_ASSERT(result.ec == std::errc {});
    const std::string_view chars { buffer, result.ptr };

    if (alternate && chars.find('.') == std::string_view::npos) {
        const std::size_t e_pos = chars.find('e');
        const std::string_view mantissa = chars.substr(0, e_pos);
        append_chars(out, mantissa.data(), mantissa.data() + mantissa.size());
        out.push_back(u8'.');
        if (e_pos != std::string_view::npos) {
            append_chars(out, chars.data() + e_pos, chars.data() + chars.size());
        }
    }
    else {
        append_chars(out, chars.data(), chars.data() + chars.size());
    }

    if (to_upper) {
        uppercase_ascii(out, begin);
    }
}

} // namespace plume
