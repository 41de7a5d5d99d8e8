#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "plume/util/assert.hpp"
#include "plume/util/chars.hpp"
#include "plume/util/result.hpp"
#include "plume/util/strings.hpp"
#include "plume/util/to_chars.hpp"
#include "plume/util/unicode.hpp"

#include "plume/escape.hpp"
#include "plume/escape_wrapper.hpp"
#include "plume/format.hpp"
#include "plume/settings.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {
namespace {

// TEXT MEASUREMENT ================================================================================

/// @brief Returns the length of the character reference at the start of `text`,
/// like `5` for `&amp;`, or zero if `text` does not start with one.
[[nodiscard]]
std::size_t entity_length(std::u8string_view text)
{
    constexpr std::size_t max_entity_name_length = 32;

    if (!text.starts_with(u8'&')) {
        return 0;
    }
    for (std::size_t i = 1; i < text.size() && i <= max_entity_name_length + 1; ++i) {
        const char8_t c = text[i];
        if (c == u8';') {
            return i == 1 ? 0 : i + 1;
        }
        if (!is_ascii_alphanumeric(c) && c != u8'#') {
            return 0;
        }
    }
    return 0;
}

/// @brief Returns the length in code units of the first visible character of escaped text,
/// which is either a whole character reference or a single code point.
[[nodiscard]]
std::size_t next_character_length(std::u8string_view text)
{
    if (const std::size_t length = entity_length(text)) {
        return length;
    }
    const auto [_, length] = utf8::decode_and_length_or_replacement(text);
    return std::size_t(length);
}

/// @brief Returns the number of visible characters in escaped `text`.
/// Character references count as a single character.
[[nodiscard]]
std::size_t display_length(std::u8string_view text)
{
    std::size_t result = 0;
    for (; !text.empty(); ++result) {
        text.remove_prefix(next_character_length(text));
    }
    return result;
}

/// @brief Returns the longest prefix of escaped `text` with at most `n` visible characters.
/// Truncating escaped text this way is equivalent to escaping truncated raw text,
/// and never splits a character reference.
[[nodiscard]]
std::u8string_view display_prefix(std::u8string_view text, std::size_t n)
{
    std::size_t length = 0;
    for (; n != 0 && length < text.size(); --n) {
        length += next_character_length(text.substr(length));
    }
    return text.substr(0, length);
}

[[nodiscard]]
bool is_all_digits(std::u8string_view str)
{
    if (str.empty()) {
        return false;
    }
    for (const char8_t c : str) {
        if (!is_ascii_digit(c)) {
            return false;
        }
    }
    return true;
}

/// @brief Parses the longest prefix of decimal digits in `str` and removes it from `str`.
/// Returns no value if the number does not fit into `std::size_t`.
[[nodiscard]]
std::optional<std::size_t> consume_digits(std::u8string_view& str)
{
    std::size_t length = 0;
    while (length < str.size() && is_ascii_digit(str[length])) {
        ++length;
    }
    const std::string_view digits = as_string_view(str.substr(0, length));
    std::size_t result = 0;
    const std::from_chars_result parsed
        = std::from_chars(digits.data(), digits.data() + digits.size(), result);
    str.remove_prefix(length);
    if (length != 0 && parsed.ec != std::errc {}) {
        return {};
    }
    return result;
}

// PADDING =========================================================================================

enum struct Alignment : Default_Underlying {
    none,
    left,
    right,
    center,
    /// @brief Padding is placed between the sign and the digits, like `-0042`.
    after_sign,
};

struct Padding {
    std::size_t width = 0;
    Alignment align = Alignment::none;
    /// @brief A single code point.
    std::u8string_view fill = u8" ";
};

void append_fill(std::u8string& out, std::u8string_view fill, std::size_t n)
{
    for (; n != 0; --n) {
        out += fill;
    }
}

/// @brief Appends `prefix` (a sign and base prefix) and `body` to `out`,
/// padded to the width in `padding`.
/// `body_length` is the number of visible characters in `body`.
void append_padded(
    std::u8string& out,
    std::u8string_view prefix,
    std::u8string_view body,
    std::size_t body_length,
    const Padding& padding,
    Alignment default_align
)
{
    const std::size_t length = prefix.size() + body_length;
    if (length >= padding.width) {
        out += prefix;
        out += body;
        return;
    }
    const std::size_t total = padding.width - length;
    const Alignment align = padding.align == Alignment::none ? default_align : padding.align;
    switch (align) {
    case Alignment::left: {
        out += prefix;
        out += body;
        append_fill(out, padding.fill, total);
        break;
    }
    case Alignment::center: {
        append_fill(out, padding.fill, total / 2);
        out += prefix;
        out += body;
        append_fill(out, padding.fill, total - total / 2);
        break;
    }
    case Alignment::after_sign: {
        out += prefix;
        append_fill(out, padding.fill, total);
        out += body;
        break;
    }
    case Alignment::none:
    case Alignment::right: {
        append_fill(out, padding.fill, total);
        out += prefix;
        out += body;
        break;
    }
    }
}

void append_text(
    std::u8string& out,
    std::u8string_view text,
    std::optional<std::size_t> precision,
    const Padding& padding
)
{
    if (precision) {
        text = display_prefix(text, *precision);
    }
    append_padded(out, {}, text, display_length(text), padding, Alignment::left);
}

// NUMBERS =========================================================================================

struct Number_Parts {
    /// @brief The sign and base prefix, like `-0x`.
    std::u8string prefix;
    std::u8string digits;
};

/// @brief Inserts `separator` between every `group_size` digits of `str`,
/// counted from the right, within the first `end` code units.
void insert_grouping(
    std::u8string& str,
    std::size_t end,
    char8_t separator,
    std::size_t group_size
)
{
    for (std::size_t i = end; i > group_size; i -= group_size) {
        str.insert(str.begin() + std::ptrdiff_t(i - group_size), separator);
    }
}

/// @brief Appends the sign of a number, given a sign option of `-`, `+`, or space.
/// With `-`, only negative numbers have a sign.
void append_sign(std::u8string& out, bool negative, char8_t sign)
{
    if (negative) {
        out.push_back(u8'-');
    }
    else if (sign != u8'-') {
        out.push_back(sign);
    }
}

/// @brief Formats an integer.
/// @param type One of `d`, `b`, `o`, `x`, or `X`.
/// @param min_digits The digits are padded with leading zeros to at least this length.
/// @param grouping `,`, `_`, or zero for no digit grouping.
[[nodiscard]]
Number_Parts integer_parts(
    const Big_Integer& x,
    char8_t type,
    char8_t sign,
    bool alternate,
    std::size_t min_digits,
    char8_t grouping
)
{
    Number_Parts result;
    append_sign(result.prefix, x < 0, sign);

    int base = 10;
    switch (type) {
    case u8'b': base = 2; break;
    case u8'o': base = 8; break;
    case u8'x':
    case u8'X': base = 16; break;
    default: break;
    }
    if (alternate && base != 10) {
        result.prefix.push_back(u8'0');
        result.prefix.push_back(type == u8'X' ? u8'X' : type);
    }

    append_integer_magnitude(result.digits, x, base, type == u8'X');
    if (result.digits.size() < min_digits) {
        result.digits.insert(0, min_digits - result.digits.size(), u8'0');
    }
    if (grouping != 0) {
        insert_grouping(result.digits, result.digits.size(), grouping, base == 10 ? 3 : 4);
    }
    return result;
}

/// @brief Removes trailing zeros from the fraction of the mantissa in `str`,
/// keeping at least `min_fraction_digits` digits,
/// and the decimal point if no fractional digits remain.
void strip_trailing_zeros(std::u8string& str, std::size_t min_fraction_digits)
{
    const std::size_t point = str.find(u8'.');
    if (point == std::u8string::npos) {
        return;
    }
    const std::size_t e = str.find_first_of(u8"eE", point);
    const std::size_t mantissa_end = e == std::u8string::npos ? str.size() : e;
    std::size_t end = mantissa_end;
    while (end > point + 1 + min_fraction_digits && str[end - 1] == u8'0') {
        --end;
    }
    if (end == point + 1) {
        end = point;
    }
    str.erase(end, mantissa_end - end);
}

[[nodiscard]]
int scientific_exponent(std::u8string_view str)
{
    const std::size_t e = str.find(u8'e');
    PLUME_ASSERT(e != std::u8string_view::npos);
    std::u8string_view exponent = str.substr(e + 1);
    if (exponent.starts_with(u8'+')) {
        exponent.remove_prefix(1);
    }
    const std::string_view chars = as_string_view(exponent);
    int result = 0;
    const std::from_chars_result parsed
        = std::from_chars(chars.data(), chars.data() + chars.size(), result);
    PLUME_ASSERT(parsed.ec == std::errc {});
    return result;
}

/// @brief Appends the non-negative, finite `x` like general notation with the given precision,
/// except that fixed notation always includes at least one fractional digit,
/// and scientific notation is used once the exponent reaches `precision - 1`.
/// This is the behavior of a replacement field with precision but without a type, like `{:.3}`.
void append_float_with_precision(std::u8string& out, Float x, int precision, bool alternate)
{
    const int p = precision == 0 ? 1 : precision;
    std::u8string scientific;
    append_float(scientific, x, Float_Notation::scientific, p - 1, alternate, false);
    const int exponent = scientific_exponent(scientific);

    if (exponent < -4 || exponent >= p - 1) {
        if (!alternate) {
            strip_trailing_zeros(scientific, 0);
        }
        out += scientific;
        return;
    }
    std::u8string fixed;
    append_float(fixed, x, Float_Notation::fixed, p - 1 - exponent, alternate, false);
    if (!alternate) {
        strip_trailing_zeros(fixed, 1);
    }
    if (!fixed.contains(u8'.')) {
        fixed += u8".0";
    }
    out += fixed;
}

/// @brief Returns `true` iff the mantissa of the formatted number `digits` has no nonzero digit.
[[nodiscard]]
bool is_rounded_zero(std::u8string_view digits)
{
    for (const char8_t c : digits) {
        if (c == u8'e' || c == u8'E' || c == u8'%') {
            break;
        }
        if (is_ascii_digit(c) && c != u8'0') {
            return false;
        }
    }
    return true;
}

/// @brief Formats a floating-point number.
/// @param type One of `e`, `E`, `f`, `F`, `g`, `G`, `%`,
/// or zero for the shortest representation (with precision, see `append_float_with_precision`).
[[nodiscard]]
Number_Parts float_parts(
    Float x,
    char8_t type,
    char8_t sign,
    bool alternate,
    std::optional<std::size_t> precision,
    char8_t grouping,
    bool coerce_negative_zero
)
{
    Number_Parts result;
    const Float magnitude = std::fabs(x);
    const bool upper = type == u8'E' || type == u8'F' || type == u8'G';
    const int p = int(precision.value_or(6));
    switch (type) {
    case u8'e':
    case u8'E': {
        append_float(result.digits, magnitude, Float_Notation::scientific, p, alternate, upper);
        break;
    }
    case u8'f':
    case u8'F': {
        append_float(result.digits, magnitude, Float_Notation::fixed, p, alternate, upper);
        break;
    }
    case u8'g':
    case u8'G': {
        append_float(result.digits, magnitude, Float_Notation::general, p, alternate, upper);
        break;
    }
    case u8'%': {
        append_float(result.digits, magnitude * 100, Float_Notation::fixed, p, alternate, false);
        result.digits.push_back(u8'%');
        break;
    }
    default: {
        if (!std::isfinite(magnitude)) {
            append_float_shortest(result.digits, magnitude);
        }
        else if (precision) {
            append_float_with_precision(result.digits, magnitude, p, alternate);
        }
        else {
            append_float_shortest(result.digits, magnitude);
        }
        break;
    }
    }
    // With z, a value which rounds to zero has no negative sign.
    const bool negative = std::signbit(x) && !std::isnan(x)
        && !(coerce_negative_zero && std::isfinite(x) && is_rounded_zero(result.digits));
    append_sign(result.prefix, negative, sign);

    if (grouping != 0 && std::isfinite(magnitude)) {
        const std::size_t integer_end = result.digits.find_first_not_of(all_ascii_digit8);
        insert_grouping(
            result.digits, integer_end == std::u8string::npos ? result.digits.size() : integer_end,
            grouping, 3
        );
    }
    return result;
}

/// @brief Appends the code point `code_point`, escaped.
[[nodiscard]]
Result<void, Text_Error> append_escaped_code_point(std::u8string& out, const Big_Integer& code_point)
{
    if (code_point < 0 || code_point > code_point_max) {
        return Text_Error::format_argument_type;
    }
    const auto c = char32_t(code_point.convert_to<std::uint32_t>());
    if (!is_scalar_value(c)) {
        return Text_Error::format_argument_type;
    }
    append_escaped(out, utf8::encode8_unchecked(c).as_string());
    return {};
}

// PERCENT-STYLE ===================================================================================

struct Percent_Spec {
    bool left = false;
    bool plus = false;
    bool space = false;
    bool zero = false;
    bool alternate = false;
    std::size_t width = 0;
    std::optional<std::size_t> precision;
    char8_t conversion = 0;
};

struct Percent_Formatter {
private:
    std::u8string& m_out;
    std::u8string_view m_remainder;
    std::span<const Wrapped_Argument> m_positional;
    const Wrapped_Argument* m_mapping;
    std::optional<std::span<const Named_Argument>> m_named;
    std::size_t m_next_positional = 0;

public:
    [[nodiscard]]
    Percent_Formatter(
        std::u8string& out,
        std::u8string_view format,
        std::span<const Wrapped_Argument> positional,
        const Wrapped_Argument* mapping
    )
        : m_out { out }
        , m_remainder { format }
        , m_positional { positional }
        , m_mapping { mapping }
    {
    }

    [[nodiscard]]
    Percent_Formatter(
        std::u8string& out,
        std::u8string_view format,
        std::span<const Named_Argument> named
    )
        : m_out { out }
        , m_remainder { format }
        , m_mapping { nullptr }
        , m_named { named }
    {
    }

    [[nodiscard]]
    Result<void, Text_Error> operator()()
    {
        while (!m_remainder.empty()) {
            const std::size_t percent = m_remainder.find(u8'%');
            m_out += m_remainder.substr(0, percent);
            if (percent == std::u8string_view::npos) {
                break;
            }
            m_remainder.remove_prefix(percent + 1);
            if (auto r = format_directive(); !r) {
                return r;
            }
        }
        // A mapping is formatted through its keys,
        // so leftover positional arguments are only an error without one.
        if (!has_keys() && m_next_positional < m_positional.size()) {
            return Text_Error::format_arity;
        }
        return {};
    }

private:
    [[nodiscard]]
    bool has_keys() const
    {
        return m_mapping || m_named;
    }

    [[nodiscard]]
    Result<Wrapped_Argument, Text_Error> lookup(std::u8string_view key) const
    {
        if (m_mapping) {
            return m_mapping->get_item(Value::string(key));
        }
        PLUME_ASSERT(m_named);
        for (const Named_Argument& arg : *m_named | std::views::reverse) {
            if (arg.name == key) {
                return arg.value;
            }
        }
        return Text_Error::format_key;
    }

    [[nodiscard]]
    bool consume(char8_t c)
    {
        if (m_remainder.starts_with(c)) {
            m_remainder.remove_prefix(1);
            return true;
        }
        return false;
    }

    [[nodiscard]]
    Result<const Wrapped_Argument*, Text_Error> next_positional()
    {
        if (m_next_positional >= m_positional.size()) {
            return Text_Error::format_arity;
        }
        return &m_positional[m_next_positional++];
    }

    /// @brief Consumes the next positional argument for a `*` width or precision.
    [[nodiscard]]
    Result<long long, Text_Error> next_star_argument()
    {
        const Result<const Wrapped_Argument*, Text_Error> arg = next_positional();
        if (!arg) {
            return arg.error();
        }
        const std::optional<Big_Integer> value = (*arg)->to_exact_integer();
        if (!value) {
            return Text_Error::format_argument_type;
        }
        if (*value > Big_Integer(max_format_width) || *value < -Big_Integer(max_format_width)) {
            return Text_Error::format_specifier;
        }
        return value->convert_to<long long>();
    }

    [[nodiscard]]
    Result<std::u8string_view, Text_Error> consume_key()
    {
        int depth = 1;
        for (std::size_t i = 0; i < m_remainder.size(); ++i) {
            if (m_remainder[i] == u8'(') {
                ++depth;
            }
            else if (m_remainder[i] == u8')' && --depth == 0) {
                const std::u8string_view key = m_remainder.substr(0, i);
                m_remainder.remove_prefix(i + 1);
                return key;
            }
        }
        return Text_Error::format_syntax;
    }

    [[nodiscard]]
    Result<void, Text_Error> format_directive()
    {
        std::optional<Wrapped_Argument> keyed;
        if (consume(u8'(')) {
            if (!has_keys()) {
                return Text_Error::format_argument_type;
            }
            const Result<std::u8string_view, Text_Error> key = consume_key();
            if (!key) {
                return key.error();
            }
            Result<Wrapped_Argument, Text_Error> item = lookup(*key);
            if (!item) {
                return item.error();
            }
            keyed.emplace(std::move(*item));
        }

        Percent_Spec spec;
        while (!m_remainder.empty()) {
            const char8_t c = m_remainder.front();
            if (c == u8'-') {
                spec.left = true;
            }
            else if (c == u8'+') {
                spec.plus = true;
            }
            else if (c == u8' ') {
                spec.space = true;
            }
            else if (c == u8'0') {
                spec.zero = true;
            }
            else if (c == u8'#') {
                spec.alternate = true;
            }
            else {
                break;
            }
            m_remainder.remove_prefix(1);
        }

        if (consume(u8'*')) {
            const Result<long long, Text_Error> width = next_star_argument();
            if (!width) {
                return width.error();
            }
            if (*width < 0) {
                spec.left = true;
            }
            spec.width = std::size_t(*width < 0 ? -*width : *width);
        }
        else {
            const std::optional<std::size_t> width = consume_digits(m_remainder);
            if (!width || *width > max_format_width) {
                return Text_Error::format_specifier;
            }
            spec.width = *width;
        }

        if (consume(u8'.')) {
            if (consume(u8'*')) {
                const Result<long long, Text_Error> precision = next_star_argument();
                if (!precision) {
                    return precision.error();
                }
                spec.precision = std::size_t(*precision < 0 ? 0 : *precision);
            }
            else {
                spec.precision = consume_digits(m_remainder);
                if (!spec.precision || *spec.precision > max_format_width) {
                    return Text_Error::format_specifier;
                }
            }
        }

        // Length modifiers have no meaning here, but are accepted like in C.
        while (consume(u8'h') || consume(u8'l') || consume(u8'L')) { }

        if (m_remainder.empty()) {
            return Text_Error::format_syntax;
        }
        spec.conversion = m_remainder.front();
        m_remainder.remove_prefix(1);

        if (spec.conversion == u8'%') {
            m_out.push_back(u8'%');
            return {};
        }

        const Wrapped_Argument* arg = keyed ? &*keyed : nullptr;
        if (!arg) {
            const Result<const Wrapped_Argument*, Text_Error> positional = next_positional();
            if (!positional) {
                return positional.error();
            }
            arg = *positional;
        }
        return format_argument(*arg, spec);
    }

    [[nodiscard]]
    Result<void, Text_Error> format_argument(const Wrapped_Argument& arg, const Percent_Spec& spec)
    {
        const Padding padding {
            .width = spec.width,
            .align = spec.left ? Alignment::left : Alignment::right,
        };
        const char8_t sign = spec.plus ? u8'+' : spec.space ? u8' ' : u8'-';

        const auto append_number = [&](const Number_Parts& parts, bool zero_fill) {
            Padding number_padding = padding;
            if (zero_fill && spec.zero && !spec.left) {
                number_padding.align = Alignment::after_sign;
                number_padding.fill = u8"0";
            }
            append_padded(
                m_out, parts.prefix, parts.digits, parts.digits.size(), number_padding,
                Alignment::right
            );
        };

        switch (spec.conversion) {
        case u8's':
        case u8'r':
        case u8'a': {
            const Result<std::u8string, Text_Error> text = spec.conversion == u8's'
                ? arg.to_text()
                : arg.to_representation(spec.conversion == u8'a');
            if (!text) {
                return text.error();
            }
            append_text(m_out, *text, spec.precision, padding);
            return {};
        }
        case u8'd':
        case u8'i':
        case u8'u': {
            const std::optional<Big_Integer> value = arg.to_integer();
            if (!value) {
                return Text_Error::format_argument_type;
            }
            if (spec.precision && *spec.precision > std::size_t(max_format_precision)) {
                return Text_Error::format_specifier;
            }
            append_number(
                integer_parts(*value, u8'd', sign, false, spec.precision.value_or(0), 0), true
            );
            return {};
        }
        case u8'o':
        case u8'x':
        case u8'X': {
            const std::optional<Big_Integer> value = arg.to_exact_integer();
            if (!value) {
                return Text_Error::format_argument_type;
            }
            if (spec.precision && *spec.precision > std::size_t(max_format_precision)) {
                return Text_Error::format_specifier;
            }
            append_number(
                integer_parts(
                    *value, spec.conversion, sign, spec.alternate, spec.precision.value_or(0), 0
                ),
                true
            );
            return {};
        }
        case u8'e':
        case u8'E':
        case u8'f':
        case u8'F':
        case u8'g':
        case u8'G': {
            const std::optional<Float> value = arg.to_float();
            if (!value) {
                return Text_Error::format_argument_type;
            }
            if (spec.precision && *spec.precision > std::size_t(max_format_precision)) {
                return Text_Error::format_specifier;
            }
            append_number(
                float_parts(
                    *value, spec.conversion, sign, spec.alternate, spec.precision, 0, false
                ),
                std::isfinite(*value)
            );
            return {};
        }
        case u8'c': {
            std::u8string character;
            if (const std::optional<Big_Integer> code_point = arg.to_exact_integer()) {
                if (auto r = append_escaped_code_point(character, *code_point); !r) {
                    return r;
                }
            }
            else {
                Result<std::u8string, Text_Error> text = arg.to_text();
                if (!text) {
                    return text.error();
                }
                if (arg.is_number() || display_length(*text) != 1) {
                    return Text_Error::format_argument_type;
                }
                character = std::move(*text);
            }
            append_padded(m_out, {}, character, 1, padding, Alignment::right);
            return {};
        }
        default: break;
        }
        return Text_Error::format_syntax;
    }
};

// BRACE-STYLE =====================================================================================

struct Brace_Spec {
    /// @brief The fill code point, or empty if none was specified.
    std::u8string_view fill;
    Alignment align = Alignment::none;
    /// @brief `+`, `-`, space, or zero if unspecified.
    char8_t sign = 0;
    bool coerce_negative_zero = false;
    bool alternate = false;
    bool zero = false;
    std::size_t width = 0;
    char8_t grouping = 0;
    std::optional<std::size_t> precision;
    char8_t type = 0;
};

[[nodiscard]]
constexpr Alignment alignment_of(char8_t c)
{
    switch (c) {
    case u8'<': return Alignment::left;
    case u8'>': return Alignment::right;
    case u8'^': return Alignment::center;
    case u8'=': return Alignment::after_sign;
    default: return Alignment::none;
    }
}

[[nodiscard]]
Result<Brace_Spec, Text_Error> parse_brace_spec(std::u8string_view spec)
{
    Brace_Spec result;
    if (!spec.empty()) {
        [[maybe_unused]] const auto [fill_code_point, fill_length]
            = utf8::decode_and_length_or_replacement(spec);
        const auto fill_size = std::size_t(fill_length);
        if (spec.size() > fill_size && alignment_of(spec[fill_size]) != Alignment::none) {
            result.fill = spec.substr(0, fill_size);
            result.align = alignment_of(spec[fill_size]);
            spec.remove_prefix(fill_size + 1);
        }
        else if (alignment_of(spec.front()) != Alignment::none) {
            result.align = alignment_of(spec.front());
            spec.remove_prefix(1);
        }
    }
    if (spec.starts_with(u8'+') || spec.starts_with(u8'-') || spec.starts_with(u8' ')) {
        result.sign = spec.front();
        spec.remove_prefix(1);
    }
    if (spec.starts_with(u8'z')) {
        result.coerce_negative_zero = true;
        spec.remove_prefix(1);
    }
    if (spec.starts_with(u8'#')) {
        result.alternate = true;
        spec.remove_prefix(1);
    }
    if (spec.starts_with(u8'0')) {
        result.zero = true;
        spec.remove_prefix(1);
    }
    const std::optional<std::size_t> width = consume_digits(spec);
    if (!width || *width > max_format_width) {
        return Text_Error::format_specifier;
    }
    result.width = *width;
    if (spec.starts_with(u8',') || spec.starts_with(u8'_')) {
        result.grouping = spec.front();
        spec.remove_prefix(1);
    }
    if (spec.starts_with(u8'.')) {
        spec.remove_prefix(1);
        if (spec.empty() || !is_ascii_digit(spec.front())) {
            return Text_Error::format_specifier;
        }
        result.precision = consume_digits(spec);
        if (!result.precision || *result.precision > std::size_t(max_format_precision)) {
            return Text_Error::format_specifier;
        }
    }
    if (spec.size() > 1) {
        return Text_Error::format_specifier;
    }
    if (spec.size() == 1) {
        result.type = spec.front();
    }
    return result;
}

[[nodiscard]]
Result<void, Text_Error>
append_text_with_spec(std::u8string& out, std::u8string_view text, const Brace_Spec& spec)
{
    if (spec.type != 0 && spec.type != u8's') {
        return Text_Error::format_specifier;
    }
    if (spec.sign != 0 || spec.alternate || spec.grouping != 0 || spec.coerce_negative_zero
        || spec.align == Alignment::after_sign) {
        return Text_Error::format_specifier;
    }
    const Padding padding {
        .width = spec.width,
        .align = spec.align,
        .fill = !spec.fill.empty() ? spec.fill
            : spec.zero            ? u8"0"
                                   : u8" ",
    };
    append_text(out, text, spec.precision, padding);
    return {};
}

[[nodiscard]]
Result<void, Text_Error>
append_number_with_spec(std::u8string& out, const Wrapped_Argument& arg, const Brace_Spec& spec)
{
    Padding padding {
        .width = spec.width,
        .align = spec.align,
        .fill = spec.fill.empty() ? u8" " : spec.fill,
    };
    if (spec.zero && spec.fill.empty() && spec.align == Alignment::none) {
        padding.fill = u8"0";
        padding.align = Alignment::after_sign;
    }
    const char8_t sign = spec.sign == 0 ? u8'-' : spec.sign;
    const bool is_float = arg.is_floating();

    Number_Parts parts;
    switch (spec.type) {
    case 0:
    case u8'n':
    case u8'd':
    case u8'b':
    case u8'o':
    case u8'x':
    case u8'X': {
        if (is_float && (spec.type == 0 || spec.type == u8'n')) {
            const char8_t float_type = spec.type == 0 ? char8_t(0) : u8'g';
            parts = float_parts(
                *arg.to_float(), float_type, sign, spec.alternate, spec.precision, spec.grouping,
                spec.coerce_negative_zero
            );
            break;
        }
        if (is_float || spec.precision || spec.coerce_negative_zero) {
            return Text_Error::format_specifier;
        }
        const char8_t int_type = spec.type == 0 || spec.type == u8'n' ? u8'd' : spec.type;
        if (spec.grouping == u8',' && int_type != u8'd') {
            return Text_Error::format_specifier;
        }
        parts = integer_parts(
            *arg.to_exact_integer(), int_type, sign, spec.alternate, 0, spec.grouping
        );
        break;
    }
    case u8'c': {
        const std::optional<Big_Integer> code_point = arg.to_exact_integer();
        if (!code_point || spec.sign != 0 || spec.alternate || spec.grouping != 0) {
            return Text_Error::format_specifier;
        }
        if (auto r = append_escaped_code_point(parts.digits, *code_point); !r) {
            return r;
        }
        append_padded(out, {}, parts.digits, 1, padding, Alignment::right);
        return {};
    }
    case u8'e':
    case u8'E':
    case u8'f':
    case u8'F':
    case u8'g':
    case u8'G':
    case u8'%': {
        parts = float_parts(
            *arg.to_float(), spec.type, sign, spec.alternate, spec.precision, spec.grouping,
            spec.coerce_negative_zero
        );
        break;
    }
    default: return Text_Error::format_specifier;
    }

    append_padded(out, parts.prefix, parts.digits, parts.digits.size(), padding, Alignment::right);
    return {};
}

struct Brace_Formatter {
private:
    enum struct Numbering : Default_Underlying {
        none,
        automatic,
        manual,
    };

    std::span<const Wrapped_Argument> m_positional;
    std::span<const Named_Argument> m_named;
    Numbering m_numbering = Numbering::none;
    std::size_t m_next_automatic = 0;

public:
    [[nodiscard]]
    Brace_Formatter(
        std::span<const Wrapped_Argument> positional,
        std::span<const Named_Argument> named
    )
        : m_positional { positional }
        , m_named { named }
    {
    }

    /// @brief Formats `format` into `out`.
    /// @param depth The nesting depth of replacement fields,
    /// where zero is the top level and one is within a format spec.
    [[nodiscard]]
    Result<void, Text_Error> operator()(std::u8string& out, std::u8string_view format, int depth)
    {
        while (!format.empty()) {
            const std::size_t brace = format.find_first_of(u8"{}");
            out += format.substr(0, brace);
            if (brace == std::u8string_view::npos) {
                break;
            }
            const char8_t c = format[brace];
            format.remove_prefix(brace + 1);

            if (c == u8'}') {
                if (!format.starts_with(u8'}')) {
                    return Text_Error::format_syntax;
                }
                out.push_back(u8'}');
                format.remove_prefix(1);
                continue;
            }
            if (format.starts_with(u8'{')) {
                out.push_back(u8'{');
                format.remove_prefix(1);
                continue;
            }

            std::size_t level = 1;
            std::size_t end = 0;
            for (; end < format.size(); ++end) {
                if (format[end] == u8'{') {
                    ++level;
                }
                else if (format[end] == u8'}' && --level == 0) {
                    break;
                }
            }
            if (end == format.size()) {
                return Text_Error::format_syntax;
            }
            if (auto r = replace_field(out, format.substr(0, end), depth); !r) {
                return r;
            }
            format.remove_prefix(end + 1);
        }
        return {};
    }

private:
    [[nodiscard]]
    Result<void, Text_Error> replace_field(std::u8string& out, std::u8string_view field, int depth)
    {
        std::size_t name_length = 0;
        bool in_brackets = false;
        for (; name_length < field.size(); ++name_length) {
            const char8_t c = field[name_length];
            if (c == u8'[') {
                in_brackets = true;
            }
            else if (c == u8']') {
                in_brackets = false;
            }
            else if (!in_brackets && (c == u8'!' || c == u8':')) {
                break;
            }
        }
        const std::u8string_view name = field.substr(0, name_length);
        std::u8string_view rest = field.substr(name_length);

        char8_t conversion = 0;
        if (rest.starts_with(u8'!')) {
            if (rest.size() < 2) {
                return Text_Error::format_syntax;
            }
            conversion = rest[1];
            rest.remove_prefix(2);
            if (!rest.empty() && rest.front() != u8':') {
                return Text_Error::format_syntax;
            }
            if (conversion != u8's' && conversion != u8'r' && conversion != u8'a') {
                return Text_Error::format_specifier;
            }
        }
        std::u8string_view spec_text;
        if (rest.starts_with(u8':')) {
            spec_text = rest.substr(1);
        }

        const Result<Wrapped_Argument, Text_Error> arg = resolve_field(name);
        if (!arg) {
            return arg.error();
        }

        std::u8string expanded_spec;
        if (spec_text.contains(u8'{')) {
            if (depth >= 1) {
                return Text_Error::format_specifier;
            }
            if (auto r = (*this)(expanded_spec, spec_text, depth + 1); !r) {
                return r;
            }
            spec_text = expanded_spec;
        }

        if (conversion == 0 && spec_text.empty()) {
            const Result<std::u8string, Text_Error> text = arg->to_text();
            if (!text) {
                return text.error();
            }
            out += *text;
            return {};
        }

        const Result<Brace_Spec, Text_Error> spec = parse_brace_spec(spec_text);
        if (!spec) {
            return spec.error();
        }
        if (conversion == 0 && arg->is_number()) {
            return append_number_with_spec(out, *arg, *spec);
        }
        const Result<std::u8string, Text_Error> text = conversion == 0 || conversion == u8's'
            ? arg->to_text()
            : arg->to_representation(conversion == u8'a');
        if (!text) {
            return text.error();
        }
        return append_text_with_spec(out, *text, *spec);
    }

    [[nodiscard]]
    Result<Wrapped_Argument, Text_Error> positional_argument(std::size_t index)
    {
        if (index >= m_positional.size()) {
            return Text_Error::format_arity;
        }
        return m_positional[index];
    }

    [[nodiscard]]
    Result<Wrapped_Argument, Text_Error> resolve_field(std::u8string_view name)
    {
        const std::size_t first_end = name.find_first_of(u8".[");
        const std::u8string_view first = name.substr(0, first_end);
        std::u8string_view accessors
            = first_end == std::u8string_view::npos ? std::u8string_view {} : name.substr(first_end);

        Result<Wrapped_Argument, Text_Error> current = Text_Error::format_key;
        if (first.empty()) {
            if (m_numbering == Numbering::manual) {
                return Text_Error::format_numbering;
            }
            m_numbering = Numbering::automatic;
            current = positional_argument(m_next_automatic++);
        }
        else if (is_all_digits(first)) {
            if (m_numbering == Numbering::automatic) {
                return Text_Error::format_numbering;
            }
            m_numbering = Numbering::manual;
            std::u8string_view digits = first;
            const std::optional<std::size_t> index = consume_digits(digits);
            if (!index) {
                return Text_Error::format_arity;
            }
            current = positional_argument(*index);
        }
        else {
            // Later arguments with the same name take precedence.
            for (auto it = m_named.rbegin(); it != m_named.rend(); ++it) {
                if (it->name == first) {
                    current = it->value;
                    break;
                }
            }
        }
        if (!current) {
            return current;
        }

        while (!accessors.empty()) {
            if (accessors.front() == u8'.') {
                accessors.remove_prefix(1);
                const std::size_t attribute_end = accessors.find_first_of(u8".[");
                const std::u8string_view attribute = accessors.substr(0, attribute_end);
                if (attribute.empty()) {
                    return Text_Error::format_syntax;
                }
                accessors.remove_prefix(attribute.size());
                current = current->get_attribute(attribute);
            }
            else if (accessors.front() == u8'[') {
                const std::size_t close = accessors.find(u8']');
                if (close == std::u8string_view::npos || close == 1) {
                    return Text_Error::format_syntax;
                }
                const std::u8string_view key = accessors.substr(1, close - 1);
                accessors.remove_prefix(close + 1);
                Value key_value;
                if (is_all_digits(key)) {
                    std::u8string_view digits = key;
                    const std::optional<std::size_t> index = consume_digits(digits);
                    if (!index) {
                        return Text_Error::format_key;
                    }
                    key_value = Value::integer(Integer(*index));
                }
                else {
                    key_value = Value::string(key);
                }
                current = current->get_item(key_value);
            }
            else {
                return Text_Error::format_syntax;
            }
            if (!current) {
                return current;
            }
        }
        return current;
    }
};

} // namespace

Result<void, Text_Error> format_percent(
    std::u8string& out,
    std::u8string_view format,
    std::span<const Wrapped_Argument> positional,
    const Wrapped_Argument* mapping
)
{
    std::u8string result;
    Percent_Formatter formatter { result, format, positional, mapping };
    if (auto r = formatter(); !r) {
        return r;
    }
    out += result;
    return {};
}

Result<void, Text_Error> format_percent(
    std::u8string& out,
    std::u8string_view format,
    std::span<const Named_Argument> named
)
{
    std::u8string result;
    Percent_Formatter formatter { result, format, named };
    if (auto r = formatter(); !r) {
        return r;
    }
    out += result;
    return {};
}

Result<void, Text_Error> format_braced(
    std::u8string& out,
    std::u8string_view format,
    std::span<const Wrapped_Argument> positional,
    std::span<const Named_Argument> named
)
{
    std::u8string result;
    Brace_Formatter formatter { positional, named };
    if (auto r = formatter(result, format, 0); !r) {
        return r;
    }
    out += result;
    return {};
}

} // namespace plume
