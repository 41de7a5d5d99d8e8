#include <cstddef>
#include <string>
#include <string_view>

#include <unicode/uchar.h>

#include "plume/util/assert.hpp"
#include "plume/util/case_transform.hpp"
#include "plume/util/chars.hpp"
#include "plume/util/unicode.hpp"

namespace plume {

char32_t simple_to_lower(char32_t c) noexcept
{
    if (is_ascii(c)) {
        return char32_t(to_ascii_lower(char8_t(c)));
    }
    return char32_t(u_tolower(UChar32(c)));
}

char32_t simple_to_upper(char32_t c) noexcept
{
    if (is_ascii(c)) {
        return char32_t(to_ascii_upper(char8_t(c)));
    }
    return char32_t(u_toupper(UChar32(c)));
}

void append_case_transformed(
    std::u8string& out,
    std::u8string_view str,
    Text_Transformation transform
)
{
    out.reserve(out.size() + str.size());

    bool first = true;
    while (!str.empty()) {
        const auto [point, length] = utf8::decode_and_length_or_replacement(str);
        PLUME_ASSERT(length != 0);
        const auto units = std::size_t(length);

        // Invalid sequences decode to U+FFFD, which has no case mapping anyway,
        // so the original code units are preserved.
        const bool to_upper = transform == Text_Transformation::uppercase
            || (transform == Text_Transformation::capitalize && first);
        const char32_t transformed = to_upper ? simple_to_upper(point) : simple_to_lower(point);
        if (transformed == point) {
            out.append(str.substr(0, units));
        }
        else {
            const utf8::Code_Units_And_Length encoded = utf8::encode8_unchecked(transformed);
            out.append(encoded.as_string());
        }

        str.remove_prefix(units);
        first = false;
    }
}

} // namespace plume
