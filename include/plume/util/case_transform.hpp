#ifndef PLUME_CASE_TRANSFORM_HPP
#define PLUME_CASE_TRANSFORM_HPP

#include <string>
#include <string_view>

namespace plume {

/// @brief Returns the value of the `Simple_Uppercase_Mapping` property of `c`,
/// or `c` itself if `c` is not a code point with such a property.
[[nodiscard]]
char32_t simple_to_upper(char32_t c) noexcept;

/// @brief Returns the value of the `Simple_Lowercase_Mapping` property of `c`,
/// or `c` itself if `c` is not a code point with such a property.
[[nodiscard]]
char32_t simple_to_lower(char32_t c) noexcept;

enum struct Text_Transformation : unsigned char {
    lowercase,
    uppercase,
    /// @brief The first code point is uppercased, all following ones lowercased.
    capitalize,
};

/// @brief Appends `str` to `out`, with each code point transformed according to `transform`.
/// Code units which do not form valid UTF-8 are appended unchanged.
/// None of the case mappings involve ASCII punctuation,
/// so HTML markup characters never appear or disappear.
void append_case_transformed(
    std::u8string& out,
    std::u8string_view str,
    Text_Transformation transform
);

} // namespace plume

#endif
