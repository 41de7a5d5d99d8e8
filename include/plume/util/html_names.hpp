#ifndef PLUME_HTML_NAMES_HPP
#define PLUME_HTML_NAMES_HPP

#include <string_view>

#include "ulight/impl/lang/html.hpp"

namespace plume {

/// @brief Returns `true` if `str` is a valid HTML tag identifier.
/// This includes both builtin tag names (which are purely alphabetic)
/// and custom tag names.
[[nodiscard]]
constexpr bool is_html_tag_name(std::u8string_view str)
{
    return ulight::html::is_tag_name(str);
}

/// @brief Returns `true` if `str` is a valid HTML attribute name.
[[nodiscard]]
constexpr bool is_html_attribute_name(std::u8string_view str)
{
    return ulight::html::is_attribute_name(str);
}

namespace html_element {

inline constexpr std::u8string_view a = u8"a";

} // namespace html_element

namespace html_attr {

inline constexpr std::u8string_view href = u8"href";
inline constexpr std::u8string_view title = u8"title";

} // namespace html_attr

} // namespace plume

#endif
