#ifndef PLUME_HTML_HPP
#define PLUME_HTML_HPP

#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "plume/util/result.hpp"

#include "plume/fwd.hpp"
#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {

/// @brief Marks an attribute without a value, like `checked` or `disabled`.
/// Such attributes are written as `checked="checked"`, which is valid in both HTML and XHTML.
struct Valueless_Attribute {
    friend bool operator==(Valueless_Attribute, Valueless_Attribute) = default;
};

struct Html_Attribute {
    std::u8string_view name;
    /// @brief The attribute value.
    /// Null values cause the attribute to be omitted.
    std::variant<Value, Valueless_Attribute> value;
};

/// @brief Returns an opening tag like `<a href="x" title="y">`,
/// or a self-closing tag like `<br />` if `xml_end` is `true`.
/// Attribute values are converted to text and escaped (unless they are `Safe_Text`).
/// Fails with `Text_Error::input_type` if `tag` or an attribute name is not a valid HTML name.
[[nodiscard]]
Result<Safe_Text, Text_Error>
html_tag(std::u8string_view tag, std::span<const Html_Attribute> attributes = {}, bool xml_end = false);

/// @brief Returns a link like `<a href="url" title="title">text</a>`,
/// where `text` is escaped.
/// A null `title` is omitted.
/// Additional `attributes` follow the `title`.
[[nodiscard]]
Result<Safe_Text, Text_Error> href(
    const Value& url,
    const Value& text,
    const Value& title = Value::null,
    std::span<const Html_Attribute> attributes = {}
);

/// @brief Percent-encodes the text of `value` for use within a URL,
/// like `foo%20bar` for `foo bar`.
/// Unreserved characters and `/` are kept;
/// everything else (including non-ASCII code units) is encoded.
/// Fails with `Text_Error::input_type` if `value` is null.
[[nodiscard]]
Result<std::u8string, Text_Error> url_quote(const Value& value);

/// @brief Like the other overload, but if `value` is null, returns `fallback` as-is.
[[nodiscard]]
Result<std::u8string, Text_Error> url_quote(const Value& value, std::u8string_view fallback);

/// @brief Returns `path` with a query string, like `/search?lang=en&amp;q=foo%20bar`.
/// The path, keys, and values are quoted with `url_quote`,
/// the parameters are sorted by key,
/// and the separating `&` is escaped.
/// If `query` is empty, there is no `?`.
[[nodiscard]]
Result<Safe_Text, Text_Error> url_with_query(const Value& path, const Dict& query);

/// @brief Returns `value` escaped, with `<br />` inserted before every line feed.
[[nodiscard]]
Result<Safe_Text, Text_Error> nl2br(const Value& value);

/// @brief Returns the text of `value` with every `</` replaced by `<\/`,
/// so that it can be embedded within a `<script>` element
/// without ending the element prematurely.
///
/// Nothing else is escaped; the text of `value` is assumed to be trusted script source.
[[nodiscard]]
Result<Safe_Text, Text_Error> js_escape(const Value& value);

} // namespace plume

#endif
