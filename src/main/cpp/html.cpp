#include <algorithm>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <boost/regex.hpp>

#include "plume/util/html_names.hpp"
#include "plume/util/result.hpp"
#include "plume/util/strings.hpp"
#include "plume/util/url_encode.hpp"

#include "plume/escape.hpp"
#include "plume/html.hpp"
#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {

Result<Safe_Text, Text_Error>
html_tag(std::u8string_view tag, std::span<const Html_Attribute> attributes, bool xml_end)
{
    if (!is_html_tag_name(tag)) {
        return Text_Error::input_type;
    }
    std::u8string result = u8"<";
    result += tag;
    for (const auto& [name, value] : attributes) {
        if (!is_html_attribute_name(name)) {
            return Text_Error::input_type;
        }
        if (std::holds_alternative<Valueless_Attribute>(value)) {
            result += u8' ';
            result += name;
            result += u8"=\"";
            result += name;
            result += u8'"';
            continue;
        }
        const Value& v = std::get<Value>(value);
        if (v.is_null()) {
            continue;
        }
        const Result<Safe_Text, Text_Error> escaped = Safe_Text::from_raw(v);
        if (!escaped) {
            return escaped.error();
        }
        result += u8' ';
        result += name;
        result += u8"=\"";
        result += escaped->get_text();
        result += u8'"';
    }
    result += xml_end ? u8" />" : u8">";
    return Safe_Text::trusted(std::move(result));
}

Result<Safe_Text, Text_Error> href(
    const Value& url,
    const Value& text,
    const Value& title,
    std::span<const Html_Attribute> attributes
)
{
    std::vector<Html_Attribute> all_attributes;
    all_attributes.reserve(attributes.size() + 2);
    all_attributes.push_back({ .name = html_attr::href, .value = url });
    all_attributes.push_back({ .name = html_attr::title, .value = title });
    all_attributes.insert(all_attributes.end(), attributes.begin(), attributes.end());

    const Result<Safe_Text, Text_Error> open = html_tag(html_element::a, all_attributes);
    if (!open) {
        return open;
    }
    const Result<Safe_Text, Text_Error> content = Safe_Text::from_raw(text);
    if (!content) {
        return content;
    }
    return *open + *content + Safe_Text::trusted(u8"</a>");
}

Result<std::u8string, Text_Error> url_quote(const Value& value)
{
    if (value.is_null()) {
        return Text_Error::input_type;
    }
    const Result<std::u8string, Text_Error> text = stringify(value);
    if (!text) {
        return text;
    }
    std::u8string result;
    url_encode_if(result, *text, [](char8_t c) { return !is_url_quote_safe_set.contains(c); });
    return result;
}

Result<std::u8string, Text_Error> url_quote(const Value& value, std::u8string_view fallback)
{
    if (value.is_null()) {
        return std::u8string { fallback };
    }
    return url_quote(value);
}

Result<Safe_Text, Text_Error> url_with_query(const Value& path, const Dict& query)
{
    Result<std::u8string, Text_Error> result = url_quote(path);
    if (!result) {
        return result.error();
    }
    if (query.entries.empty()) {
        return Safe_Text::trusted(std::move(*result));
    }

    std::vector<const std::pair<std::u8string, Value>*> sorted;
    sorted.reserve(query.entries.size());
    for (const auto& entry : query.entries) {
        sorted.push_back(&entry);
    }
    std::ranges::stable_sort(sorted, {}, [](const auto* entry) -> const std::u8string& {
        return entry->first;
    });

    result->push_back(u8'?');
    bool first = true;
    for (const auto* const entry : sorted) {
        if (!first) {
            result->append(u8"&amp;");
        }
        first = false;
        const Result<std::u8string, Text_Error> key = url_quote(Value::string(entry->first));
        const Result<std::u8string, Text_Error> value = url_quote(entry->second);
        if (!key || !value) {
            return !key ? key.error() : value.error();
        }
        // Quoted text contains no markup characters, so no escaping is needed.
        *result += *key;
        result->push_back(u8'=');
        *result += *value;
    }
    return Safe_Text::trusted(std::move(*result));
}

Result<Safe_Text, Text_Error> nl2br(const Value& value)
{
    const Result<Safe_Text, Text_Error> text = Safe_Text::from_raw(value);
    if (!text) {
        return text;
    }
    return Safe_Text::trusted(replace_all(text->get_text(), u8"\n", u8"<br />\n"));
}

Result<Safe_Text, Text_Error> js_escape(const Value& value)
{
    const Result<std::u8string, Text_Error> text = stringify(value);
    if (!text) {
        return text.error();
    }
    static const boost::regex etago { "</" };
    const std::string escaped = boost::regex_replace(
        std::string { as_string_view(*text) }, etago, "<\\/", boost::format_literal
    );
    return Safe_Text::trusted(as_u8string_view(escaped));
}

} // namespace plume
