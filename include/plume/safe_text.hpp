#ifndef PLUME_SAFE_TEXT_HPP
#define PLUME_SAFE_TEXT_HPP

#include <compare>
#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "plume/util/result.hpp"

#include "plume/fwd.hpp"
#include "plume/text_error.hpp"

namespace plume {

/// @brief Immutable text which is known to be safe for inclusion in HTML.
///
/// Outside of the entities `&amp;`, `&lt;`, `&gt;`, and `&quot;`,
/// the text contains no `&`, `<`, `>`, or `"` which did not already exist in trusted input.
/// Trusted input is either a string explicitly wrapped with `Safe_Text::trusted`
/// (such as the literal markup of a template),
/// or another `Safe_Text`.
/// All other text which flows into a `Safe_Text` (through concatenation, joining, formatting, etc.)
/// is escaped exactly once on the way in.
///
/// Comparison and hashing only consider the underlying text,
/// so `Safe_Text::escaped(u8"<")` compares equal to the plain string `u8"&lt;"`.
struct Safe_Text {
private:
    std::u8string m_text;

    [[nodiscard]]
    explicit Safe_Text(std::u8string&& text) noexcept
        : m_text { std::move(text) }
    {
    }

public:
    /// @brief Constructs empty text.
    [[nodiscard]]
    Safe_Text() noexcept
        = default;

    /// @brief Returns `text` as `Safe_Text` without escaping it.
    /// This is used for the literal markup of templates;
    /// the caller vouches for the absence of unintended markup.
    [[nodiscard]]
    static Safe_Text trusted(std::u8string_view text)
    {
        return Safe_Text { std::u8string { text } };
    }

    [[nodiscard]]
    static Safe_Text trusted(std::u8string&& text) noexcept
    {
        return Safe_Text { std::move(text) };
    }

    [[nodiscard]]
    static Safe_Text trusted(const char8_t* text)
    {
        return trusted(std::u8string_view { text });
    }

    /// @brief Returns raw `text` escaped as `Safe_Text`.
    [[nodiscard]]
    static Safe_Text escaped(std::u8string_view text);

    /// @brief Returns `value` if it is already `Safe_Text`,
    /// otherwise its text conversion, escaped (see `append_stringified_escaped`).
    [[nodiscard]]
    static Result<Safe_Text, Text_Error> from_raw(const Value& value);

    /// @brief Returns the underlying, already escaped text.
    [[nodiscard]]
    std::u8string_view get_text() const noexcept
    {
        return m_text;
    }

    /// @brief Moves the underlying text out of this object,
    /// leaving it empty.
    [[nodiscard]]
    std::u8string release() && noexcept
    {
        return std::move(m_text);
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_text.empty();
    }

    /// @brief Returns the length in code units.
    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_text.size();
    }

    /// @brief Returns the length in code points.
    [[nodiscard]]
    std::size_t length() const noexcept;

    /// @brief Returns this text repeated `n` times, or empty text if `n <= 0`.
    /// Repetition of safe text cannot produce new markup, so nothing is escaped.
    [[nodiscard]]
    Safe_Text repeat(Integer n) const;

    /// @brief Joins the `parts` using this text as a separator.
    /// `Safe_Text` parts are used as-is, string parts are escaped,
    /// and any other part results in `Text_Error::input_type`.
    [[nodiscard]]
    Result<Safe_Text, Text_Error> join(std::span<const Value> parts) const;

    /// @brief Like the overload taking a span, but `parts` shall be a list.
    /// Otherwise, the result is `Text_Error::input_type`.
    [[nodiscard]]
    Result<Safe_Text, Text_Error> join(const Value& parts) const;

    /// @brief Percent-style formatting with positional arguments,
    /// with this text as the trusted template.
    /// For example, `trusted(u8"<b>%s</b>").format(...)` with the string `<i>`
    /// yields `<b>&lt;i&gt;</b>`.
    /// Every argument is escaped exactly once, except for `Safe_Text` arguments,
    /// which are inserted verbatim, and numbers, which need no escaping.
    [[nodiscard]]
    Result<Safe_Text, Text_Error> format(std::span<const Value> args) const;

    /// @brief Percent-style formatting where `args` is interpreted as follows:
    /// a list supplies positional arguments,
    /// a dict supplies named arguments (`%(name)s`),
    /// and any other value is the single positional argument.
    [[nodiscard]]
    Result<Safe_Text, Text_Error> format(const Value& args) const;

    /// @brief Percent-style formatting with named arguments, like `%(name)s`.
    /// A directive without a name (like `%s`) formats the `mapping` itself.
    [[nodiscard]]
    Result<Safe_Text, Text_Error> format_named(const Dict& mapping) const;

    /// @brief Brace-style formatting, like `{}`, `{0}`, `{name}`, or `{name[key]:>10}`.
    [[nodiscard]]
    Result<Safe_Text, Text_Error> format_braced(std::span<const Value> args) const;

    /// @brief Brace-style formatting with positional and named arguments.
    [[nodiscard]]
    Result<Safe_Text, Text_Error>
    format_braced(std::span<const Value> args, const Dict& named_args) const;

    /// @brief Returns `true` iff this text starts with `raw`, after escaping `raw`.
    [[nodiscard]]
    bool starts_with(std::u8string_view raw) const;
    [[nodiscard]]
    bool starts_with(const Safe_Text& prefix) const noexcept
    {
        return m_text.starts_with(prefix.m_text);
    }
    /// @brief Like the other overloads, but fails with `Text_Error::input_type`
    /// if `probe` is neither a string nor `Safe_Text`.
    [[nodiscard]]
    Result<bool, Text_Error> starts_with(const Value& probe) const;

    /// @brief Returns `true` iff this text ends with `raw`, after escaping `raw`.
    [[nodiscard]]
    bool ends_with(std::u8string_view raw) const;
    [[nodiscard]]
    bool ends_with(const Safe_Text& suffix) const noexcept
    {
        return m_text.ends_with(suffix.m_text);
    }
    [[nodiscard]]
    Result<bool, Text_Error> ends_with(const Value& probe) const;

    /// @brief Replaces occurrences of `old_text` with `new_text`,
    /// where both are escaped first.
    /// At most `limit` replacements are made, or all if `limit` is negative.
    /// Because the search happens in escaped space,
    /// replacing `&` matches the entity `&amp;`, never the ampersand of another entity.
    [[nodiscard]]
    Safe_Text
    replace(std::u8string_view old_text, std::u8string_view new_text, long long limit = -1) const;

    /// @brief Like the overload taking raw strings, but either operand may be `Safe_Text`,
    /// in which case it is used as-is.
    /// Operands which are neither strings nor `Safe_Text` result in `Text_Error::input_type`.
    [[nodiscard]]
    Result<Safe_Text, Text_Error>
    replace(const Value& old_text, const Value& new_text, long long limit = -1) const;

    [[nodiscard]]
    Safe_Text lower() const;
    [[nodiscard]]
    Safe_Text upper() const;
    /// @brief Returns this text with the first code point uppercased
    /// and all others lowercased.
    [[nodiscard]]
    Safe_Text capitalize() const;

    /// @brief Returns a diagnostic representation, like `<safe_text 'a&amp;b'>`.
    /// The result is meant for debugging and logging, not for output into HTML.
    [[nodiscard]]
    std::u8string representation() const;

    [[nodiscard]]
    friend bool operator==(const Safe_Text&, const Safe_Text&) = default;
    [[nodiscard]]
    friend std::strong_ordering operator<=>(const Safe_Text&, const Safe_Text&) = default;

    [[nodiscard]]
    friend bool operator==(const Safe_Text& x, std::u8string_view y) noexcept
    {
        return x.get_text() == y;
    }
    [[nodiscard]]
    friend std::strong_ordering operator<=>(const Safe_Text& x, std::u8string_view y) noexcept
    {
        return x.get_text() <=> y;
    }

    [[nodiscard]]
    friend Safe_Text operator+(const Safe_Text& x, const Safe_Text& y)
    {
        std::u8string result;
        result.reserve(x.size() + y.size());
        result += x.m_text;
        result += y.m_text;
        return Safe_Text { std::move(result) };
    }

    /// @brief Appends raw text `y`, escaped.
    [[nodiscard]]
    friend Safe_Text operator+(const Safe_Text& x, std::u8string_view y);
    /// @brief Prepends raw text `x`, escaped.
    [[nodiscard]]
    friend Safe_Text operator+(std::u8string_view x, const Safe_Text& y);

    [[nodiscard]]
    friend Safe_Text operator*(const Safe_Text& x, Integer n)
    {
        return x.repeat(n);
    }
};

/// @brief Concatenates two values, of which at least one shall be `Safe_Text`.
/// If both are `Safe_Text`, their texts are concatenated.
/// If one is `Safe_Text` and the other is a string, the string is escaped first.
/// In any other case, the result is `Text_Error::unsupported_operation`,
/// which the caller may report as an unsupported operand combination.
[[nodiscard]]
Result<Safe_Text, Text_Error> concat(const Value& x, const Value& y);

} // namespace plume

template <>
struct std::hash<plume::Safe_Text> {
    [[nodiscard]]
    std::size_t operator()(const plume::Safe_Text& text) const noexcept
    {
        return std::hash<std::u8string_view> {}(text.get_text());
    }
};

#endif
