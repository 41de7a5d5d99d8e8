#ifndef PLUME_TEXT_ERROR_HPP
#define PLUME_TEXT_ERROR_HPP

#include <string_view>

#include "plume/fwd.hpp"

namespace plume {

/// @brief The broad kind of a `Text_Error`.
enum struct Text_Error_Category : Default_Underlying {
    /// @brief An operand which is required to be text is not.
    input_type,
    /// @brief A value's own text conversion failed or produced something other than text.
    conversion,
    /// @brief A formatting template or its arguments were rejected.
    format,
    /// @brief An operation is not supported for the combination of operand types,
    /// such as concatenating two values of which neither is `Safe_Text`.
    unsupported_operation,
};

enum struct Text_Error : Default_Underlying {
    /// @brief An operand is required to be text (or convertible to text) and is not.
    input_type,
    /// @brief The text conversion or representation of an `Object` failed,
    /// or yielded a value which is not text.
    conversion,
    /// @brief A formatting template is malformed,
    /// like `%` at the end of the template, `%y`, or an unmatched `{`.
    format_syntax,
    /// @brief The number of arguments does not match the template.
    /// That is, too few or too many positional arguments, or a positional index out of range.
    format_arity,
    /// @brief A named argument, item, or attribute referenced by the template does not exist.
    format_key,
    /// @brief An argument has the wrong type for its directive,
    /// like `%d` for a string, `%(name)s` without a mapping,
    /// or item access on a value which has no items.
    format_argument_type,
    /// @brief A format specification is invalid, like `{:q}` or a precision which is too large.
    format_specifier,
    /// @brief Automatic field numbering (`{}`) and manual field numbering (`{0}`) were mixed.
    format_numbering,
    /// @brief The operation is unsupported for the given operand types.
    unsupported_operation,
};

[[nodiscard]]
constexpr Text_Error_Category text_error_category(Text_Error error) noexcept
{
    switch (error) {
    case Text_Error::input_type: return Text_Error_Category::input_type;
    case Text_Error::conversion: return Text_Error_Category::conversion;
    case Text_Error::format_syntax:
    case Text_Error::format_arity:
    case Text_Error::format_key:
    case Text_Error::format_argument_type:
    case Text_Error::format_specifier:
    case Text_Error::format_numbering: return Text_Error_Category::format;
    case Text_Error::unsupported_operation: return Text_Error_Category::unsupported_operation;
    }
    return Text_Error_Category::format;
}

/// @brief Returns the diagnostic id of `error`,
/// a dot-separated sequence of identifiers like `format.arity`.
[[nodiscard]]
constexpr std::u8string_view text_error_id(Text_Error error) noexcept
{
    switch (error) {
    case Text_Error::input_type: return u8"text.input-type";
    case Text_Error::conversion: return u8"text.conversion";
    case Text_Error::format_syntax: return u8"format.syntax";
    case Text_Error::format_arity: return u8"format.arity";
    case Text_Error::format_key: return u8"format.key";
    case Text_Error::format_argument_type: return u8"format.argument-type";
    case Text_Error::format_specifier: return u8"format.specifier";
    case Text_Error::format_numbering: return u8"format.numbering";
    case Text_Error::unsupported_operation: return u8"text.unsupported-operation";
    }
    return u8"text.unknown";
}

[[nodiscard]]
constexpr std::u8string_view text_error_message(Text_Error error) noexcept
{
    switch (error) {
    case Text_Error::input_type: return u8"A text operand was required.";
    case Text_Error::conversion: return u8"The conversion of a value to text failed.";
    case Text_Error::format_syntax: return u8"The format template is malformed.";
    case Text_Error::format_arity:
        return u8"The number of arguments does not match the format template.";
    case Text_Error::format_key:
        return u8"The format template refers to a key or attribute which does not exist.";
    case Text_Error::format_argument_type:
        return u8"A format argument has the wrong type for its directive.";
    case Text_Error::format_specifier: return u8"Invalid format specification.";
    case Text_Error::format_numbering:
        return u8"Cannot switch between automatic and manual field numbering.";
    case Text_Error::unsupported_operation:
        return u8"The operation is not supported for these operand types.";
    }
    return u8"Unknown error.";
}

} // namespace plume

#endif
