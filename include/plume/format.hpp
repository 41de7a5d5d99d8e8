#ifndef PLUME_FORMAT_HPP
#define PLUME_FORMAT_HPP

#include <span>
#include <string>
#include <string_view>

#include "plume/util/result.hpp"

#include "plume/escape_wrapper.hpp"
#include "plume/fwd.hpp"
#include "plume/text_error.hpp"

namespace plume {

struct Named_Argument {
    std::u8string_view name;
    Wrapped_Argument value;
};

enum struct Format_Syntax : Default_Underlying {
    /// @brief `printf`-like directives such as `%s`, `%-5d`, or `%(name)r`.
    percent,
    /// @brief Replacement fields such as `{}`, `{0}`, `{name.attr[key]!r:>10}`.
    brace,
};

/// @brief Substitutes the percent-style directives in the trusted template `format`
/// and appends the result to `out`.
///
/// Directives have the form `%[(key)][flags][width][.precision]conversion`,
/// where the flags are any of `-`, `+`, space, `0`, and `#`,
/// the width and precision may be `*` to take them from the next positional argument,
/// and the conversion is one of `s`, `r`, `a`, `d`, `i`, `u`, `o`, `x`, `X`, `e`, `E`, `f`, `F`,
/// `g`, `G`, `c`, or `%`.
///
/// Directives without a key consume the `positional` arguments in order,
/// and all of them must be consumed unless a `mapping` is given.
/// Directives with a key look the key up as an item of `mapping`;
/// without a mapping, they fail with `Text_Error::format_argument_type`.
///
/// The text of the arguments is obtained through `Wrapped_Argument`,
/// so it is escaped unless the argument is trusted.
/// The text of the template itself is copied as-is.
///
/// On failure, `out` is left unchanged.
[[nodiscard]]
Result<void, Text_Error> format_percent(
    std::u8string& out,
    std::u8string_view format,
    std::span<const Wrapped_Argument> positional,
    const Wrapped_Argument* mapping = nullptr
);

/// @brief Like the overload with a mapping,
/// but keys are looked up among the `named` arguments, where later arguments take precedence.
/// There are no positional arguments, and a missing key is `Text_Error::format_key`.
[[nodiscard]]
Result<void, Text_Error> format_percent(
    std::u8string& out,
    std::u8string_view format,
    std::span<const Named_Argument> named
);

/// @brief Substitutes the brace-style replacement fields in the trusted template `format`
/// and appends the result to `out`.
///
/// Replacement fields have the form `{[field][!conversion][:spec]}`,
/// where `field` is empty (automatic numbering), a decimal index (manual numbering),
/// or the name of a `named` argument,
/// followed by any number of `.attribute` or `[key]` accessors.
/// The conversion is one of `s`, `r`, or `a`.
/// A format specification has the form `[[fill]align][sign][z][#][0][width][grouping][.precision][type]`,
/// and may itself contain replacement fields, like `{:>{width}}`.
/// `{{` and `}}` stand for literal braces.
///
/// On failure, `out` is left unchanged.
[[nodiscard]]
Result<void, Text_Error> format_braced(
    std::u8string& out,
    std::u8string_view format,
    std::span<const Wrapped_Argument> positional,
    std::span<const Named_Argument> named = {}
);

} // namespace plume

#endif
