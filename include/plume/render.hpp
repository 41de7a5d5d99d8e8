#ifndef PLUME_RENDER_HPP
#define PLUME_RENDER_HPP

#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "plume/util/result.hpp"

#include "plume/format.hpp"
#include "plume/fwd.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {

using Template_Variable = std::pair<std::u8string, Value>;

/// @brief Renders the trusted template `source` with the given named `variables`
/// and appends the result to `out` as a single fragment.
///
/// Both syntaxes look names up among the `variables` only,
/// so directives without a name (`%s`, `{}`) fail with `Text_Error::format_arity`
/// regardless of the output language.
/// In HTML mode, variables are escaped on substitution unless they are `Safe_Text`.
/// In text mode, they are substituted verbatim.
///
/// On failure, nothing is appended to `out`.
[[nodiscard]]
Result<void, Text_Error> render_template(
    Output_Accumulator& out,
    std::u8string_view source,
    std::span<const Template_Variable> variables,
    Format_Syntax syntax
);

} // namespace plume

#endif
