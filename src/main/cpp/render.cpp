#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "plume/util/result.hpp"

#include "plume/escape_wrapper.hpp"
#include "plume/format.hpp"
#include "plume/output_accumulator.hpp"
#include "plume/output_language.hpp"
#include "plume/render.hpp"
#include "plume/safe_text.hpp"
#include "plume/text_error.hpp"
#include "plume/value.hpp"

namespace plume {

Result<void, Text_Error> render_template(
    Output_Accumulator& out,
    std::u8string_view source,
    std::span<const Template_Variable> variables,
    Format_Syntax syntax
)
{
    const bool html = out.get_language() == Output_Language::html;

    std::vector<Named_Argument> named;
    named.reserve(variables.size());
    for (const auto& [name, value] : variables) {
        if (html) {
            named.push_back({ name, wrap(value) });
            continue;
        }
        Result<Wrapped_Argument, Text_Error> arg = wrap_verbatim(value);
        if (!arg) {
            return arg.error();
        }
        named.push_back({ name, std::move(*arg) });
    }

    std::u8string text;
    const Result<void, Text_Error> result = syntax == Format_Syntax::percent
        ? format_percent(text, source, named)
        : format_braced(text, source, {}, named);
    if (!result) {
        return result;
    }
    if (html) {
        out.append(Safe_Text::trusted(std::move(text)));
    }
    else {
        out.append(std::u8string_view { text });
    }
    return {};
}

} // namespace plume
