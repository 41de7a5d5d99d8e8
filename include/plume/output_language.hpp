#ifndef PLUME_OUTPUT_LANGUAGE_HPP
#define PLUME_OUTPUT_LANGUAGE_HPP

#include <string_view>

#include "plume/fwd.hpp"
#include "plume/plume.h"

namespace plume {

enum struct Output_Language : Default_Underlying {
    /// @brief Plaintext output.
    /// Fragments are kept as they are,
    /// which is used e.g. for e-mail bodies or other places
    /// where markup has no meaning.
    text = PLUME_OUTPUT_TEXT,
    /// @brief HTML output.
    /// Fragments which are not `Safe_Text` are escaped.
    html = PLUME_OUTPUT_HTML,
};

[[nodiscard]]
constexpr std::u8string_view output_language_name(Output_Language language) noexcept
{
    switch (language) {
    case Output_Language::text: return u8"text";
    case Output_Language::html: return u8"html";
    }
    return u8"???";
}

} // namespace plume

#endif
