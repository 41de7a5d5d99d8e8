#ifndef PLUME_DIAGNOSTIC_HPP
#define PLUME_DIAGNOSTIC_HPP

#include <string_view>

#include "plume/util/severity.hpp"

#include "plume/fwd.hpp"

namespace plume {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// This shall be in the range [`Severity::min`, `Severity::max`].
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

/// @brief A file could not be read.
inline constexpr std::u8string_view file_read = u8"file.read";
/// @brief A file could not be written.
inline constexpr std::u8string_view file_write = u8"file.write";

/// @brief A `-D` variable definition is not of the form `name=value`.
inline constexpr std::u8string_view variable_invalid = u8"variable.invalid";
/// @brief The same variable was defined more than once.
inline constexpr std::u8string_view variable_duplicate = u8"variable.duplicate";

/// @brief Rendering a template failed.
/// The message carries the `text_error_id` of the underlying error.
inline constexpr std::u8string_view render_failed = u8"render.failed";

} // namespace diagnostic

} // namespace plume

#endif
