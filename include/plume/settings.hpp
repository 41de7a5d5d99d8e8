#ifndef PLUME_SETTINGS_HPP
#define PLUME_SETTINGS_HPP

#include <cstddef>

#ifndef NDEBUG // debug builds
#define PLUME_IF_DEBUG(...) __VA_ARGS__
#define PLUME_IF_NOT_DEBUG(...)
#else // release builds
#define PLUME_IF_DEBUG(...)
#define PLUME_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

namespace plume {

/// @brief The size of the stack buffer used when formatting a single number.
/// This is large enough for any 64-bit integer in base 2 with sign and prefix,
/// and for any `double` in fixed notation with a reasonable precision.
inline constexpr std::size_t number_buffer_size = 512;

/// @brief The greatest precision accepted by numeric format specifications.
/// Larger precisions are rejected as `Text_Error::format_specifier`.
inline constexpr int max_format_precision = 100;

/// @brief The greatest width accepted by format specifications.
inline constexpr std::size_t max_format_width = 1 << 20;

/// @brief The initial capacity reserved for the fragment list of an `Output_Accumulator`.
inline constexpr std::size_t default_fragment_capacity = 64;

} // namespace plume

#endif
