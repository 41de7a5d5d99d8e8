#ifndef PLUME_H
#define PLUME_H

#ifdef __cplusplus
extern "C" {
#endif

// NOLINTNEXTLINE(performance-enum-size)
enum plume_severity {
    PLUME_SEVERITY_MIN = 0,
    PLUME_SEVERITY_TRACE = 10,
    PLUME_SEVERITY_DEBUG = 20,
    PLUME_SEVERITY_INFO = 30,
    PLUME_SEVERITY_SOFT_WARNING = 40,
    PLUME_SEVERITY_WARNING = 50,
    PLUME_SEVERITY_ERROR = 70,
    PLUME_SEVERITY_FATAL = 90,
    PLUME_SEVERITY_MAX = 90,
    PLUME_SEVERITY_NONE = 100,
};

// NOLINTNEXTLINE(performance-enum-size)
enum plume_output_language {
    /// @brief Plaintext output.
    /// Fragments are written as they are, without any escaping.
    PLUME_OUTPUT_TEXT = 1,
    /// @brief HTML output.
    /// Fragments which are not already safe HTML are escaped.
    PLUME_OUTPUT_HTML = 2,
};

#ifdef __cplusplus
}
#endif

#endif
