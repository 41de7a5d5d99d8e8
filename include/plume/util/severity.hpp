#ifndef PLUME_SEVERITY_HPP
#define PLUME_SEVERITY_HPP

#include <compare>
#include <string_view>

#include "plume/fwd.hpp"
#include "plume/plume.h"

namespace plume {

enum struct Severity : Default_Underlying {
    min = PLUME_SEVERITY_MIN,
    trace = PLUME_SEVERITY_TRACE,
    debug = PLUME_SEVERITY_DEBUG,
    info = PLUME_SEVERITY_INFO,
    soft_warning = PLUME_SEVERITY_SOFT_WARNING,
    warning = PLUME_SEVERITY_WARNING,
    error = PLUME_SEVERITY_ERROR,
    fatal = PLUME_SEVERITY_FATAL,
    max = PLUME_SEVERITY_MAX,
    none = PLUME_SEVERITY_NONE,
};

[[nodiscard]]
constexpr std::strong_ordering operator<=>(Severity x, Severity y) noexcept
{
    return Default_Underlying(x) <=> Default_Underlying(y);
}

[[nodiscard]]
constexpr std::u8string_view severity_tag(Severity severity)
{
    using enum Severity;
    switch (severity) {
    case min: return u8"MIN";
    case trace: return u8"TRACE";
    case debug: return u8"DEBUG";
    case info: return u8"INFO";
    case soft_warning: return u8"SOFTWARN";
    case warning: return u8"WARNING";
    case error: return u8"ERROR";
    case fatal: return u8"FATAL";
    case none: break;
    }
    return u8"???";
}

} // namespace plume

#endif
