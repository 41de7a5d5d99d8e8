#ifndef PLUME_ASSERT_HPP
#define PLUME_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace plume {

#define PLUME_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define PLUME_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define PLUME_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace plume

#endif
