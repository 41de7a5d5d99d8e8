#ifndef PLUME_FWD_HPP
#define PLUME_FWD_HPP

#include "plume/settings.hpp"

PLUME_IF_DEBUG() // silence unused warning for settings.hpp

namespace plume {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define PLUME_ENUM_STRING_CASE8(...)                                                               \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Collecting_Logger;
struct Diagnostic;
struct Dict;
struct Escape_Wrapper;
using Float = double;
struct Ignorant_Logger;
enum struct IO_Error_Code : Default_Underlying;
using Integer = long long;
struct List;
struct Logger;
struct Null;
struct Object;
enum struct Output_Language : Default_Underlying;
struct Output_Accumulator;
template <typename, typename>
struct Result;
struct Safe_Text;
enum struct Severity : Default_Underlying;
enum struct Text_Error : Default_Underlying;
enum struct Text_Error_Category : Default_Underlying;
struct Value;
enum struct Value_Kind : Default_Underlying;
struct Valueless_Attribute;
struct Wrapped_Argument;

} // namespace plume

#endif
