#ifndef MPINT_FWD_HPP
#define MPINT_FWD_HPP

#include "mpint/settings.hpp"

MPINT_IF_DEBUG() // silence unused warning for settings.hpp

namespace mpint {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define MPINT_ENUM_STRING_CASE(...)                                                                \
    case __VA_ARGS__: return #__VA_ARGS__

#define MPINT_ENUM_STRING_CASE8(...)                                                               \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Always_Failing_Random_Source;
struct Big_Int;
enum struct Big_Int_Error : Default_Underlying;
struct Collecting_Logger;
template <typename>
struct Conversion_Result;
struct Diagnostic;
enum struct Div_Rounding : Default_Underlying;
template <typename, typename>
struct Div_Result;
struct Factorial_Cache;
struct Ignorant_Logger;
struct Logger;
struct Random_Options;
struct Random_Source;
enum struct Random_Source_Error : Default_Underlying;
template <typename, typename>
struct Result;
enum struct Severity : Default_Underlying;
struct System_Random_Source;

namespace detail {

struct Big_Int_Backend;

} // namespace detail

} // namespace mpint

#endif
