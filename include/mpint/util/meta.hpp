#ifndef MPINT_META_HPP
#define MPINT_META_HPP

#include <concepts>
#include <type_traits>

#include "mpint/settings.hpp"

namespace mpint {

template <typename T, typename... Us>
concept one_of = (std::same_as<T, Us> || ...);

template <typename T>
concept signed_or_unsigned = one_of<
    T,
    signed char,
    signed short,
    signed int,
    signed long,
    signed long long,
    Int128,
    unsigned char,
    unsigned short,
    unsigned int,
    unsigned long,
    unsigned long long,
    Uint128>;

/// @brief Equivalent to `std::is_signed_v<T>`,
/// but also works for 128-bit integers in strict (non-GNU) language modes.
template <signed_or_unsigned T>
inline constexpr bool is_signed_integer_v = T(-1) < T(0);

} // namespace mpint

#endif
