#ifndef MPINT_BIG_INT_OPS_HPP
#define MPINT_BIG_INT_OPS_HPP

#include <string>
#include <string_view>

#include "mpint/big_int.hpp"

namespace mpint {

/// @brief Returns the digits of `x` in the given `base`,
/// with a leading `-` for negative numbers.
[[nodiscard]]
inline std::string to_string(const Big_Int& x, const int base = 10, const bool to_upper = false)
{
    std::string result;
    x.print_to([&](const std::string_view str) { result += str; }, base, to_upper);
    return result;
}

[[nodiscard]]
inline std::u8string to_u8string(const Big_Int& x, const int base = 10, const bool to_upper = false)
{
    std::u8string result;
    x.print_to([&](const std::u8string_view str) { result += str; }, base, to_upper);
    return result;
}

} // namespace mpint

#endif
