#ifndef MPINT_SETTINGS_HPP
#define MPINT_SETTINGS_HPP

#include <cstddef>
#include <cstdint>

#include "ulight/impl/platform.h"

namespace mpint {

using Int32 = std::int32_t;
using Int64 = std::int64_t;
using Uint32 = std::uint32_t;
using Uint64 = std::uint64_t;

#if defined(ULIGHT_CLANG) || defined(ULIGHT_GCC)
__extension__ typedef signed __int128 Int128; // NOLINT modernize-use-using
__extension__ typedef unsigned __int128 Uint128; // NOLINT modernize-use-using
#else
#error "mpint currently only supports Clang or GCC."
#endif

/// @brief The size of the stack buffer used when printing large integers.
/// Integers whose digits do not fit are printed into a heap allocation instead.
inline constexpr std::size_t big_int_print_buffer_size = 8192;

/// @brief The maximum amount of bytes requested from the operating system
/// in a single call when drawing random bytes.
inline constexpr std::size_t random_source_chunk_size = 256;

} // namespace mpint

#endif
