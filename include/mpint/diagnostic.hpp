#ifndef MPINT_DIAGNOSTIC_HPP
#define MPINT_DIAGNOSTIC_HPP

#include <string_view>

#include "mpint/util/severity.hpp"

#include "mpint/fwd.hpp"

namespace mpint {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// FACTORIAL CACHE =================================================================================

/// @brief A factorial was found in the cache.
inline constexpr std::u8string_view factorial_cache_hit = u8"factorial-cache.hit";

/// @brief A factorial was not found in the cache, and was computed and inserted.
inline constexpr std::u8string_view factorial_cache_miss = u8"factorial-cache.miss";

/// @brief A factorial of a negative number was requested.
inline constexpr std::u8string_view factorial_cache_negative = u8"factorial-cache.negative";

// RANDOM ==========================================================================================

/// @brief The random source failed to provide the requested amount of bytes.
inline constexpr std::u8string_view random_source = u8"random.source";

} // namespace diagnostic

} // namespace mpint

#endif
