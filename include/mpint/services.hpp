#ifndef MPINT_SERVICES_HPP
#define MPINT_SERVICES_HPP

#include <cstddef>
#include <span>
#include <string_view>

#include "mpint/util/assert.hpp"
#include "mpint/util/result.hpp"
#include "mpint/util/severity.hpp"

#include "mpint/diagnostic.hpp"
#include "mpint/fwd.hpp"

namespace mpint {

// LOGGING =========================================================================================

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        MPINT_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Emits a diagnostic with the given `severity`, `id`, and `message`,
    /// but only if `can_log(severity)` is `true`.
    constexpr void
    try_log(Severity severity, std::u8string_view id, std::u8string_view message = {})
    {
        MPINT_DEBUG_ASSERT(severity_is_emittable(severity));
        if (can_log(severity)) {
            (*this)(Diagnostic { .severity = severity, .id = id, .message = message });
        }
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

// RANDOMNESS ======================================================================================

enum struct Random_Source_Error : Default_Underlying {
    /// @brief The source of randomness cannot be accessed at all.
    unavailable,
    /// @brief The source of randomness provided fewer bytes than requested.
    exhausted,
};

[[nodiscard]]
constexpr std::u8string_view random_source_error_name(Random_Source_Error e)
{
    switch (e) {
        using enum Random_Source_Error;
        MPINT_ENUM_STRING_CASE8(unavailable);
        MPINT_ENUM_STRING_CASE8(exhausted);
    }
    MPINT_ASSERT_UNREACHABLE(u8"Invalid error.");
}

/// @brief A source of cryptographically secure random bytes.
struct Random_Source {
    /// @brief Fills `out` with random bytes.
    /// If a failed result is returned, the contents of `out` are unspecified.
    [[nodiscard]]
    virtual Result<void, Random_Source_Error> operator()(std::span<std::byte> out)
        = 0;
};

/// @brief A `Random_Source` which obtains bytes from the operating system,
/// using the `getrandom` system call.
struct System_Random_Source final : Random_Source {
    [[nodiscard]]
    Result<void, Random_Source_Error> operator()(std::span<std::byte> out) final;
};

inline constinit System_Random_Source system_random_source;

/// @brief A `Random_Source` that never provides any bytes.
struct Always_Failing_Random_Source final : Random_Source {
    [[nodiscard]]
    Result<void, Random_Source_Error> operator()(std::span<std::byte>) final
    {
        return Random_Source_Error::unavailable;
    }
};

inline constinit Always_Failing_Random_Source always_failing_random_source;

} // namespace mpint

#endif
