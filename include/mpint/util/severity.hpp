#ifndef MPINT_SEVERITY_HPP
#define MPINT_SEVERITY_HPP

#include <string_view>

#include "mpint/fwd.hpp"

namespace mpint {

enum struct Severity : Default_Underlying {
    /// @brief The lowest severity; no diagnostic is emitted with this level.
    min = 0,
    /// @brief Very fine-grained information, such as cache hits.
    trace = 10,
    /// @brief Information which is useful when debugging, such as cache misses.
    debug = 20,
    info = 30,
    soft_warning = 40,
    warning = 50,
    error = 70,
    fatal = 90,
    /// @brief The highest severity that a diagnostic can have.
    max = fatal,
    /// @brief When used as a minimum severity, nothing is logged.
    none = 100,
};

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

/// @brief Returns `true` if a diagnostic with the given severity can be emitted,
/// i.e. if `severity` is neither `min` nor `none`.
[[nodiscard]]
constexpr bool severity_is_emittable(Severity severity)
{
    return severity > Severity::min && severity < Severity::none;
}

} // namespace mpint

#endif
