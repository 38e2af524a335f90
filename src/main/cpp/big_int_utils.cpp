#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "mpint/util/charconv.hpp"
#include "mpint/util/result.hpp"
#include "mpint/util/severity.hpp"
#include "mpint/util/strings.hpp"

#include "mpint/big_int.hpp"
#include "mpint/big_int_error.hpp"
#include "mpint/big_int_utils.hpp"
#include "mpint/diagnostic.hpp"
#include "mpint/services.hpp"
#include "mpint/settings.hpp"

namespace mpint {
namespace {

void log_with_number(
    Logger& logger,
    const Severity severity,
    const std::u8string_view id,
    const std::u8string_view prefix,
    const Int128 number
)
{
    if (!logger.can_log(severity)) {
        return;
    }
    std::u8string message { prefix };
    message += as_u8string_view(to_characters(number).as_string());
    logger.try_log(severity, id, message);
}

} // namespace

// FACTORIAL CACHE =================================================================================

Result<Big_Int, Big_Int_Error> Factorial_Cache::get(const Int64 n)
{
    if (n < 0) {
        log_with_number(
            m_logger, Severity::warning, diagnostic::factorial_cache_negative,
            u8"Factorial of negative number requested: ", n
        );
        return Big_Int_Error::domain;
    }
    const auto key = Uint64(n);
    {
        const std::shared_lock lock { m_mutex };
        if (const auto it = m_values.find(key); it != m_values.end()) {
            log_with_number(
                m_logger, Severity::trace, diagnostic::factorial_cache_hit,
                u8"Found cached factorial of ", n
            );
            return it->second;
        }
    }

    const std::unique_lock lock { m_mutex };
    // Another thread may have computed the value between releasing the shared lock
    // and acquiring the exclusive one.
    if (const auto it = m_values.find(key); it != m_values.end()) {
        return it->second;
    }
    Result<Big_Int, Big_Int_Error> result = Big_Int::factorial(n);
    if (!result) {
        return result;
    }
    ++m_computation_count;
    m_values.emplace(key, *result);
    log_with_number(
        m_logger, Severity::debug, diagnostic::factorial_cache_miss, u8"Computed factorial of ", n
    );
    return result;
}

bool Factorial_Cache::contains(const Int64 n) const
{
    if (n < 0) {
        return false;
    }
    const std::shared_lock lock { m_mutex };
    return m_values.contains(Uint64(n));
}

std::size_t Factorial_Cache::size() const
{
    const std::shared_lock lock { m_mutex };
    return m_values.size();
}

std::size_t Factorial_Cache::computation_count() const
{
    const std::shared_lock lock { m_mutex };
    return m_computation_count;
}

Factorial_Cache& global_factorial_cache()
{
    static Factorial_Cache cache;
    return cache;
}

Result<Big_Int, Big_Int_Error> cached_factorial(const Int64 n)
{
    return global_factorial_cache().get(n);
}

// RANDOM ==========================================================================================

Result<Big_Int, Big_Int_Error> random(const std::size_t size_bytes, const Random_Options& options)
{
    if (size_bytes == 0) {
        return Big_Int::zero();
    }
    std::vector<std::byte> bytes(size_bytes);
    const Result<void, Random_Source_Error> status = options.source(bytes);
    if (!status) {
        if (options.logger.can_log(Severity::error)) {
            std::u8string message = u8"Failed to obtain random bytes: ";
            message += random_source_error_name(status.error());
            options.logger.try_log(Severity::error, diagnostic::random_source, message);
        }
        return Big_Int_Error::random_source;
    }
    return Big_Int::from_buffer(std::span<const std::byte> { bytes }, false);
}

} // namespace mpint
