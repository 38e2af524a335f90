#ifndef MPINT_BIG_INT_UTILS_HPP
#define MPINT_BIG_INT_UTILS_HPP

#include <cstddef>
#include <shared_mutex>
#include <unordered_map>

#include "mpint/util/result.hpp"

#include "mpint/big_int.hpp"
#include "mpint/big_int_error.hpp"
#include "mpint/fwd.hpp"
#include "mpint/services.hpp"
#include "mpint/settings.hpp"

namespace mpint {

// FACTORIAL CACHE =================================================================================

/// @brief A thread-safe, lazily populated mapping from `n` to `n!`.
/// Entries are never evicted, and every factorial is computed at most once
/// over the lifetime of the cache, even if it is first requested by multiple threads at once.
///
/// The `Logger` passed on construction may be invoked concurrently
/// if the cache is accessed from multiple threads.
struct Factorial_Cache {
private:
    Logger& m_logger;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<Uint64, Big_Int> m_values;
    std::size_t m_computation_count = 0;

public:
    [[nodiscard]]
    explicit Factorial_Cache(Logger& logger = ignorant_logger)
        : m_logger { logger }
    {
    }

    Factorial_Cache(const Factorial_Cache&) = delete;
    Factorial_Cache& operator=(const Factorial_Cache&) = delete;

    /// @brief Returns `n!`, computing and storing it first if not already present.
    /// Fails with `Big_Int_Error::domain` if `n` is negative.
    [[nodiscard]]
    Result<Big_Int, Big_Int_Error> get(Int64 n);

    /// @brief Returns `true` if `n!` has already been computed.
    [[nodiscard]]
    bool contains(Int64 n) const;

    /// @brief Returns the amount of stored factorials.
    [[nodiscard]]
    std::size_t size() const;

    /// @brief Returns the amount of times that a factorial had to be computed.
    /// This is equal to `size()` because no entry is ever computed twice or evicted.
    [[nodiscard]]
    std::size_t computation_count() const;
};

/// @brief Returns the process-wide factorial cache,
/// which is created on first use and never destroyed before program exit.
[[nodiscard]]
Factorial_Cache& global_factorial_cache();

/// @brief Equivalent to `global_factorial_cache().get(n)`.
[[nodiscard]]
Result<Big_Int, Big_Int_Error> cached_factorial(Int64 n);

// GCD =============================================================================================

/// @brief Returns the greatest common divisor of `a` and `b`, which is never negative.
/// If any operand is textual, returns a `Result`
/// which fails with `Big_Int_Error::parse` if that operand is not a decimal number.
template <big_int_operand A, big_int_operand B>
[[nodiscard]]
auto gcd(const A& a, const B& b)
{
    if constexpr (textual_big_int_operand<A>) {
        using result_type = Result<Big_Int, Big_Int_Error>;
        const result_type x = to_big_int(a);
        if (!x) {
            return result_type(error_tag, x.error());
        }
        return result_type(x->gcd(b));
    }
    else {
        return to_big_int(a).gcd(b);
    }
}

// RANDOM ==========================================================================================

struct Random_Options {
    /// @brief The source of random bytes.
    Random_Source& source = system_random_source;
    /// @brief Receives a diagnostic if `source` fails.
    Logger& logger = ignorant_logger;
};

/// @brief Returns a random non-negative integer made of `size_bytes` bytes
/// obtained from `options.source`,
/// i.e. a value in range `[0, pow(2, 8 * size_bytes))`.
/// If `size_bytes` is zero, the result is zero and no bytes are requested.
/// Fails with `Big_Int_Error::random_source` if the source fails.
[[nodiscard]]
Result<Big_Int, Big_Int_Error> random(std::size_t size_bytes, const Random_Options& options = {});

} // namespace mpint

#endif
