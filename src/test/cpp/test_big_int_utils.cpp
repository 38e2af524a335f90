#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <ostream>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "mpint/util/result.hpp"
#include "mpint/util/severity.hpp"

#include "mpint/big_int.hpp"
#include "mpint/big_int_error.hpp"
#include "mpint/big_int_ops.hpp"
#include "mpint/big_int_utils.hpp"
#include "mpint/diagnostic.hpp"
#include "mpint/services.hpp"

#include "collecting_logger.hpp"

namespace mpint {

// NOLINTNEXTLINE(misc-use-internal-linkage)
std::ostream& operator<<(std::ostream&, const Big_Int&);

namespace {

/// @brief Fills every requested byte with the same value.
struct Constant_Random_Source final : Random_Source {
    std::byte value;
    std::size_t requested_bytes = 0;

    [[nodiscard]]
    explicit Constant_Random_Source(std::byte value)
        : value { value }
    {
    }

    [[nodiscard]]
    Result<void, Random_Source_Error> operator()(std::span<std::byte> out) final
    {
        requested_bytes += out.size();
        std::ranges::fill(out, value);
        return {};
    }
};

struct Exhausted_Random_Source final : Random_Source {
    [[nodiscard]]
    Result<void, Random_Source_Error> operator()(std::span<std::byte>) final
    {
        return Random_Source_Error::exhausted;
    }
};

// FACTORIAL CACHE =================================================================================

TEST(Factorial_Cache, get)
{
    Factorial_Cache cache;
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.contains(5));

    EXPECT_EQ(cache.get(5).value(), 120);
    EXPECT_TRUE(cache.contains(5));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.computation_count(), 1u);

    EXPECT_EQ(cache.get(5).value(), 120);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.computation_count(), 1u);

    EXPECT_EQ(cache.get(0).value(), 1);
    EXPECT_EQ(cache.get(50).value(), Big_Int::factorial(50).value());
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.computation_count(), 3u);
}

TEST(Factorial_Cache, negative)
{
    Factorial_Cache cache;
    EXPECT_EQ(cache.get(-1).error(), Big_Int_Error::domain);
    EXPECT_FALSE(cache.contains(-1));
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.computation_count(), 0u);
}

TEST(Factorial_Cache, logging)
{
    Collecting_Logger logger { std::pmr::new_delete_resource() };
    Factorial_Cache cache { logger };

    EXPECT_EQ(cache.get(10).value(), 3628800);
    ASSERT_EQ(logger.diagnostics.size(), 1u);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::debug);
    EXPECT_EQ(logger.diagnostics[0].id, diagnostic::factorial_cache_miss);
    EXPECT_EQ(logger.diagnostics[0].message, u8"Computed factorial of 10");

    EXPECT_EQ(cache.get(10).value(), 3628800);
    ASSERT_EQ(logger.diagnostics.size(), 2u);
    EXPECT_EQ(logger.diagnostics[1].severity, Severity::trace);
    EXPECT_EQ(logger.diagnostics[1].id, diagnostic::factorial_cache_hit);

    EXPECT_FALSE(cache.get(-3));
    ASSERT_EQ(logger.diagnostics.size(), 3u);
    EXPECT_EQ(logger.diagnostics[2].severity, Severity::warning);
    EXPECT_EQ(logger.diagnostics[2].id, diagnostic::factorial_cache_negative);
    EXPECT_EQ(logger.diagnostics[2].message, u8"Factorial of negative number requested: -3");
}

TEST(Factorial_Cache, logging_respects_min_severity)
{
    Collecting_Logger logger { std::pmr::new_delete_resource() };
    logger.set_min_severity(Severity::warning);
    Factorial_Cache cache { logger };

    EXPECT_TRUE(cache.get(10));
    EXPECT_TRUE(cache.get(10));
    EXPECT_TRUE(logger.nothing_logged());

    EXPECT_FALSE(cache.get(-1));
    EXPECT_EQ(logger.count_logged(diagnostic::factorial_cache_negative), 1u);
}

TEST(Factorial_Cache, concurrent_access)
{
    constexpr int thread_count = 8;
    constexpr Int64 max_n = 150;

    Factorial_Cache cache;
    std::vector<std::thread> threads;
    std::vector<int> failures(thread_count);
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&cache, &failures, t] {
            // Half of the threads go in reverse, so that both orders race.
            for (Int64 i = 0; i <= max_n; ++i) {
                const Int64 n = t % 2 == 0 ? i : max_n - i;
                const Result<Big_Int, Big_Int_Error> result = cache.get(n);
                if (!result || *result != Big_Int::factorial(n).value()) {
                    ++failures[std::size_t(t)];
                }
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    for (const int f : failures) {
        EXPECT_EQ(f, 0);
    }
    EXPECT_EQ(cache.size(), std::size_t(max_n + 1));
    EXPECT_EQ(cache.computation_count(), std::size_t(max_n + 1));
}

TEST(Factorial_Cache, global)
{
    const Big_Int f = cached_factorial(40).value();
    EXPECT_EQ(f, Big_Int::factorial(40).value());
    EXPECT_TRUE(global_factorial_cache().contains(40));
    EXPECT_EQ(&global_factorial_cache(), &global_factorial_cache());

    EXPECT_EQ(cached_factorial(-1).error(), Big_Int_Error::domain);
}

// GCD =============================================================================================

TEST(Gcd, mixed_operands)
{
    EXPECT_EQ(gcd(48, 18), 6);
    EXPECT_EQ(gcd(48_n, -18), 6);
    EXPECT_EQ(gcd(0, 0), 0);
    EXPECT_EQ(gcd(-7, 0), 7);

    EXPECT_EQ(gcd("48", 18).value(), 6);
    EXPECT_EQ(gcd(48, "18").value(), 6);
    EXPECT_EQ(gcd(std::string("-48"), 18_n).value(), 6);

    EXPECT_EQ(gcd("x", 18).error(), Big_Int_Error::parse);
    EXPECT_EQ(gcd(18, "x").error(), Big_Int_Error::parse);

    const Big_Int pow_2_200 = Big_Int(2).pow(200).value();
    EXPECT_EQ(gcd(pow_2_200, Big_Int(10).pow(30).value()), Big_Int(2).pow(30).value());
}

// RANDOM ==========================================================================================

TEST(Random, zero_bytes)
{
    Constant_Random_Source source { std::byte { 0xff } };
    EXPECT_EQ(random(0, { .source = source }).value(), 0);
    EXPECT_EQ(source.requested_bytes, 0u);
}

TEST(Random, constant_source)
{
    Constant_Random_Source source { std::byte { 0xff } };
    EXPECT_EQ(random(2, { .source = source }).value(), 65535);
    EXPECT_EQ(source.requested_bytes, 2u);

    const Big_Int big = random(32, { .source = source }).value();
    EXPECT_EQ(big, Big_Int(2).pow(256).value() - 1_n);
    EXPECT_EQ(source.requested_bytes, 34u);

    Constant_Random_Source zeros { std::byte {} };
    EXPECT_EQ(random(64, { .source = zeros }).value(), 0);
}

TEST(Random, failing_source)
{
    Collecting_Logger logger { std::pmr::new_delete_resource() };
    const Result<Big_Int, Big_Int_Error> result
        = random(8, { .source = always_failing_random_source, .logger = logger });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Big_Int_Error::random_source);

    ASSERT_EQ(logger.diagnostics.size(), 1u);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::error);
    EXPECT_EQ(logger.diagnostics[0].id, diagnostic::random_source);
    EXPECT_EQ(logger.diagnostics[0].message, u8"Failed to obtain random bytes: unavailable");
}

TEST(Random, exhausted_source)
{
    Exhausted_Random_Source source;
    Collecting_Logger logger { std::pmr::new_delete_resource() };
    EXPECT_EQ(
        random(8, { .source = source, .logger = logger }).error(), Big_Int_Error::random_source
    );
    EXPECT_EQ(logger.diagnostics.at(0).message, u8"Failed to obtain random bytes: exhausted");
}

TEST(Random, system_source)
{
    const Big_Int limit = Big_Int(2).pow(256).value();
    for (int i = 0; i < 20; ++i) {
        const Big_Int x = random(32).value();
        EXPECT_TRUE(x.between(0_n, limit, false) && x != limit) << x;
    }
    const Big_Int a = random(32).value();
    const Big_Int b = random(32).value();
    EXPECT_NE(a, b);
}

} // namespace
} // namespace mpint
