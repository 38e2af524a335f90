#ifndef MPINT_BIG_INT_HPP
#define MPINT_BIG_INT_HPP

#include <charconv>
#include <compare>
#include <concepts>
#include <cstddef>
#include <limits>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "mpint/util/assert.hpp"
#include "mpint/util/charconv.hpp"
#include "mpint/util/function_ref.hpp"
#include "mpint/util/math.hpp"
#include "mpint/util/meta.hpp"
#include "mpint/util/result.hpp"
#include "mpint/util/strings.hpp"

#include "mpint/big_int_error.hpp"
#include "mpint/fwd.hpp"
#include "mpint/settings.hpp"

namespace mpint {

template <typename T>
struct Conversion_Result {
    /// @brief The result value of the conversion.
    T value;
    /// @brief True if the conversions has an inexact result,
    /// such as a truncated result.
    bool lossy;

    friend bool operator==(const Conversion_Result&, const Conversion_Result&) = default;
};

// OPERAND CONCEPTS ================================================================================

/// @brief A native integer type which converts to `Big_Int` without loss.
/// `bool` and character types are deliberately not integers for this purpose.
template <typename T>
concept big_int_integral = signed_or_unsigned<std::remove_cv_t<T>>;

/// @brief An operand which can be converted to `Big_Int` without any possibility of failure.
template <typename T>
concept exact_big_int_operand = std::same_as<std::remove_cv_t<T>, Big_Int> || big_int_integral<T>;

/// @brief An operand which is interpreted as a decimal digit sequence.
/// Conversion fails if the string is not a decimal number.
template <typename T>
concept textual_big_int_operand
    = !exact_big_int_operand<T> && std::convertible_to<const T&, std::string_view>;

/// @brief Any type that `Big_Int` operations accept as an operand.
template <typename T>
concept big_int_operand = exact_big_int_operand<T> || textual_big_int_operand<T>;

namespace detail {

/// @brief A sufficiently large and aligned type for a `boost::multiprecision::cpp_int`
/// to live inside.
///
/// This acts as an opaque wrapper which manages the lifetime of a `cpp_int`,
/// without requiring an include of `<boost/multiprecision/cpp_int.hpp>` in all headers
/// that use `Big_Int`; this would have massive compilation cost.
struct Big_Int_Backend {
private:
    alignas(16) unsigned char m_storage[32];

public:
    Big_Int_Backend();
    Big_Int_Backend(const Big_Int_Backend&) = delete;
    Big_Int_Backend(Big_Int_Backend&&) = delete;

    Big_Int_Backend& operator=(const Big_Int_Backend&) = delete;
    Big_Int_Backend& operator=(Big_Int_Backend&&) = delete;

    ~Big_Int_Backend();

    [[nodiscard]]
    auto& get();
    [[nodiscard]]
    const auto& get() const;
};

template <typename R>
struct Lift_Big_Int_Result {
    using type = Result<R, Big_Int_Error>;
};

template <typename T, typename E>
struct Lift_Big_Int_Result<Result<T, E>> {
    using type = Result<T, E>;
};

/// @brief `R` if `R` is already a `Result`, otherwise `Result<R, Big_Int_Error>`.
template <typename R>
using lift_big_int_result_t = typename Lift_Big_Int_Result<R>::type;

// The following functions are implemented by the multi-precision engine.
// Unless stated otherwise, operands may be small or big,
// and results are always in canonical form.

[[nodiscard]]
Big_Int big_int_from_u128(Uint128 x);

/// @brief Parses a digit sequence with an optional leading `-`.
/// `digits` shall have been validated beforehand.
[[nodiscard]]
Big_Int big_int_from_digits(std::string_view digits, int base);

/// @brief Interprets `bytes` as an unsigned big-endian magnitude.
[[nodiscard]]
Big_Int big_int_from_bytes(std::span<const std::byte> bytes);

/// @brief Returns the unsigned big-endian magnitude of `x`, without leading zero bytes.
[[nodiscard]]
std::vector<std::byte> big_int_to_bytes(const Big_Int& x);

/// @brief Returns the value of `x` truncated to 128 bits.
[[nodiscard]]
Conversion_Result<Int128> big_int_trunc_i128(const Big_Int& x);

[[nodiscard]]
int big_int_compare(const Big_Int& x, const Big_Int& y);
[[nodiscard]]
int big_int_signum(const Big_Int& x);
[[nodiscard]]
int big_int_ones_width(const Big_Int& x);

[[nodiscard]]
Big_Int big_int_neg(const Big_Int& x);
[[nodiscard]]
Big_Int big_int_abs(const Big_Int& x);
[[nodiscard]]
Big_Int big_int_add(const Big_Int& x, const Big_Int& y);
[[nodiscard]]
Big_Int big_int_sub(const Big_Int& x, const Big_Int& y);
[[nodiscard]]
Big_Int big_int_mul(const Big_Int& x, const Big_Int& y);

/// @brief `y` shall not be zero.
[[nodiscard]]
Div_Result<Big_Int, Big_Int> big_int_div_rem(const Big_Int& x, const Big_Int& y, Div_Rounding);
/// @brief `y` shall not be zero.
[[nodiscard]]
Big_Int big_int_mod(const Big_Int& x, const Big_Int& y);

[[nodiscard]]
Big_Int big_int_pow(const Big_Int& x, Uint32 y);
/// @brief `m` shall be positive.
/// Fails with `Big_Int_Error::domain` if `y` is negative and `x` has no inverse modulo `m`.
[[nodiscard]]
Result<Big_Int, Big_Int_Error> big_int_pow_mod(const Big_Int& x, const Big_Int& y, const Big_Int& m);
/// @brief `x` shall not be negative.
[[nodiscard]]
Big_Int big_int_sqrt(const Big_Int& x);
[[nodiscard]]
Big_Int big_int_gcd(const Big_Int& x, const Big_Int& y);
[[nodiscard]]
Big_Int big_int_factorial(Uint64 n);

/// @brief Converts `x` to a string and writes the resulting digits into `buffer`.
/// @returns The amount of characters written to `buffer` if conversions succeeded,
/// or zero if it failed (due to the buffer being too small).
[[nodiscard]]
std::size_t
big_int_to_string(char* buffer, std::size_t size, const Big_Int& x, int base, bool to_upper);

} // namespace detail

/// @brief An arbitrary precision integer.
///
/// A `Big_Int` uses reference-counting to store an immutable engine integer.
/// This makes `Big_Int` cheaply copyable and movable,
/// and it makes the container itself small.
/// Because the engine integer is never modified once created,
/// copies may be shared between threads freely.
///
/// Furthermore, `Big_Int` is optimized for small integers;
/// for values representable as a signed 128-bit integer,
/// the value is directly stored in the container, without allocations.
///
/// All operations produce new values; no operation modifies its operands.
/// Fallible operations return `Result<T, Big_Int_Error>`.
struct Big_Int {
private:
    Int128 m_small = 0;
    // If non-null, holds a value outside the range of Int128, and m_small is zero.
    std::shared_ptr<const detail::Big_Int_Backend> m_big;

    [[nodiscard]]
    explicit Big_Int(std::shared_ptr<const detail::Big_Int_Backend> big) noexcept
        : m_big { std::move(big) }
    {
        MPINT_ASSERT(m_big);
    }

public:
    /// @brief Returns a reference to a `Big_Int` with value zero.
    [[nodiscard]]
    static const Big_Int& zero()
    {
        static const Big_Int result { 0 };
        return result;
    }

    /// @brief Returns a reference to a `Big_Int` with value one.
    [[nodiscard]]
    static const Big_Int& one()
    {
        static const Big_Int result { 1 };
        return result;
    }

    /// @brief Wraps an engine integer.
    /// The value of `big` shall not be representable as `Int128`.
    [[nodiscard]]
    static Big_Int from_backend(std::shared_ptr<const detail::Big_Int_Backend> big) noexcept
    {
        return Big_Int { std::move(big) };
    }

    /// @brief Initializes to zero.
    [[nodiscard]]
    Big_Int() noexcept
        = default;

    /// @brief Initializes to the given value.
    template <big_int_integral T>
    [[nodiscard]]
    explicit Big_Int(const T x)
    {
        if constexpr (is_signed_integer_v<T>) {
            m_small = Int128 { x };
        }
        else if (Uint128 { x } >> 127) {
            *this = detail::big_int_from_u128(Uint128 { x });
        }
        else {
            m_small = Int128(x);
        }
    }

    // CONSTRUCTION ================================================================================

    /// @brief Parses `value` as a digit sequence in the given `base`.
    ///
    /// `base` shall be zero or in range `[2, 36]`; otherwise, fails with `Big_Int_Error::domain`.
    /// A `base` of zero detects the base from the prefix:
    /// `0x` and `0X` are hexadecimal, `0b` and `0B` are binary,
    /// a leading `0` followed by more digits is octal, and everything else is decimal.
    /// An optional `0x` prefix is also accepted for base 16, and `0b` for base 2.
    /// The digits may be preceded by `-`.
    ///
    /// Fails with `Big_Int_Error::parse` if `value` is empty or not entirely a number.
    [[nodiscard]]
    static Result<Big_Int, Big_Int_Error> from(std::string_view value, int base = 10);

    [[nodiscard]]
    static Result<Big_Int, Big_Int_Error> from(std::u8string_view value, int base = 10)
    {
        return from(as_string_view(value), base);
    }

    /// @brief Equivalent to `Big_Int(value)`.
    /// The `base` is ignored because the value of a native integer does not depend on it.
    template <big_int_integral T>
    [[nodiscard]]
    static Big_Int from(const T value, [[maybe_unused]] int base = 10)
    {
        return Big_Int(value);
    }

    /// @brief Interprets `buffer` as an unsigned big-endian magnitude.
    /// @param reverse If `true`, the order of bytes in `buffer` is reversed first,
    /// meaning that `buffer` is interpreted as little-endian.
    [[nodiscard]]
    static Big_Int from_buffer(std::span<const std::byte> buffer, bool reverse = true);

    /// @brief Equivalent to `from_buffer(as_bytes(buffer), reverse)`.
    [[nodiscard]]
    static Big_Int from_buffer(std::string_view buffer, bool reverse = true)
    {
        return from_buffer(as_bytes(buffer), reverse);
    }

    /// @brief Returns `n!`.
    /// Fails with `Big_Int_Error::domain` if `n` is negative.
    [[nodiscard]]
    static Result<Big_Int, Big_Int_Error> factorial(Int64 n);

    // OBSERVERS ===================================================================================

    /// @brief Returns `true` if the value is stored directly in this object,
    /// i.e. if it is representable as `Int128`.
    [[nodiscard]]
    bool is_small() const noexcept
    {
        return !m_big;
    }

    /// @brief Returns the engine integer, or a null pointer if `is_small()`.
    [[nodiscard]]
    const detail::Big_Int_Backend* get_backend() const noexcept
    {
        return m_big.get();
    }

    /// @brief Returns `true` if this value is zero.
    [[nodiscard]]
    bool is_zero() const noexcept
    {
        return is_small() && m_small == 0;
    }

    /// @brief Equivalent to `(*this > 0) - (*this < 0)`.
    [[nodiscard]]
    int get_signum() const
    {
        if (is_small()) {
            return (m_small > 0) - (m_small < 0);
        }
        return detail::big_int_signum(*this);
    }

    // TYPE CONVERSION =============================================================================

    /// @brief Returns the value as a 64-bit integer.
    /// Fails with `Big_Int_Error::overflow` if the value is not representable.
    [[nodiscard]]
    Result<Int64, Big_Int_Error> to_int() const
    {
        const auto [value, lossy] = as_i64();
        if (lossy) {
            return Big_Int_Error::overflow;
        }
        return value;
    }

    [[nodiscard]]
    Conversion_Result<Int32> as_i32() const
    {
        const auto [i128, i128_lossy] = as_i128();
        return { .value = Int32(i128), .lossy = i128_lossy || Int32(i128) != i128 };
    }

    [[nodiscard]]
    Conversion_Result<Int64> as_i64() const
    {
        const auto [i128, i128_lossy] = as_i128();
        return { .value = Int64(i128), .lossy = i128_lossy || Int64(i128) != i128 };
    }

    [[nodiscard]]
    Conversion_Result<Int128> as_i128() const
    {
        if (is_small()) {
            return { .value = m_small, .lossy = false };
        }
        return detail::big_int_trunc_i128(*this);
    }

    /// @brief Returns the unsigned magnitude of this integer as bytes,
    /// without leading zero bytes.
    /// The sign is not preserved, and zero results in an empty buffer.
    /// @param reverse If `true`, the result is little-endian, otherwise big-endian.
    [[nodiscard]]
    std::vector<std::byte> to_buffer(bool reverse = true) const;

    // COMPARISON ==================================================================================

    /// @brief Returns `-1` if `*this < rhs`, `0` if `*this == rhs`, and `1` if `*this > rhs`.
    [[nodiscard]]
    int compare(const Big_Int& rhs) const
    {
        if (is_small()) {
            if (rhs.is_small()) {
                return (m_small > rhs.m_small) - (m_small < rhs.m_small);
            }
            // A big value is always outside the range of small values.
            return -rhs.get_signum();
        }
        if (rhs.is_small()) {
            return get_signum();
        }
        return detail::big_int_compare(*this, rhs);
    }

    template <big_int_operand T>
        requires(!std::same_as<T, Big_Int>)
    [[nodiscard]]
    auto compare(const T& rhs) const
    {
        return with_operand(rhs, [this](const Big_Int& r) { return compare(r); });
    }

    template <big_int_operand T>
    [[nodiscard]]
    auto less_than(const T& rhs) const
    {
        return map_comparison(rhs, [](int c) { return c < 0; });
    }

    template <big_int_operand T>
    [[nodiscard]]
    auto less_than_equal(const T& rhs) const
    {
        return map_comparison(rhs, [](int c) { return c <= 0; });
    }

    template <big_int_operand T>
    [[nodiscard]]
    auto equal(const T& rhs) const
    {
        return map_comparison(rhs, [](int c) { return c == 0; });
    }

    template <big_int_operand T>
    [[nodiscard]]
    auto greater_than(const T& rhs) const
    {
        return map_comparison(rhs, [](int c) { return c > 0; });
    }

    template <big_int_operand T>
    [[nodiscard]]
    auto greater_than_equal(const T& rhs) const
    {
        return map_comparison(rhs, [](int c) { return c >= 0; });
    }

    /// @brief Returns `true` if this value lies in the closed interval `[left, right]`,
    /// or in the open interval `(left, right)` if `exclusive` is `true`.
    [[nodiscard]]
    bool between(const Big_Int& left, const Big_Int& right, bool exclusive = false) const
    {
        if (exclusive) {
            return compare(left) > 0 && compare(right) < 0;
        }
        return compare(left) >= 0 && compare(right) <= 0;
    }

    template <big_int_operand L, big_int_operand R>
        requires(!std::same_as<L, Big_Int> || !std::same_as<R, Big_Int>)
    [[nodiscard]]
    auto between(const L& left, const R& right, bool exclusive = false) const
    {
        return with_operand(left, [&](const Big_Int& l) {
            return with_operand(right, [&](const Big_Int& r) {
                return between(l, r, exclusive);
            });
        });
    }

    [[nodiscard]]
    friend bool operator==(const Big_Int& x, const Big_Int& y)
    {
        if (x.is_small() && y.is_small()) {
            return x.m_small == y.m_small;
        }
        return x.compare(y) == 0;
    }

    template <big_int_integral T>
    [[nodiscard]]
    friend bool operator==(const Big_Int& x, const T y)
    {
        return x == Big_Int(y);
    }

    [[nodiscard]]
    friend std::strong_ordering operator<=>(const Big_Int& x, const Big_Int& y)
    {
        return x.compare(y) <=> 0;
    }

    template <big_int_integral T>
    [[nodiscard]]
    friend std::strong_ordering operator<=>(const Big_Int& x, const T y)
    {
        return x.compare(Big_Int(y)) <=> 0;
    }

    // ARITHMETIC ==================================================================================

    [[nodiscard]]
    Big_Int add(const Big_Int& rhs) const
    {
        if (is_small() && rhs.is_small()) {
            Int128 sum;
            if (!add_overflow(sum, m_small, rhs.m_small)) [[likely]] {
                return Big_Int { sum };
            }
        }
        return detail::big_int_add(*this, rhs);
    }

    template <big_int_operand T>
        requires(!std::same_as<T, Big_Int>)
    [[nodiscard]]
    auto add(const T& rhs) const
    {
        return with_operand(rhs, [this](const Big_Int& r) { return add(r); });
    }

    [[nodiscard]]
    Big_Int sub(const Big_Int& rhs) const
    {
        if (is_small() && rhs.is_small()) {
            Int128 difference;
            if (!sub_overflow(difference, m_small, rhs.m_small)) [[likely]] {
                return Big_Int { difference };
            }
        }
        return detail::big_int_sub(*this, rhs);
    }

    template <big_int_operand T>
        requires(!std::same_as<T, Big_Int>)
    [[nodiscard]]
    auto sub(const T& rhs) const
    {
        return with_operand(rhs, [this](const Big_Int& r) { return sub(r); });
    }

    [[nodiscard]]
    Big_Int mul(const Big_Int& rhs) const
    {
        if (is_small() && rhs.is_small()) {
            Int128 product;
            if (!mul_overflow(product, m_small, rhs.m_small)) [[likely]] {
                return Big_Int { product };
            }
        }
        return detail::big_int_mul(*this, rhs);
    }

    template <big_int_operand T>
        requires(!std::same_as<T, Big_Int>)
    [[nodiscard]]
    auto mul(const T& rhs) const
    {
        return with_operand(rhs, [this](const Big_Int& r) { return mul(r); });
    }

    /// @brief Returns the quotient and remainder of the division `*this / rhs`,
    /// with rounding as specified by `rounding`.
    /// The result satisfies `quotient * rhs + remainder == *this`.
    /// Fails with `Big_Int_Error::division_by_zero` if `rhs` is zero.
    [[nodiscard]]
    Result<Div_Result<Big_Int, Big_Int>, Big_Int_Error>
    div_rem(const Big_Int& rhs, Div_Rounding rounding = Div_Rounding::to_zero) const;

    template <big_int_operand T>
        requires(!std::same_as<T, Big_Int>)
    [[nodiscard]]
    auto div_rem(const T& rhs, Div_Rounding rounding = Div_Rounding::to_zero) const
    {
        return with_operand(rhs, [&](const Big_Int& r) { return div_rem(r, rounding); });
    }

    /// @brief Returns the quotient of the division `*this / rhs`,
    /// with rounding as specified by `rounding`.
    /// Fails with `Big_Int_Error::division_by_zero` if `rhs` is zero.
    [[nodiscard]]
    Result<Big_Int, Big_Int_Error>
    div_q(const Big_Int& rhs, Div_Rounding rounding = Div_Rounding::to_zero) const;

    template <big_int_operand T>
        requires(!std::same_as<T, Big_Int>)
    [[nodiscard]]
    auto div_q(const T& rhs, Div_Rounding rounding = Div_Rounding::to_zero) const
    {
        return with_operand(rhs, [&](const Big_Int& r) { return div_q(r, rounding); });
    }

    /// @brief Equivalent to `div_q(rhs, rounding)`.
    template <big_int_operand T>
    [[nodiscard]]
    auto div(const T& rhs, Div_Rounding rounding = Div_Rounding::to_zero) const
    {
        return div_q(rhs, rounding);
    }

    /// @brief Returns the remainder of the division `*this / rhs`,
    /// with rounding of the quotient as specified by `rounding`.
    /// Fails with `Big_Int_Error::division_by_zero` if `rhs` is zero.
    [[nodiscard]]
    Result<Big_Int, Big_Int_Error>
    div_r(const Big_Int& rhs, Div_Rounding rounding = Div_Rounding::to_zero) const;

    template <big_int_operand T>
        requires(!std::same_as<T, Big_Int>)
    [[nodiscard]]
    auto div_r(const T& rhs, Div_Rounding rounding = Div_Rounding::to_zero) const
    {
        return with_operand(rhs, [&](const Big_Int& r) { return div_r(r, rounding); });
    }

    /// @brief Returns `*this` modulo `|rhs|`, which is always in range `[0, |rhs|)`.
    /// Fails with `Big_Int_Error::division_by_zero` if `rhs` is zero.
    [[nodiscard]]
    Result<Big_Int, Big_Int_Error> mod(const Big_Int& rhs) const;

    template <big_int_operand T>
        requires(!std::same_as<T, Big_Int>)
    [[nodiscard]]
    auto mod(const T& rhs) const
    {
        return with_operand(rhs, [this](const Big_Int& r) { return mod(r); });
    }

    /// @brief Returns `*this` raised to the power of `exponent`.
    /// `pow(0, 0)` is `1`.
    /// Fails with `Big_Int_Error::domain` if `exponent` is negative,
    /// and with `Big_Int_Error::overflow` if `exponent` does not fit into 32 bits,
    /// unless the result is trivially known (`*this` is `0`, `1`, or `-1`).
    [[nodiscard]]
    Result<Big_Int, Big_Int_Error> pow(const Big_Int& exponent) const;

    template <big_int_operand T>
        requires(!std::same_as<T, Big_Int>)
    [[nodiscard]]
    auto pow(const T& exponent) const
    {
        return with_operand(exponent, [this](const Big_Int& e) { return pow(e); });
    }

    /// @brief Returns `pow(*this, exponent)` modulo `modulus`, in range `[0, modulus)`.
    /// A negative `exponent` raises the modular inverse of `*this` instead.
    /// Fails with `Big_Int_Error::domain` if `modulus` is not positive,
    /// or if `exponent` is negative and no inverse exists.
    [[nodiscard]]
    Result<Big_Int, Big_Int_Error> pow_mod(const Big_Int& exponent, const Big_Int& modulus) const;

    template <big_int_operand E, big_int_operand M>
        requires(!std::same_as<E, Big_Int> || !std::same_as<M, Big_Int>)
    [[nodiscard]]
    auto pow_mod(const E& exponent, const M& modulus) const
    {
        return with_operand(exponent, [&](const Big_Int& e) {
            return with_operand(modulus, [&](const Big_Int& m) { return pow_mod(e, m); });
        });
    }

    /// @brief Returns the square root, rounded down.
    /// Fails with `Big_Int_Error::domain` if this value is negative.
    [[nodiscard]]
    Result<Big_Int, Big_Int_Error> sqrt() const;

    /// @brief Returns the absolute value.
    [[nodiscard]]
    Big_Int abs() const
    {
        if (is_small() && m_small != std::numeric_limits<Int128>::min()) {
            return Big_Int { m_small < 0 ? -m_small : m_small };
        }
        return detail::big_int_abs(*this);
    }

    /// @brief Returns this value negated.
    [[nodiscard]]
    Big_Int negate() const
    {
        if (is_small() && m_small != std::numeric_limits<Int128>::min()) {
            return Big_Int { -m_small };
        }
        return detail::big_int_neg(*this);
    }

    /// @brief Returns the greatest common divisor, which is never negative.
    /// `gcd(0, 0)` is `0`.
    [[nodiscard]]
    Big_Int gcd(const Big_Int& rhs) const;

    template <big_int_operand T>
        requires(!std::same_as<T, Big_Int>)
    [[nodiscard]]
    auto gcd(const T& rhs) const
    {
        return with_operand(rhs, [this](const Big_Int& r) { return gcd(r); });
    }

    [[nodiscard]]
    Big_Int operator+() const
    {
        return *this;
    }

    [[nodiscard]]
    Big_Int operator-() const
    {
        return negate();
    }

    [[nodiscard]]
    friend Big_Int operator+(const Big_Int& x, const Big_Int& y)
    {
        return x.add(y);
    }

    [[nodiscard]]
    friend Big_Int operator-(const Big_Int& x, const Big_Int& y)
    {
        return x.sub(y);
    }

    [[nodiscard]]
    friend Big_Int operator*(const Big_Int& x, const Big_Int& y)
    {
        return x.mul(y);
    }

    // STRING CONVERSIONS ==========================================================================

    /// @brief Passes a string containing the digits representing this integer to `out`.
    /// @param base The base of the digits.
    /// Shall be in [2, 36].
    /// @param to_upper If `true`, outputs digits for base 11 or more in uppercase.
    void print_to(
        Function_Ref<void(std::string_view)> out, //
        int base = 10,
        bool to_upper = false
    ) const;

    void print_to(
        Function_Ref<void(std::u8string_view)> out,
        const int base = 10,
        const bool to_upper = false
    ) const
    {
        print_to([&](const std::string_view str) { out(as_u8string_view(str)); }, base, to_upper);
    }

private:
    /// @brief Converts `operand` to `Big_Int` and invokes `f` with it.
    /// For exact operands, returns the result of `f` unchanged.
    /// For textual operands, returns a `Result`
    /// which holds `Big_Int_Error::parse` if the operand is not a decimal number.
    template <typename T, typename F>
    [[nodiscard]]
    static auto with_operand(const T& operand, F&& f)
    {
        if constexpr (std::same_as<T, Big_Int>) {
            return f(operand);
        }
        else if constexpr (big_int_integral<T>) {
            return f(Big_Int(operand));
        }
        else {
            static_assert(textual_big_int_operand<T>);
            using result_type
                = detail::lift_big_int_result_t<std::invoke_result_t<F&, const Big_Int&>>;
            const Result<Big_Int, Big_Int_Error> parsed = from(std::string_view(operand));
            if (!parsed) {
                return result_type(error_tag, parsed.error());
            }
            return result_type(f(*parsed));
        }
    }

    template <typename T, typename Predicate>
    [[nodiscard]]
    auto map_comparison(const T& rhs, Predicate predicate) const
    {
        return with_operand(rhs, [&](const Big_Int& r) -> bool {
            return predicate(compare(r));
        });
    }
};

/// @brief Analogous to
/// ```cpp
/// std::from_chars(digits.data(), digits.data() + digits.size(), out, base)
/// ```
/// if hypothetically, `std::from_chars` had big integer support.
/// @param digits A string starting with a sequence of digits in the given `base`,
/// optionally preceded by `-`.
/// It is not required that the entire string is a valid digit sequence.
/// @param out The object in which the result of parsing is stored upon success.
/// Otherwise, it remains unmodified.
/// @param base The base of the digit sequence.
[[nodiscard]]
std::from_chars_result from_characters(std::string_view digits, Big_Int& out, int base = 10);

[[nodiscard]]
inline std::from_chars_result
from_characters(const std::u8string_view digits, Big_Int& out, const int base = 10)
{
    return from_characters(as_string_view(digits), out, base);
}

/// @brief Converts an exact operand to `Big_Int`.
template <exact_big_int_operand T>
[[nodiscard]]
Big_Int to_big_int(const T& x)
{
    if constexpr (std::same_as<T, Big_Int>) {
        return x;
    }
    else {
        return Big_Int(x);
    }
}

/// @brief Converts a textual operand to `Big_Int` by parsing it as a decimal number.
template <textual_big_int_operand T>
[[nodiscard]]
Result<Big_Int, Big_Int_Error> to_big_int(const T& x)
{
    return Big_Int::from(std::string_view(x));
}

[[nodiscard]]
inline Big_Int operator""_n(const unsigned long long digits)
{
    return Big_Int(digits);
}

static_assert(sizeof(Big_Int) <= 32);

} // namespace mpint

#endif
