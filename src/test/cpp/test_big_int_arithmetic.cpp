#include <limits>
#include <ostream>
#include <string_view>

#include <gtest/gtest.h>

#include "mpint/util/math.hpp"
#include "mpint/util/result.hpp"

#include "mpint/big_int.hpp"
#include "mpint/big_int_error.hpp"
#include "mpint/big_int_ops.hpp"

namespace mpint {

// NOLINTNEXTLINE(misc-use-internal-linkage)
std::ostream& operator<<(std::ostream&, const Big_Int&);

namespace {

[[nodiscard]]
Big_Int pow2(const int exponent)
{
    return Big_Int(2).pow(exponent).value();
}

[[nodiscard]]
Big_Int pow10(const int exponent)
{
    return Big_Int(10).pow(exponent).value();
}

[[nodiscard]]
Big_Int parse(const std::string_view digits)
{
    return Big_Int::from(digits).value();
}

const Big_Int int128_max = Big_Int(std::numeric_limits<Int128>::max());
const Big_Int int128_min = Big_Int(std::numeric_limits<Int128>::min());

constexpr Div_Rounding all_roundings[] {
    Div_Rounding::to_zero,
    Div_Rounding::to_pos_inf,
    Div_Rounding::to_neg_inf,
};

TEST(Big_Int_Arithmetic, add)
{
    EXPECT_EQ(Big_Int(1).add(2), 3);
    EXPECT_EQ(Big_Int(-5) + 3_n, -2);
    EXPECT_EQ(int128_max + 1_n, pow2(127));
    EXPECT_EQ(int128_min + -1_n, -pow2(127) - 1_n);
    EXPECT_EQ(int128_max + int128_max, pow2(128) - 2_n);

    const Big_Int sum = pow2(200) + -pow2(200);
    EXPECT_EQ(sum, 0);
    EXPECT_TRUE(sum.is_small());
}

TEST(Big_Int_Arithmetic, sub)
{
    EXPECT_EQ(Big_Int(1).sub(2), -1);
    EXPECT_EQ(int128_min - 1_n, -pow2(127) - 1_n);
    EXPECT_EQ(int128_max - int128_min, pow2(128) - 1_n);
    EXPECT_EQ(pow2(200) - pow2(199), pow2(199));
    EXPECT_EQ(pow2(200) - (pow2(200) - 5_n), 5);
}

TEST(Big_Int_Arithmetic, mul)
{
    EXPECT_EQ(Big_Int(-6).mul(7), -42);
    EXPECT_EQ(pow2(64) * pow2(64), pow2(128));
    EXPECT_EQ(-pow2(100) * pow2(100), -pow2(200));
    EXPECT_EQ(int128_min * -1_n, pow2(127));
    EXPECT_EQ(pow2(300) * 0_n, 0);
    EXPECT_TRUE((pow2(300) * 0_n).is_small());
}

TEST(Big_Int_Arithmetic, div_rem_small)
{
    const auto to_zero = Big_Int(-7).div_rem(2).value();
    EXPECT_EQ(to_zero.quotient, -3);
    EXPECT_EQ(to_zero.remainder, -1);

    const auto to_pos_inf = Big_Int(-7).div_rem(2, Div_Rounding::to_pos_inf).value();
    EXPECT_EQ(to_pos_inf.quotient, -3);
    EXPECT_EQ(to_pos_inf.remainder, -1);

    const auto to_neg_inf = Big_Int(-7).div_rem(2, Div_Rounding::to_neg_inf).value();
    EXPECT_EQ(to_neg_inf.quotient, -4);
    EXPECT_EQ(to_neg_inf.remainder, 1);

    EXPECT_EQ(Big_Int(7).div(2, Div_Rounding::to_pos_inf).value(), 4);
    EXPECT_EQ(Big_Int(7).div_r(2, Div_Rounding::to_pos_inf).value(), -1);
}

TEST(Big_Int_Arithmetic, div_rem_big)
{
    const Big_Int x = -(pow10(40) + 7_n);
    const Big_Int y = pow10(20);

    const auto to_zero = x.div_rem(y).value();
    EXPECT_EQ(to_zero.quotient, -pow10(20));
    EXPECT_EQ(to_zero.remainder, -7);

    const auto to_pos_inf = x.div_rem(y, Div_Rounding::to_pos_inf).value();
    EXPECT_EQ(to_pos_inf.quotient, -pow10(20));
    EXPECT_EQ(to_pos_inf.remainder, -7);

    const auto to_neg_inf = x.div_rem(y, Div_Rounding::to_neg_inf).value();
    EXPECT_EQ(to_neg_inf.quotient, -pow10(20) - 1_n);
    EXPECT_EQ(to_neg_inf.remainder, pow10(20) - 7_n);

    const auto positive_to_pos_inf
        = (pow10(40) + 7_n).div_rem(y, Div_Rounding::to_pos_inf).value();
    EXPECT_EQ(positive_to_pos_inf.quotient, pow10(20) + 1_n);
    EXPECT_EQ(positive_to_pos_inf.remainder, 7_n - pow10(20));

    const auto by_seven = (pow2(200) + 1_n).div_rem(7).value();
    EXPECT_EQ(
        by_seven.quotient, parse("229562577751284325077423156048737514646028999111827547900196")
    );
    EXPECT_EQ(by_seven.remainder, 5);
}

TEST(Big_Int_Arithmetic, div_rem_identity)
{
    const Big_Int values[] { -pow2(200) - 3_n, -pow10(30), int128_min, -7_n, -1_n,
                             1_n, 3_n, int128_max, pow10(30) + 11_n, pow2(200) };
    for (const Big_Int& x : values) {
        for (const Big_Int& y : values) {
            for (const Div_Rounding rounding : all_roundings) {
                const auto [q, r] = x.div_rem(y, rounding).value();
                EXPECT_EQ(q * y + r, x) << x << " / " << y;
                EXPECT_EQ(x.div_q(y, rounding).value(), q);
                EXPECT_EQ(x.div_r(y, rounding).value(), r);
                EXPECT_TRUE(r.abs() < y.abs()) << x << " / " << y;
                if (rounding == Div_Rounding::to_zero && !r.is_zero()) {
                    EXPECT_EQ(r.get_signum(), x.get_signum());
                }
                if (rounding == Div_Rounding::to_neg_inf && !r.is_zero()) {
                    EXPECT_EQ(r.get_signum(), y.get_signum());
                }
                if (rounding == Div_Rounding::to_pos_inf && !r.is_zero()) {
                    EXPECT_EQ(r.get_signum(), -y.get_signum());
                }
            }
        }
    }
}

TEST(Big_Int_Arithmetic, div_int128_min_by_minus_one)
{
    for (const Div_Rounding rounding : all_roundings) {
        const auto [q, r] = int128_min.div_rem(-1, rounding).value();
        EXPECT_EQ(q, pow2(127));
        EXPECT_FALSE(q.is_small());
        EXPECT_EQ(r, 0);
        EXPECT_EQ(int128_min.div_r(-1, rounding).value(), 0);
    }
    EXPECT_EQ(int128_min.div(-1).value(), pow2(127));
}

TEST(Big_Int_Arithmetic, division_by_zero)
{
    for (const Big_Int& x : { 0_n, 5_n, -pow2(200) }) {
        for (const Div_Rounding rounding : all_roundings) {
            EXPECT_EQ(x.div_rem(0, rounding).error(), Big_Int_Error::division_by_zero);
            EXPECT_EQ(x.div_q(0, rounding).error(), Big_Int_Error::division_by_zero);
            EXPECT_EQ(x.div_r(0, rounding).error(), Big_Int_Error::division_by_zero);
        }
        EXPECT_EQ(x.div(0_n).error(), Big_Int_Error::division_by_zero);
        EXPECT_EQ(x.mod(0).error(), Big_Int_Error::division_by_zero);
    }
}

TEST(Big_Int_Arithmetic, mod)
{
    EXPECT_EQ(Big_Int(7).mod(3).value(), 1);
    EXPECT_EQ(Big_Int(-7).mod(3).value(), 2);
    EXPECT_EQ(Big_Int(7).mod(-3).value(), 1);
    EXPECT_EQ(Big_Int(-7).mod(-3).value(), 2);
    EXPECT_EQ(Big_Int(-7).mod(1).value(), 0);
    EXPECT_EQ(int128_min.mod(-1).value(), 0);

    EXPECT_EQ((-pow2(200)).mod(3).value(), 2);
    EXPECT_EQ(Big_Int(-5).mod(pow2(200)).value(), pow2(200) - 5_n);
    EXPECT_EQ(Big_Int(5).mod(-pow2(200)).value(), 5);

    const Big_Int values[] { -pow2(150), int128_min, -9_n, -2_n, 2_n, 9_n, pow2(150) + 1_n };
    for (const Big_Int& x : values) {
        for (const Big_Int& y : values) {
            const Big_Int m = x.mod(y).value();
            EXPECT_TRUE(m.between(0_n, y.abs(), true) || m.is_zero()) << x << " mod " << y;
            EXPECT_TRUE((x - m).mod(y).value().is_zero()) << x << " mod " << y;
        }
    }
}

TEST(Big_Int_Arithmetic, pow)
{
    EXPECT_EQ(Big_Int(3).pow(0).value(), 1);
    EXPECT_EQ(Big_Int(0).pow(0).value(), 1);
    EXPECT_EQ(pow2(200).pow(0).value(), 1);
    EXPECT_EQ(Big_Int(0).pow(5).value(), 0);
    EXPECT_EQ(Big_Int(-2).pow(3).value(), -8);
    EXPECT_EQ(Big_Int(3).pow(100).value(), parse("515377520732011331036461129765621272702107522001"));
    EXPECT_EQ(Big_Int(-3).pow(3).value(), -27);
    EXPECT_EQ(pow2(100).pow(2).value(), pow2(200));

    EXPECT_EQ(Big_Int(2).pow(-1).error(), Big_Int_Error::domain);
    EXPECT_EQ(Big_Int(0).pow(-pow2(200)).error(), Big_Int_Error::domain);
}

TEST(Big_Int_Arithmetic, pow_huge_exponent)
{
    const Big_Int huge = pow2(200);
    EXPECT_EQ(Big_Int(0).pow(huge).value(), 0);
    EXPECT_EQ(Big_Int(1).pow(huge).value(), 1);
    EXPECT_EQ(Big_Int(-1).pow(huge).value(), 1);
    EXPECT_EQ(Big_Int(-1).pow(huge + 1_n).value(), -1);

    EXPECT_EQ(Big_Int(2).pow(huge).error(), Big_Int_Error::overflow);
    EXPECT_EQ(Big_Int(-2).pow(Big_Int(std::numeric_limits<Uint32>::max()) + 1_n).error(),
              Big_Int_Error::overflow);
}

TEST(Big_Int_Arithmetic, pow_mod)
{
    EXPECT_EQ(Big_Int(2).pow_mod(10, 1000).value(), 24);
    EXPECT_EQ(Big_Int(-2).pow_mod(3, 5).value(), 2);
    EXPECT_EQ(Big_Int(7).pow_mod(0, 5).value(), 1);
    EXPECT_EQ(Big_Int(7).pow_mod(5, 1).value(), 0);
    EXPECT_EQ(Big_Int(2).pow_mod(pow2(100), 1000000007).value(), 41558481);

    EXPECT_EQ(Big_Int(2).pow_mod(3, 0).error(), Big_Int_Error::domain);
    EXPECT_EQ(Big_Int(2).pow_mod(3, -5).error(), Big_Int_Error::domain);
}

TEST(Big_Int_Arithmetic, pow_mod_negative_exponent)
{
    EXPECT_EQ(Big_Int(3).pow_mod(-1, 7).value(), 5);
    EXPECT_EQ(Big_Int(3).pow_mod(-2, 7).value(), 4);
    EXPECT_EQ(Big_Int(-4).pow_mod(-1, 7).value(), 5);
    EXPECT_EQ(
        Big_Int(123456789).pow_mod(-1, pow10(30) + 57_n).value(),
        parse("951144331155413413514262063034")
    );

    EXPECT_EQ(Big_Int(2).pow_mod(-1, 4).error(), Big_Int_Error::domain);
    EXPECT_EQ(Big_Int(0).pow_mod(-1, 7).error(), Big_Int_Error::domain);
}

TEST(Big_Int_Arithmetic, sqrt)
{
    EXPECT_EQ(Big_Int(0).sqrt().value(), 0);
    EXPECT_EQ(Big_Int(1).sqrt().value(), 1);
    EXPECT_EQ(Big_Int(15).sqrt().value(), 3);
    EXPECT_EQ(Big_Int(16).sqrt().value(), 4);
    EXPECT_EQ(int128_max.sqrt().value(), parse("13043817825332782212"));
    EXPECT_EQ(pow2(200).sqrt().value(), pow2(100));
    EXPECT_EQ(pow2(201).sqrt().value(), parse("1792728671193156477399422023278"));
    EXPECT_EQ(pow10(100).sqrt().value(), pow10(50));

    EXPECT_EQ(Big_Int(-1).sqrt().error(), Big_Int_Error::domain);
    EXPECT_EQ((-pow2(200)).sqrt().error(), Big_Int_Error::domain);
}

TEST(Big_Int_Arithmetic, abs_negate)
{
    EXPECT_EQ(Big_Int(-7).abs(), 7);
    EXPECT_EQ(Big_Int(7).abs(), 7);
    EXPECT_EQ(Big_Int(0).abs(), 0);
    EXPECT_EQ((-pow2(200)).abs(), pow2(200));

    EXPECT_EQ(Big_Int(7).negate(), -7);
    EXPECT_EQ(Big_Int(0).negate(), 0);
    EXPECT_EQ(int128_min.negate(), pow2(127));
    EXPECT_EQ(pow2(127).negate(), int128_min);
    EXPECT_EQ(-(-pow2(200)), pow2(200));
    EXPECT_EQ(+pow2(200), pow2(200));
}

TEST(Big_Int_Arithmetic, gcd)
{
    EXPECT_EQ(Big_Int(48).gcd(18), 6);
    EXPECT_EQ(Big_Int(-48).gcd(18), 6);
    EXPECT_EQ(Big_Int(48).gcd(-18), 6);
    EXPECT_EQ(Big_Int(0).gcd(0), 0);
    EXPECT_EQ(Big_Int(-5).gcd(0), 5);
    EXPECT_EQ(Big_Int(0).gcd(-5), 5);
    EXPECT_EQ(Big_Int(17).gcd(13), 1);

    EXPECT_EQ(int128_min.gcd(0), pow2(127));
    EXPECT_EQ(pow2(200).gcd(Big_Int(6).pow(50).value()), pow2(50));
    EXPECT_EQ((-pow2(200)).gcd(0), pow2(200));
    EXPECT_EQ(pow2(200).gcd(12), 4);

    EXPECT_EQ(Big_Int(48).gcd("18").value(), 6);
    EXPECT_EQ(Big_Int(48).gcd("x").error(), Big_Int_Error::parse);
}

TEST(Big_Int_Arithmetic, factorial)
{
    EXPECT_EQ(Big_Int::factorial(0).value(), 1);
    EXPECT_EQ(Big_Int::factorial(1).value(), 1);
    EXPECT_EQ(Big_Int::factorial(5).value(), 120);
    EXPECT_EQ(Big_Int::factorial(25).value(), parse("15511210043330985984000000"));

    const Big_Int f33 = Big_Int::factorial(33).value();
    EXPECT_EQ(f33, parse("8683317618811886495518194401280000000"));
    EXPECT_TRUE(f33.is_small());

    const Big_Int f34 = Big_Int::factorial(34).value();
    EXPECT_EQ(f34, parse("295232799039604140847618609643520000000"));
    EXPECT_FALSE(f34.is_small());
    EXPECT_EQ(f34, f33 * 34_n);

    // clang-format off
    EXPECT_EQ(
        to_string(Big_Int::factorial(100).value()),
        "93326215443944152681699238856266700490715968264381621468592963895217599993229915608941463976156518286253697920827223758251185210916864000000000000000000000000"
    );
    // clang-format on

    EXPECT_EQ(Big_Int::factorial(-1).error(), Big_Int_Error::domain);
}

} // namespace
} // namespace mpint
