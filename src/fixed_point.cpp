// =============================================================================
// fixed_point.cpp - 18-decimal fixed-point arithmetic
// exp/ln use binary range reduction and (6,7)/(8,8)-term rational
// approximations evaluated in 2**96 fixed point.
// =============================================================================

#include "hyper/fixed_point.hpp"

namespace hyper {
namespace fixed {

namespace {

using boost::multiprecision::cpp_int;

// Arithmetic shift right: floor(v / 2**n), also for negative v
cpp_int asr(const cpp_int& v, unsigned n) {
    if (v >= 0) return v >> n;
    cpp_int m = -v;
    cpp_int divisor = cpp_int(1) << n;
    return -((m + divisor - 1) >> n);
}

// Bounds of the exp domain (1e18 scale)
const cpp_int EXP_MIN("-42139678854452767551");
const cpp_int EXP_MAX("135305999368893231589");

// ln(2) in 2**96 fixed point
const cpp_int LN2_X96("54916777467707473351141471128");
const cpp_int FIVE_POW_18("3814697265625");

const cpp_int EXP_SCALE("0x29d9dc38563c32e5c2f6dc192ee70ef65f9978af3");

const cpp_int LN_SCALE("0x1340daa0d5f769dba1915cef59f0815a5506");
const cpp_int LN_2_SCALED("0x267a36c0c95b3975ab3ee5b203a7614a3f75373f047d803ae7b6687f2b3");
const cpp_int LN_BASE_SCALED("0x57115e47018c7177eebf7cd370a3356a1b7863008a5ae8028c72b8864284");

const cpp_int WAD("1000000000000000000");
const cpp_int I256_MAX_BIG = (cpp_int(1) << 255) - 1;

cpp_int exp_big(cpp_int x) {
    if (x <= EXP_MIN) {
        return 0;
    }
    if (x >= EXP_MAX) {
        throw ArithmeticError(errors::INVALID_EXPONENT, "exp: exponent out of range");
    }

    // (-42, 136) * 1e18 -> (-42, 136) * 2**96
    x = (x << 78) / FIVE_POW_18;

    // exp(x) = exp(x') * 2**k with k = round(x / ln 2)
    cpp_int k = asr((x << 96) / LN2_X96 + (cpp_int(1) << 95), 96);
    x = x - k * LN2_X96;

    cpp_int y = x + cpp_int("1346386616545796478920950773328");
    y = asr(y * x, 96) + cpp_int("57155421227552351082224309758442");
    cpp_int p = y + x - cpp_int("94201549194550492254356042504812");
    p = asr(p * y, 96) + cpp_int("28719021644029726153956944680412240");
    p = p * x + (cpp_int("4385272521454847904659076985693276") << 96);

    cpp_int q = x - cpp_int("2855989394907223263936484059900");
    q = asr(q * x, 96) + cpp_int("50020603652535783019961831881945");
    q = asr(q * x, 96) - cpp_int("533845033583426703283633433725380");
    q = asr(q * x, 96) + cpp_int("3604857256930695427073651918091429");
    q = asr(q * x, 96) - cpp_int("14423608567350463180887372962807573");
    q = asr(q * x, 96) + cpp_int("26449188498355588339934803723976023");

    cpp_int r = p / q;

    // k is in [-61, 195]
    int shift = 195 - k.convert_to<int>();
    return (r * EXP_SCALE) >> shift;
}

cpp_int ln_big(cpp_int x) {
    if (x <= 0) {
        throw ArithmeticError(errors::LN_INVALID_INPUT, "ln: input must be positive");
    }
    if (x > I256_MAX_BIG) {
        throw ArithmeticError(errors::LN_INVALID_INPUT, "ln: input exceeds int256 range");
    }

    // Reduce to (1, 2) * 2**96: ln(2**k * x) = k * ln(2) + ln(x)
    int r = static_cast<int>(boost::multiprecision::msb(x));
    int k = r - 96;
    x = (x << static_cast<unsigned>(159 - k)) >> 159;

    cpp_int p = x + cpp_int("3273285459638523848632254066296");
    p = asr(p * x, 96) + cpp_int("24828157081833163892658089445524");
    p = asr(p * x, 96) + cpp_int("43456485725739037958740375743393");
    p = asr(p * x, 96) - cpp_int("11111509109440967052023855526967");
    p = asr(p * x, 96) - cpp_int("45023709667254063763336534515857");
    p = asr(p * x, 96) - cpp_int("14706773417378608786704636184526");
    p = p * x - (cpp_int("795164235651350426258249787498") << 96);

    cpp_int q = x + cpp_int("5573035233440673466300451813936");
    q = asr(q * x, 96) + cpp_int("71694874799317883764090561454958");
    q = asr(q * x, 96) + cpp_int("283447036172924575727196451306956");
    q = asr(q * x, 96) + cpp_int("401686690394027663651624208769553");
    q = asr(q * x, 96) + cpp_int("204048457590392012362485061816622");
    q = asr(q * x, 96) + cpp_int("31853899698501571402653359427138");
    q = asr(q * x, 96) + cpp_int("909429971244387300277376558375");

    cpp_int res = p / q;

    // Scale, add k * ln(2) and ln(2**96 / 1e18), convert back to 1e18
    res = res * LN_SCALE;
    res = res + LN_2_SCALED * k;
    res = res + LN_BASE_SCALED;
    return asr(res, 174);
}

}  // namespace

// =============================================================================
// Checked Arithmetic
// =============================================================================

U256 add(const U256& x, const U256& y) {
    if (x > U256_MAX - y) {
        throw ArithmeticError(errors::ARITHMETIC_OVERFLOW, "add: overflow");
    }
    return x + y;
}

U256 sub(const U256& x, const U256& y) {
    if (y > x) {
        throw ArithmeticError(errors::ARITHMETIC_UNDERFLOW, "sub: underflow");
    }
    return x - y;
}

U256 mul_div_down(const U256& x, const U256& y, const U256& d) {
    if (d == 0) {
        throw ArithmeticError(errors::DIVISION_BY_ZERO, "mul_div_down: division by zero");
    }
    U512 q = (U512(x) * U512(y)) / U512(d);
    if (q > U512(U256_MAX)) {
        throw ArithmeticError(errors::ARITHMETIC_OVERFLOW, "mul_div_down: overflow");
    }
    return U256(q);
}

U256 mul_div_up(const U256& x, const U256& y, const U256& d) {
    if (d == 0) {
        throw ArithmeticError(errors::DIVISION_BY_ZERO, "mul_div_up: division by zero");
    }
    U512 product = U512(x) * U512(y);
    if (product == 0) return 0;

    U512 q = product / U512(d);
    if (product % U512(d) != 0) ++q;
    if (q > U512(U256_MAX)) {
        throw ArithmeticError(errors::ARITHMETIC_OVERFLOW, "mul_div_up: overflow");
    }
    return U256(q);
}

// =============================================================================
// Transcendental Functions
// =============================================================================

I256 exp(const I256& x) {
    return I256(exp_big(cpp_int(x)));
}

I256 ln(const I256& x) {
    return I256(ln_big(cpp_int(x)));
}

U256 pow(const U256& x, const U256& y) {
    if (y == 0) return ONE;
    if (x == 0) return 0;

    cpp_int y_big(y);
    if (y_big > I256_MAX_BIG) {
        throw ArithmeticError(errors::ARITHMETIC_OVERFLOW, "pow: exponent exceeds int256 range");
    }

    // x^y = exp(y * ln(x))
    cpp_int ylnx = (y_big * ln_big(cpp_int(x))) / WAD;
    cpp_int result = exp_big(ylnx);
    return U256(result);
}

// =============================================================================
// Averages and Rescaling
// =============================================================================

U256 update_weighted_average(const U256& average, const U256& total_weight,
                             const U256& delta, const U256& delta_weight,
                             bool is_adding) {
    if (is_adding) {
        U256 weight = add(total_weight, delta_weight);
        if (weight == 0) return 0;
        U512 num = U512(average) * U512(total_weight) + U512(delta) * U512(delta_weight);
        return U256(num / U512(weight));
    }

    if (delta_weight >= total_weight) return 0;
    U256 weight = total_weight - delta_weight;
    U512 kept = U512(average) * U512(total_weight);
    U512 removed = U512(delta) * U512(delta_weight);
    // Rounding in earlier updates can leave the removed term marginally larger
    if (removed >= kept) return 0;
    return U256((kept - removed) / U512(weight));
}

U256 ray_to_wad(const U256& ray) {
    return ray / U256(1000000000ULL);
}

U256 wad_to_ray(const U256& wad) {
    return mul_div_down(wad, U256(1000000000ULL), U256(1));
}

I256 to_signed(const U256& x) {
    if (cpp_int(x) > I256_MAX_BIG) {
        throw ArithmeticError(errors::ARITHMETIC_OVERFLOW, "to_signed: value exceeds int256 range");
    }
    return I256(x);
}

U256 to_unsigned(const I256& x) {
    if (x < 0) {
        throw ArithmeticError(errors::ARITHMETIC_UNDERFLOW, "to_unsigned: negative value");
    }
    return U256(x);
}

} // namespace fixed
} // namespace hyper
