#ifndef HYPER_FIXED_POINT_HPP
#define HYPER_FIXED_POINT_HPP

#include "types.hpp"
#include "errors.hpp"

namespace hyper {

// =============================================================================
// Fixed-Point Arithmetic (18 decimals, unsigned 256-bit words)
//
// Every operation is checked: overflow, underflow, division by zero and
// out-of-domain exp/ln inputs throw ArithmeticError instead of wrapping or
// saturating. Products are formed in 512 bits so x*y never truncates before
// the division.
// =============================================================================

namespace fixed {

U256 add(const U256& x, const U256& y);
U256 sub(const U256& x, const U256& y);

// floor(x * y / d)
U256 mul_div_down(const U256& x, const U256& y, const U256& d);

// ceil(x * y / d); exactly 0 when x * y == 0
U256 mul_div_up(const U256& x, const U256& y, const U256& d);

inline U256 mul_down(const U256& x, const U256& y) { return mul_div_down(x, y, ONE); }
inline U256 mul_up(const U256& x, const U256& y) { return mul_div_up(x, y, ONE); }
inline U256 div_down(const U256& x, const U256& y) { return mul_div_down(x, ONE, y); }
inline U256 div_up(const U256& x, const U256& y) { return mul_div_up(x, ONE, y); }

// e^x for signed x scaled by 1e18. Returns 0 for x <= ~-42e18, throws for
// x >= ~135.3e18.
I256 exp(const I256& x);

// Natural log of x scaled by 1e18. Requires x > 0.
I256 ln(const I256& x);

// x^y = exp(y * ln(x)); pow(x, 0) == ONE, pow(0, y) == 0 for y != 0
U256 pow(const U256& x, const U256& y);

// Weighted running average. `is_adding` folds (delta, delta_weight) into
// (average, total_weight); otherwise removes it.
U256 update_weighted_average(const U256& average, const U256& total_weight,
                             const U256& delta, const U256& delta_weight,
                             bool is_adding);

// 1e27 <-> 1e18 rescaling at adapter boundaries
U256 ray_to_wad(const U256& ray);
U256 wad_to_ray(const U256& wad);

// Signed helpers used by pricing code for net exposure
I256 to_signed(const U256& x);
U256 to_unsigned(const I256& x);

inline U256 min(const U256& a, const U256& b) { return a < b ? a : b; }
inline U256 max(const U256& a, const U256& b) { return a > b ? a : b; }

} // namespace fixed

} // namespace hyper

#endif // HYPER_FIXED_POINT_HPP
