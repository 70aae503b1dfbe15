#include "routing/amm_math.hpp"
#include <algorithm>

namespace AmmMath {
  long double ConstantProductOut(long double amount_in, long double reserve_in, long double reserve_out,
                                 unsigned fee_bps) {
    if (amount_in <= 0.0L || reserve_in <= 0.0L || reserve_out <= 0.0L || fee_bps >= 10000) return 0.0L;
    long double in_with_fee = amount_in * static_cast<long double>(10000 - fee_bps);
    long double numerator = in_with_fee * reserve_out;
    long double denominator = reserve_in * 10000.0L + in_with_fee;
    return numerator / denominator;
  }

  double PriceImpactPercent(long double amount_in, long double amount_out,
                            long double reserve_in, long double reserve_out) {
    if (amount_in <= 0.0L || reserve_in <= 0.0L || reserve_out <= 0.0L) return 0.0;
    long double mid = reserve_out / reserve_in;
    long double exec = amount_out / amount_in;
    long double impact = (1.0L - exec / mid) * 100.0L;
    return static_cast<double>(std::max(0.0L, impact));
  }

  double ImpactFromReference(long double amount_in, long double amount_out,
                             long double ref_in, long double ref_out) {
    if (amount_in <= 0.0L || ref_in <= 0.0L || ref_out <= 0.0L) return 0.0;
    long double ref_rate = ref_out / ref_in;
    long double exec = amount_out / amount_in;
    long double impact = (1.0L - exec / ref_rate) * 100.0L;
    return static_cast<double>(std::max(0.0L, impact));
  }
}
