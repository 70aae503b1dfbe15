#pragma once

namespace AmmMath {
  // Uniswap v2 getAmountOut with a fee in basis points. Zero for empty pools.
  long double ConstantProductOut(long double amount_in, long double reserve_in, long double reserve_out,
                                 unsigned fee_bps = 30);
  // Shortfall of the execution price against the pool mid-price, in percent.
  double PriceImpactPercent(long double amount_in, long double amount_out,
                            long double reserve_in, long double reserve_out);
  // Shortfall of the full-size rate against a small reference quote's rate, in percent.
  double ImpactFromReference(long double amount_in, long double amount_out,
                             long double ref_in, long double ref_out);
}
