#include "scheduler/gas_escalator.hpp"
#include <cmath>

static unsigned long long BumpOne(unsigned long long v, double factor) {
  if (v == 0) return 0;
  auto bumped = static_cast<unsigned long long>(std::ceil(static_cast<double>(v) * factor));
  return bumped > v ? bumped : v + 1;
}

GasParams GasEscalator::Next(const GasParams& current) const {
  GasParams next;
  next.max_priority_fee_per_gas = BumpOne(current.max_priority_fee_per_gas, bump_factor_);
  next.max_fee_per_gas = BumpOne(current.max_fee_per_gas, bump_factor_);
  if (next.max_fee_per_gas < next.max_priority_fee_per_gas) next.max_fee_per_gas = next.max_priority_fee_per_gas;
  return next;
}
