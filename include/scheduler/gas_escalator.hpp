#pragma once

struct GasParams {
  unsigned long long max_fee_per_gas = 0;
  unsigned long long max_priority_fee_per_gas = 0;

  bool IsSet() const { return max_fee_per_gas != 0; }
};

// Fee bumps for resubmitting a transaction the node rejected as underpriced.
// Nodes require at least +10% to replace a pending transaction.
class GasEscalator {
public:
  explicit GasEscalator(double bump_factor = 1.2, unsigned int max_bumps = 3)
    : bump_factor_(bump_factor < 1.1 ? 1.1 : bump_factor), max_bumps_(max_bumps) {}
  GasParams Next(const GasParams& current) const;
  double BumpFactor() const { return bump_factor_; }
  unsigned int MaxBumps() const { return max_bumps_; }
private:
  double bump_factor_;
  unsigned int max_bumps_;
};
