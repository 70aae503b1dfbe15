#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/types.hpp"

// Prices gas in output-token base units for route ranking.
// Rates come from GAS_OUTPUT_RATES=token:units_per_wei,... and the gas price
// from GAS_PRICE_WEI. Tokens without a rate produce an empty converter, which
// the selector treats as "ignore gas".
class GasOracle {
public:
  static constexpr unsigned long long kDefaultGasPriceWei = 30'000'000'000ULL;

  GasOracle() = default;
  // Adds the rates and gas price found in configuration.
  void LoadFromConfig();

  void SetRate(const std::string& token, long double units_per_wei);
  void SetGasPriceWei(unsigned long long wei);
  unsigned long long GasPriceWei() const;

  std::optional<long double> Convert(const std::string& token_out, unsigned long long gas_units) const;
  GasToOutput ConverterFor(const std::string& token_out) const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, long double> rates_; // lowercase token
  unsigned long long gas_price_wei_ = kDefaultGasPriceWei;
};
