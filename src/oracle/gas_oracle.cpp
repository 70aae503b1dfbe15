#include "oracle/gas_oracle.hpp"
#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"

void GasOracle::LoadFromConfig() {
  for (const auto& kv : ConfigManager::GetList("GAS_OUTPUT_RATES")) {
    auto pos = kv.find(':');
    if (pos == std::string::npos) {
      METAROUTE_LOG_WARNING("GAS_OUTPUT_RATES entry without ':' ignored: " + kv);
      continue;
    }
    try {
      SetRate(kv.substr(0, pos), std::stold(kv.substr(pos + 1)));
    } catch (const std::exception& e) {
      METAROUTE_LOG_WARNING("GAS_OUTPUT_RATES entry '" + kv + "' ignored: " + e.what());
    }
  }
  if (auto p = ConfigManager::Get("GAS_PRICE_WEI")) {
    try {
      SetGasPriceWei(std::stoull(*p));
    } catch (const std::exception& e) {
      METAROUTE_LOG_WARNING("GAS_PRICE_WEI invalid, keeping default: " + std::string(e.what()));
    }
  }
}

void GasOracle::SetRate(const std::string& token, long double units_per_wei) {
  std::lock_guard<std::mutex> lock(mutex_);
  rates_[ToLowerHex(token)] = units_per_wei;
}

void GasOracle::SetGasPriceWei(unsigned long long wei) {
  std::lock_guard<std::mutex> lock(mutex_);
  gas_price_wei_ = wei;
}

unsigned long long GasOracle::GasPriceWei() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return gas_price_wei_;
}

std::optional<long double> GasOracle::Convert(const std::string& token_out, unsigned long long gas_units) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rates_.find(ToLowerHex(token_out));
  if (it == rates_.end()) return std::nullopt;
  return static_cast<long double>(gas_units) * static_cast<long double>(gas_price_wei_) * it->second;
}

GasToOutput GasOracle::ConverterFor(const std::string& token_out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rates_.find(ToLowerHex(token_out));
  if (it == rates_.end()) return GasToOutput();
  long double per_gas = static_cast<long double>(gas_price_wei_) * it->second;
  return [per_gas](unsigned long long gas_units) -> std::optional<long double> {
    return static_cast<long double>(gas_units) * per_gas;
  };
}
