#include "gas/gas_strategy.hpp"
#include "node_connection/rpc_client.hpp"
#include "telemetry/structured_logger.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <nlohmann/json.hpp>

GasParams GasStrategy::Quote() {
  unsigned long long prio = kFallbackPriorityFeeWei;
  try {
    unsigned long long p = rpc_.EthMaxPriorityFeePerGas();
    if (p > 0) prio = p;
  } catch (const RpcError& e) {
    // Some nodes do not implement the tip oracle; a revert-style error is not fatal.
    if (e.kind() != RpcError::Kind::kRpc) throw;
    METAROUTE_LOG_DEBUG(std::string("eth_maxPriorityFeePerGas unavailable: ") + e.what());
  }

  nlohmann::json block = rpc_.EthGetBlockByNumber("latest", false);
  unsigned long long base = 0;
  if (block.is_object() && block.contains("baseFeePerGas") && block["baseFeePerGas"].is_string()) {
    base = HexToULL(block["baseFeePerGas"].get<std::string>());
  }

  GasParams fees;
  fees.max_priority_fee_per_gas = prio;
  fees.max_fee_per_gas = base * 2 + prio;
  StructuredLogger::Instance().Event("gas_quote", {
    {"network", network_},
    {"base_fee", base},
    {"priority_fee", prio},
    {"max_fee", fees.max_fee_per_gas}
  });
  return fees;
}
