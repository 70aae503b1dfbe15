#pragma once
#include <string>
#include "scheduler/gas_escalator.hpp"

class RpcClient;

// EIP-1559 fee pricing: max fee = 2 x base fee + priority tip.
class GasStrategy {
public:
  GasStrategy(RpcClient& rpc, const std::string& network) : rpc_(rpc), network_(network) {}
  // Throws RpcError when the node cannot be reached.
  GasParams Quote();

  static constexpr unsigned long long kFallbackPriorityFeeWei = 2'000'000'000ULL;
private:
  RpcClient& rpc_;
  std::string network_;
};
