#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/types.hpp"

struct SimulatedQuote {
  long double amount_out = 0.0L;
  unsigned long long gas_estimate = 0;
};

struct PoolReserves {
  long double reserve_in = 0.0L;
  long double reserve_out = 0.0L;
};

// Read-only on-chain queries used by the DEX adapters. Implementations
// throw (RpcError or std::runtime_error) on transport or decoding failure
// and must honor timeout_ms.
class ChainQuoter {
public:
  virtual ~ChainQuoter() = default;

  virtual SimulatedQuote SimulateQuote(const std::string& quoter,
                                       const std::string& token_in,
                                       const std::string& token_out,
                                       long double amount_in,
                                       unsigned fee_tier,
                                       int timeout_ms) = 0;

  // Amounts along `path`, first element equal to amount_in.
  virtual std::vector<long double> GetAmountsOut(const std::string& router,
                                                 long double amount_in,
                                                 const std::vector<std::string>& path,
                                                 int timeout_ms) = 0;

  // Pair address, or empty when the factory has no pool for the tokens.
  virtual std::string FindPool(const std::string& factory,
                               const std::string& token_a,
                               const std::string& token_b,
                               int timeout_ms) = 0;

  // Reserves oriented to (token_in, token_out).
  virtual PoolReserves ReadPoolReserves(const std::string& pool,
                                        const std::string& token_in,
                                        const std::string& token_out,
                                        int timeout_ms) = 0;
};

// One quoter per network.
class ChainQuoterRegistry {
public:
  void Set(const NetworkId& network, std::shared_ptr<ChainQuoter> quoter) {
    std::lock_guard<std::mutex> lock(mutex_);
    quoters_[network] = std::move(quoter);
  }
  std::shared_ptr<ChainQuoter> Get(const NetworkId& network) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quoters_.find(network);
    return it == quoters_.end() ? nullptr : it->second;
  }
private:
  mutable std::mutex mutex_;
  std::unordered_map<NetworkId, std::shared_ptr<ChainQuoter>> quoters_;
};
