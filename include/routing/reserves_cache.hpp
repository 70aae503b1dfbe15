#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "chain/chain_quoter.hpp"

// V2 pair and reserve lookups shared by the DEX adapters. Pair addresses
// are cached for the life of the process, reserves for `ttl`.
class V2ReservesCache {
public:
  explicit V2ReservesCache(std::chrono::milliseconds ttl = std::chrono::milliseconds(3000)) : ttl_(ttl) {}

  // Pair address or empty when the factory has none. Misses are cached too.
  std::string GetPairAddress(ChainQuoter& quoter, const std::string& factory,
                             const std::string& token_a, const std::string& token_b, int timeout_ms);

  // Reserves oriented to (token_in, token_out); nullopt when there is no pair.
  std::optional<PoolReserves> GetReserves(ChainQuoter& quoter, const std::string& factory,
                                          const std::string& token_in, const std::string& token_out,
                                          int timeout_ms);
  void Clear();
private:
  struct ResEntry {
    PoolReserves reserves;  // oriented to the key's token order
    std::chrono::steady_clock::time_point fetched_at;
  };
  std::chrono::milliseconds ttl_;
  std::mutex mutex_;
  std::unordered_map<std::string, std::string> pair_cache_;     // factory|a|b (sorted, lowercase)
  std::unordered_map<std::string, ResEntry> reserves_cache_;    // pair|token_in
  static std::string KeyFactoryPair(const std::string& factory, const std::string& a, const std::string& b);
};
