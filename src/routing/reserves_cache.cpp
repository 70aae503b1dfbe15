#include "routing/reserves_cache.hpp"
#include "utils/hex.hpp"

std::string V2ReservesCache::KeyFactoryPair(const std::string& factory, const std::string& a, const std::string& b) {
  std::string aa = ToLowerHex(a), bb = ToLowerHex(b);
  if (bb < aa) std::swap(aa, bb);
  return ToLowerHex(factory) + '|' + aa + '|' + bb;
}

std::string V2ReservesCache::GetPairAddress(ChainQuoter& quoter, const std::string& factory,
                                            const std::string& token_a, const std::string& token_b, int timeout_ms) {
  auto key = KeyFactoryPair(factory, token_a, token_b);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pair_cache_.find(key);
    if (it != pair_cache_.end()) return it->second;
  }
  // Lookup happens outside the lock; concurrent misses may both query.
  std::string pair = quoter.FindPool(factory, token_a, token_b, timeout_ms);
  std::lock_guard<std::mutex> lock(mutex_);
  pair_cache_[key] = pair;
  return pair;
}

std::optional<PoolReserves> V2ReservesCache::GetReserves(ChainQuoter& quoter, const std::string& factory,
                                                         const std::string& token_in, const std::string& token_out,
                                                         int timeout_ms) {
  std::string pair = GetPairAddress(quoter, factory, token_in, token_out, timeout_ms);
  if (pair.empty()) return std::nullopt;
  std::string rkey = ToLowerHex(pair) + '|' + ToLowerHex(token_in);
  auto now = std::chrono::steady_clock::now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reserves_cache_.find(rkey);
    if (it != reserves_cache_.end() && now - it->second.fetched_at < ttl_) return it->second.reserves;
  }
  PoolReserves r = quoter.ReadPoolReserves(pair, token_in, token_out, timeout_ms);
  std::lock_guard<std::mutex> lock(mutex_);
  reserves_cache_[rkey] = ResEntry{r, now};
  return r;
}

void V2ReservesCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  pair_cache_.clear();
  reserves_cache_.clear();
}
