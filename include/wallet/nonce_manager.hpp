#pragma once
#include <mutex>
#include <optional>
#include <string>

class RpcClient;

// Hands out sequential nonces for one account, seeded from the node's pending
// count on first use. Reset() drops the local counter so the next call re-reads it.
class NonceManager {
public:
  NonceManager(RpcClient& rpc, const std::string& address);
  unsigned long long Next();
  void Reset();
private:
  RpcClient& rpc_;
  std::string address_;
  std::mutex mutex_;
  std::optional<unsigned long long> next_;
};
