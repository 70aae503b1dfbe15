#include "wallet/nonce_manager.hpp"
#include "node_connection/rpc_client.hpp"

NonceManager::NonceManager(RpcClient& rpc, const std::string& address) : rpc_(rpc), address_(address) {}

unsigned long long NonceManager::Next() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!next_) next_ = rpc_.EthGetTransactionCount(address_, "pending");
  return (*next_)++;
}

void NonceManager::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  next_.reset();
}
