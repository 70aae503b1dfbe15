#pragma once
#include <atomic>
#include <string>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "utils/json_rpc.hpp"

class HttpClient;

// Thin JSON-RPC client over an HttpClient. Every call throws RpcError.
class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt);

  nlohmann::json Call(const std::string& method, const nlohmann::json& params, int timeout_ms);

  // Returns the 0x-prefixed return data.
  std::string EthCall(const std::string& to, const std::string& data, int timeout_ms = 2000,
                      const std::string& block = "latest");
  std::string EthSendRawTransaction(const std::string& raw_tx_hex, int timeout_ms = 5000);
  // Null JSON while the transaction is still pending.
  nlohmann::json EthGetTransactionReceipt(const std::string& tx_hash, int timeout_ms = 5000);
  unsigned long long EthGetTransactionCount(const std::string& address, const std::string& block_tag = "pending",
                                            int timeout_ms = 2000);
  nlohmann::json EthGetBlockByNumber(const std::string& tag_or_hex, bool full_tx = false, int timeout_ms = 2000);
  unsigned long long EthMaxPriorityFeePerGas(int timeout_ms = 2000);
  unsigned long long EthEstimateGas(const nlohmann::json& tx, int timeout_ms = 2000);

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  std::unordered_map<std::string, std::string> default_headers_;
  std::atomic<long> next_id_{1};
};
