#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <cctype>

using json = nlohmann::json;

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// "Name: value" sets that header; a bare token goes to Authorization.
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

static unsigned long long QuantityOrThrow(const json& result, const char* method) {
  if (!result.is_string()) throw RpcError(RpcError::Kind::kMalformed, std::string(method) + ": quantity expected");
  return HexToULL(result.get<std::string>());
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header)
  : http_(http), endpoint_(endpoint_url) {
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

json RpcClient::Call(const std::string& method, const json& params, int timeout_ms) {
  std::string payload = JsonRpcUtil::BuildRequest(method, params, next_id_.fetch_add(1));
  HttpResponse resp = http_.Post(endpoint_, payload, default_headers_, timeout_ms);
  if (resp.status == 0) {
    throw RpcError(RpcError::Kind::kTransport, method + " transport failure: " + resp.error);
  }
  if (resp.status < 200 || resp.status >= 300) {
    METAROUTE_LOG_WARNING(method + " HTTP status=" + std::to_string(resp.status));
    throw RpcError(RpcError::Kind::kHttpStatus, method + " HTTP status " + std::to_string(resp.status), resp.status);
  }
  return JsonRpcUtil::ExtractResult(resp.body);
}

std::string RpcClient::EthCall(const std::string& to, const std::string& data, int timeout_ms, const std::string& block) {
  json params = json::array({ json{{"to", to}, {"data", Ensure0x(data)}}, block });
  json result = Call("eth_call", params, timeout_ms);
  if (!result.is_string()) throw RpcError(RpcError::Kind::kMalformed, "eth_call: hex string expected");
  return result.get<std::string>();
}

std::string RpcClient::EthSendRawTransaction(const std::string& raw_tx_hex, int timeout_ms) {
  json result = Call("eth_sendRawTransaction", json::array({ Ensure0x(raw_tx_hex) }), timeout_ms);
  if (!result.is_string()) throw RpcError(RpcError::Kind::kMalformed, "eth_sendRawTransaction: hash expected");
  return result.get<std::string>();
}

json RpcClient::EthGetTransactionReceipt(const std::string& tx_hash, int timeout_ms) {
  return Call("eth_getTransactionReceipt", json::array({ tx_hash }), timeout_ms);
}

unsigned long long RpcClient::EthGetTransactionCount(const std::string& address, const std::string& block_tag, int timeout_ms) {
  return QuantityOrThrow(Call("eth_getTransactionCount", json::array({ address, block_tag }), timeout_ms),
                         "eth_getTransactionCount");
}

json RpcClient::EthGetBlockByNumber(const std::string& tag_or_hex, bool full_tx, int timeout_ms) {
  return Call("eth_getBlockByNumber", json::array({ tag_or_hex, full_tx }), timeout_ms);
}

unsigned long long RpcClient::EthMaxPriorityFeePerGas(int timeout_ms) {
  return QuantityOrThrow(Call("eth_maxPriorityFeePerGas", json::array(), timeout_ms), "eth_maxPriorityFeePerGas");
}

unsigned long long RpcClient::EthEstimateGas(const json& tx, int timeout_ms) {
  return QuantityOrThrow(Call("eth_estimateGas", json::array({ tx }), timeout_ms), "eth_estimateGas");
}
