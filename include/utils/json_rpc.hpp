#pragma once
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Raised for every JSON-RPC failure. kind() tells transport problems apart
// from node-side rejections, which carry the node's message verbatim.
class RpcError : public std::runtime_error {
public:
  enum class Kind { kTransport, kHttpStatus, kRpc, kMalformed };
  RpcError(Kind kind, const std::string& what, long http_status = 0)
    : std::runtime_error(what), kind_(kind), http_status_(http_status) {}
  Kind kind() const { return kind_; }
  long http_status() const { return http_status_; }
private:
  Kind kind_;
  long http_status_;
};

namespace JsonRpcUtil {
  std::string BuildRequest(const std::string& method, const nlohmann::json& params, long id);
  // Returns the "result" member; throws RpcError(kRpc) carrying error.message
  // when the node answered with an error object, kMalformed on bad JSON.
  nlohmann::json ExtractResult(const std::string& json_body);
  // error.message if present, empty otherwise. Never throws.
  std::string ExtractError(const std::string& json_body);
}
