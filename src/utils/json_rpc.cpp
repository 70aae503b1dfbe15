#include "utils/json_rpc.hpp"

using json = nlohmann::json;

namespace JsonRpcUtil {
  std::string BuildRequest(const std::string& method, const json& params, long id) {
    json req = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}, {"id", id}};
    return req.dump();
  }

  json ExtractResult(const std::string& body) {
    json j;
    try {
      j = json::parse(body);
    } catch (const json::parse_error& e) {
      throw RpcError(RpcError::Kind::kMalformed, std::string("rpc response is not JSON: ") + e.what());
    }
    if (!j.is_object()) throw RpcError(RpcError::Kind::kMalformed, "rpc response is not an object");
    if (j.contains("error") && !j["error"].is_null()) {
      const auto& err = j["error"];
      if (err.is_object() && err.contains("message") && err["message"].is_string()) {
        throw RpcError(RpcError::Kind::kRpc, err["message"].get<std::string>());
      }
      throw RpcError(RpcError::Kind::kRpc, err.dump());
    }
    if (!j.contains("result")) throw RpcError(RpcError::Kind::kMalformed, "missing result");
    return j["result"];
  }

  std::string ExtractError(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("error")) return std::string();
    const auto& err = j["error"];
    if (err.is_object() && err.contains("message") && err["message"].is_string()) {
      return err["message"].get<std::string>();
    }
    return err.is_null() ? std::string() : err.dump();
  }
}
