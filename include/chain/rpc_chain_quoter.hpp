#pragma once
#include "chain/chain_quoter.hpp"
#include "node_connection/rpc_client.hpp"

class HttpClient;
struct NetworkConfig;

// ChainQuoter over eth_call.
class RpcChainQuoter : public ChainQuoter {
public:
  RpcChainQuoter(HttpClient& http, const NetworkConfig& network);

  SimulatedQuote SimulateQuote(const std::string& quoter,
                               const std::string& token_in,
                               const std::string& token_out,
                               long double amount_in,
                               unsigned fee_tier,
                               int timeout_ms) override;
  std::vector<long double> GetAmountsOut(const std::string& router,
                                         long double amount_in,
                                         const std::vector<std::string>& path,
                                         int timeout_ms) override;
  std::string FindPool(const std::string& factory,
                       const std::string& token_a,
                       const std::string& token_b,
                       int timeout_ms) override;
  PoolReserves ReadPoolReserves(const std::string& pool,
                                const std::string& token_in,
                                const std::string& token_out,
                                int timeout_ms) override;
private:
  RpcClient rpc_;
};
