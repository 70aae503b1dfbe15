#include "chain/rpc_chain_quoter.hpp"
#include "config/network.hpp"
#include "routing/dex_router.hpp"
#include "utils/abi.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

RpcChainQuoter::RpcChainQuoter(HttpClient& http, const NetworkConfig& network)
  : rpc_(http, network.rpc_url, network.auth_header) {}

SimulatedQuote RpcChainQuoter::SimulateQuote(const std::string& quoter,
                                             const std::string& token_in,
                                             const std::string& token_out,
                                             long double amount_in,
                                             unsigned fee_tier,
                                             int timeout_ms) {
  auto res = rpc_.EthCall(quoter, DexRouter::EncodeQuoteExactInputSingle(token_in, token_out, amount_in, fee_tier), timeout_ms);
  // (amountOut, sqrtPriceX96After, initializedTicksCrossed, gasEstimate)
  SimulatedQuote q;
  q.amount_out = Abi::WordToUnits(res, 0);
  q.gas_estimate = Abi::WordToULL(res, 3);
  return q;
}

std::vector<long double> RpcChainQuoter::GetAmountsOut(const std::string& router,
                                                       long double amount_in,
                                                       const std::vector<std::string>& path,
                                                       int timeout_ms) {
  auto res = rpc_.EthCall(router, DexRouter::EncodeGetAmountsOut(amount_in, path), timeout_ms);
  auto amounts = DexRouter::DecodeAmounts(res);
  if (amounts.size() != path.size()) {
    throw std::runtime_error("getAmountsOut returned " + std::to_string(amounts.size()) + " amounts for a " +
                             std::to_string(path.size()) + "-token path");
  }
  return amounts;
}

std::string RpcChainQuoter::FindPool(const std::string& factory,
                                     const std::string& token_a,
                                     const std::string& token_b,
                                     int timeout_ms) {
  auto res = rpc_.EthCall(factory, DexRouter::EncodeGetPair(token_a, token_b), timeout_ms);
  std::string pair = Abi::WordToAddress(res, 0);
  if (HexToUnits(pair) == 0.0L) return std::string();
  return pair;
}

PoolReserves RpcChainQuoter::ReadPoolReserves(const std::string& pool,
                                              const std::string& token_in,
                                              const std::string& token_out,
                                              int timeout_ms) {
  auto reserves = rpc_.EthCall(pool, DexRouter::kGetReserves, timeout_ms);
  auto token0 = Abi::WordToAddress(rpc_.EthCall(pool, DexRouter::kToken0, timeout_ms), 0);
  long double r0 = Abi::WordToUnits(reserves, 0);
  long double r1 = Abi::WordToUnits(reserves, 1);
  PoolReserves out;
  if (SameAddress(token0, token_in)) {
    out.reserve_in = r0; out.reserve_out = r1;
  } else if (SameAddress(token0, token_out)) {
    out.reserve_in = r1; out.reserve_out = r0;
  } else {
    throw std::runtime_error("pool " + pool + " does not hold " + token_in);
  }
  return out;
}
