#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "execution/transaction_submitter.hpp"
#include "config/network.hpp"

class HttpClient;
class RpcClient;
class Signer;
class NonceManager;
class GasStrategy;

// Signs locally with one key and broadcasts through each network's RPC node.
class RpcTransactionSubmitter : public TransactionSubmitter {
public:
  // Throws std::invalid_argument for a malformed key.
  RpcTransactionSubmitter(std::shared_ptr<HttpClient> http, const std::string& private_key_hex);
  ~RpcTransactionSubmitter() override;

  void AddNetwork(const NetworkConfig& config);

  SubmitResult SignAndSubmit(const UnsignedTransaction& tx) override;
  Receipt GetReceipt(const NetworkId& network,
                     const std::string& tx_hash,
                     const std::string& token_out,
                     const std::string& recipient) override;
  std::string Address() const override;

  static constexpr double kGasLimitMargin = 1.2;
  static constexpr const char* kTransferTopic =
      "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";

private:
  struct Chain {
    NetworkConfig config;
    std::unique_ptr<RpcClient> rpc;
    std::unique_ptr<NonceManager> nonces;
    std::unique_ptr<GasStrategy> gas;
  };
  Chain* Find(const NetworkId& network);

  std::shared_ptr<HttpClient> http_;
  std::unique_ptr<Signer> signer_;
  std::mutex mutex_;
  std::map<NetworkId, std::unique_ptr<Chain>> chains_;
};
