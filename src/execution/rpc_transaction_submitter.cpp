#include "execution/rpc_transaction_submitter.hpp"
#include "node_connection/rpc_client.hpp"
#include "wallet/signer.hpp"
#include "wallet/nonce_manager.hpp"
#include "gas/gas_strategy.hpp"
#include "common/logger.hpp"
#include "utils/abi.hpp"
#include "utils/hex.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

RpcTransactionSubmitter::RpcTransactionSubmitter(std::shared_ptr<HttpClient> http, const std::string& private_key_hex)
  : http_(std::move(http)), signer_(new Signer(private_key_hex)) {
  if (!http_) throw std::invalid_argument("RpcTransactionSubmitter needs an HTTP client");
}

RpcTransactionSubmitter::~RpcTransactionSubmitter() = default;

void RpcTransactionSubmitter::AddNetwork(const NetworkConfig& config) {
  auto chain = std::make_unique<Chain>();
  chain->config = config;
  chain->rpc.reset(new RpcClient(*http_, config.rpc_url, config.auth_header));
  chain->nonces.reset(new NonceManager(*chain->rpc, signer_->Address()));
  chain->gas.reset(new GasStrategy(*chain->rpc, config.network));
  std::lock_guard<std::mutex> lock(mutex_);
  chains_[config.network] = std::move(chain);
}

RpcTransactionSubmitter::Chain* RpcTransactionSubmitter::Find(const NetworkId& network) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chains_.find(network);
  return it == chains_.end() ? nullptr : it->second.get();
}

std::string RpcTransactionSubmitter::Address() const { return signer_->Address(); }

SubmitResult RpcTransactionSubmitter::SignAndSubmit(const UnsignedTransaction& tx) {
  Chain* chain = Find(tx.network);
  if (!chain) {
    return SubmitResult::Failed(SubmitResult::Status::kSubmissionError, "no RPC endpoint for network " + tx.network);
  }

  TransactionFields fields;
  GasParams fees = tx.fees;
  try {
    if (!fees.IsSet()) fees = chain->gas->Quote();
    fields.gas_limit = tx.gas_limit;
    if (fields.gas_limit == 0) {
      json call = {{"from", signer_->Address()}, {"to", tx.to}, {"data", tx.data}, {"value", tx.value}};
      unsigned long long estimate = chain->rpc->EthEstimateGas(call);
      fields.gas_limit = static_cast<unsigned long long>(std::ceil(estimate * kGasLimitMargin));
    }
    fields.nonce = tx.nonce ? *tx.nonce : chain->nonces->Next();
  } catch (const RpcError& e) {
    return SubmitResult::Failed(SubmitResult::Status::kSubmissionError, e.what(), fees);
  }

  fields.chain_id = static_cast<unsigned long long>(chain->config.chain_id);
  fields.max_fee_per_gas = fees.max_fee_per_gas;
  fields.max_priority_fee_per_gas = fees.max_priority_fee_per_gas;
  fields.to = tx.to;
  fields.value = tx.value;
  fields.data = tx.data;

  std::string raw;
  try {
    raw = signer_->SignEip1559(fields);
  } catch (const std::exception& e) {
    return SubmitResult::Failed(SubmitResult::Status::kSigningError, e.what(), fees);
  }

  try {
    std::string hash = chain->rpc->EthSendRawTransaction(raw);
    METAROUTE_LOG_INFO("Submitted " + hash + " on " + tx.network + " nonce " + std::to_string(fields.nonce));
    return SubmitResult::Submitted(hash, fees);
  } catch (const RpcError& e) {
    // A rejected transaction never consumed its nonce; re-read it next time.
    chain->nonces->Reset();
    return SubmitResult::Failed(SubmitResult::Status::kSubmissionError, e.what(), fees);
  }
}

Receipt RpcTransactionSubmitter::GetReceipt(const NetworkId& network,
                                            const std::string& tx_hash,
                                            const std::string& token_out,
                                            const std::string& recipient) {
  Chain* chain = Find(network);
  if (!chain) throw std::runtime_error("no RPC endpoint for network " + network);

  Receipt out;
  json r = chain->rpc->EthGetTransactionReceipt(tx_hash);
  if (r.is_null()) return out;
  if (!r.is_object()) throw std::runtime_error("malformed receipt for " + tx_hash);

  std::string status = r.value("status", std::string("0x1"));
  out.status = HexToULL(status) == 1 ? ReceiptStatus::kConfirmed : ReceiptStatus::kReverted;
  if (r.contains("gasUsed") && r["gasUsed"].is_string()) out.gas_used = HexToULL(r["gasUsed"].get<std::string>());
  if (out.status != ReceiptStatus::kConfirmed) return out;

  // Sum token_out Transfer events whose destination is the recipient.
  long double received = 0.0L;
  bool seen = false;
  auto logs = r.find("logs");
  if (logs != r.end() && logs->is_array()) {
    for (const auto& log : *logs) {
      if (!SameAddress(log.value("address", std::string()), token_out)) continue;
      const auto& topics = log.value("topics", json::array());
      if (topics.size() < 3 || !topics[0].is_string() || !topics[2].is_string()) continue;
      if (ToLowerHex(topics[0].get<std::string>()) != kTransferTopic) continue;
      if (!SameAddress(Abi::WordToAddress(topics[2].get<std::string>(), 0), recipient)) continue;
      received += Abi::WordToUnits(log.value("data", std::string("0x")), 0);
      seen = true;
    }
  }
  if (seen) out.amount_out = received;
  return out;
}
