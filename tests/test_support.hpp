#pragma once
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "chain/chain_quoter.hpp"
#include "config/source_registry.hpp"
#include "execution/transaction_submitter.hpp"
#include "net/http_client.hpp"
#include "sources/quote_source_adapter.hpp"
#include "utils/hex.hpp"
#include "utils/json_rpc.hpp"

namespace testing_support {

constexpr const char* kWeth = "0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2";
constexpr const char* kUsdc = "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48";
constexpr const char* kDai = "0x6B175474E89094C44Da98b954EedeAC495271d0F";
constexpr const char* kRecipient = "0x1111111111111111111111111111111111111111";
constexpr const char* kRouterA = "0x7a250d5630B4cF539739dF2C5dAcb4c659F2488D";
constexpr const char* kFactoryA = "0x5C69bEe701ef814a2B6a3EDD4B1652CB9cc5aA6f";
constexpr const char* kRouterB = "0xd9e1cE17f2641f24aE83637ab66a2cca9C378B9F";
constexpr const char* kFactoryB = "0xC0AEe478e3658e2610c5F7A4A2E1777cE9e4f2Ac";
constexpr const char* kV3Router = "0xE592427A0AEce92De3Edee1F18E0157C05861564";
constexpr const char* kV3Quoter = "0x61fFE014bA17989E743c5F6cB21bF9697530B21e";

inline TradeRequest MakeRequest(long double amount = 1000.0L, const std::string& network = "ethereum") {
  return TradeRequest::Create(network, kWeth, kUsdc, amount);
}

// Registry with one external source per id, all on "ethereum".
inline std::shared_ptr<SourceRegistry> ExternalRegistry(const std::vector<std::string>& ids,
                                                        unsigned rate_limit_per_minute = 0) {
  nlohmann::json doc;
  doc["external_aggregators"] = nlohmann::json::object();
  for (const auto& id : ids) {
    doc["external_aggregators"][id] = {
      {"name", id},
      {"api_url", "https://" + id + ".example/api"},
      {"supported_networks", {"ethereum"}},
      {"rate_limit_per_minute", rate_limit_per_minute},
    };
  }
  auto reg = std::make_shared<SourceRegistry>();
  reg->LoadFromJson(doc.dump());
  return reg;
}

inline Quote MakeQuote(const std::string& source, long double amount_out, unsigned long long gas = 0,
                       double impact = 0.1, double confidence = 0.9) {
  Quote q;
  q.source_id = source;
  q.source_kind = SourceKind::kExternalAggregator;
  q.amount_out = amount_out;
  q.gas_estimate = gas;
  q.price_impact_percent = impact;
  q.confidence = confidence;
  q.route.push_back(RouteHop{source, kWeth, kUsdc, source, 0});
  q.fetched_at = std::chrono::steady_clock::now();
  return q;
}

// HttpClient answering from a per-URL script and recording every request.
class FakeHttpClient : public HttpClient {
public:
  struct Request {
    std::string url;
    std::string body;
    std::unordered_map<std::string, std::string> headers;
    int timeout_ms = 0;
  };

  void Respond(const std::string& url, long status, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[url] = HttpResponse{status, body, status == 0 ? "connection refused" : ""};
  }
  // Handler receiving the parsed JSON-RPC request; returns the "result" value.
  void RpcHandler(std::function<nlohmann::json(const std::string& method, const nlohmann::json& params)> fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    rpc_ = std::move(fn);
  }

  HttpResponse Post(const std::string& url, const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers, int timeout_ms) override {
    std::function<nlohmann::json(const std::string&, const nlohmann::json&)> rpc;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(Request{url, body, headers, timeout_ms});
      auto it = responses_.find(url);
      if (it != responses_.end()) return it->second;
      rpc = rpc_;
    }
    if (rpc) {
      auto req = nlohmann::json::parse(body);
      nlohmann::json reply = {{"jsonrpc", "2.0"}, {"id", req["id"]}};
      try {
        reply["result"] = rpc(req["method"].get<std::string>(), req["params"]);
      } catch (const std::runtime_error& e) {
        reply.erase("result");
        reply["error"] = {{"code", -32000}, {"message", e.what()}};
      }
      return HttpResponse{200, reply.dump(), ""};
    }
    return HttpResponse{404, "", ""};
  }

  std::vector<Request> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }
  size_t RequestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

private:
  mutable std::mutex mutex_;
  std::map<std::string, HttpResponse> responses_;
  std::function<nlohmann::json(const std::string&, const nlohmann::json&)> rpc_;
  std::vector<Request> requests_;
};

// In-memory chain state: v2 pools keyed by factory and token pair, v3
// quotes keyed by fee tier.
class FakeChainQuoter : public ChainQuoter {
public:
  void AddPool(const std::string& factory, const std::string& a, const std::string& b,
               long double reserve_a, long double reserve_b) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string pool = "0x" + std::string(38, '0') + std::to_string(10 + pools_.size()).substr(0, 2);
    pools_[Key(factory, a, b)] = pool;
    reserves_[ToLowerHex(pool) + "|" + ToLowerHex(a)] = PoolReserves{reserve_a, reserve_b};
    reserves_[ToLowerHex(pool) + "|" + ToLowerHex(b)] = PoolReserves{reserve_b, reserve_a};
  }
  void SetV3Quote(unsigned tier, long double amount_out, unsigned long long gas = 140000) {
    std::lock_guard<std::mutex> lock(mutex_);
    v3_[tier] = SimulatedQuote{amount_out, gas};
  }
  void FailReservesWith(std::function<void()> thrower) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserves_failure_ = std::move(thrower);
  }
  void SetRouterAmounts(std::function<std::vector<long double>(long double, const std::vector<std::string>&)> fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    router_ = std::move(fn);
  }

  SimulatedQuote SimulateQuote(const std::string&, const std::string&, const std::string&,
                               long double amount_in, unsigned fee_tier, int) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++simulate_calls;
    auto it = v3_.find(fee_tier);
    if (it == v3_.end()) throw RpcError(RpcError::Kind::kRpc, "execution reverted");
    // Linear in size below the quoted amount keeps reference quotes meaningful.
    SimulatedQuote q = it->second;
    if (amount_in < last_full_amount_) q.amount_out = it->second.amount_out * amount_in / last_full_amount_ * 1.01L;
    else last_full_amount_ = amount_in;
    return q;
  }
  std::vector<long double> GetAmountsOut(const std::string&, long double amount_in,
                                         const std::vector<std::string>& path, int) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!router_) throw RpcError(RpcError::Kind::kRpc, "execution reverted");
    return router_(amount_in, path);
  }
  std::string FindPool(const std::string& factory, const std::string& a, const std::string& b, int) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++find_pool_calls;
    auto it = pools_.find(Key(factory, a, b));
    return it == pools_.end() ? std::string() : it->second;
  }
  PoolReserves ReadPoolReserves(const std::string& pool, const std::string& token_in, const std::string&, int) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++reserve_reads;
    if (reserves_failure_) reserves_failure_();
    return reserves_.at(ToLowerHex(pool) + "|" + ToLowerHex(token_in));
  }

  int simulate_calls = 0;
  int find_pool_calls = 0;
  int reserve_reads = 0;

private:
  static std::string Key(const std::string& factory, const std::string& a, const std::string& b) {
    std::string x = ToLowerHex(a), y = ToLowerHex(b);
    if (y < x) std::swap(x, y);
    return ToLowerHex(factory) + "|" + x + "|" + y;
  }
  std::mutex mutex_;
  std::map<std::string, std::string> pools_;
  std::map<std::string, PoolReserves> reserves_;
  std::map<unsigned, SimulatedQuote> v3_;
  std::function<void()> reserves_failure_;
  std::function<std::vector<long double>(long double, const std::vector<std::string>&)> router_;
  long double last_full_amount_ = 0.0L;
};

// Adapter driven by a per-source script. A hanging source waits for its
// cancel flag (bounded) so worker threads always drain.
class ScriptedAdapter : public QuoteSourceAdapter {
public:
  struct Behavior {
    long double amount_out = 0.0L;
    std::chrono::milliseconds delay{0};
    bool hang = false;
    SourceError error = SourceError::kNone;
    bool throws = false;
    double impact = 0.1;
    unsigned long long gas = 100000;
    double confidence = 0.9;
    std::string override_source_id;
    std::string calldata;   // attached with tx_to = kRouterA when set
  };

  explicit ScriptedAdapter(SourceKind kind = SourceKind::kExternalAggregator) : kind_(kind) {}

  void Script(const std::string& id, Behavior b) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_[id] = b;
  }
  SourceKind Kind() const override { return kind_; }

  FetchResult FetchQuote(const TradeRequest& request, const SourceDescriptor& d, const FetchContext& ctx) override {
    Behavior b;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++calls_;
      b = script_[d.id];
    }
    if (b.hang) {
      auto limit = std::chrono::steady_clock::now() + std::chrono::seconds(5);
      while (!ctx.Cancelled() && std::chrono::steady_clock::now() < limit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
      saw_cancel_ = ctx.Cancelled();
      return FetchResult::Fail(SourceError::kTimeout, "cancelled");
    }
    if (b.delay.count() > 0) std::this_thread::sleep_for(b.delay);
    if (b.throws) throw std::runtime_error("adapter exploded");
    if (b.error != SourceError::kNone) return FetchResult::Fail(b.error, "scripted failure");
    Quote q;
    q.source_id = b.override_source_id.empty() ? d.id : b.override_source_id;
    q.source_kind = d.kind;
    q.amount_out = b.amount_out;
    q.gas_estimate = b.gas;
    q.price_impact_percent = b.impact;
    q.confidence = b.confidence;
    q.route.push_back(RouteHop{d.id, request.token_in, request.token_out, d.id, 0});
    if (!b.calldata.empty()) {
      q.calldata = b.calldata;
      q.tx_to = kRouterA;
    }
    q.fetched_at = std::chrono::steady_clock::now();
    return FetchResult::Ok(q);
  }

  int Calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
  bool SawCancel() const { return saw_cancel_.load(); }

private:
  SourceKind kind_;
  mutable std::mutex mutex_;
  std::map<std::string, Behavior> script_;
  int calls_ = 0;
  std::atomic<bool> saw_cancel_{false};
};

// Submitter replaying queued results; every SignAndSubmit is recorded.
class FakeSubmitter : public TransactionSubmitter {
public:
  void QueueResult(SubmitResult r) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.push_back(std::move(r));
  }
  void SetReceipt(Receipt r) {
    std::lock_guard<std::mutex> lock(mutex_);
    receipt_ = r;
  }

  SubmitResult SignAndSubmit(const UnsignedTransaction& tx) override {
    std::lock_guard<std::mutex> lock(mutex_);
    submitted_.push_back(tx);
    if (results_.empty()) {
      GasParams fees = tx.fees.IsSet() ? tx.fees : GasParams{100, 10};
      return SubmitResult::Submitted("0xhash" + std::to_string(submitted_.size()), fees);
    }
    SubmitResult r = results_.front();
    results_.pop_front();
    return r;
  }
  Receipt GetReceipt(const NetworkId&, const std::string&, const std::string&, const std::string&) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++receipt_polls_;
    return receipt_;
  }
  std::string Address() const override { return kRecipient; }

  std::vector<UnsignedTransaction> Submitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_;
  }
  int ReceiptPolls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return receipt_polls_;
  }

private:
  mutable std::mutex mutex_;
  std::deque<SubmitResult> results_;
  std::vector<UnsignedTransaction> submitted_;
  Receipt receipt_{ReceiptStatus::kConfirmed, std::nullopt, 21000};
  int receipt_polls_ = 0;
};

} // namespace testing_support
