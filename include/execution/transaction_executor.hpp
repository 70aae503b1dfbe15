#pragma once
#include <memory>
#include <mutex>
#include <chrono>
#include <string>
#include <unordered_map>
#include "core/types.hpp"
#include "execution/transaction_builder.hpp"
#include "execution/transaction_submitter.hpp"
#include "scheduler/gas_escalator.hpp"

// Executes a chosen quote at most once per AggregationResult. Precondition
// failures return before the submitter is touched.
// Quotes older than the retention window are always expired, so executed
// results are forgotten once their newest quote leaves that window.
class TransactionExecutor {
public:
  static constexpr std::chrono::milliseconds kDefaultRetention{std::chrono::minutes(10)};

  TransactionExecutor(std::shared_ptr<TransactionSubmitter> submitter,
                      std::shared_ptr<TransactionBuilder> builder,
                      GasEscalator escalator = GasEscalator(),
                      std::chrono::milliseconds retention = kDefaultRetention);

  TradeResult Execute(const AggregationResult& result, const Quote& chosen, const ExecutionStrategy& strategy);
  bool IsConsumed(const std::string& request_id) const;

private:
  // Claims the result for execution, or fills `rejected` and returns false.
  bool Claim(const AggregationResult& result, const Quote& chosen, const ExecutionStrategy& strategy,
             TradeResult& rejected);
  void Release(const std::string& request_id);
  // Caller holds mutex_.
  void PruneConsumed(std::chrono::steady_clock::time_point now);
  bool SubmitWithRetry(UnsignedTransaction tx, const ExecutionStrategy& strategy, TradeResult& out);
  void AwaitReceipt(const TradeRequest& request, const std::string& recipient,
                    const ExecutionStrategy& strategy, TradeResult& out);

  std::shared_ptr<TransactionSubmitter> submitter_;
  std::shared_ptr<TransactionBuilder> builder_;
  GasEscalator escalator_;
  std::chrono::milliseconds retention_;
  mutable std::mutex mutex_;
  // request_id -> fetched_at of the newest quote in that result
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> consumed_;
};
