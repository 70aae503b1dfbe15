#include "execution/transaction_executor.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <thread>

namespace {
TradeResult Rejected(const AggregationResult& result, const Quote& chosen, ExecutionError error, std::string reason) {
  TradeResult r;
  r.request_id = result.request_id;
  r.source_id = chosen.source_id;
  r.error = error;
  r.failure_reason = std::move(reason);
  return r;
}

bool SameQuote(const Quote& a, const Quote& b) {
  return a.source_id == b.source_id && a.amount_out == b.amount_out && a.fetched_at == b.fetched_at;
}
}

TransactionExecutor::TransactionExecutor(std::shared_ptr<TransactionSubmitter> submitter,
                                         std::shared_ptr<TransactionBuilder> builder,
                                         GasEscalator escalator,
                                         std::chrono::milliseconds retention)
  : submitter_(std::move(submitter)), builder_(std::move(builder)), escalator_(escalator), retention_(retention) {}

bool TransactionExecutor::IsConsumed(const std::string& request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return consumed_.count(request_id) > 0;
}

void TransactionExecutor::Release(const std::string& request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  consumed_.erase(request_id);
}

void TransactionExecutor::PruneConsumed(std::chrono::steady_clock::time_point now) {
  for (auto it = consumed_.begin(); it != consumed_.end();) {
    if (now - it->second > retention_) it = consumed_.erase(it);
    else ++it;
  }
}

bool TransactionExecutor::Claim(const AggregationResult& result, const Quote& chosen,
                                const ExecutionStrategy& strategy, TradeResult& rejected) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = std::chrono::steady_clock::now();
  PruneConsumed(now);
  if (consumed_.count(result.request_id)) {
    rejected = Rejected(result, chosen, ExecutionError::kAlreadyExecuted,
                        "aggregation result " + result.request_id + " was already executed");
    return false;
  }
  bool known = std::any_of(result.quotes.begin(), result.quotes.end(),
                           [&](const AssessedQuote& aq) { return SameQuote(aq.quote, chosen); });
  if (!known) {
    rejected = Rejected(result, chosen, ExecutionError::kUnknownQuote, "quote is not part of this aggregation result");
    return false;
  }
  auto age = now - chosen.fetched_at;
  auto max_age = std::min(strategy.max_quote_age, retention_);
  if (age > max_age) {
    rejected = Rejected(result, chosen, ExecutionError::kQuoteExpired,
                        "quote is " + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(age).count()) +
                        "ms old, limit " + std::to_string(max_age.count()) + "ms");
    return false;
  }
  if (chosen.price_impact_percent > strategy.max_slippage_percent) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "price impact %.2f%% exceeds max slippage %.2f%%",
                  chosen.price_impact_percent, strategy.max_slippage_percent);
    rejected = Rejected(result, chosen, ExecutionError::kSlippageExceeded, buf);
    return false;
  }
  auto newest = chosen.fetched_at;
  for (const auto& aq : result.quotes) newest = std::max(newest, aq.quote.fetched_at);
  consumed_[result.request_id] = newest;
  return true;
}

TradeResult TransactionExecutor::Execute(const AggregationResult& result, const Quote& chosen,
                                         const ExecutionStrategy& strategy) {
  TradeResult out;
  if (!submitter_) {
    out = Rejected(result, chosen, ExecutionError::kUnsupported, "no transaction submitter configured");
    return out;
  }
  if (!Claim(result, chosen, strategy, out)) {
    METAROUTE_LOG_WARNING("Execution refused for " + result.request_id + ": " + out.failure_reason);
    return out;
  }
  out.request_id = result.request_id;
  out.source_id = chosen.source_id;

  std::string recipient = strategy.recipient.empty() ? submitter_->Address() : strategy.recipient;
  UnsignedTransaction tx;
  std::string error;
  if (!builder_->Build(result.request, chosen, strategy, recipient, tx, error)) {
    // Nothing reached the chain, so the result may be executed again.
    Release(result.request_id);
    out.error = ExecutionError::kUnsupported;
    out.failure_reason = error;
    METAROUTE_LOG_ERROR("Cannot build transaction for " + chosen.source_id + ": " + error);
    return out;
  }

  if (SubmitWithRetry(tx, strategy, out)) AwaitReceipt(result.request, recipient, strategy, out);

  StructuredLogger::Instance().Event("tx_result", {
    {"request_id", out.request_id},
    {"source_id", out.source_id},
    {"tx_hash", out.tx_hash},
    {"confirmed", out.confirmed},
    {"error", ToString(out.error)},
    {"attempts", out.attempts},
    {"reason", out.failure_reason},
  });
  return out;
}

bool TransactionExecutor::SubmitWithRetry(UnsignedTransaction tx, const ExecutionStrategy& strategy, TradeResult& out) {
  const int max_retries = std::max(0, std::min(strategy.max_execution_retries, static_cast<int>(escalator_.MaxBumps())));
  for (;;) {
    ++out.attempts;
    SubmitResult sr = submitter_->SignAndSubmit(tx);
    if (sr.ok()) {
      out.tx_hash = sr.tx_hash;
      METAROUTE_LOG_INFO("Submitted " + sr.tx_hash + " for " + out.request_id + " via " + out.source_id);
      StructuredLogger::Instance().Event("tx_submitted", {
        {"request_id", out.request_id},
        {"tx_hash", sr.tx_hash},
        {"attempt", out.attempts},
        {"max_fee_per_gas", sr.fees_used.max_fee_per_gas},
        {"max_priority_fee", sr.fees_used.max_priority_fee_per_gas},
      });
      return true;
    }
    if (sr.status == SubmitResult::Status::kSigningError) {
      out.error = ExecutionError::kSigningError;
      out.failure_reason = sr.error;
      METAROUTE_LOG_ERROR("Signing failed for " + out.request_id + ": " + sr.error);
      return false;
    }
    if (!IsTransientSubmissionError(sr.error)) {
      out.error = ExecutionError::kSubmissionError;
      out.failure_reason = sr.error;
      METAROUTE_LOG_ERROR("Submission rejected for " + out.request_id + ": " + sr.error);
      return false;
    }
    if (out.attempts > max_retries) {
      out.error = ExecutionError::kExecutionFailed;
      out.failure_reason = "transient failure persisted after " + std::to_string(out.attempts) + " attempts: " + sr.error;
      METAROUTE_LOG_ERROR(out.failure_reason);
      return false;
    }
    tx.fees = escalator_.Next(sr.fees_used);
    tx.nonce.reset();
    METAROUTE_LOG_WARNING("Transient submission failure (" + sr.error + "), retrying with bumped gas");
    StructuredLogger::Instance().Event("tx_retry", {
      {"request_id", out.request_id},
      {"attempt", out.attempts},
      {"error", sr.error},
      {"new_max_fee", tx.fees.max_fee_per_gas},
      {"new_max_prio", tx.fees.max_priority_fee_per_gas},
    });
  }
}

void TransactionExecutor::AwaitReceipt(const TradeRequest& request, const std::string& recipient,
                                       const ExecutionStrategy& strategy, TradeResult& out) {
  auto deadline = std::chrono::steady_clock::now() + strategy.receipt_timeout;
  for (;;) {
    try {
      Receipt r = submitter_->GetReceipt(request.network_id, out.tx_hash, request.token_out, recipient);
      if (r.status == ReceiptStatus::kConfirmed) {
        out.confirmed = true;
        out.actual_amount_out = r.amount_out;
        METAROUTE_LOG_INFO("Confirmed " + out.tx_hash + " gas_used=" + std::to_string(r.gas_used));
        return;
      }
      if (r.status == ReceiptStatus::kReverted) {
        out.error = ExecutionError::kExecutionFailed;
        out.failure_reason = "transaction " + out.tx_hash + " reverted";
        METAROUTE_LOG_ERROR(out.failure_reason);
        return;
      }
    } catch (const std::exception& e) {
      METAROUTE_LOG_WARNING("Receipt poll for " + out.tx_hash + " failed: " + e.what());
    }
    if (std::chrono::steady_clock::now() + strategy.receipt_poll_interval > deadline) break;
    std::this_thread::sleep_for(strategy.receipt_poll_interval);
  }
  out.error = ExecutionError::kExecutionFailed;
  out.failure_reason = "no receipt for " + out.tx_hash + " within " + std::to_string(strategy.receipt_timeout.count()) + "ms";
  METAROUTE_LOG_WARNING(out.failure_reason);
}
