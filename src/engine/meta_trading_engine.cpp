#include "engine/meta_trading_engine.hpp"
#include "aggregation/route_selector.hpp"
#include "config/source_registry.hpp"
#include "common/logger.hpp"
#include "routing/reserves_cache.hpp"
#include "sources/builtin_aggregator_adapter.hpp"
#include "sources/direct_dex_adapter.hpp"
#include "sources/external_aggregator_adapter.hpp"
#include "telemetry/structured_logger.hpp"
#include "utils/hex.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

namespace {
size_t ClampWorkers(size_t requested) {
  return std::min(std::max<size_t>(requested, 1), EngineOptions::kMaxWorkerThreads);
}
}

MetaTradingEngine::MetaTradingEngine(std::shared_ptr<const SourceRegistry> registry,
                                     std::shared_ptr<TransactionSubmitter> submitter,
                                     EngineOptions options)
  : registry_(std::move(registry)),
    limiter_(std::make_shared<RateLimiter>()),
    reserves_(std::make_shared<V2ReservesCache>(options.reserves_ttl)),
    builder_(std::make_shared<TransactionBuilder>(registry_, nullptr)),
    executor_(std::move(submitter), builder_),
    aggregator_(registry_, ClampWorkers(options.worker_threads)) {}

void MetaTradingEngine::RegisterAdapter(std::shared_ptr<QuoteSourceAdapter> adapter) {
  if (auto external = std::dynamic_pointer_cast<ExternalAggregatorAdapter>(adapter)) builder_->SetExternalClient(external);
  aggregator_.RegisterAdapter(std::move(adapter));
}

void MetaTradingEngine::InstallStandardAdapters(std::shared_ptr<HttpClient> http,
                                                std::shared_ptr<ChainQuoterRegistry> quoters) {
  RegisterAdapter(std::make_shared<DirectDexAdapter>(quoters, reserves_));
  RegisterAdapter(std::make_shared<BuiltinAggregatorAdapter>(registry_, quoters, reserves_));
  RegisterAdapter(std::make_shared<ExternalAggregatorAdapter>(std::move(http), limiter_));
}

std::string MetaTradingEngine::ValidateRequest(const TradeRequest& request, const ExecutionStrategy& strategy) {
  if (request.network_id.empty()) return "network_id is empty";
  if (!IsHexAddress(request.token_in)) return "token_in is not an address: " + request.token_in;
  if (!IsHexAddress(request.token_out)) return "token_out is not an address: " + request.token_out;
  if (SameAddress(request.token_in, request.token_out)) return "token_in and token_out are the same token";
  if (!std::isfinite(static_cast<double>(request.amount_in)) || request.amount_in <= 0.0L) return "amount_in must be positive";
  if (strategy.global_timeout.count() <= 0 || strategy.quote_timeout_per_source.count() <= 0) return "timeouts must be positive";
  if (strategy.max_slippage_percent < 0.0) return "max_slippage_percent is negative";
  return std::string();
}

AggregationResult MetaTradingEngine::Quote(const TradeRequest& request, const ExecutionStrategy& strategy) {
  AggregationResult result;
  result.request_id = request.request_id;
  result.request = request;

  std::string invalid = ValidateRequest(request, strategy);
  if (!invalid.empty()) {
    result.status = AggregationStatus::kInvalidRequest;
    result.recommended_execution.rationale = "invalid_request: " + invalid;
    result.warnings.push_back(invalid);
    METAROUTE_LOG_WARNING("Rejected request " + request.request_id + ": " + invalid);
    stats_.RecordQuoteCycle(result);
    return result;
  }

  GatherOutcome outcome = aggregator_.Gather(request, strategy);
  result.quotes = std::move(outcome.quotes);
  result.failures = std::move(outcome.failures);
  result.elapsed = outcome.elapsed;
  if (outcome.global_timeout_hit) result.warnings.push_back("global timeout reached; slow sources were cancelled");

  if (outcome.no_viable_route) {
    result.status = AggregationStatus::kNoViableRoute;
    result.recommended_execution.should_execute = false;
    result.recommended_execution.rationale = "no_viable_route: " + std::to_string(outcome.candidates) +
                                             " candidate sources, none returned a quote";
  } else {
    SelectionOutcome sel = RouteSelector::Select(result.quotes, strategy);
    result.status = AggregationStatus::kOk;
    result.best_quote = result.quotes[*sel.best_index].quote;
    result.recommended_execution = sel.recommendation;
    result.warnings.insert(result.warnings.end(), sel.warnings.begin(), sel.warnings.end());
    METAROUTE_LOG_INFO("Request " + request.request_id + " best=" + result.best_quote->source_id + " " +
                       result.recommended_execution.rationale);
    StructuredLogger::Instance().Event("route_selected", {
      {"request_id", request.request_id},
      {"source_id", result.best_quote->source_id},
      {"amount_out", static_cast<double>(result.best_quote->amount_out)},
      {"risk", ToString(result.recommended_execution.risk_level)},
      {"should_execute", result.recommended_execution.should_execute},
      {"rationale", result.recommended_execution.rationale},
    });
  }

  StructuredLogger::Instance().Event("quote_cycle", {
    {"request_id", request.request_id},
    {"network", request.network_id},
    {"mode", ToString(strategy.mode)},
    {"status", ToString(result.status)},
    {"candidates", outcome.candidates},
    {"quotes", result.quotes.size()},
    {"failures", result.failures.size()},
    {"elapsed_ms", result.elapsed.count()},
  });
  stats_.RecordQuoteCycle(result);
  return result;
}

TradeResult MetaTradingEngine::Execute(const AggregationResult& result, const ExecutionStrategy& strategy) {
  if (!result.best_quote) {
    TradeResult r;
    r.request_id = result.request_id;
    r.error = ExecutionError::kUnknownQuote;
    r.failure_reason = "aggregation result has no best quote";
    stats_.RecordExecution(r);
    return r;
  }
  return Execute(result, *result.best_quote, strategy);
}

TradeResult MetaTradingEngine::Execute(const AggregationResult& result, const ::Quote& chosen,
                                       const ExecutionStrategy& strategy) {
  TradeResult r = executor_.Execute(result, chosen, strategy);
  stats_.RecordExecution(r);
  return r;
}

PerformanceStats MetaTradingEngine::Stats() const { return stats_.Snapshot(); }
