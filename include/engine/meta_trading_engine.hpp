#pragma once
#include <memory>
#include "core/types.hpp"
#include "aggregation/quote_aggregator.hpp"
#include "execution/transaction_executor.hpp"
#include "sources/rate_limiter.hpp"
#include "telemetry/stats_collector.hpp"

class SourceRegistry;
class HttpClient;
class ChainQuoterRegistry;
class V2ReservesCache;

struct EngineOptions {
  static constexpr size_t kMaxWorkerThreads = 64;
  size_t worker_threads = 8;     // clamped to [1, kMaxWorkerThreads]
  std::chrono::milliseconds reserves_ttl{3000};
};

// Entry point for callers: quote a trade across every applicable source,
// execute the chosen route, read statistics. Each instance owns its own
// counters, rate-limit buckets and worker pool.
class MetaTradingEngine {
public:
  MetaTradingEngine(std::shared_ptr<const SourceRegistry> registry,
                    std::shared_ptr<TransactionSubmitter> submitter,
                    EngineOptions options = EngineOptions());

  void RegisterAdapter(std::shared_ptr<QuoteSourceAdapter> adapter);
  // DirectDex and built-in adapters over `quoters`, external adapter over `http`.
  void InstallStandardAdapters(std::shared_ptr<HttpClient> http, std::shared_ptr<ChainQuoterRegistry> quoters);

  AggregationResult Quote(const TradeRequest& request, const ExecutionStrategy& strategy);
  // Executes result.best_quote.
  TradeResult Execute(const AggregationResult& result, const ExecutionStrategy& strategy);
  TradeResult Execute(const AggregationResult& result, const ::Quote& chosen, const ExecutionStrategy& strategy);
  PerformanceStats Stats() const;

  // Empty when the request and strategy are usable, else the first problem.
  static std::string ValidateRequest(const TradeRequest& request, const ExecutionStrategy& strategy);

private:
  std::shared_ptr<const SourceRegistry> registry_;
  std::shared_ptr<RateLimiter> limiter_;
  std::shared_ptr<V2ReservesCache> reserves_;
  std::shared_ptr<TransactionBuilder> builder_;
  StatsCollector stats_;
  TransactionExecutor executor_;
  QuoteAggregator aggregator_;
};
