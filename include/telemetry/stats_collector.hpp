#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include "core/types.hpp"

struct SourceStats {
  unsigned long long requests = 0;
  unsigned long long successes = 0;
  unsigned long long failures = 0;
  unsigned long long timeouts = 0;
  unsigned long long rate_limited = 0;
  double avg_latency_ms = 0.0; // over successful quotes

  double SuccessRate() const { return requests ? static_cast<double>(successes) / requests : 0.0; }
};

struct PerformanceStats {
  unsigned long long quote_cycles = 0;
  unsigned long long quotes_requested = 0;   // source fetches issued
  unsigned long long quotes_succeeded = 0;
  unsigned long long no_viable_route = 0;
  unsigned long long invalid_requests = 0;
  unsigned long long executions_attempted = 0; // reached the submitter
  unsigned long long executions_succeeded = 0;
  unsigned long long executions_failed = 0;
  unsigned long long executions_refused = 0;   // stopped before any submission
  long double cumulative_savings = 0.0L;     // best minus worst amount_out, summed
  double avg_savings_percent = 0.0;
  double avg_gather_latency_ms = 0.0;
  std::map<std::string, SourceStats> per_source;
};

// Thread-safe, purely additive counters owned by one engine instance.
class StatsCollector {
public:
  void RecordQuoteCycle(const AggregationResult& result);
  void RecordExecution(const TradeResult& result);
  PerformanceStats Snapshot() const;
private:
  mutable std::mutex mutex_;
  PerformanceStats stats_;
  unsigned long long savings_samples_ = 0;
};
