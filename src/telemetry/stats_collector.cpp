#include "telemetry/stats_collector.hpp"
#include <algorithm>

namespace {
// Incremental mean update.
void Fold(double& avg, unsigned long long n, double sample) {
  avg += (sample - avg) / static_cast<double>(n);
}
}

void StatsCollector::RecordQuoteCycle(const AggregationResult& result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (result.status == AggregationStatus::kInvalidRequest) {
    ++stats_.invalid_requests;
    return;
  }
  ++stats_.quote_cycles;
  Fold(stats_.avg_gather_latency_ms, stats_.quote_cycles, static_cast<double>(result.elapsed.count()));
  stats_.quotes_requested += result.quotes.size() + result.failures.size();
  stats_.quotes_succeeded += result.quotes.size();
  if (result.status == AggregationStatus::kNoViableRoute) ++stats_.no_viable_route;

  for (const auto& aq : result.quotes) {
    auto& s = stats_.per_source[aq.quote.source_id];
    ++s.requests;
    ++s.successes;
    Fold(s.avg_latency_ms, s.successes, static_cast<double>(aq.quote.latency.count()));
  }
  for (const auto& f : result.failures) {
    auto& s = stats_.per_source[f.source_id];
    ++s.requests;
    ++s.failures;
    if (f.error == SourceError::kTimeout) ++s.timeouts;
    if (f.error == SourceError::kRateLimited) ++s.rate_limited;
  }

  if (result.best_quote && result.quotes.size() >= 2) {
    long double worst = result.best_quote->amount_out;
    for (const auto& aq : result.quotes) worst = std::min(worst, aq.quote.amount_out);
    long double saved = result.best_quote->amount_out - worst;
    if (saved > 0.0L) stats_.cumulative_savings += saved;
    ++savings_samples_;
    double pct = worst > 0.0L ? static_cast<double>(saved / worst * 100.0L) : 0.0;
    Fold(stats_.avg_savings_percent, savings_samples_, pct);
  }
}

void StatsCollector::RecordExecution(const TradeResult& result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (result.attempts == 0) {
    ++stats_.executions_refused;
    return;
  }
  ++stats_.executions_attempted;
  if (result.ok()) ++stats_.executions_succeeded;
  else ++stats_.executions_failed;
}

PerformanceStats StatsCollector::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}
