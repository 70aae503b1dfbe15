#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "core/types.hpp"
#include "scheduler/thread_pool.hpp"
#include "sources/quote_source_adapter.hpp"

class SourceRegistry;

struct GatherOutcome {
  bool no_viable_route = true;
  std::vector<AssessedQuote> quotes;   // slot order, not ranked
  std::vector<SourceFailure> failures;
  std::size_t candidates = 0;
  bool global_timeout_hit = false;
  std::chrono::milliseconds elapsed{0};
};

// Fans one request out to every applicable source on a fixed worker pool and
// collects whatever settles before the per-source and global deadlines.
// Results that arrive after their slot was abandoned are dropped.
class QuoteAggregator {
public:
  QuoteAggregator(std::shared_ptr<const SourceRegistry> registry, size_t worker_threads);
  ~QuoteAggregator();

  // Replaces any adapter previously registered for the same kind.
  void RegisterAdapter(std::shared_ptr<QuoteSourceAdapter> adapter);
  std::shared_ptr<QuoteSourceAdapter> Adapter(SourceKind kind) const;

  GatherOutcome Gather(const TradeRequest& request, const ExecutionStrategy& strategy);

private:
  struct GatherState;
  static void RunFetch(const std::shared_ptr<GatherState>& state, size_t slot,
                       const std::shared_ptr<QuoteSourceAdapter>& adapter, const TradeRequest& request);

  std::shared_ptr<const SourceRegistry> registry_;
  mutable std::mutex adapters_mutex_;
  std::map<SourceKind, std::shared_ptr<QuoteSourceAdapter>> adapters_;
  ThreadPool pool_;
};
