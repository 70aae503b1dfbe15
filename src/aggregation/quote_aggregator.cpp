#include "aggregation/quote_aggregator.hpp"
#include "aggregation/risk_assessor.hpp"
#include "config/source_registry.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <condition_variable>

using Clock = std::chrono::steady_clock;

namespace {
enum class SlotPhase { kPending, kDone, kAbandoned };

std::chrono::milliseconds Since(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}
}

struct QuoteAggregator::GatherState {
  struct Slot {
    SourceDescriptor descriptor;
    SlotPhase phase = SlotPhase::kPending;
    Clock::time_point deadline;
    std::shared_ptr<std::atomic<bool>> cancel = std::make_shared<std::atomic<bool>>(false);
    std::optional<AssessedQuote> quote;
    std::optional<SourceFailure> failure;
  };
  Clock::time_point start;
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<Slot> slots;
  std::size_t arrivals = 0;
};

QuoteAggregator::QuoteAggregator(std::shared_ptr<const SourceRegistry> registry, size_t worker_threads)
  : registry_(std::move(registry)), pool_(worker_threads) {}

QuoteAggregator::~QuoteAggregator() = default;

void QuoteAggregator::RegisterAdapter(std::shared_ptr<QuoteSourceAdapter> adapter) {
  if (!adapter) throw std::invalid_argument("null adapter");
  std::lock_guard<std::mutex> lock(adapters_mutex_);
  adapters_[adapter->Kind()] = std::move(adapter);
}

std::shared_ptr<QuoteSourceAdapter> QuoteAggregator::Adapter(SourceKind kind) const {
  std::lock_guard<std::mutex> lock(adapters_mutex_);
  auto it = adapters_.find(kind);
  return it == adapters_.end() ? nullptr : it->second;
}

void QuoteAggregator::RunFetch(const std::shared_ptr<GatherState>& state, size_t index,
                               const std::shared_ptr<QuoteSourceAdapter>& adapter, const TradeRequest& request) {
  // Slots are never resized once tasks run; descriptor/deadline/cancel are read-only here.
  const auto& slot = state->slots[index];
  FetchContext ctx;
  ctx.deadline = slot.deadline;
  ctx.cancelled = slot.cancel;

  FetchResult result;
  if (ctx.Expired()) {
    result = FetchResult::Fail(SourceError::kTimeout, "deadline passed before the fetch started");
  } else {
    try {
      result = adapter->FetchQuote(request, slot.descriptor, ctx);
    } catch (const std::exception& e) {
      result = FetchResult::Fail(SourceError::kSourceUnavailable, std::string("adapter threw: ") + e.what());
    }
  }

  std::optional<AssessedQuote> assessed;
  if (result.ok()) {
    Quote& q = *result.quote;
    if (q.source_id != slot.descriptor.id) {
      result = FetchResult::Fail(SourceError::kInvalidResponse, "quote tagged with foreign source id " + q.source_id);
    } else if (!(q.amount_out > 0.0L) || !std::isfinite(static_cast<double>(q.amount_out))) {
      result = FetchResult::Fail(SourceError::kInvalidResponse, "non-positive amount_out");
    } else {
      q.source_kind = slot.descriptor.kind;
      q.confidence = std::clamp(std::isfinite(q.confidence) ? q.confidence : 0.0, 0.0, 1.0);
      assessed = AssessedQuote{q, RiskAssessor::Assess(q)};
    }
  }

  auto latency = Since(state->start);
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    auto& s = state->slots[index];
    if (s.phase != SlotPhase::kPending) {
      METAROUTE_LOG_DEBUG("Discarding late result from " + s.descriptor.id);
      return;
    }
    s.phase = SlotPhase::kDone;
    if (assessed) {
      assessed->quote.arrival_index = state->arrivals++;
      assessed->quote.latency = latency;
      s.quote = std::move(assessed);
    } else {
      s.failure = SourceFailure{s.descriptor.id, result.error, result.detail, latency};
    }
  }
  state->cv.notify_all();
}

GatherOutcome QuoteAggregator::Gather(const TradeRequest& request, const ExecutionStrategy& strategy) {
  GatherOutcome outcome;
  auto state = std::make_shared<GatherState>();
  state->start = Clock::now();
  const auto global_deadline = state->start + strategy.global_timeout;
  const auto source_deadline = std::min(global_deadline, state->start + strategy.quote_timeout_per_source);

  auto candidates = registry_->Candidates(request.network_id, strategy.mode);
  outcome.candidates = candidates.size();
  state->slots.resize(candidates.size());
  std::vector<std::shared_ptr<QuoteSourceAdapter>> adapters(candidates.size());
  for (size_t i = 0; i < candidates.size(); ++i) {
    auto& slot = state->slots[i];
    slot.descriptor = candidates[i];
    slot.deadline = source_deadline;
    adapters[i] = Adapter(candidates[i].kind);
    if (!adapters[i]) {
      slot.phase = SlotPhase::kDone;
      slot.failure = SourceFailure{slot.descriptor.id, SourceError::kUnsupported,
                                   std::string("no adapter for ") + ToString(slot.descriptor.kind), {}};
    }
  }
  for (size_t i = 0; i < candidates.size(); ++i) {
    if (!adapters[i]) continue;
    auto adapter = adapters[i];
    pool_.Enqueue([state, i, adapter, request] { RunFetch(state, i, adapter, request); });
  }

  {
    std::unique_lock<std::mutex> lock(state->mutex);
    for (;;) {
      auto now = Clock::now();
      bool global_expired = now >= global_deadline;
      size_t pending = 0;
      auto next_wake = global_deadline;
      for (auto& slot : state->slots) {
        if (slot.phase != SlotPhase::kPending) continue;
        if (global_expired || now >= slot.deadline) {
          slot.phase = SlotPhase::kAbandoned;
          slot.cancel->store(true);
          slot.failure = SourceFailure{slot.descriptor.id, SourceError::kTimeout,
                                       global_expired ? "cancelled at global timeout" : "no answer within per-source timeout",
                                       Since(state->start)};
          if (global_expired) outcome.global_timeout_hit = true;
          continue;
        }
        ++pending;
        next_wake = std::min(next_wake, slot.deadline);
      }
      if (pending == 0) break;
      state->cv.wait_until(lock, next_wake);
    }
    for (auto& slot : state->slots) {
      if (slot.quote) outcome.quotes.push_back(*slot.quote);
      else if (slot.failure) outcome.failures.push_back(*slot.failure);
    }
  }

  outcome.elapsed = Since(state->start);
  outcome.no_viable_route = outcome.quotes.empty();
  for (const auto& f : outcome.failures) {
    METAROUTE_LOG_WARNING("Source " + f.source_id + " abstained (" + ToString(f.error) + "): " + f.detail);
    StructuredLogger::Instance().Event("source_failure", {
      {"request_id", request.request_id},
      {"source_id", f.source_id},
      {"error", ToString(f.error)},
      {"detail", f.detail},
      {"latency_ms", f.latency.count()},
    });
  }
  if (outcome.no_viable_route) {
    METAROUTE_LOG_WARNING("No viable route for request " + request.request_id + " across " +
                          std::to_string(outcome.candidates) + " candidate sources");
  }
  return outcome;
}
