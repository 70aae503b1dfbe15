#pragma once
#include <atomic>
#include <exception>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "core/types.hpp"
#include "config/source_registry.hpp"

// Deadline and cancel flag handed to one fetch. Adapters bound their I/O by
// RemainingMs() and may stop early once Cancelled() turns true.
struct FetchContext {
  std::chrono::steady_clock::time_point deadline;
  std::shared_ptr<std::atomic<bool>> cancelled;

  static FetchContext WithTimeout(std::chrono::milliseconds timeout) {
    FetchContext ctx;
    ctx.deadline = std::chrono::steady_clock::now() + timeout;
    ctx.cancelled = std::make_shared<std::atomic<bool>>(false);
    return ctx;
  }
  int RemainingMs() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
  }
  bool Cancelled() const { return cancelled && cancelled->load(); }
  bool Expired() const { return Cancelled() || std::chrono::steady_clock::now() >= deadline; }
};

struct FetchResult {
  std::optional<Quote> quote;
  SourceError error = SourceError::kNone;
  std::string detail;

  static FetchResult Ok(Quote q) { FetchResult r; r.quote = std::move(q); return r; }
  static FetchResult Fail(SourceError e, std::string detail) {
    FetchResult r; r.error = e; r.detail = std::move(detail); return r;
  }
  bool ok() const { return quote.has_value(); }
};

// One implementation per SourceKind. FetchQuote must not throw for
// source-level failures; it reports them through FetchResult.
class QuoteSourceAdapter {
public:
  virtual ~QuoteSourceAdapter() = default;
  virtual SourceKind Kind() const = 0;
  virtual FetchResult FetchQuote(const TradeRequest& request,
                                 const SourceDescriptor& descriptor,
                                 const FetchContext& ctx) = 0;

protected:
  // Guards the network precondition shared by every adapter.
  static std::optional<FetchResult> CheckApplicable(const TradeRequest& request, const SourceDescriptor& descriptor);
};

// Maps an exception raised by ChainQuoter into a source error. A request
// whose context already expired is reported as a timeout regardless of cause.
FetchResult ChainFailure(const std::exception& e, const FetchContext& ctx);
