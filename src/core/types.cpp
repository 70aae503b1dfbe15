#include "core/types.hpp"
#include <algorithm>
#include <cctype>
#include <random>
#include <sstream>
#include <iomanip>

const char* ToString(SourceKind kind) {
  switch (kind) {
    case SourceKind::kDirectDex: return "direct_dex";
    case SourceKind::kBuiltinAggregator: return "builtin_aggregator";
    case SourceKind::kExternalAggregator: return "external_aggregator";
  }
  return "unknown";
}

const char* ToString(ExecutionMode mode) {
  switch (mode) {
    case ExecutionMode::kDirectDex: return "direct_dex";
    case ExecutionMode::kNormalAggregation: return "normal_aggregation";
    case ExecutionMode::kMetaAggregation: return "meta_aggregation";
  }
  return "unknown";
}

const char* ToString(RiskLevel level) {
  switch (level) {
    case RiskLevel::kLow: return "Low";
    case RiskLevel::kMedium: return "Medium";
    case RiskLevel::kHigh: return "High";
    case RiskLevel::kVeryHigh: return "VeryHigh";
  }
  return "unknown";
}

const char* ToString(SourceError error) {
  switch (error) {
    case SourceError::kNone: return "none";
    case SourceError::kSourceUnavailable: return "source_unavailable";
    case SourceError::kTimeout: return "timeout";
    case SourceError::kInvalidResponse: return "invalid_response";
    case SourceError::kUnsupported: return "unsupported";
    case SourceError::kRateLimited: return "rate_limited";
  }
  return "unknown";
}

const char* ToString(AggregationStatus status) {
  switch (status) {
    case AggregationStatus::kOk: return "ok";
    case AggregationStatus::kNoViableRoute: return "no_viable_route";
    case AggregationStatus::kInvalidRequest: return "invalid_request";
  }
  return "unknown";
}

const char* ToString(ExecutionError error) {
  switch (error) {
    case ExecutionError::kNone: return "none";
    case ExecutionError::kQuoteExpired: return "quote_expired";
    case ExecutionError::kSlippageExceeded: return "slippage_exceeded";
    case ExecutionError::kAlreadyExecuted: return "already_executed";
    case ExecutionError::kUnknownQuote: return "unknown_quote";
    case ExecutionError::kUnsupported: return "unsupported";
    case ExecutionError::kExecutionFailed: return "execution_failed";
    case ExecutionError::kSigningError: return "signing_error";
    case ExecutionError::kSubmissionError: return "submission_error";
  }
  return "unknown";
}

std::optional<ExecutionMode> ParseExecutionMode(const std::string& name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "direct" || s == "direct_dex") return ExecutionMode::kDirectDex;
  if (s == "normal" || s == "normal_aggregation") return ExecutionMode::kNormalAggregation;
  if (s == "meta" || s == "meta_aggregation") return ExecutionMode::kMetaAggregation;
  return std::nullopt;
}

static std::string NewRequestId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
  return oss.str();
}

TradeRequest TradeRequest::Create(const NetworkId& network,
                                  const std::string& token_in,
                                  const std::string& token_out,
                                  long double amount_in) {
  TradeRequest r;
  r.request_id = NewRequestId();
  r.network_id = network;
  r.token_in = token_in;
  r.token_out = token_out;
  r.amount_in = amount_in;
  r.created_at = std::chrono::system_clock::now();
  return r;
}

const AssessedQuote* AggregationResult::Best() const {
  if (!best_quote) return nullptr;
  for (const auto& aq : quotes) {
    if (aq.quote.source_id == best_quote->source_id) return &aq;
  }
  return nullptr;
}
