#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Chain name as used in the registry ("ethereum", "polygon", ...).
using NetworkId = std::string;

enum class SourceKind { kDirectDex, kBuiltinAggregator, kExternalAggregator };

enum class ExecutionMode { kDirectDex, kNormalAggregation, kMetaAggregation };

enum class RiskLevel { kLow = 0, kMedium = 1, kHigh = 2, kVeryHigh = 3 };

enum class SourceError {
  kNone,
  kSourceUnavailable,
  kTimeout,
  kInvalidResponse,
  kUnsupported,
  kRateLimited,
};

enum class AggregationStatus { kOk, kNoViableRoute, kInvalidRequest };

enum class ExecutionError {
  kNone,
  kQuoteExpired,
  kSlippageExceeded,
  kAlreadyExecuted,
  kUnknownQuote,
  kUnsupported,
  kExecutionFailed,
  kSigningError,
  kSubmissionError,
};

const char* ToString(SourceKind kind);
const char* ToString(ExecutionMode mode);
const char* ToString(RiskLevel level);
const char* ToString(SourceError error);
const char* ToString(AggregationStatus status);
const char* ToString(ExecutionError error);

std::optional<ExecutionMode> ParseExecutionMode(const std::string& name);

struct RouteHop {
  std::string venue;      // pool, router or aggregator-reported hop id
  std::string token_in;
  std::string token_out;
  std::string protocol;   // "uniswap_v2", "uniswap_v3", or source-reported
  unsigned fee = 0;       // v3 fee tier, 0 when not applicable
};

struct TradeRequest {
  std::string request_id;
  NetworkId network_id;
  std::string token_in;
  std::string token_out;
  long double amount_in = 0.0L; // base units of token_in
  std::chrono::system_clock::time_point created_at;

  static TradeRequest Create(const NetworkId& network,
                             const std::string& token_in,
                             const std::string& token_out,
                             long double amount_in);
};

struct Quote {
  std::string source_id;
  SourceKind source_kind = SourceKind::kDirectDex;
  long double amount_out = 0.0L; // base units of token_out
  unsigned long long gas_estimate = 0;
  double price_impact_percent = 0.0;
  std::vector<RouteHop> route;
  double confidence = 0.0;
  std::chrono::steady_clock::time_point fetched_at;
  std::chrono::milliseconds latency{0};
  // Completion order within one gather, 0-based.
  std::size_t arrival_index = 0;
  // Transaction supplied by an external aggregator, if any.
  std::string calldata;
  std::string tx_to;
  std::string tx_value;

  std::size_t HopCount() const { return route.empty() ? 1 : route.size(); }
};

struct RiskAssessment {
  RiskLevel risk_level = RiskLevel::kLow;
  std::vector<std::string> warnings;
};

struct AssessedQuote {
  Quote quote;
  RiskAssessment risk;
};

// Converts a gas amount into base units of the output token. Returns nullopt
// when no rate is known.
using GasToOutput = std::function<std::optional<long double>(unsigned long long gas_units)>;

struct ExecutionStrategy {
  ExecutionMode mode = ExecutionMode::kMetaAggregation;
  double max_slippage_percent = 1.0;
  std::chrono::milliseconds quote_timeout_per_source{3000};
  std::chrono::milliseconds global_timeout{5000};
  bool prefer_speed_over_savings = false;
  double min_savings_threshold_percent = 0.5;
  std::size_t min_confirmations = 2;
  std::chrono::milliseconds max_quote_age{30000};
  GasToOutput gas_to_output;
  int max_execution_retries = 2;
  std::chrono::milliseconds receipt_timeout{60000};
  std::chrono::milliseconds receipt_poll_interval{1000};
  std::string recipient;
};

struct Recommendation {
  bool should_execute = false;
  RiskLevel risk_level = RiskLevel::kLow;
  std::string rationale;
};

struct SourceFailure {
  std::string source_id;
  SourceError error = SourceError::kNone;
  std::string detail;
  std::chrono::milliseconds latency{0};
};

struct AggregationResult {
  AggregationStatus status = AggregationStatus::kNoViableRoute;
  std::string request_id;
  TradeRequest request;
  std::vector<AssessedQuote> quotes;
  std::optional<Quote> best_quote;
  Recommendation recommended_execution;
  std::vector<SourceFailure> failures;
  std::vector<std::string> warnings;
  std::chrono::milliseconds elapsed{0};

  bool ok() const { return status == AggregationStatus::kOk; }
  const AssessedQuote* Best() const;
};

struct TradeResult {
  std::string request_id;
  std::string source_id;
  std::string tx_hash;
  std::string failure_reason;
  bool confirmed = false;
  std::optional<long double> actual_amount_out;
  ExecutionError error = ExecutionError::kNone;
  int attempts = 0;

  bool ok() const { return error == ExecutionError::kNone && confirmed; }
};
