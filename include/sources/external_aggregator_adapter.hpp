#pragma once
#include <memory>
#include <string>
#include "sources/quote_source_adapter.hpp"
#include "sources/rate_limiter.hpp"

class HttpClient;

// Unsigned transaction fields returned by an aggregator's /swap endpoint.
struct ExternalSwap {
  std::string to;
  std::string data;
  std::string value = "0x0";
  unsigned long long gas = 0;
};

// Quotes through a third-party aggregator's HTTP API:
//   POST {api_url}/quote  {token_in, token_out, amount_in, network}
//   POST {api_url}/swap   same plus recipient and min_amount_out
// Every call spends one token of the source's per-minute quota first.
class ExternalAggregatorAdapter : public QuoteSourceAdapter {
public:
  static constexpr double kDefaultConfidence = 0.75;

  ExternalAggregatorAdapter(std::shared_ptr<HttpClient> http, std::shared_ptr<RateLimiter> limiter);

  SourceKind Kind() const override { return SourceKind::kExternalAggregator; }
  FetchResult FetchQuote(const TradeRequest& request,
                         const SourceDescriptor& descriptor,
                         const FetchContext& ctx) override;

  // Throws std::runtime_error when the source refuses or answers garbage.
  ExternalSwap BuildSwap(const TradeRequest& request,
                         const Quote& quote,
                         const SourceDescriptor& descriptor,
                         const std::string& recipient,
                         long double min_amount_out,
                         int timeout_ms);

  // Name of the config key holding a source's API key ("0x-api" -> "0X_API_API_KEY").
  static std::string ApiKeyName(const std::string& source_id);

private:
  std::shared_ptr<HttpClient> http_;
  std::shared_ptr<RateLimiter> limiter_;
};
