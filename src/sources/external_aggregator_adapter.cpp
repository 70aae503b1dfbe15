#include "sources/external_aggregator_adapter.hpp"
#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "net/http_client.hpp"
#include "utils/hex.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace {

std::string UnitsToDecimal(long double units) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(0) << std::floor(units);
  return oss.str();
}

long double ParseRawAmount(const json& v, const char* field) {
  if (v.is_number()) return v.get<long double>();
  if (v.is_string()) {
    std::string s = v.get<std::string>();
    if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return HexToUnits(s);
    size_t used = 0;
    long double out = std::stold(s, &used);
    if (used != s.size()) throw std::invalid_argument(std::string(field) + " is not numeric: " + s);
    return out;
  }
  throw std::invalid_argument(std::string(field) + " has unexpected type " + v.type_name());
}

// Accepts JSON numbers, decimal strings and 0x-quantities. Negative and
// non-finite values throw std::out_of_range.
long double ParseAmount(const json& v, const char* field) {
  long double out = ParseRawAmount(v, field);
  if (!std::isfinite(out) || out < 0.0L) throw std::out_of_range(std::string(field) + " is out of range");
  return out;
}

unsigned long long ParseGas(const json& v, const char* field) {
  long double out = ParseAmount(v, field);
  if (out >= static_cast<long double>(std::numeric_limits<unsigned long long>::max())) {
    throw std::out_of_range(std::string(field) + " does not fit in 64 bits");
  }
  return static_cast<unsigned long long>(out);
}

std::vector<RouteHop> ParseRoute(const json& body, const TradeRequest& request, const SourceDescriptor& descriptor) {
  std::vector<RouteHop> route;
  auto it = body.find("route");
  if (it != body.end() && it->is_array()) {
    for (const auto& hop : *it) {
      RouteHop h;
      if (hop.is_string()) {
        h.venue = hop.get<std::string>();
      } else if (hop.is_object()) {
        h.venue = hop.value("venue", hop.value("pool", hop.value("name", std::string())));
        h.token_in = hop.value("token_in", std::string());
        h.token_out = hop.value("token_out", std::string());
        h.protocol = hop.value("protocol", std::string());
        h.fee = hop.value("fee", 0u);
      } else {
        throw std::invalid_argument("route entries must be strings or objects");
      }
      route.push_back(std::move(h));
    }
  }
  if (route.empty()) route.push_back(RouteHop{descriptor.name, request.token_in, request.token_out, descriptor.id, 0});
  return route;
}

std::unordered_map<std::string, std::string> BaseHeaders() {
  return {{"Content-Type", "application/json"}, {"Accept", "application/json"}};
}

} // namespace

ExternalAggregatorAdapter::ExternalAggregatorAdapter(std::shared_ptr<HttpClient> http, std::shared_ptr<RateLimiter> limiter)
  : http_(std::move(http)), limiter_(std::move(limiter)) {}

std::string ExternalAggregatorAdapter::ApiKeyName(const std::string& source_id) {
  std::string out = source_id;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
  });
  return out + "_API_KEY";
}

FetchResult ExternalAggregatorAdapter::FetchQuote(const TradeRequest& request,
                                                  const SourceDescriptor& descriptor,
                                                  const FetchContext& ctx) {
  if (auto rejected = CheckApplicable(request, descriptor)) return *rejected;
  const ExternalEndpoint* ep = descriptor.External();
  if (!ep) return FetchResult::Fail(SourceError::kUnsupported, "descriptor has no HTTP endpoint");

  auto headers = BaseHeaders();
  if (ep->requires_api_key) {
    auto key = ConfigManager::Get(ApiKeyName(descriptor.id));
    if (!key || key->empty()) {
      return FetchResult::Fail(SourceError::kSourceUnavailable, "missing " + ApiKeyName(descriptor.id));
    }
    headers["X-API-Key"] = *key;
  }

  if (descriptor.rate_limit_per_minute > 0 && !limiter_->TryAcquire(descriptor.id, descriptor.rate_limit_per_minute)) {
    auto wait = limiter_->TimeUntilAvailable(descriptor.id);
    return FetchResult::Fail(SourceError::kRateLimited, "quota exhausted, next slot in " + std::to_string(wait.count()) + "ms");
  }
  if (ctx.Expired()) return FetchResult::Fail(SourceError::kTimeout, "deadline reached before request");

  json payload = {
    {"token_in", request.token_in},
    {"token_out", request.token_out},
    {"amount_in", UnitsToDecimal(request.amount_in)},
    {"network", request.network_id},
  };
  HttpResponse resp = http_->Post(ep->api_url + "/quote", payload.dump(), headers, ctx.RemainingMs());
  if (resp.status == 0) {
    if (ctx.Expired()) return FetchResult::Fail(SourceError::kTimeout, resp.error);
    return FetchResult::Fail(SourceError::kSourceUnavailable, resp.error);
  }
  if (resp.status == 429) return FetchResult::Fail(SourceError::kRateLimited, "HTTP 429 from source");
  if (resp.status < 200 || resp.status >= 300) {
    return FetchResult::Fail(SourceError::kSourceUnavailable, "HTTP " + std::to_string(resp.status));
  }

  Quote q;
  try {
    json body = json::parse(resp.body);
    if (!body.is_object()) return FetchResult::Fail(SourceError::kInvalidResponse, "quote body is not an object");
    if (!body.contains("amount_out")) return FetchResult::Fail(SourceError::kInvalidResponse, "missing amount_out");
    q.amount_out = ParseAmount(body["amount_out"], "amount_out");
    if (body.contains("gas_estimate") && !body["gas_estimate"].is_null()) {
      q.gas_estimate = ParseGas(body["gas_estimate"], "gas_estimate");
    }
    q.price_impact_percent = body.value("price_impact", 0.0);
    q.confidence = std::clamp(body.value("confidence", kDefaultConfidence), 0.0, 1.0);
    q.route = ParseRoute(body, request, descriptor);
    q.calldata = body.value("calldata", std::string());
    q.tx_to = body.value("to", std::string());
    if (body.contains("value") && !body["value"].is_null()) q.tx_value = UnitsToHex(ParseAmount(body["value"], "value"));
  } catch (const json::exception& e) {
    return FetchResult::Fail(SourceError::kInvalidResponse, e.what());
  } catch (const std::logic_error& e) {
    // std::invalid_argument and std::out_of_range from amount parsing
    return FetchResult::Fail(SourceError::kInvalidResponse, e.what());
  }
  if (q.amount_out <= 0.0L) return FetchResult::Fail(SourceError::kUnsupported, "source has no route");
  if (!q.tx_to.empty() && !IsHexAddress(q.tx_to)) {
    return FetchResult::Fail(SourceError::kInvalidResponse, "to is not an address: " + q.tx_to);
  }

  q.source_id = descriptor.id;
  q.source_kind = SourceKind::kExternalAggregator;
  q.fetched_at = std::chrono::steady_clock::now();
  return FetchResult::Ok(std::move(q));
}

ExternalSwap ExternalAggregatorAdapter::BuildSwap(const TradeRequest& request,
                                                  const Quote& quote,
                                                  const SourceDescriptor& descriptor,
                                                  const std::string& recipient,
                                                  long double min_amount_out,
                                                  int timeout_ms) {
  const ExternalEndpoint* ep = descriptor.External();
  if (!ep) throw std::runtime_error(descriptor.id + " has no HTTP endpoint");
  auto headers = BaseHeaders();
  if (ep->requires_api_key) headers["X-API-Key"] = ConfigManager::GetOrThrow(ApiKeyName(descriptor.id));
  if (descriptor.rate_limit_per_minute > 0 && !limiter_->TryAcquire(descriptor.id, descriptor.rate_limit_per_minute)) {
    throw std::runtime_error(descriptor.id + " quota exhausted");
  }

  json payload = {
    {"token_in", request.token_in},
    {"token_out", request.token_out},
    {"amount_in", UnitsToDecimal(request.amount_in)},
    {"network", request.network_id},
    {"recipient", recipient},
    {"min_amount_out", UnitsToDecimal(min_amount_out)},
    {"quoted_amount_out", UnitsToDecimal(quote.amount_out)},
  };
  HttpResponse resp = http_->Post(ep->api_url + "/swap", payload.dump(), headers, timeout_ms);
  if (resp.status < 200 || resp.status >= 300) {
    throw std::runtime_error(descriptor.id + " /swap failed: " +
                             (resp.status == 0 ? resp.error : "HTTP " + std::to_string(resp.status)));
  }
  ExternalSwap swap;
  try {
    json body = json::parse(resp.body);
    swap.to = body.at("to").get<std::string>();
    swap.data = body.at("data").get<std::string>();
    if (body.contains("value") && !body["value"].is_null()) swap.value = UnitsToHex(ParseAmount(body["value"], "value"));
    if (body.contains("gas") && !body["gas"].is_null()) {
      swap.gas = ParseGas(body["gas"], "gas");
    }
  } catch (const json::exception& e) {
    throw std::runtime_error(descriptor.id + " /swap returned bad JSON: " + e.what());
  } catch (const std::logic_error& e) {
    throw std::runtime_error(descriptor.id + " /swap returned a bad amount: " + e.what());
  }
  if (!IsHexAddress(swap.to)) throw std::runtime_error(descriptor.id + " /swap returned bad target " + swap.to);
  return swap;
}
