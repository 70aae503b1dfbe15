#include "sources/builtin_aggregator_adapter.hpp"
#include "config/source_registry.hpp"
#include "common/logger.hpp"
#include "routing/amm_math.hpp"
#include "utils/hex.hpp"
#include <algorithm>

BuiltinAggregatorAdapter::BuiltinAggregatorAdapter(std::shared_ptr<const SourceRegistry> registry,
                                                   std::shared_ptr<ChainQuoterRegistry> quoters,
                                                   std::shared_ptr<V2ReservesCache> reserves)
  : registry_(std::move(registry)), quoters_(std::move(quoters)), reserves_(std::move(reserves)) {}

std::optional<BuiltinAggregatorAdapter::Candidate> BuiltinAggregatorAdapter::Evaluate(
    ChainQuoter& chain, const DexEndpoint& dex, const std::vector<std::string>& path,
    long double amount_in, const FetchContext& ctx) {
  Candidate c;
  long double amount = amount_in;
  long double mid_rate = 1.0L;
  for (size_t i = 0; i + 1 < path.size(); ++i) {
    auto r = reserves_->GetReserves(chain, dex.contracts.factory, path[i], path[i + 1], ctx.RemainingMs());
    if (!r || r->reserve_in <= 0.0L || r->reserve_out <= 0.0L) return std::nullopt;
    mid_rate *= r->reserve_out / r->reserve_in;
    amount = AmmMath::ConstantProductOut(amount, r->reserve_in, r->reserve_out, dex.fee_bps);
    if (amount <= 0.0L) return std::nullopt;
    c.route.push_back(RouteHop{dex.contracts.router, path[i], path[i + 1], ToString(DexProtocol::kUniswapV2), 0});
  }
  c.amount_out = amount;
  long double exec_rate = amount / amount_in;
  c.impact = static_cast<double>(std::max(0.0L, (1.0L - exec_rate / mid_rate) * 100.0L));
  return c;
}

FetchResult BuiltinAggregatorAdapter::FetchQuote(const TradeRequest& request,
                                                 const SourceDescriptor& descriptor,
                                                 const FetchContext& ctx) {
  if (auto rejected = CheckApplicable(request, descriptor)) return *rejected;
  const BuiltinAggregatorEndpoint* ep = descriptor.Builtin();
  if (!ep) return FetchResult::Fail(SourceError::kUnsupported, "descriptor has no member venues");
  auto chain = quoters_ ? quoters_->Get(request.network_id) : nullptr;
  if (!chain) return FetchResult::Fail(SourceError::kSourceUnavailable, "no chain quoter for " + request.network_id);

  std::vector<std::vector<std::string>> paths;
  paths.push_back({request.token_in, request.token_out});
  for (const auto& connector : ep->connector_tokens) {
    if (SameAddress(connector, request.token_in) || SameAddress(connector, request.token_out)) continue;
    paths.push_back({request.token_in, connector, request.token_out});
  }

  std::optional<Candidate> best;
  std::optional<FetchResult> last_failure;
  for (const auto& dex_id : ep->dex_ids) {
    auto member = registry_->Find(dex_id);
    if (!member || !member->Dex() || !member->Supports(request.network_id)) continue;
    for (const auto& path : paths) {
      if (ctx.Expired()) break;
      try {
        auto c = Evaluate(*chain, *member->Dex(), path, request.amount_in, ctx);
        if (c && (!best || c->amount_out > best->amount_out)) best = std::move(c);
      } catch (const std::exception& e) {
        METAROUTE_LOG_DEBUG(descriptor.id + ": " + dex_id + " path of " + std::to_string(path.size()) +
                            " tokens failed: " + e.what());
        last_failure = ChainFailure(e, ctx);
      }
    }
  }

  if (!best) {
    if (ctx.Expired()) return FetchResult::Fail(SourceError::kTimeout, "deadline reached while routing");
    if (last_failure) return *last_failure;
    return FetchResult::Fail(SourceError::kUnsupported, "no member venue routes this pair");
  }

  Quote q;
  q.source_id = descriptor.id;
  q.source_kind = SourceKind::kBuiltinAggregator;
  q.amount_out = best->amount_out;
  q.gas_estimate = kGasPerHop * best->route.size();
  q.price_impact_percent = best->impact;
  q.route = std::move(best->route);
  q.confidence = kConfidence;
  q.fetched_at = std::chrono::steady_clock::now();
  return FetchResult::Ok(std::move(q));
}
