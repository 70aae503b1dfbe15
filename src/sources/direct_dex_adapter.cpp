#include "sources/direct_dex_adapter.hpp"
#include "common/logger.hpp"
#include "routing/amm_math.hpp"
#include "utils/json_rpc.hpp"

namespace {
constexpr long double kReferenceDivisor = 1000.0L;

Quote BaseQuote(const SourceDescriptor& descriptor) {
  Quote q;
  q.source_id = descriptor.id;
  q.source_kind = SourceKind::kDirectDex;
  q.fetched_at = std::chrono::steady_clock::now();
  return q;
}
}

DirectDexAdapter::DirectDexAdapter(std::shared_ptr<ChainQuoterRegistry> quoters,
                                   std::shared_ptr<V2ReservesCache> reserves)
  : quoters_(std::move(quoters)), reserves_(std::move(reserves)) {}

FetchResult DirectDexAdapter::FetchQuote(const TradeRequest& request,
                                         const SourceDescriptor& descriptor,
                                         const FetchContext& ctx) {
  if (auto rejected = CheckApplicable(request, descriptor)) return *rejected;
  const DexEndpoint* dex = descriptor.Dex();
  if (!dex) return FetchResult::Fail(SourceError::kUnsupported, "descriptor has no DEX endpoint");
  auto chain = quoters_ ? quoters_->Get(request.network_id) : nullptr;
  if (!chain) return FetchResult::Fail(SourceError::kSourceUnavailable, "no chain quoter for " + request.network_id);

  try {
    if (dex->protocol == DexProtocol::kUniswapV3) return QuoteV3(*chain, request, descriptor, *dex, ctx);
    return QuoteV2(*chain, request, descriptor, *dex, ctx);
  } catch (const std::exception& e) {
    return ChainFailure(e, ctx);
  }
}

FetchResult DirectDexAdapter::QuoteV3(ChainQuoter& chain, const TradeRequest& request,
                                      const SourceDescriptor& descriptor, const DexEndpoint& dex,
                                      const FetchContext& ctx) {
  std::optional<SimulatedQuote> best;
  unsigned best_tier = 0;
  for (unsigned tier : dex.fee_tiers) {
    if (ctx.Expired()) break;
    try {
      SimulatedQuote sim = chain.SimulateQuote(dex.contracts.quoter, request.token_in, request.token_out,
                                               request.amount_in, tier, ctx.RemainingMs());
      if (sim.amount_out > 0.0L && (!best || sim.amount_out > best->amount_out)) {
        best = sim;
        best_tier = tier;
      }
    } catch (const RpcError& e) {
      // A revert means no initialized pool at this tier; try the next one.
      if (e.kind() != RpcError::Kind::kRpc) throw;
    }
  }
  if (!best) {
    if (ctx.Expired()) return FetchResult::Fail(SourceError::kTimeout, "deadline reached before any fee tier answered");
    return FetchResult::Fail(SourceError::kUnsupported, "no v3 pool for pair");
  }

  double impact = 0.0;
  long double ref_in = request.amount_in / kReferenceDivisor;
  if (ref_in >= 1.0L && !ctx.Expired()) {
    try {
      SimulatedQuote reference = chain.SimulateQuote(dex.contracts.quoter, request.token_in, request.token_out,
                                                     ref_in, best_tier, ctx.RemainingMs());
      impact = AmmMath::ImpactFromReference(request.amount_in, best->amount_out, ref_in, reference.amount_out);
    } catch (const RpcError& e) {
      METAROUTE_LOG_DEBUG(descriptor.id + ": reference quote for price impact failed: " + e.what());
    }
  }

  Quote q = BaseQuote(descriptor);
  q.amount_out = best->amount_out;
  q.gas_estimate = best->gas_estimate > 0 ? best->gas_estimate : kV3DefaultGas;
  q.price_impact_percent = impact;
  q.route.push_back(RouteHop{dex.contracts.router, request.token_in, request.token_out, ToString(DexProtocol::kUniswapV3), best_tier});
  q.confidence = kReservesConfidence;
  return FetchResult::Ok(std::move(q));
}

FetchResult DirectDexAdapter::QuoteV2(ChainQuoter& chain, const TradeRequest& request,
                                      const SourceDescriptor& descriptor, const DexEndpoint& dex,
                                      const FetchContext& ctx) {
  Quote q = BaseQuote(descriptor);
  q.gas_estimate = kV2GasPerHop;

  std::optional<PoolReserves> reserves;
  try {
    reserves = reserves_->GetReserves(chain, dex.contracts.factory, request.token_in, request.token_out,
                                      ctx.RemainingMs());
    if (!reserves) return FetchResult::Fail(SourceError::kUnsupported, "no v2 pair for tokens");
  } catch (const std::exception& e) {
    if (ctx.Expired()) return FetchResult::Fail(SourceError::kTimeout, e.what());
    METAROUTE_LOG_DEBUG(descriptor.id + ": reserves unreadable, using router: " + e.what());
    reserves.reset();
  }

  if (reserves) {
    if (reserves->reserve_in <= 0.0L || reserves->reserve_out <= 0.0L) {
      return FetchResult::Fail(SourceError::kUnsupported, "v2 pair has no liquidity");
    }
    q.amount_out = AmmMath::ConstantProductOut(request.amount_in, reserves->reserve_in, reserves->reserve_out, dex.fee_bps);
    q.price_impact_percent = AmmMath::PriceImpactPercent(request.amount_in, q.amount_out,
                                                         reserves->reserve_in, reserves->reserve_out);
    q.confidence = kReservesConfidence;
  } else {
    std::vector<std::string> path{request.token_in, request.token_out};
    auto amounts = chain.GetAmountsOut(dex.contracts.router, request.amount_in, path, ctx.RemainingMs());
    q.amount_out = amounts.back();
    long double ref_in = request.amount_in / kReferenceDivisor;
    if (ref_in >= 1.0L && !ctx.Expired()) {
      auto reference = chain.GetAmountsOut(dex.contracts.router, ref_in, path, ctx.RemainingMs());
      q.price_impact_percent = AmmMath::ImpactFromReference(request.amount_in, q.amount_out, ref_in, reference.back());
    }
    q.confidence = kRouterConfidence;
  }
  if (q.amount_out <= 0.0L) return FetchResult::Fail(SourceError::kUnsupported, "zero output");
  q.route.push_back(RouteHop{dex.contracts.router, request.token_in, request.token_out, ToString(DexProtocol::kUniswapV2), 0});
  return FetchResult::Ok(std::move(q));
}
