#pragma once
#include <memory>
#include "sources/quote_source_adapter.hpp"
#include "chain/chain_quoter.hpp"
#include "routing/reserves_cache.hpp"

// Prices a single DEX venue through on-chain reads: QuoterV2 for v3 venues,
// pair reserves (router getAmountsOut as fallback) for v2 venues.
class DirectDexAdapter : public QuoteSourceAdapter {
public:
  static constexpr unsigned long long kV2GasPerHop = 120000;
  static constexpr unsigned long long kV3DefaultGas = 150000;
  static constexpr double kReservesConfidence = 0.9;
  static constexpr double kRouterConfidence = 0.85;

  DirectDexAdapter(std::shared_ptr<ChainQuoterRegistry> quoters, std::shared_ptr<V2ReservesCache> reserves);

  SourceKind Kind() const override { return SourceKind::kDirectDex; }
  FetchResult FetchQuote(const TradeRequest& request,
                         const SourceDescriptor& descriptor,
                         const FetchContext& ctx) override;

private:
  FetchResult QuoteV3(ChainQuoter& chain, const TradeRequest& request,
                      const SourceDescriptor& descriptor, const DexEndpoint& dex, const FetchContext& ctx);
  FetchResult QuoteV2(ChainQuoter& chain, const TradeRequest& request,
                      const SourceDescriptor& descriptor, const DexEndpoint& dex, const FetchContext& ctx);

  std::shared_ptr<ChainQuoterRegistry> quoters_;
  std::shared_ptr<V2ReservesCache> reserves_;
};
