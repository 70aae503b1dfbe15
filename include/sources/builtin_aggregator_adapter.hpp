#pragma once
#include <memory>
#include "sources/quote_source_adapter.hpp"
#include "chain/chain_quoter.hpp"
#include "routing/reserves_cache.hpp"

class SourceRegistry;

// In-process router over the reserves of its member v2 venues. Evaluates the
// direct pool and every connector two-hop on each member and keeps the best,
// so a winning route always settles through a single router.
class BuiltinAggregatorAdapter : public QuoteSourceAdapter {
public:
  static constexpr unsigned long long kGasPerHop = 120000;
  static constexpr double kConfidence = 0.8;

  BuiltinAggregatorAdapter(std::shared_ptr<const SourceRegistry> registry,
                           std::shared_ptr<ChainQuoterRegistry> quoters,
                           std::shared_ptr<V2ReservesCache> reserves);

  SourceKind Kind() const override { return SourceKind::kBuiltinAggregator; }
  FetchResult FetchQuote(const TradeRequest& request,
                         const SourceDescriptor& descriptor,
                         const FetchContext& ctx) override;

private:
  struct Candidate {
    long double amount_out = 0.0L;
    double impact = 0.0;
    std::vector<RouteHop> route;
  };
  // Walks `path` through one venue's pools; nullopt when a pool is missing or dry.
  std::optional<Candidate> Evaluate(ChainQuoter& chain, const DexEndpoint& dex,
                                    const std::vector<std::string>& path,
                                    long double amount_in, const FetchContext& ctx);

  std::shared_ptr<const SourceRegistry> registry_;
  std::shared_ptr<ChainQuoterRegistry> quoters_;
  std::shared_ptr<V2ReservesCache> reserves_;
};
