#include <gtest/gtest.h>
#include "routing/amm_math.hpp"
#include "sources/direct_dex_adapter.hpp"
#include "test_support.hpp"

using namespace testing_support;

namespace {
SourceDescriptor V2Descriptor() {
  SourceDescriptor d;
  d.id = "uniswap_v2";
  d.kind = SourceKind::kDirectDex;
  d.supported_networks = {"ethereum"};
  DexEndpoint ep;
  ep.protocol = DexProtocol::kUniswapV2;
  ep.contracts.router = kRouterA;
  ep.contracts.factory = kFactoryA;
  d.endpoint = ep;
  return d;
}

SourceDescriptor V3Descriptor() {
  SourceDescriptor d;
  d.id = "uniswap_v3";
  d.kind = SourceKind::kDirectDex;
  d.supported_networks = {"ethereum"};
  DexEndpoint ep;
  ep.protocol = DexProtocol::kUniswapV3;
  ep.contracts.router = kV3Router;
  ep.contracts.quoter = kV3Quoter;
  ep.fee_tiers = {500, 3000, 10000};
  d.endpoint = ep;
  return d;
}

struct Fixture {
  std::shared_ptr<FakeChainQuoter> chain = std::make_shared<FakeChainQuoter>();
  std::shared_ptr<ChainQuoterRegistry> quoters = std::make_shared<ChainQuoterRegistry>();
  std::shared_ptr<V2ReservesCache> cache = std::make_shared<V2ReservesCache>();
  DirectDexAdapter adapter{quoters, cache};
  Fixture() { quoters->Set("ethereum", chain); }
};

FetchContext Ctx() { return FetchContext::WithTimeout(std::chrono::milliseconds(1000)); }
}

TEST(DirectDexAdapter, V2QuoteFromReserves) {
  Fixture f;
  f.chain->AddPool(kFactoryA, kWeth, kUsdc, 1000000.0L, 2000000000.0L);
  FetchResult r = f.adapter.FetchQuote(MakeRequest(1000.0L), V2Descriptor(), Ctx());
  ASSERT_TRUE(r.ok()) << r.detail;
  long double expected = AmmMath::ConstantProductOut(1000.0L, 1000000.0L, 2000000000.0L, 30);
  EXPECT_EQ(r.quote->amount_out, expected);
  EXPECT_NEAR(r.quote->price_impact_percent,
              AmmMath::PriceImpactPercent(1000.0L, expected, 1000000.0L, 2000000000.0L), 1e-9);
  EXPECT_EQ(r.quote->gas_estimate, DirectDexAdapter::kV2GasPerHop);
  EXPECT_DOUBLE_EQ(r.quote->confidence, DirectDexAdapter::kReservesConfidence);
  ASSERT_EQ(r.quote->route.size(), 1u);
  EXPECT_EQ(r.quote->route[0].venue, kRouterA);
  EXPECT_EQ(r.quote->route[0].protocol, "uniswap_v2");
}

TEST(DirectDexAdapter, V2ReversedPairIsOriented) {
  Fixture f;
  f.chain->AddPool(kFactoryA, kUsdc, kWeth, 2000000000.0L, 1000000.0L);
  FetchResult r = f.adapter.FetchQuote(MakeRequest(1000.0L), V2Descriptor(), Ctx());
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.quote->amount_out, AmmMath::ConstantProductOut(1000.0L, 1000000.0L, 2000000000.0L, 30));
}

TEST(DirectDexAdapter, V2WithoutPairIsUnsupported) {
  Fixture f;
  FetchResult r = f.adapter.FetchQuote(MakeRequest(), V2Descriptor(), Ctx());
  EXPECT_EQ(r.error, SourceError::kUnsupported);
}

TEST(DirectDexAdapter, V2FallsBackToRouterWhenReservesUnreadable) {
  Fixture f;
  f.chain->AddPool(kFactoryA, kWeth, kUsdc, 1.0L, 1.0L);
  f.chain->FailReservesWith([] { throw RpcError(RpcError::Kind::kMalformed, "short getReserves result"); });
  f.chain->SetRouterAmounts([](long double in, const std::vector<std::string>&) {
    return std::vector<long double>{in, in * 1.9L};
  });
  FetchResult r = f.adapter.FetchQuote(MakeRequest(1000.0L), V2Descriptor(), Ctx());
  ASSERT_TRUE(r.ok()) << r.detail;
  EXPECT_EQ(r.quote->amount_out, 1900.0L);
  EXPECT_NEAR(r.quote->price_impact_percent, 0.0, 1e-9);
  EXPECT_DOUBLE_EQ(r.quote->confidence, DirectDexAdapter::kRouterConfidence);
}

TEST(DirectDexAdapter, TransportFailureIsUnavailable) {
  Fixture f;
  f.chain->AddPool(kFactoryA, kWeth, kUsdc, 1.0L, 1.0L);
  f.chain->FailReservesWith([] { throw RpcError(RpcError::Kind::kTransport, "connection reset"); });
  f.chain->SetRouterAmounts([](long double, const std::vector<std::string>&) -> std::vector<long double> {
    throw RpcError(RpcError::Kind::kTransport, "connection reset");
  });
  FetchResult r = f.adapter.FetchQuote(MakeRequest(), V2Descriptor(), Ctx());
  EXPECT_EQ(r.error, SourceError::kSourceUnavailable);
}

TEST(DirectDexAdapter, V3PicksBestFeeTier) {
  Fixture f;
  f.chain->SetV3Quote(500, 900.0L);
  f.chain->SetV3Quote(3000, 950.0L, 130000);
  FetchResult r = f.adapter.FetchQuote(MakeRequest(1000.0L), V3Descriptor(), Ctx());
  ASSERT_TRUE(r.ok()) << r.detail;
  EXPECT_EQ(r.quote->amount_out, 950.0L);
  EXPECT_EQ(r.quote->gas_estimate, 130000u);
  ASSERT_EQ(r.quote->route.size(), 1u);
  EXPECT_EQ(r.quote->route[0].fee, 3000u);
  EXPECT_EQ(r.quote->route[0].protocol, "uniswap_v3");
  EXPECT_EQ(r.quote->route[0].venue, kV3Router);
  EXPECT_GT(r.quote->price_impact_percent, 0.5);
  EXPECT_LT(r.quote->price_impact_percent, 1.5);
}

TEST(DirectDexAdapter, V3WithoutPoolsIsUnsupported) {
  Fixture f;
  FetchResult r = f.adapter.FetchQuote(MakeRequest(), V3Descriptor(), Ctx());
  EXPECT_EQ(r.error, SourceError::kUnsupported);
  EXPECT_EQ(f.chain->simulate_calls, 3);
}

TEST(DirectDexAdapter, MissingChainQuoterIsUnavailable) {
  Fixture f;
  FetchResult r = f.adapter.FetchQuote(MakeRequest(1000.0L, "polygon"), [] {
    SourceDescriptor d = V2Descriptor();
    d.supported_networks.insert("polygon");
    return d;
  }(), Ctx());
  EXPECT_EQ(r.error, SourceError::kSourceUnavailable);
}

TEST(V2ReservesCache, CachesPairsAndReserves) {
  FakeChainQuoter chain;
  chain.AddPool(kFactoryA, kWeth, kUsdc, 10.0L, 20.0L);
  V2ReservesCache cache(std::chrono::milliseconds(60000));
  auto a = cache.GetReserves(chain, kFactoryA, kWeth, kUsdc, 100);
  auto b = cache.GetReserves(chain, kFactoryA, kWeth, kUsdc, 100);
  ASSERT_TRUE(a && b);
  EXPECT_EQ(a->reserve_in, 10.0L);
  EXPECT_EQ(chain.find_pool_calls, 1);
  EXPECT_EQ(chain.reserve_reads, 1);

  EXPECT_FALSE(cache.GetReserves(chain, kFactoryA, kWeth, kDai, 100));
  EXPECT_FALSE(cache.GetReserves(chain, kFactoryA, kDai, kWeth, 100));
  EXPECT_EQ(chain.find_pool_calls, 2);

  cache.Clear();
  cache.GetReserves(chain, kFactoryA, kWeth, kUsdc, 100);
  EXPECT_EQ(chain.reserve_reads, 2);
}
