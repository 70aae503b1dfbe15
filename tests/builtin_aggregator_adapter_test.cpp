#include <gtest/gtest.h>
#include "routing/amm_math.hpp"
#include "sources/builtin_aggregator_adapter.hpp"
#include "test_support.hpp"

using namespace testing_support;
using json = nlohmann::json;

namespace {
std::shared_ptr<SourceRegistry> Registry() {
  json doc = {
    {"builtin_dex", {
      {"uniswap_v2", {{"router_address", kRouterA}, {"factory_address", kFactoryA}}},
      {"sushiswap", {{"router_address", kRouterB}, {"factory_address", kFactoryB}}},
    }},
    {"builtin_aggregators", {
      {"v2_router", {{"dex_ids", {"uniswap_v2", "sushiswap"}}, {"connector_tokens", {kDai}}}},
    }},
  };
  auto reg = std::make_shared<SourceRegistry>();
  reg->LoadFromJson(doc.dump());
  return reg;
}

struct Fixture {
  std::shared_ptr<SourceRegistry> registry = Registry();
  std::shared_ptr<FakeChainQuoter> chain = std::make_shared<FakeChainQuoter>();
  std::shared_ptr<ChainQuoterRegistry> quoters = std::make_shared<ChainQuoterRegistry>();
  BuiltinAggregatorAdapter adapter{registry, quoters, std::make_shared<V2ReservesCache>()};
  Fixture() { quoters->Set("ethereum", chain); }
  SourceDescriptor Descriptor() const { return *registry->Find("v2_router"); }
};

FetchContext Ctx() { return FetchContext::WithTimeout(std::chrono::milliseconds(1000)); }
}

TEST(BuiltinAggregatorAdapter, PrefersConnectorRouteWhenDeeper) {
  Fixture f;
  f.chain->AddPool(kFactoryA, kWeth, kUsdc, 100.0L, 200000.0L);
  f.chain->AddPool(kFactoryB, kWeth, kDai, 10000.0L, 20000000.0L);
  f.chain->AddPool(kFactoryB, kDai, kUsdc, 20000000.0L, 20000000.0L);

  FetchResult r = f.adapter.FetchQuote(MakeRequest(10.0L), f.Descriptor(), Ctx());
  ASSERT_TRUE(r.ok()) << r.detail;

  long double hop1 = AmmMath::ConstantProductOut(10.0L, 10000.0L, 20000000.0L, 30);
  long double hop2 = AmmMath::ConstantProductOut(hop1, 20000000.0L, 20000000.0L, 30);
  EXPECT_EQ(r.quote->amount_out, hop2);
  EXPECT_GT(r.quote->amount_out, AmmMath::ConstantProductOut(10.0L, 100.0L, 200000.0L, 30));
  ASSERT_EQ(r.quote->route.size(), 2u);
  EXPECT_EQ(r.quote->route[0].venue, kRouterB);
  EXPECT_EQ(r.quote->route[1].venue, kRouterB);
  EXPECT_EQ(r.quote->route[0].token_out, kDai);
  EXPECT_EQ(r.quote->gas_estimate, 2 * BuiltinAggregatorAdapter::kGasPerHop);
  EXPECT_DOUBLE_EQ(r.quote->confidence, BuiltinAggregatorAdapter::kConfidence);
  EXPECT_EQ(r.quote->source_kind, SourceKind::kBuiltinAggregator);
}

TEST(BuiltinAggregatorAdapter, PicksBestDirectPoolAcrossMembers) {
  Fixture f;
  f.chain->AddPool(kFactoryA, kWeth, kUsdc, 1000.0L, 2000000.0L);
  f.chain->AddPool(kFactoryB, kWeth, kUsdc, 1000.0L, 2100000.0L);
  FetchResult r = f.adapter.FetchQuote(MakeRequest(1.0L), f.Descriptor(), Ctx());
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.quote->route.size(), 1u);
  EXPECT_EQ(r.quote->route[0].venue, kRouterB);
  EXPECT_EQ(r.quote->gas_estimate, BuiltinAggregatorAdapter::kGasPerHop);
}

TEST(BuiltinAggregatorAdapter, NoPoolsIsUnsupported) {
  Fixture f;
  FetchResult r = f.adapter.FetchQuote(MakeRequest(), f.Descriptor(), Ctx());
  EXPECT_EQ(r.error, SourceError::kUnsupported);
}

TEST(BuiltinAggregatorAdapter, ChainErrorsSurfaceWhenNothingRoutes) {
  Fixture f;
  f.chain->AddPool(kFactoryA, kWeth, kUsdc, 1.0L, 1.0L);
  f.chain->FailReservesWith([] { throw RpcError(RpcError::Kind::kHttpStatus, "HTTP 502", 502); });
  FetchResult r = f.adapter.FetchQuote(MakeRequest(), f.Descriptor(), Ctx());
  EXPECT_EQ(r.error, SourceError::kSourceUnavailable);
}
