#include <gtest/gtest.h>
#include <algorithm>
#include "aggregation/risk_assessor.hpp"
#include "aggregation/route_selector.hpp"
#include "test_support.hpp"

using namespace testing_support;

namespace {
AssessedQuote Assessed(Quote q) { return AssessedQuote{q, RiskAssessor::Assess(q)}; }

ExecutionStrategy IdentityGas() {
  ExecutionStrategy s;
  s.gas_to_output = [](unsigned long long gas) -> std::optional<long double> { return static_cast<long double>(gas); };
  return s;
}
}

TEST(RouteSelector, GasAdjustedValueWins) {
  // A: 950 out, 2 gas; B: 960 out, 1 gas. Effective 948 vs 959.
  std::vector<AssessedQuote> quotes{Assessed(MakeQuote("A", 950.0L, 2)), Assessed(MakeQuote("B", 960.0L, 1))};
  ExecutionStrategy s = IdentityGas();
  s.min_savings_threshold_percent = 0.5;
  SelectionOutcome out = RouteSelector::Select(quotes, s);
  ASSERT_TRUE(out.best_index);
  EXPECT_EQ(quotes[*out.best_index].quote.source_id, "B");
  EXPECT_TRUE(out.recommendation.should_execute);
  EXPECT_EQ(out.recommendation.rationale.rfind("best_value: B", 0), 0u);
  EXPECT_TRUE(out.warnings.empty());
}

TEST(RouteSelector, SelectionIgnoresInputOrder) {
  std::vector<AssessedQuote> quotes{
    Assessed(MakeQuote("A", 1000.0L)), Assessed(MakeQuote("B", 1200.0L)),
    Assessed(MakeQuote("C", 1100.0L)), Assessed(MakeQuote("D", 1200.0L, 0, 0.1, 0.95)),
  };
  ExecutionStrategy s;
  s.min_savings_threshold_percent = 0.0;
  std::string first;
  std::sort(quotes.begin(), quotes.end(),
            [](const AssessedQuote& a, const AssessedQuote& b) { return a.quote.source_id < b.quote.source_id; });
  do {
    SelectionOutcome out = RouteSelector::Select(quotes, s);
    ASSERT_TRUE(out.best_index);
    const std::string& id = quotes[*out.best_index].quote.source_id;
    if (first.empty()) first = id;
    EXPECT_EQ(id, first);
  } while (std::next_permutation(quotes.begin(), quotes.end(),
                                 [](const AssessedQuote& a, const AssessedQuote& b) {
                                   return a.quote.source_id < b.quote.source_id;
                                 }));
  // Equal value: higher confidence breaks the tie.
  EXPECT_EQ(first, "D");
}

TEST(RouteSelector, WarnsWhenGasCannotBeConverted) {
  std::vector<AssessedQuote> quotes{Assessed(MakeQuote("A", 950.0L, 500000)), Assessed(MakeQuote("B", 960.0L, 10))};
  SelectionOutcome out = RouteSelector::Select(quotes, ExecutionStrategy());
  ASSERT_TRUE(out.best_index);
  EXPECT_EQ(quotes[*out.best_index].quote.source_id, "B");
  ASSERT_FALSE(out.warnings.empty());
  EXPECT_NE(out.warnings[0].find("gas cost ignored"), std::string::npos);
}

TEST(RouteSelector, PartialGasConversionFallsBackToRawOutput) {
  // A converts to 900 after gas; B has no known gas price. Both must be compared on amount_out.
  std::vector<AssessedQuote> quotes{Assessed(MakeQuote("A", 1000.0L, 100)), Assessed(MakeQuote("B", 950.0L, 7))};
  ExecutionStrategy s;
  s.gas_to_output = [](unsigned long long gas) -> std::optional<long double> {
    if (gas == 7) return std::nullopt;
    return static_cast<long double>(gas);
  };
  SelectionOutcome out = RouteSelector::Select(quotes, s);
  ASSERT_TRUE(out.best_index);
  EXPECT_EQ(quotes[*out.best_index].quote.source_id, "A");
  ASSERT_FALSE(out.warnings.empty());
  EXPECT_NE(out.warnings[0].find("gas cost ignored"), std::string::npos);
}

TEST(RouteSelector, NearTiePrefersLowerRisk) {
  // 1000 vs 1003 is within 0.5%; the riskier leader yields to the safer runner-up.
  Quote risky = MakeQuote("risky", 1003.0L, 0, 1.0);
  Quote safe = MakeQuote("safe", 1000.0L, 0, 0.1);
  std::vector<AssessedQuote> quotes{Assessed(risky), Assessed(safe)};
  ExecutionStrategy s;
  s.max_slippage_percent = 2.0;
  SelectionOutcome out = RouteSelector::Select(quotes, s);
  ASSERT_TRUE(out.best_index);
  EXPECT_EQ(quotes[*out.best_index].quote.source_id, "safe");
  EXPECT_EQ(out.recommendation.rationale.rfind("lower_risk: safe", 0), 0u);

  s.min_savings_threshold_percent = 0.1;
  out = RouteSelector::Select(quotes, s);
  EXPECT_EQ(quotes[*out.best_index].quote.source_id, "risky");
}

TEST(RouteSelector, SlippageCompliantQuotesAreRankedFirst) {
  std::vector<AssessedQuote> quotes{Assessed(MakeQuote("big", 2000.0L, 0, 3.0)), Assessed(MakeQuote("ok", 1000.0L, 0, 0.4))};
  ExecutionStrategy s;
  s.max_slippage_percent = 1.0;
  SelectionOutcome out = RouteSelector::Select(quotes, s);
  EXPECT_EQ(quotes[*out.best_index].quote.source_id, "ok");
  EXPECT_TRUE(out.recommendation.should_execute);
}

TEST(RouteSelector, NothingWithinSlippageIsNotExecutable) {
  std::vector<AssessedQuote> quotes{Assessed(MakeQuote("a", 2000.0L, 0, 1.5)), Assessed(MakeQuote("b", 1000.0L, 0, 1.8))};
  ExecutionStrategy s;
  s.max_slippage_percent = 1.0;
  SelectionOutcome out = RouteSelector::Select(quotes, s);
  ASSERT_TRUE(out.best_index);
  EXPECT_EQ(quotes[*out.best_index].quote.source_id, "a");
  EXPECT_FALSE(out.recommendation.should_execute);
  EXPECT_EQ(out.recommendation.rationale.rfind("slippage_exceeded:", 0), 0u);
}

TEST(RouteSelector, VeryHighRiskIsNeverRecommended) {
  std::vector<AssessedQuote> quotes{Assessed(MakeQuote("a", 2000.0L, 0, 7.0)), Assessed(MakeQuote("b", 1000.0L, 0, 8.0))};
  ExecutionStrategy s;
  s.max_slippage_percent = 50.0;
  SelectionOutcome out = RouteSelector::Select(quotes, s);
  EXPECT_EQ(out.recommendation.risk_level, RiskLevel::kVeryHigh);
  EXPECT_FALSE(out.recommendation.should_execute);
  EXPECT_EQ(out.recommendation.rationale.rfind("risk_too_high:", 0), 0u);
}

TEST(RouteSelector, MetaModeWantsEnoughConfirmations) {
  std::vector<AssessedQuote> quotes{Assessed(MakeQuote("only", 1000.0L))};
  ExecutionStrategy s;
  s.mode = ExecutionMode::kMetaAggregation;
  s.min_confirmations = 2;
  SelectionOutcome out = RouteSelector::Select(quotes, s);
  EXPECT_FALSE(out.recommendation.should_execute);
  EXPECT_EQ(out.recommendation.rationale, "insufficient_confirmations: 1 of 2");

  s.mode = ExecutionMode::kDirectDex;
  EXPECT_TRUE(RouteSelector::Select(quotes, s).recommendation.should_execute);
}

TEST(RouteSelector, SpeedModeTakesFirstQualifyingArrival) {
  Quote early_risky = MakeQuote("early", 1200.0L, 0, 3.0);
  early_risky.arrival_index = 0;
  Quote second = MakeQuote("second", 1000.0L);
  second.arrival_index = 1;
  Quote third = MakeQuote("third", 1100.0L);
  third.arrival_index = 2;
  std::vector<AssessedQuote> quotes{Assessed(third), Assessed(early_risky), Assessed(second)};
  ExecutionStrategy s;
  s.prefer_speed_over_savings = true;
  s.max_slippage_percent = 5.0;
  SelectionOutcome out = RouteSelector::Select(quotes, s);
  ASSERT_TRUE(out.best_index);
  EXPECT_EQ(quotes[*out.best_index].quote.source_id, "second");
  EXPECT_EQ(out.recommendation.rationale.rfind("first_qualifying: second", 0), 0u);
}

TEST(RouteSelector, SpeedModeFallsBackToValue) {
  Quote a = MakeQuote("a", 1000.0L, 0, 3.0);
  a.arrival_index = 0;
  Quote b = MakeQuote("b", 1500.0L, 0, 4.0);
  b.arrival_index = 1;
  std::vector<AssessedQuote> quotes{Assessed(a), Assessed(b)};
  ExecutionStrategy s;
  s.prefer_speed_over_savings = true;
  s.max_slippage_percent = 10.0;
  SelectionOutcome out = RouteSelector::Select(quotes, s);
  EXPECT_EQ(quotes[*out.best_index].quote.source_id, "b");
  bool fell_back = false;
  for (const auto& w : out.warnings) fell_back |= w.find("fell back") != std::string::npos;
  EXPECT_TRUE(fell_back);
}

TEST(RouteSelector, EmptyInput) {
  SelectionOutcome out = RouteSelector::Select({}, ExecutionStrategy());
  EXPECT_FALSE(out.best_index);
  EXPECT_FALSE(out.recommendation.should_execute);
}

TEST(RouteSelector, EffectiveValueSubtractsConvertedGas) {
  ExecutionStrategy s = IdentityGas();
  bool ignored = false;
  EXPECT_EQ(RouteSelector::EffectiveValue(MakeQuote("a", 100.0L, 30), s, &ignored), 70.0L);
  EXPECT_FALSE(ignored);
  s.gas_to_output = [](unsigned long long) -> std::optional<long double> { return std::nullopt; };
  EXPECT_EQ(RouteSelector::EffectiveValue(MakeQuote("a", 100.0L, 30), s, &ignored), 100.0L);
  EXPECT_TRUE(ignored);
}
