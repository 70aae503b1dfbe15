#include <gtest/gtest.h>
#include <limits>
#include "aggregation/risk_assessor.hpp"
#include "test_support.hpp"

using namespace testing_support;

TEST(RiskAssessor, ImpactBands) {
  EXPECT_EQ(RiskAssessor::LevelForImpact(0.0), RiskLevel::kLow);
  EXPECT_EQ(RiskAssessor::LevelForImpact(0.49), RiskLevel::kLow);
  EXPECT_EQ(RiskAssessor::LevelForImpact(0.5), RiskLevel::kMedium);
  EXPECT_EQ(RiskAssessor::LevelForImpact(2.0), RiskLevel::kMedium);
  EXPECT_EQ(RiskAssessor::LevelForImpact(2.01), RiskLevel::kHigh);
  EXPECT_EQ(RiskAssessor::LevelForImpact(5.0), RiskLevel::kHigh);
  EXPECT_EQ(RiskAssessor::LevelForImpact(5.01), RiskLevel::kVeryHigh);
  EXPECT_EQ(RiskAssessor::LevelForImpact(std::numeric_limits<double>::quiet_NaN()), RiskLevel::kVeryHigh);
}

TEST(RiskAssessor, HopsRaiseRiskOneLevelEach) {
  EXPECT_EQ(RiskAssessor::LevelForHops(1), RiskLevel::kLow);
  EXPECT_EQ(RiskAssessor::LevelForHops(2), RiskLevel::kMedium);
  EXPECT_EQ(RiskAssessor::LevelForHops(3), RiskLevel::kHigh);
  EXPECT_EQ(RiskAssessor::LevelForHops(4), RiskLevel::kVeryHigh);
  EXPECT_EQ(RiskAssessor::LevelForHops(9), RiskLevel::kVeryHigh);
}

TEST(RiskAssessor, LowConfidenceIsAtLeastMedium) {
  Quote q = MakeQuote("x", 100.0L, 0, 0.1, 0.3);
  RiskAssessment r = RiskAssessor::Assess(q);
  EXPECT_EQ(r.risk_level, RiskLevel::kMedium);
  ASSERT_EQ(r.warnings.size(), 1u);
  EXPECT_NE(r.warnings[0].find("confidence"), std::string::npos);
}

TEST(RiskAssessor, LevelIsMaximumOfContributions) {
  Quote q = MakeQuote("x", 100.0L, 0, 0.1, 0.95);
  q.route.push_back(RouteHop{"x", kUsdc, kDai, "x", 0});
  q.route.push_back(RouteHop{"x", kDai, kUsdc, "x", 0});
  RiskAssessment r = RiskAssessor::Assess(q);
  EXPECT_EQ(r.risk_level, RiskLevel::kHigh);
  EXPECT_EQ(r.warnings.size(), 1u);

  q.price_impact_percent = 6.0;
  EXPECT_EQ(RiskAssessor::Assess(q).risk_level, RiskLevel::kVeryHigh);
}

TEST(RiskAssessor, MonotoneInImpact) {
  Quote q = MakeQuote("x", 100.0L);
  RiskLevel prev = RiskLevel::kLow;
  for (double impact = 0.0; impact < 10.0; impact += 0.25) {
    q.price_impact_percent = impact;
    RiskLevel now = RiskAssessor::Assess(q).risk_level;
    EXPECT_GE(now, prev) << "impact " << impact;
    prev = now;
  }
}

TEST(RiskAssessor, CleanQuoteHasNoWarnings) {
  RiskAssessment r = RiskAssessor::Assess(MakeQuote("x", 100.0L, 0, 0.2, 0.9));
  EXPECT_EQ(r.risk_level, RiskLevel::kLow);
  EXPECT_TRUE(r.warnings.empty());
}
