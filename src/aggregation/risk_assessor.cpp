#include "aggregation/risk_assessor.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace {
std::string Format(const char* fmt, double v) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return buf;
}
}

RiskLevel RiskAssessor::LevelForImpact(double pct) {
  if (!std::isfinite(pct)) return RiskLevel::kVeryHigh;
  if (pct < 0.5) return RiskLevel::kLow;
  if (pct <= 2.0) return RiskLevel::kMedium;
  if (pct <= 5.0) return RiskLevel::kHigh;
  return RiskLevel::kVeryHigh;
}

RiskLevel RiskAssessor::LevelForHops(std::size_t hops) {
  if (hops <= 1) return RiskLevel::kLow;
  std::size_t level = std::min<std::size_t>(hops - 1, static_cast<std::size_t>(RiskLevel::kVeryHigh));
  return static_cast<RiskLevel>(level);
}

RiskLevel RiskAssessor::LevelForConfidence(double confidence) {
  if (!std::isfinite(confidence) || confidence < kLowConfidence) return RiskLevel::kMedium;
  return RiskLevel::kLow;
}

RiskAssessment RiskAssessor::Assess(const Quote& quote) {
  RiskAssessment out;
  RiskLevel impact = LevelForImpact(quote.price_impact_percent);
  RiskLevel hops = LevelForHops(quote.HopCount());
  RiskLevel confidence = LevelForConfidence(quote.confidence);
  out.risk_level = std::max({impact, hops, confidence});

  if (impact > RiskLevel::kLow) {
    if (std::isfinite(quote.price_impact_percent)) {
      out.warnings.push_back(Format("price impact %.2f%% exceeds comfortable threshold", quote.price_impact_percent));
    } else {
      out.warnings.push_back("price impact unknown");
    }
  }
  if (hops > RiskLevel::kLow) {
    out.warnings.push_back("route traverses " + std::to_string(quote.HopCount()) + " hops");
  }
  if (confidence > RiskLevel::kLow) {
    out.warnings.push_back(Format("source confidence low (%.2f)", quote.confidence));
  }
  return out;
}
