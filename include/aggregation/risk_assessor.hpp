#pragma once
#include "core/types.hpp"

// Deterministic risk grading of a single quote. The final level is the
// highest of the impact, route-length and confidence contributions.
class RiskAssessor {
public:
  static RiskAssessment Assess(const Quote& quote);

  // <0.5% Low, up to 2% Medium, up to 5% High, above VeryHigh.
  static RiskLevel LevelForImpact(double price_impact_percent);
  // One level per hop beyond the first, capped at VeryHigh.
  static RiskLevel LevelForHops(std::size_t hops);
  static RiskLevel LevelForConfidence(double confidence);

  static constexpr double kLowConfidence = 0.5;
};
