#pragma once
#include <optional>
#include <string>
#include <vector>
#include "core/types.hpp"

struct SelectionOutcome {
  std::optional<std::size_t> best_index; // into the input vector
  Recommendation recommendation;
  std::vector<std::string> warnings;
};

// Ranks assessed quotes under a strategy. Savings mode is a pure function of
// the input set; speed mode additionally honors Quote::arrival_index.
class RouteSelector {
public:
  static SelectionOutcome Select(const std::vector<AssessedQuote>& quotes, const ExecutionStrategy& strategy);

  // amount_out minus gas priced in output units. Sets *gas_ignored when
  // no conversion is available.
  static long double EffectiveValue(const Quote& quote, const ExecutionStrategy& strategy, bool* gas_ignored = nullptr);
};
