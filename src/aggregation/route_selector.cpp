#include "aggregation/route_selector.hpp"
#include <algorithm>
#include <cstdio>
#include <numeric>

namespace {

std::string Fmt(const char* fmt, double a, double b = 0.0) {
  char buf[128];
  std::snprintf(buf, sizeof(buf), fmt, a, b);
  return buf;
}

struct Ranked {
  std::size_t index;
  long double value;
};

// Total order: value desc, risk asc, confidence desc, source id asc.
bool RanksAbove(const Ranked& a, const Ranked& b, const std::vector<AssessedQuote>& quotes) {
  if (a.value != b.value) return a.value > b.value;
  const auto& qa = quotes[a.index];
  const auto& qb = quotes[b.index];
  if (qa.risk.risk_level != qb.risk.risk_level) return qa.risk.risk_level < qb.risk.risk_level;
  if (qa.quote.confidence != qb.quote.confidence) return qa.quote.confidence > qb.quote.confidence;
  return qa.quote.source_id < qb.quote.source_id;
}

// Near-equal values: risk first, then confidence, then the usual order.
bool SafestOf(const Ranked& a, const Ranked& b, const std::vector<AssessedQuote>& quotes) {
  const auto& qa = quotes[a.index];
  const auto& qb = quotes[b.index];
  if (qa.risk.risk_level != qb.risk.risk_level) return qa.risk.risk_level < qb.risk.risk_level;
  if (qa.quote.confidence != qb.quote.confidence) return qa.quote.confidence > qb.quote.confidence;
  return RanksAbove(a, b, quotes);
}

std::size_t BestByValue(std::vector<Ranked> pool, const std::vector<AssessedQuote>& quotes,
                        double threshold_percent, bool* tie_broken) {
  std::sort(pool.begin(), pool.end(), [&](const Ranked& a, const Ranked& b) { return RanksAbove(a, b, quotes); });
  if (pool.size() < 2) return pool.front().index;
  const Ranked& top = pool[0];
  const Ranked& second = pool[1];
  long double lower = std::min(top.value, second.value);
  long double gap = top.value - second.value;
  if (lower > 0.0L && gap < lower * static_cast<long double>(threshold_percent) / 100.0L) {
    bool second_safer = SafestOf(second, top, quotes);
    if (tie_broken) *tie_broken = second_safer;
    return second_safer ? second.index : top.index;
  }
  return top.index;
}

} // namespace

long double RouteSelector::EffectiveValue(const Quote& quote, const ExecutionStrategy& strategy, bool* gas_ignored) {
  if (strategy.gas_to_output) {
    if (auto cost = strategy.gas_to_output(quote.gas_estimate)) return quote.amount_out - *cost;
  }
  if (gas_ignored) *gas_ignored = true;
  return quote.amount_out;
}

SelectionOutcome RouteSelector::Select(const std::vector<AssessedQuote>& quotes, const ExecutionStrategy& strategy) {
  SelectionOutcome out;
  if (quotes.empty()) {
    out.recommendation.should_execute = false;
    out.recommendation.rationale = "no_quotes: nothing to rank";
    return out;
  }

  // Gas is subtracted for every quote or for none.
  bool gas_ignored = false;
  std::vector<long double> values;
  for (const auto& aq : quotes) values.push_back(EffectiveValue(aq.quote, strategy, &gas_ignored));
  if (gas_ignored) {
    for (std::size_t i = 0; i < quotes.size(); ++i) values[i] = quotes[i].quote.amount_out;
  }
  std::vector<Ranked> all, compliant;
  for (std::size_t i = 0; i < quotes.size(); ++i) {
    Ranked r{i, values[i]};
    all.push_back(r);
    if (quotes[i].quote.price_impact_percent <= strategy.max_slippage_percent) compliant.push_back(r);
  }
  if (gas_ignored) out.warnings.push_back("gas cost ignored in ranking: no gas-to-output conversion available");
  if (compliant.empty()) out.warnings.push_back("no quote within slippage tolerance");

  std::size_t winner = 0;
  std::string reason;
  bool tie_broken = false;
  if (strategy.prefer_speed_over_savings) {
    std::vector<std::size_t> by_arrival(quotes.size());
    std::iota(by_arrival.begin(), by_arrival.end(), 0);
    std::stable_sort(by_arrival.begin(), by_arrival.end(), [&](std::size_t a, std::size_t b) {
      return quotes[a].quote.arrival_index < quotes[b].quote.arrival_index;
    });
    auto first = std::find_if(by_arrival.begin(), by_arrival.end(), [&](std::size_t i) {
      return quotes[i].risk.risk_level <= RiskLevel::kMedium &&
             quotes[i].quote.price_impact_percent <= strategy.max_slippage_percent;
    });
    if (first != by_arrival.end()) {
      winner = *first;
      reason = "first_qualifying: " + quotes[winner].quote.source_id + " arrived #" +
               std::to_string(quotes[winner].quote.arrival_index + 1);
    } else {
      winner = BestByValue(all, quotes, strategy.min_savings_threshold_percent, &tie_broken);
      out.warnings.push_back("no quote qualified for speed selection; fell back to best value");
    }
  } else {
    winner = BestByValue(compliant.empty() ? all : compliant, quotes, strategy.min_savings_threshold_percent, &tie_broken);
  }
  if (reason.empty()) {
    reason = (tie_broken ? "lower_risk: " : "best_value: ") + quotes[winner].quote.source_id +
             Fmt(" effective %.0f", static_cast<double>(all[winner].value));
  }

  const AssessedQuote& w = quotes[winner];
  out.best_index = winner;
  out.recommendation.risk_level = w.risk.risk_level;
  out.recommendation.should_execute = false;
  if (w.risk.risk_level == RiskLevel::kVeryHigh) {
    out.recommendation.rationale = "risk_too_high: " + w.quote.source_id + " graded VeryHigh";
  } else if (w.quote.price_impact_percent > strategy.max_slippage_percent) {
    out.recommendation.rationale = "slippage_exceeded: " +
        Fmt("impact %.2f%% above max %.2f%%", w.quote.price_impact_percent, strategy.max_slippage_percent);
  } else if (strategy.mode == ExecutionMode::kMetaAggregation && quotes.size() < strategy.min_confirmations) {
    out.recommendation.rationale = "insufficient_confirmations: " + std::to_string(quotes.size()) + " of " +
                                   std::to_string(strategy.min_confirmations);
  } else {
    out.recommendation.should_execute = true;
    out.recommendation.rationale = reason;
  }
  return out;
}
