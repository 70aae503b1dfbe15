#include <gtest/gtest.h>
#include <thread>
#include "engine/meta_trading_engine.hpp"
#include "test_support.hpp"

using namespace testing_support;
using std::chrono::milliseconds;

namespace {
ExecutionStrategy QuickStrategy() {
  ExecutionStrategy s;
  s.quote_timeout_per_source = milliseconds(150);
  s.global_timeout = milliseconds(300);
  s.gas_to_output = [](unsigned long long gas) -> std::optional<long double> { return static_cast<long double>(gas); };
  s.receipt_timeout = milliseconds(100);
  s.receipt_poll_interval = milliseconds(10);
  return s;
}

ScriptedAdapter::Behavior Returns(long double out, unsigned long long gas, double confidence,
                                  const std::string& calldata = "") {
  ScriptedAdapter::Behavior b;
  b.amount_out = out;
  b.gas = gas;
  b.confidence = confidence;
  b.calldata = calldata;
  return b;
}

ScriptedAdapter::Behavior Hangs() {
  ScriptedAdapter::Behavior b;
  b.hang = true;
  return b;
}

struct EngineFixture {
  std::shared_ptr<FakeSubmitter> submitter = std::make_shared<FakeSubmitter>();
  std::shared_ptr<ScriptedAdapter> adapter = std::make_shared<ScriptedAdapter>();
  MetaTradingEngine engine{ExternalRegistry({"A", "B", "C"}), submitter, EngineOptions{4, milliseconds(3000)}};

  EngineFixture() { engine.RegisterAdapter(adapter); }
};
}

TEST(MetaTradingEngine, PicksBestGasAdjustedQuoteWhileOneSourceHangs) {
  EngineFixture f;
  f.adapter->Script("A", Returns(950.0L, 2, 0.9));
  f.adapter->Script("B", Returns(960.0L, 1, 0.7));
  f.adapter->Script("C", Hangs());

  AggregationResult r = f.engine.Quote(MakeRequest(1000.0L), QuickStrategy());
  ASSERT_TRUE(r.ok());
  ASSERT_TRUE(r.best_quote);
  EXPECT_EQ(r.best_quote->source_id, "B");
  EXPECT_EQ(r.recommended_execution.risk_level, RiskLevel::kLow);
  EXPECT_TRUE(r.recommended_execution.should_execute);
  EXPECT_EQ(r.quotes.size(), 2u);
  ASSERT_EQ(r.failures.size(), 1u);
  EXPECT_EQ(r.failures[0].source_id, "C");
  EXPECT_EQ(r.failures[0].error, SourceError::kTimeout);
  EXPECT_LT(r.elapsed, milliseconds(2000));

  PerformanceStats stats = f.engine.Stats();
  EXPECT_EQ(stats.quote_cycles, 1u);
  EXPECT_EQ(stats.quotes_requested, 3u);
  EXPECT_EQ(stats.quotes_succeeded, 2u);
  EXPECT_EQ(stats.per_source["C"].timeouts, 1u);
  EXPECT_EQ(stats.cumulative_savings, 10.0L);
}

TEST(MetaTradingEngine, AllSourcesTimingOutIsNoViableRoute) {
  EngineFixture f;
  f.adapter->Script("A", Hangs());
  f.adapter->Script("B", Hangs());
  f.adapter->Script("C", Hangs());

  AggregationResult r = f.engine.Quote(MakeRequest(1000.0L), QuickStrategy());
  EXPECT_EQ(r.status, AggregationStatus::kNoViableRoute);
  EXPECT_FALSE(r.best_quote);
  EXPECT_FALSE(r.recommended_execution.should_execute);
  EXPECT_EQ(r.recommended_execution.rationale.rfind("no_viable_route", 0), 0u);
  EXPECT_EQ(r.failures.size(), 3u);

  TradeResult t = f.engine.Execute(r, QuickStrategy());
  EXPECT_EQ(t.error, ExecutionError::kUnknownQuote);
  EXPECT_TRUE(f.submitter->Submitted().empty());
  EXPECT_EQ(f.engine.Stats().no_viable_route, 1u);
}

TEST(MetaTradingEngine, InvalidRequestsNeverReachSources) {
  EngineFixture f;
  f.adapter->Script("A", Returns(950.0L, 2, 0.9));

  AggregationResult same = f.engine.Quote(TradeRequest::Create("ethereum", kWeth, kWeth, 10.0L), QuickStrategy());
  EXPECT_EQ(same.status, AggregationStatus::kInvalidRequest);
  AggregationResult zero = f.engine.Quote(MakeRequest(0.0L), QuickStrategy());
  EXPECT_EQ(zero.status, AggregationStatus::kInvalidRequest);
  AggregationResult bad = f.engine.Quote(TradeRequest::Create("ethereum", "WETH", kUsdc, 10.0L), QuickStrategy());
  EXPECT_EQ(bad.status, AggregationStatus::kInvalidRequest);

  EXPECT_EQ(f.adapter->Calls(), 0);
  PerformanceStats stats = f.engine.Stats();
  EXPECT_EQ(stats.invalid_requests, 3u);
  EXPECT_EQ(stats.quote_cycles, 0u);
}

TEST(MetaTradingEngine, ValidateRequestNamesTheProblem) {
  ExecutionStrategy s;
  EXPECT_TRUE(MetaTradingEngine::ValidateRequest(MakeRequest(), s).empty());
  EXPECT_NE(MetaTradingEngine::ValidateRequest(MakeRequest(1.0L, ""), s).find("network_id"), std::string::npos);
  s.max_slippage_percent = -1.0;
  EXPECT_NE(MetaTradingEngine::ValidateRequest(MakeRequest(), s).find("slippage"), std::string::npos);
  s = ExecutionStrategy();
  s.global_timeout = milliseconds(0);
  EXPECT_NE(MetaTradingEngine::ValidateRequest(MakeRequest(), s).find("timeouts"), std::string::npos);
}

TEST(MetaTradingEngine, ExecutesBestQuoteOnce) {
  EngineFixture f;
  f.adapter->Script("A", Returns(950.0L, 2, 0.9, "0xaaaa"));
  f.adapter->Script("B", Returns(960.0L, 1, 0.9, "0xbbbb"));
  f.adapter->Script("C", Returns(900.0L, 1, 0.9, "0xcccc"));
  ExecutionStrategy s = QuickStrategy();

  AggregationResult r = f.engine.Quote(MakeRequest(1000.0L), s);
  ASSERT_TRUE(r.ok());
  TradeResult first = f.engine.Execute(r, s);
  EXPECT_TRUE(first.ok()) << first.failure_reason;
  EXPECT_EQ(first.source_id, "B");
  ASSERT_EQ(f.submitter->Submitted().size(), 1u);
  EXPECT_EQ(f.submitter->Submitted()[0].data, "0xbbbb");
  EXPECT_EQ(f.submitter->Submitted()[0].to, kRouterA);

  TradeResult second = f.engine.Execute(r, r.quotes[0].quote, s);
  EXPECT_EQ(second.error, ExecutionError::kAlreadyExecuted);
  EXPECT_EQ(f.submitter->Submitted().size(), 1u);

  PerformanceStats stats = f.engine.Stats();
  EXPECT_EQ(stats.executions_attempted, 1u);
  EXPECT_EQ(stats.executions_succeeded, 1u);
  EXPECT_EQ(stats.executions_failed, 0u);
  EXPECT_EQ(stats.executions_refused, 1u);
}

TEST(MetaTradingEngine, StaleQuoteIsRefusedWithoutSubmitting) {
  EngineFixture f;
  f.adapter->Script("A", Returns(950.0L, 2, 0.9, "0xaaaa"));
  f.adapter->Script("B", Returns(960.0L, 1, 0.9, "0xbbbb"));
  f.adapter->Script("C", Hangs());
  ExecutionStrategy s = QuickStrategy();

  AggregationResult r = f.engine.Quote(MakeRequest(1000.0L), s);
  ASSERT_TRUE(r.ok());
  s.max_quote_age = milliseconds(1);
  std::this_thread::sleep_for(milliseconds(20));

  TradeResult t = f.engine.Execute(r, s);
  EXPECT_EQ(t.error, ExecutionError::kQuoteExpired);
  EXPECT_TRUE(f.submitter->Submitted().empty());
  EXPECT_EQ(f.submitter->ReceiptPolls(), 0);
}

TEST(MetaTradingEngine, InstancesKeepSeparateStats) {
  EngineFixture one;
  EngineFixture two;
  one.adapter->Script("A", Returns(950.0L, 2, 0.9));
  one.engine.Quote(MakeRequest(), QuickStrategy());
  EXPECT_EQ(one.engine.Stats().quote_cycles, 1u);
  EXPECT_EQ(two.engine.Stats().quote_cycles, 0u);
}

TEST(MetaTradingEngine, OutOfRangeWorkerCountsStillQuote) {
  for (size_t workers : {size_t(0), static_cast<size_t>(-1)}) {
    auto adapter = std::make_shared<ScriptedAdapter>();
    adapter->Script("A", Returns(950.0L, 2, 0.9));
    adapter->Script("B", Returns(940.0L, 2, 0.9));
    adapter->Script("C", Returns(930.0L, 2, 0.9));
    MetaTradingEngine engine(ExternalRegistry({"A", "B", "C"}), std::make_shared<FakeSubmitter>(),
                             EngineOptions{workers, milliseconds(3000)});
    engine.RegisterAdapter(adapter);

    AggregationResult r = engine.Quote(MakeRequest(1000.0L), QuickStrategy());
    ASSERT_TRUE(r.ok()) << "workers=" << workers;
    ASSERT_TRUE(r.best_quote);
    EXPECT_EQ(r.best_quote->source_id, "A");
    EXPECT_EQ(r.quotes.size(), 3u);
  }
}
