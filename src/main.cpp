#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "config/network.hpp"
#include "config/source_registry.hpp"
#include "chain/rpc_chain_quoter.hpp"
#include "engine/meta_trading_engine.hpp"
#include "execution/rpc_transaction_submitter.hpp"
#include "net/http_client.hpp"
#include "oracle/gas_oracle.hpp"
#include "telemetry/structured_logger.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void PrintUsage() {
  std::cerr << "usage: metaroute <network> <token_in> <token_out> <amount_in_base_units>"
               " [--execute] [--mode direct|normal|meta] [--speed]" << std::endl;
}

struct CliArgs {
  NetworkId network;
  std::string token_in;
  std::string token_out;
  long double amount_in = 0.0L;
  bool execute = false;
  bool speed = false;
  std::optional<ExecutionMode> mode;
};

bool ParseArgs(int argc, char** argv, CliArgs& out) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--execute") out.execute = true;
    else if (a == "--speed") out.speed = true;
    else if (a == "--mode" && i + 1 < argc) {
      out.mode = ParseExecutionMode(argv[++i]);
      if (!out.mode) return false;
    } else if (a.rfind("--", 0) == 0) return false;
    else positional.push_back(a);
  }
  if (positional.size() != 4) return false;
  out.network = positional[0];
  out.token_in = positional[1];
  out.token_out = positional[2];
  try {
    out.amount_in = std::stold(positional[3]);
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

void PrintResult(const AggregationResult& result) {
  std::printf("request %s: %s in %lldms\n", result.request_id.c_str(), ToString(result.status),
              static_cast<long long>(result.elapsed.count()));
  std::printf("%-24s %-20s %24s %10s %8s %-9s\n", "source", "kind", "amount_out", "gas", "impact%", "risk");
  for (const auto& aq : result.quotes) {
    const Quote& q = aq.quote;
    std::printf("%-24s %-20s %24.0Lf %10llu %8.3f %-9s\n", q.source_id.c_str(), ToString(q.source_kind),
                q.amount_out, q.gas_estimate, q.price_impact_percent, ToString(aq.risk.risk_level));
  }
  for (const auto& f : result.failures) {
    std::printf("  failed %-16s %s %s\n", f.source_id.c_str(), ToString(f.error), f.detail.c_str());
  }
  for (const auto& w : result.warnings) std::printf("  warning: %s\n", w.c_str());
  const auto& rec = result.recommended_execution;
  std::printf("recommendation: %s (%s) %s\n", rec.should_execute ? "execute" : "hold",
              ToString(rec.risk_level), rec.rationale.c_str());
}

void PrintStats(const PerformanceStats& s) {
  std::printf("cycles=%llu requested=%llu succeeded=%llu no_route=%llu avg_gather=%.1fms savings=%.0Lf\n",
              s.quote_cycles, s.quotes_requested, s.quotes_succeeded, s.no_viable_route,
              s.avg_gather_latency_ms, s.cumulative_savings);
  std::printf("executions attempted=%llu confirmed=%llu failed=%llu refused=%llu\n",
              s.executions_attempted, s.executions_succeeded, s.executions_failed, s.executions_refused);
  for (const auto& kv : s.per_source) {
    std::printf("  %-24s req=%llu ok=%llu timeouts=%llu limited=%llu success=%.2f latency=%.1fms\n",
                kv.first.c_str(), kv.second.requests, kv.second.successes, kv.second.timeouts,
                kv.second.rate_limited, kv.second.SuccessRate(), kv.second.avg_latency_ms);
  }
}

// Every collaborator, including the engine's worker pool, is destroyed
// before this returns.
int Run(const CliArgs& args) {
  auto registry = std::make_shared<SourceRegistry>();
  registry->LoadFromFile(ConfigManager::Get("REGISTRY_PATH").value_or("registry.json"));
  NetworkConfig net = LoadNetworkConfig(args.network);

  HttpClientTuning tuning;
  tuning.verify_tls = ConfigManager::GetBoolOr("HTTP_VERIFY_TLS", true);
  std::shared_ptr<HttpClient> http(CreateCurlHttpClient(tuning));

  auto quoters = std::make_shared<ChainQuoterRegistry>();
  quoters->Set(net.network, std::make_shared<RpcChainQuoter>(*http, net));

  std::shared_ptr<RpcTransactionSubmitter> submitter;
  if (auto key = ConfigManager::Get("PRIVATE_KEY")) {
    submitter = std::make_shared<RpcTransactionSubmitter>(http, *key);
    submitter->AddNetwork(net);
  } else if (args.execute) {
    std::cerr << "--execute needs PRIVATE_KEY" << std::endl;
    return 2;
  }

  EngineOptions options;
  options.worker_threads = static_cast<size_t>(std::max(1, ConfigManager::GetIntOr("WORKER_THREADS", 8)));
  MetaTradingEngine engine(registry, submitter, options);
  engine.InstallStandardAdapters(http, quoters);

  ExecutionStrategy strategy = registry->DefaultStrategy();
  if (args.mode) strategy.mode = *args.mode;
  if (args.speed) strategy.prefer_speed_over_savings = true;
  strategy.max_slippage_percent = ConfigManager::GetDoubleOr("MAX_SLIPPAGE_PERCENT", strategy.max_slippage_percent);
  strategy.min_confirmations = static_cast<size_t>(std::max(1, ConfigManager::GetIntOr("MIN_CONFIRMATIONS", 2)));
  GasOracle gas_oracle;
  gas_oracle.LoadFromConfig();
  strategy.gas_to_output = gas_oracle.ConverterFor(args.token_out);

  TradeRequest request = TradeRequest::Create(args.network, args.token_in, args.token_out, args.amount_in);
  AggregationResult result = engine.Quote(request, strategy);
  PrintResult(result);

  int rc = result.ok() ? 0 : 1;
  if (args.execute && result.ok()) {
    if (!result.recommended_execution.should_execute) {
      std::printf("not executing: %s\n", result.recommended_execution.rationale.c_str());
    } else {
      TradeResult trade = engine.Execute(result, strategy);
      std::printf("execution: %s tx=%s %s\n", trade.ok() ? "confirmed" : ToString(trade.error),
                  trade.tx_hash.c_str(), trade.failure_reason.c_str());
      if (trade.actual_amount_out) std::printf("received %.0Lf\n", *trade.actual_amount_out);
      if (!trade.ok()) rc = 1;
    }
  }
  PrintStats(engine.Stats());
  return rc;
}

} // namespace

int main(int argc, char** argv) {
  CliArgs args;
  if (!ParseArgs(argc, argv, args)) {
    PrintUsage();
    return 2;
  }

  int rc = 1;
  try {
    ConfigManager::Initialize(".env");
    LoggerOptions log_opts;
    log_opts.path = ConfigManager::Get("LOG_FILE").value_or("metaroute.log");
    log_opts.min_level = Logger::ParseLevel(ConfigManager::Get("LOG_LEVEL").value_or("INFO"));
    log_opts.mirror_to_stderr = true;
    Logger::Initialize(log_opts);
    StructuredLogger::Instance().Initialize(ConfigManager::Get("METRICS_FILE").value_or("metrics.jsonl"));
    rc = Run(args);
  } catch (const std::exception& e) {
    METAROUTE_LOG_CRITICAL(std::string("fatal: ") + e.what());
    std::cerr << "fatal: " << e.what() << std::endl;
    rc = 1;
  }
  StructuredLogger::Instance().Shutdown();
  Logger::Shutdown();
  return rc;
}
