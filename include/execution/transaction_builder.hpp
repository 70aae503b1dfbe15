#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "core/types.hpp"
#include "execution/transaction_submitter.hpp"

class SourceRegistry;
class ExternalAggregatorAdapter;

// Turns a quote into router calldata (DEX and built-in routes) or the
// aggregator-supplied transaction (external routes).
class TransactionBuilder {
public:
  static constexpr int kDeadlineSeconds = 180;
  static constexpr int kSwapRequestTimeoutMs = 5000;

  TransactionBuilder(std::shared_ptr<const SourceRegistry> registry,
                     std::shared_ptr<ExternalAggregatorAdapter> external);

  // False with `error` set when no transaction can be built for the quote.
  bool Build(const TradeRequest& request,
             const Quote& quote,
             const ExecutionStrategy& strategy,
             const std::string& recipient,
             UnsignedTransaction& out,
             std::string& error);

  // Client used for /swap when an external quote carries no calldata.
  void SetExternalClient(std::shared_ptr<ExternalAggregatorAdapter> external);

  static long double MinAmountOut(long double amount_out, double max_slippage_percent);

private:
  bool BuildRouterSwap(const TradeRequest& request, const Quote& quote, long double min_out,
                       const std::string& recipient, UnsignedTransaction& out, std::string& error);

  std::shared_ptr<const SourceRegistry> registry_;
  std::mutex external_mutex_;
  std::shared_ptr<ExternalAggregatorAdapter> external_;
};
