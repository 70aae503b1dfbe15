#include "execution/transaction_builder.hpp"
#include "config/source_registry.hpp"
#include "routing/dex_router.hpp"
#include "sources/external_aggregator_adapter.hpp"
#include "utils/hex.hpp"
#include <chrono>
#include <cmath>

namespace {
unsigned long long SwapDeadline() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<unsigned long long>(std::chrono::duration_cast<std::chrono::seconds>(now).count()) +
         TransactionBuilder::kDeadlineSeconds;
}
}

TransactionBuilder::TransactionBuilder(std::shared_ptr<const SourceRegistry> registry,
                                       std::shared_ptr<ExternalAggregatorAdapter> external)
  : registry_(std::move(registry)), external_(std::move(external)) {}

void TransactionBuilder::SetExternalClient(std::shared_ptr<ExternalAggregatorAdapter> external) {
  std::lock_guard<std::mutex> lock(external_mutex_);
  external_ = std::move(external);
}

long double TransactionBuilder::MinAmountOut(long double amount_out, double max_slippage_percent) {
  double slip = max_slippage_percent < 0.0 ? 0.0 : max_slippage_percent;
  if (slip > 100.0) slip = 100.0;
  return std::floor(amount_out * (100.0L - static_cast<long double>(slip)) / 100.0L);
}

bool TransactionBuilder::BuildRouterSwap(const TradeRequest& request, const Quote& quote, long double min_out,
                                         const std::string& recipient, UnsignedTransaction& out, std::string& error) {
  if (quote.route.empty()) { error = "quote carries no route"; return false; }
  const std::string& router = quote.route.front().venue;
  std::vector<std::string> path{quote.route.front().token_in};
  for (const auto& hop : quote.route) {
    if (!SameAddress(hop.venue, router)) { error = "route spans more than one router"; return false; }
    if (!SameAddress(hop.token_in, path.back())) { error = "route hops are not contiguous"; return false; }
    path.push_back(hop.token_out);
  }
  if (!SameAddress(path.front(), request.token_in) || !SameAddress(path.back(), request.token_out)) {
    error = "route does not connect the requested tokens";
    return false;
  }
  out.to = router;
  if (quote.route.size() == 1 && quote.route.front().protocol == ToString(DexProtocol::kUniswapV3)) {
    out.data = DexRouter::BuildV3ExactInputSingleCall(request.token_in, request.token_out, quote.route.front().fee,
                                                      recipient, SwapDeadline(), request.amount_in, min_out);
  } else {
    out.data = DexRouter::BuildV2SwapExactTokensCall(request.amount_in, min_out, path, recipient, SwapDeadline());
  }
  return true;
}

bool TransactionBuilder::Build(const TradeRequest& request,
                               const Quote& quote,
                               const ExecutionStrategy& strategy,
                               const std::string& recipient,
                               UnsignedTransaction& out,
                               std::string& error) {
  if (!IsHexAddress(recipient)) { error = "recipient is not an address: '" + recipient + "'"; return false; }
  auto descriptor = registry_->Find(quote.source_id);
  if (!descriptor) { error = "source " + quote.source_id + " is no longer registered"; return false; }

  out = UnsignedTransaction();
  out.network = request.network_id;
  long double min_out = MinAmountOut(quote.amount_out, strategy.max_slippage_percent);

  try {
    switch (descriptor->kind) {
      case SourceKind::kDirectDex:
      case SourceKind::kBuiltinAggregator:
        return BuildRouterSwap(request, quote, min_out, recipient, out, error);
      case SourceKind::kExternalAggregator:
        if (!quote.calldata.empty() && IsHexAddress(quote.tx_to)) {
          out.to = quote.tx_to;
          out.data = Ensure0x(quote.calldata);
          if (!quote.tx_value.empty()) out.value = quote.tx_value;
          return true;
        }
        {
          std::shared_ptr<ExternalAggregatorAdapter> client;
          {
            std::lock_guard<std::mutex> lock(external_mutex_);
            client = external_;
          }
          if (!client) { error = "no external aggregator client for /swap"; return false; }
          ExternalSwap swap = client->BuildSwap(request, quote, *descriptor, recipient, min_out, kSwapRequestTimeoutMs);
          out.to = swap.to;
          out.data = Ensure0x(swap.data);
          out.value = swap.value;
          out.gas_limit = swap.gas;
        }
        return true;
    }
  } catch (const std::exception& e) {
    error = e.what();
    return false;
  }
  error = "unknown source kind";
  return false;
}
