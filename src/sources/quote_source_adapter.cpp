#include "sources/quote_source_adapter.hpp"
#include "common/logger.hpp"
#include "utils/json_rpc.hpp"

std::optional<FetchResult> QuoteSourceAdapter::CheckApplicable(const TradeRequest& request,
                                                               const SourceDescriptor& descriptor) {
  if (descriptor.Supports(request.network_id)) return std::nullopt;
  // The aggregator filters by network, so reaching this is a caller bug.
  METAROUTE_LOG_ERROR("Source " + descriptor.id + " asked to quote on unsupported network " + request.network_id);
  return FetchResult::Fail(SourceError::kUnsupported, "network " + request.network_id + " not supported");
}

FetchResult ChainFailure(const std::exception& e, const FetchContext& ctx) {
  if (ctx.Expired()) return FetchResult::Fail(SourceError::kTimeout, e.what());
  if (const auto* rpc = dynamic_cast<const RpcError*>(&e)) {
    switch (rpc->kind()) {
      case RpcError::Kind::kTransport:
      case RpcError::Kind::kHttpStatus:
        return FetchResult::Fail(SourceError::kSourceUnavailable, e.what());
      case RpcError::Kind::kRpc:
        // eth_call reverted: the venue cannot price this pair.
        return FetchResult::Fail(SourceError::kUnsupported, e.what());
      case RpcError::Kind::kMalformed:
        break;
    }
  }
  return FetchResult::Fail(SourceError::kInvalidResponse, e.what());
}
