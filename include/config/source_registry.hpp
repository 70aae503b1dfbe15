#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "core/types.hpp"

enum class DexProtocol { kUniswapV2, kUniswapV3 };

const char* ToString(DexProtocol protocol);

struct DexContracts {
  std::string router;
  std::string factory;
  std::string quoter;            // v3 only
  std::string position_manager;  // optional
  std::string multicall;
  std::map<std::string, std::string> extra; // "contracts" block, free-form
};

struct DexEndpoint {
  DexProtocol protocol = DexProtocol::kUniswapV2;
  DexContracts contracts;
  unsigned fee_bps = 30;           // v2 pool fee
  std::vector<unsigned> fee_tiers; // v3 tiers to query, in hundredths of a bip
};

struct BuiltinAggregatorEndpoint {
  std::vector<std::string> dex_ids;          // member v2 DEX descriptors
  std::vector<std::string> connector_tokens; // intermediate tokens for two-hop routes
};

struct ExternalEndpoint {
  std::string api_url;
  bool requires_api_key = false;
};

struct SourceDescriptor {
  std::string id;
  SourceKind kind = SourceKind::kDirectDex;
  std::string name;
  std::set<NetworkId> supported_networks;
  bool enabled = true;
  unsigned rate_limit_per_minute = 0; // 0 = not limited
  std::variant<DexEndpoint, BuiltinAggregatorEndpoint, ExternalEndpoint> endpoint;

  bool Supports(const NetworkId& network) const { return supported_networks.count(network) > 0; }
  const DexEndpoint* Dex() const { return std::get_if<DexEndpoint>(&endpoint); }
  const BuiltinAggregatorEndpoint* Builtin() const { return std::get_if<BuiltinAggregatorEndpoint>(&endpoint); }
  const ExternalEndpoint* External() const { return std::get_if<ExternalEndpoint>(&endpoint); }
};

struct AggregationSettings {
  bool enable_meta_aggregation = true;
  double quote_timeout_seconds = 3.0;
  double max_price_impact_percent = 1.0;
  bool prioritize_savings_over_speed = true;
};

// Catalog of quote sources. Readers take a snapshot, so a reload never
// disturbs a gather that is already running.
class SourceRegistry {
public:
  SourceRegistry();

  // Parse and validate a registry document, replacing the current catalog.
  // Throws std::runtime_error naming the offending entry; the previous
  // catalog stays in place on failure.
  void LoadFromJson(const std::string& text);
  void LoadFromFile(const std::string& path);

  // Enabled sources supporting `network`, narrowed by mode, sorted by id.
  std::vector<SourceDescriptor> Candidates(const NetworkId& network, ExecutionMode mode) const;
  std::optional<SourceDescriptor> Find(const std::string& id) const;
  AggregationSettings Settings() const;
  size_t Size() const;

  // Strategy seeded from aggregation_settings.
  ExecutionStrategy DefaultStrategy() const;

private:
  struct Snapshot {
    std::vector<SourceDescriptor> sources;
    AggregationSettings settings;
  };
  std::shared_ptr<const Snapshot> Current() const;

  mutable std::mutex mutex_;
  std::shared_ptr<const Snapshot> snapshot_;
};
