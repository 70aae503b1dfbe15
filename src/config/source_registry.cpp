#include "config/source_registry.hpp"
#include "config/network.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

const char* ToString(DexProtocol protocol) {
  switch (protocol) {
    case DexProtocol::kUniswapV2: return "uniswap_v2";
    case DexProtocol::kUniswapV3: return "uniswap_v3";
  }
  return "unknown";
}

namespace {

[[noreturn]] void Fail(const std::string& section, const std::string& id, const std::string& what) {
  throw std::runtime_error("registry " + section + "." + id + ": " + what);
}

std::string OptString(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::string();
  return it->get<std::string>();
}

std::string CheckedAddress(const json& j, const char* key, bool required,
                           const std::string& section, const std::string& id) {
  std::string v = OptString(j, key);
  if (v.empty()) {
    if (required) Fail(section, id, std::string("missing ") + key);
    return v;
  }
  if (!IsHexAddress(v)) Fail(section, id, std::string(key) + " is not an address: " + v);
  return v;
}

std::set<NetworkId> ReadNetworks(const json& j, std::set<NetworkId> fallback) {
  auto it = j.find("supported_networks");
  if (it == j.end()) return fallback;
  std::set<NetworkId> out;
  for (const auto& n : *it) out.insert(n.get<std::string>());
  return out;
}

DexProtocol ParseProtocol(const std::string& raw, const std::string& id) {
  std::string s = ToLowerHex(raw);
  if (s == "uniswap_v2" || s == "v2") return DexProtocol::kUniswapV2;
  if (s == "uniswap_v3" || s == "v3") return DexProtocol::kUniswapV3;
  Fail("builtin_dex", id, "unknown protocol_type '" + raw + "'");
}

SourceDescriptor ParseDex(const std::string& id, const json& j) {
  static const std::string kSection = "builtin_dex";
  SourceDescriptor d;
  d.id = id;
  d.kind = SourceKind::kDirectDex;
  d.name = j.value("name", id);
  d.enabled = j.value("enabled", true);
  d.rate_limit_per_minute = j.value("rate_limit_per_minute", 0u);
  d.supported_networks = ReadNetworks(j, {"ethereum"});

  DexEndpoint ep;
  ep.protocol = ParseProtocol(j.value("protocol_type", std::string("uniswap_v2")), id);
  ep.contracts.router = CheckedAddress(j, "router_address", true, kSection, id);
  ep.contracts.factory = CheckedAddress(j, "factory_address", ep.protocol == DexProtocol::kUniswapV2, kSection, id);
  ep.contracts.quoter = CheckedAddress(j, "quoter_address", ep.protocol == DexProtocol::kUniswapV3, kSection, id);
  ep.contracts.position_manager = CheckedAddress(j, "position_manager_address", false, kSection, id);
  ep.contracts.multicall = CheckedAddress(j, "multicall_address", false, kSection, id);
  if (ep.contracts.multicall.empty()) ep.contracts.multicall = kDefaultMulticallAddress;
  if (auto c = j.find("contracts"); c != j.end() && c->is_object()) {
    for (auto it = c->begin(); it != c->end(); ++it) {
      if (it->is_string()) ep.contracts.extra[it.key()] = it->get<std::string>();
    }
  }
  ep.fee_bps = j.value("fee_bps", 30u);
  if (ep.fee_bps >= 10000) Fail(kSection, id, "fee_bps out of range");
  if (auto t = j.find("fee_tiers"); t != j.end()) {
    for (const auto& f : *t) ep.fee_tiers.push_back(f.get<unsigned>());
  }
  if (ep.protocol == DexProtocol::kUniswapV3 && ep.fee_tiers.empty()) {
    ep.fee_tiers = {500, 3000, 10000};
  }
  d.endpoint = ep;
  return d;
}

SourceDescriptor ParseBuiltin(const std::string& id, const json& j) {
  SourceDescriptor d;
  d.id = id;
  d.kind = SourceKind::kBuiltinAggregator;
  d.name = j.value("name", id);
  d.enabled = j.value("enabled", true);
  d.rate_limit_per_minute = j.value("rate_limit_per_minute", 0u);
  d.supported_networks = ReadNetworks(j, {"ethereum"});

  BuiltinAggregatorEndpoint ep;
  ep.dex_ids = j.at("dex_ids").get<std::vector<std::string>>();
  if (ep.dex_ids.empty()) Fail("builtin_aggregators", id, "dex_ids is empty");
  if (auto c = j.find("connector_tokens"); c != j.end()) {
    ep.connector_tokens = c->get<std::vector<std::string>>();
  }
  for (const auto& t : ep.connector_tokens) {
    if (!IsHexAddress(t)) Fail("builtin_aggregators", id, "connector token is not an address: " + t);
  }
  d.endpoint = ep;
  return d;
}

SourceDescriptor ParseExternal(const std::string& id, const json& j) {
  SourceDescriptor d;
  d.id = id;
  d.kind = SourceKind::kExternalAggregator;
  d.name = j.value("name", id);
  d.enabled = j.value("enabled", true);
  d.rate_limit_per_minute = j.value("rate_limit_per_minute", 0u);
  d.supported_networks = ReadNetworks(j, {});
  if (d.supported_networks.empty()) Fail("external_aggregators", id, "supported_networks is empty");

  ExternalEndpoint ep;
  ep.api_url = j.at("api_url").get<std::string>();
  if (ep.api_url.rfind("http://", 0) != 0 && ep.api_url.rfind("https://", 0) != 0) {
    Fail("external_aggregators", id, "api_url must be http(s): " + ep.api_url);
  }
  while (!ep.api_url.empty() && ep.api_url.back() == '/') ep.api_url.pop_back();
  ep.requires_api_key = j.value("requires_api_key", false);
  d.endpoint = ep;
  return d;
}

template <typename ParseFn>
void ParseSection(const json& root, const char* section, ParseFn parse, std::vector<SourceDescriptor>& out) {
  auto it = root.find(section);
  if (it == root.end()) return;
  if (!it->is_object()) throw std::runtime_error(std::string("registry ") + section + " must be an object");
  for (auto e = it->begin(); e != it->end(); ++e) {
    try {
      out.push_back(parse(e.key(), e.value()));
    } catch (const json::exception& ex) {
      Fail(section, e.key(), ex.what());
    }
  }
}

} // namespace

SourceRegistry::SourceRegistry() : snapshot_(std::make_shared<Snapshot>()) {}

void SourceRegistry::LoadFromJson(const std::string& text) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("registry is not valid JSON: ") + e.what());
  }
  if (!root.is_object()) throw std::runtime_error("registry root must be an object");

  auto snap = std::make_shared<Snapshot>();
  ParseSection(root, "builtin_dex", ParseDex, snap->sources);
  ParseSection(root, "builtin_aggregators", ParseBuiltin, snap->sources);
  ParseSection(root, "external_aggregators", ParseExternal, snap->sources);

  std::sort(snap->sources.begin(), snap->sources.end(),
            [](const SourceDescriptor& a, const SourceDescriptor& b) { return a.id < b.id; });
  for (size_t i = 1; i < snap->sources.size(); ++i) {
    if (snap->sources[i].id == snap->sources[i - 1].id) {
      throw std::runtime_error("registry: duplicate source id '" + snap->sources[i].id + "'");
    }
  }

  // Built-in aggregators compose v2 DEX entries declared in the same document.
  for (const auto& d : snap->sources) {
    const auto* b = d.Builtin();
    if (!b) continue;
    for (const auto& dex_id : b->dex_ids) {
      auto it = std::find_if(snap->sources.begin(), snap->sources.end(),
                             [&](const SourceDescriptor& s) { return s.id == dex_id; });
      if (it == snap->sources.end() || !it->Dex()) Fail("builtin_aggregators", d.id, "unknown dex '" + dex_id + "'");
      if (it->Dex()->protocol != DexProtocol::kUniswapV2) {
        Fail("builtin_aggregators", d.id, "dex '" + dex_id + "' is not a uniswap_v2 venue");
      }
    }
  }

  if (auto s = root.find("aggregation_settings"); s != root.end()) {
    try {
      snap->settings.enable_meta_aggregation = s->value("enable_meta_aggregation", true);
      snap->settings.quote_timeout_seconds = s->value("quote_timeout_seconds", 3.0);
      snap->settings.max_price_impact_percent = s->value("max_price_impact_percent", 1.0);
      snap->settings.prioritize_savings_over_speed = s->value("prioritize_savings_over_speed", true);
    } catch (const json::exception& ex) {
      throw std::runtime_error(std::string("registry aggregation_settings: ") + ex.what());
    }
    if (snap->settings.quote_timeout_seconds <= 0.0) {
      throw std::runtime_error("registry aggregation_settings: quote_timeout_seconds must be positive");
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = snap;
  }
  METAROUTE_LOG_INFO("Source registry loaded: " + std::to_string(snap->sources.size()) + " sources");
}

void SourceRegistry::LoadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw std::runtime_error("Cannot open registry file: " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  LoadFromJson(ss.str());
}

std::shared_ptr<const SourceRegistry::Snapshot> SourceRegistry::Current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_;
}

std::vector<SourceDescriptor> SourceRegistry::Candidates(const NetworkId& network, ExecutionMode mode) const {
  auto snap = Current();
  std::vector<SourceDescriptor> out;
  for (const auto& d : snap->sources) {
    if (!d.enabled || !d.Supports(network)) continue;
    if (mode == ExecutionMode::kDirectDex && d.kind != SourceKind::kDirectDex) continue;
    if (mode == ExecutionMode::kNormalAggregation && d.kind != SourceKind::kBuiltinAggregator) continue;
    out.push_back(d);
  }
  return out;
}

std::optional<SourceDescriptor> SourceRegistry::Find(const std::string& id) const {
  auto snap = Current();
  for (const auto& d : snap->sources) {
    if (d.id == id) return d;
  }
  return std::nullopt;
}

AggregationSettings SourceRegistry::Settings() const { return Current()->settings; }

size_t SourceRegistry::Size() const { return Current()->sources.size(); }

ExecutionStrategy SourceRegistry::DefaultStrategy() const {
  AggregationSettings s = Settings();
  ExecutionStrategy st;
  st.mode = s.enable_meta_aggregation ? ExecutionMode::kMetaAggregation : ExecutionMode::kNormalAggregation;
  st.max_slippage_percent = s.max_price_impact_percent;
  st.quote_timeout_per_source = std::chrono::milliseconds(static_cast<long long>(s.quote_timeout_seconds * 1000.0));
  st.global_timeout = st.quote_timeout_per_source + std::chrono::milliseconds(2000);
  st.prefer_speed_over_savings = !s.prioritize_savings_over_speed;
  return st;
}
