#include "config/network.hpp"
#include "common/config_manager.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

int DefaultChainId(const NetworkId& network) {
  static const std::unordered_map<std::string, int> kChains = {
    {"ethereum", 1}, {"optimism", 10}, {"bsc", 56}, {"polygon", 137},
    {"pulsechain", 369}, {"base", 8453}, {"arbitrum", 42161}, {"avalanche", 43114},
  };
  auto it = kChains.find(network);
  return it == kChains.end() ? 0 : it->second;
}

std::string NetworkEnvPrefix(const NetworkId& network) {
  std::string out = network;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
  });
  return out;
}

NetworkConfig LoadNetworkConfig(const NetworkId& network) {
  const std::string prefix = NetworkEnvPrefix(network);
  NetworkConfig cfg;
  cfg.network = network;
  cfg.chain_id = ConfigManager::GetIntOr(prefix + "_CHAIN_ID", DefaultChainId(network));
  if (cfg.chain_id <= 0) {
    throw std::runtime_error("Unknown chain id for network " + network + "; set " + prefix + "_CHAIN_ID");
  }
  cfg.rpc_url = ConfigManager::GetOrThrow(prefix + "_RPC_URL");
  if (auto a = ConfigManager::Get(prefix + "_AUTH_HEADER")) cfg.auth_header = *a;
  cfg.multicall_address = ConfigManager::Get(prefix + "_MULTICALL_ADDRESS").value_or(kDefaultMulticallAddress);
  return cfg;
}
