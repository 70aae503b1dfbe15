#pragma once
#include <string>
#include <optional>
#include "core/types.hpp"

struct NetworkConfig {
  NetworkId network;
  int chain_id = 1;
  std::string rpc_url;
  std::optional<std::string> auth_header;
  std::string multicall_address;
};

// Multicall3 is deployed at the same address on every chain we know about.
inline const char* kDefaultMulticallAddress = "0xcA11bde05977b3631167028862bE2a173976CA11";

// Well-known chain ids; returns 0 for unknown networks.
int DefaultChainId(const NetworkId& network);

// "polygon" -> "POLYGON", used as the prefix for per-network .env keys.
std::string NetworkEnvPrefix(const NetworkId& network);

// Reads <NETWORK>_RPC_URL (required), <NETWORK>_CHAIN_ID, <NETWORK>_AUTH_HEADER
// and <NETWORK>_MULTICALL_ADDRESS. Throws std::runtime_error when the RPC URL
// is missing or the chain id cannot be determined.
NetworkConfig LoadNetworkConfig(const NetworkId& network);
