#pragma once
#include <string>
#include <vector>

namespace Crypto {
  std::vector<unsigned char> Keccak256(const std::vector<unsigned char>& data);
  // 0x-prefixed hex digest of hex-encoded input (0x optional).
  std::string Keccak256Hex(const std::string& hex_input);
}
