#pragma once
#include <string>
#include <vector>

// Recursive-length-prefix encoding for typed transactions. Every function
// returns the 0x-prefixed encoding of one item.
namespace RLP {
  std::string EncodeBytes(const std::vector<unsigned char>& data);
  std::string EncodeString(const std::string& hex0x);
  std::string EncodeUint(unsigned long long value);
  // Big-endian quantity of any width ("0x0" and "0x" encode as zero).
  std::string EncodeQuantity(const std::string& hex0x);
  std::string EncodeList(const std::vector<std::string>& elements);
}
