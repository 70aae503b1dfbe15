#pragma once
#include <string>
#include <vector>

// Solidity ABI helpers for the handful of static calls the router needs.
// All encoders return hex without 0x unless stated otherwise.
namespace Abi {
  std::string Pad32(const std::string& hex_no0x);
  std::string EncodeUint(unsigned long long value);
  std::string EncodeUnits(long double units);
  std::string EncodeAddress(const std::string& address);
  // Dynamic address[] tail: length word followed by one word per item.
  std::string EncodeAddressArrayTail(const std::vector<std::string>& items);

  // Returns the 32-byte word at `index` of an eth_call result (0x optional).
  // Throws std::runtime_error if the result is too short.
  std::string Word(const std::string& result_hex, size_t index);
  long double WordToUnits(const std::string& result_hex, size_t index);
  unsigned long long WordToULL(const std::string& result_hex, size_t index);
  std::string WordToAddress(const std::string& result_hex, size_t index);
  size_t WordCount(const std::string& result_hex);
}
