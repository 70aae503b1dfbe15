#include "utils/abi.hpp"
#include "utils/hex.hpp"
#include <sstream>
#include <stdexcept>

namespace Abi {
  std::string Pad32(const std::string& hex_no0x) {
    std::string s = Strip0x(hex_no0x);
    if (s.size() > 64) return s.substr(s.size() - 64);
    if (s.size() < 64) s = std::string(64 - s.size(), '0') + s;
    return s;
  }

  std::string EncodeUint(unsigned long long value) {
    std::stringstream ss; ss << std::hex << value;
    return Pad32(ss.str());
  }

  std::string EncodeUnits(long double units) {
    return Pad32(Strip0x(UnitsToHex(units)));
  }

  std::string EncodeAddress(const std::string& address) {
    if (!IsHexAddress(address)) throw std::invalid_argument("not an address: " + address);
    return Pad32(ToLowerHex(Strip0x(address)));
  }

  std::string EncodeAddressArrayTail(const std::vector<std::string>& items) {
    std::string out = EncodeUint(items.size());
    for (const auto& a : items) out += EncodeAddress(a);
    return out;
  }

  size_t WordCount(const std::string& result_hex) {
    return Strip0x(result_hex).size() / 64;
  }

  std::string Word(const std::string& result_hex, size_t index) {
    std::string h = Strip0x(result_hex);
    if (h.size() < (index + 1) * 64) {
      throw std::runtime_error("abi result too short: need word " + std::to_string(index) +
                               ", have " + std::to_string(h.size() / 64));
    }
    return h.substr(index * 64, 64);
  }

  long double WordToUnits(const std::string& result_hex, size_t index) {
    return HexToUnits(Word(result_hex, index));
  }

  unsigned long long WordToULL(const std::string& result_hex, size_t index) {
    std::string w = Word(result_hex, index);
    // Values we read as integers (gas, counts) fit in the low 8 bytes.
    return std::stoull(w.substr(48), nullptr, 16);
  }

  std::string WordToAddress(const std::string& result_hex, size_t index) {
    return "0x" + Word(result_hex, index).substr(24, 40);
  }
}
