#include "encoding/rlp.hpp"
#include "utils/hex.hpp"

namespace {
  void Append(std::vector<unsigned char>& buf, const std::vector<unsigned char>& more) {
    buf.insert(buf.end(), more.begin(), more.end());
  }

  std::vector<unsigned char> LengthPrefix(size_t len, unsigned char offset) {
    if (len < 56) return {static_cast<unsigned char>(offset + len)};
    std::vector<unsigned char> len_bytes;
    for (size_t tmp = len; tmp; tmp >>= 8) len_bytes.insert(len_bytes.begin(), static_cast<unsigned char>(tmp & 0xFF));
    std::vector<unsigned char> out{static_cast<unsigned char>(offset + 55 + len_bytes.size())};
    Append(out, len_bytes);
    return out;
  }
}

namespace RLP {
  std::string EncodeBytes(const std::vector<unsigned char>& data) {
    if (data.size() == 1 && data[0] < 0x80) return BytesToHex0x(data);
    std::vector<unsigned char> out = LengthPrefix(data.size(), 0x80);
    Append(out, data);
    return BytesToHex0x(out);
  }

  std::string EncodeString(const std::string& hex0x) {
    return EncodeBytes(HexToBytes(hex0x));
  }

  std::string EncodeUint(unsigned long long value) {
    std::vector<unsigned char> bytes;
    for (; value; value >>= 8) bytes.insert(bytes.begin(), static_cast<unsigned char>(value & 0xFF));
    return EncodeBytes(bytes);
  }

  std::string EncodeQuantity(const std::string& hex0x) {
    std::vector<unsigned char> bytes = HexToBytes(hex0x);
    size_t first = 0;
    while (first < bytes.size() && bytes[first] == 0) ++first;
    return EncodeBytes(std::vector<unsigned char>(bytes.begin() + first, bytes.end()));
  }

  std::string EncodeList(const std::vector<std::string>& elements) {
    std::vector<unsigned char> payload;
    for (const auto& e : elements) Append(payload, HexToBytes(e));
    std::vector<unsigned char> out = LengthPrefix(payload.size(), 0xC0);
    Append(out, payload);
    return BytesToHex0x(out);
  }
}
