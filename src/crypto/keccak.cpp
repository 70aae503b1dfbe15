#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <cryptopp/keccak.h>

namespace Crypto {
  std::vector<unsigned char> Keccak256(const std::vector<unsigned char>& data) {
    CryptoPP::Keccak_256 hash;
    std::vector<unsigned char> digest(32);
    hash.CalculateDigest(digest.data(), data.data(), data.size());
    return digest;
  }

  std::string Keccak256Hex(const std::string& hex_input) {
    return BytesToHex0x(Keccak256(HexToBytes(hex_input)));
  }
}
