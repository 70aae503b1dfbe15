#pragma once
#include <vector>

namespace Crypto {
  struct Signature { std::vector<unsigned char> r; std::vector<unsigned char> s; unsigned char recovery_id = 0; };
  // Recoverable ECDSA over a 32-byte digest. Throws std::invalid_argument on
  // bad sizes and std::runtime_error when the key is rejected.
  Signature SignDigest(const std::vector<unsigned char>& priv32, const std::vector<unsigned char>& digest32);
  // Uncompressed public key: 0x04 || X(32) || Y(32).
  std::vector<unsigned char> PublicKeyFromPrivate(const std::vector<unsigned char>& priv32);
}
