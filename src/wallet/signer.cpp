#include "wallet/signer.hpp"
#include "crypto/keccak.hpp"
#include "crypto/secp256k1.hpp"
#include "encoding/rlp.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

Signer::Signer(const std::string& private_key_hex) {
  std::string h = Strip0x(private_key_hex);
  if (h.empty()) throw std::invalid_argument("empty private key");
  if (h.size() != 64 || !IsHexDigits(h)) throw std::invalid_argument("invalid private key length");
  priv_ = HexToBytes(h);
  // Address is the last 20 bytes of keccak(X || Y).
  std::vector<unsigned char> pub = Crypto::PublicKeyFromPrivate(priv_);
  std::vector<unsigned char> xy(pub.begin() + 1, pub.end());
  std::vector<unsigned char> hash = Crypto::Keccak256(xy);
  address_ = BytesToHex0x(hash.data() + 12, 20);
}

std::string Signer::SignEip1559(const TransactionFields& tx) const {
  if (!IsHexAddress(tx.to)) throw std::invalid_argument("transaction 'to' is not an address: " + tx.to);
  // [chainId, nonce, maxPriorityFeePerGas, maxFeePerGas, gasLimit, to, value, data, accessList]
  std::vector<std::string> fields{
    RLP::EncodeUint(tx.chain_id),
    RLP::EncodeUint(tx.nonce),
    RLP::EncodeUint(tx.max_priority_fee_per_gas),
    RLP::EncodeUint(tx.max_fee_per_gas),
    RLP::EncodeUint(tx.gas_limit),
    RLP::EncodeString(tx.to),
    RLP::EncodeQuantity(tx.value),
    RLP::EncodeString(tx.data),
    RLP::EncodeList({})
  };

  std::vector<unsigned char> preimage{0x02};
  std::vector<unsigned char> body = HexToBytes(RLP::EncodeList(fields));
  preimage.insert(preimage.end(), body.begin(), body.end());
  Crypto::Signature sig = Crypto::SignDigest(priv_, Crypto::Keccak256(preimage));

  fields.push_back(RLP::EncodeUint(sig.recovery_id));
  fields.push_back(RLP::EncodeQuantity(BytesToHex0x(sig.r)));
  fields.push_back(RLP::EncodeQuantity(BytesToHex0x(sig.s)));
  return "0x02" + Strip0x(RLP::EncodeList(fields));
}
