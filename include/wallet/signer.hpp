#pragma once
#include <string>
#include <vector>

struct TransactionFields {
  unsigned long long chain_id = 1;
  unsigned long long nonce = 0;
  unsigned long long gas_limit = 0;
  unsigned long long max_fee_per_gas = 0;          // wei
  unsigned long long max_priority_fee_per_gas = 0; // wei
  std::string to;                                  // 0x...
  std::string value = "0x0";                       // wei, 0x quantity
  std::string data;                                // 0x...
};

// Holds one secp256k1 key and produces raw EIP-1559 (type 2) transactions.
class Signer {
public:
  // Throws std::invalid_argument for a malformed key and std::runtime_error
  // when the curve library rejects it.
  explicit Signer(const std::string& private_key_hex);
  std::string SignEip1559(const TransactionFields& tx) const;
  const std::string& Address() const { return address_; }
private:
  std::vector<unsigned char> priv_;
  std::string address_;
};
