#include "routing/dex_router.hpp"
#include "utils/abi.hpp"
#include <stdexcept>

const char* DexRouter::kGetReserves = "0x0902f1ac";
const char* DexRouter::kToken0 = "0x0dfe1681";

std::string DexRouter::BuildV2SwapExactTokensCall(long double amount_in,
                                                  long double amount_out_min,
                                                  const std::vector<std::string>& path,
                                                  const std::string& to,
                                                  unsigned long long deadline) {
  std::string out = "0x38ed1739";
  out += Abi::EncodeUnits(amount_in);
  out += Abi::EncodeUnits(amount_out_min);
  // path offset: head is 5 slots, 5*32 = 0xa0
  out += Abi::EncodeUint(0xa0);
  out += Abi::EncodeAddress(to);
  out += Abi::EncodeUint(deadline);
  out += Abi::EncodeAddressArrayTail(path);
  return out;
}

std::string DexRouter::BuildV3ExactInputSingleCall(const std::string& token_in,
                                                   const std::string& token_out,
                                                   unsigned fee,
                                                   const std::string& recipient,
                                                   unsigned long long deadline,
                                                   long double amount_in,
                                                   long double amount_out_min) {
  // Static tuple: encoded inline, no offset.
  std::string out = "0x414bf389";
  out += Abi::EncodeAddress(token_in);
  out += Abi::EncodeAddress(token_out);
  out += Abi::EncodeUint(fee);
  out += Abi::EncodeAddress(recipient);
  out += Abi::EncodeUint(deadline);
  out += Abi::EncodeUnits(amount_in);
  out += Abi::EncodeUnits(amount_out_min);
  out += Abi::EncodeUint(0); // sqrtPriceLimitX96
  return out;
}

std::string DexRouter::EncodeGetAmountsOut(long double amount_in, const std::vector<std::string>& path) {
  std::string out = "0xd06ca61f";
  out += Abi::EncodeUnits(amount_in);
  out += Abi::EncodeUint(0x40);
  out += Abi::EncodeAddressArrayTail(path);
  return out;
}

std::vector<long double> DexRouter::DecodeAmounts(const std::string& result_hex) {
  // word 0: offset to the array, then length, then items
  unsigned long long offset_words = Abi::WordToULL(result_hex, 0) / 32;
  unsigned long long n = Abi::WordToULL(result_hex, offset_words);
  if (n > 16) throw std::runtime_error("getAmountsOut: implausible array length " + std::to_string(n));
  std::vector<long double> amounts;
  amounts.reserve(n);
  for (unsigned long long i = 0; i < n; ++i) {
    amounts.push_back(Abi::WordToUnits(result_hex, offset_words + 1 + i));
  }
  return amounts;
}

std::string DexRouter::EncodeQuoteExactInputSingle(const std::string& token_in,
                                                   const std::string& token_out,
                                                   long double amount_in,
                                                   unsigned fee) {
  std::string out = "0xc6a5026a";
  out += Abi::EncodeAddress(token_in);
  out += Abi::EncodeAddress(token_out);
  out += Abi::EncodeUnits(amount_in);
  out += Abi::EncodeUint(fee);
  out += Abi::EncodeUint(0);
  return out;
}

std::string DexRouter::EncodeGetPair(const std::string& token_a, const std::string& token_b) {
  return "0xe6a43905" + Abi::EncodeAddress(token_a) + Abi::EncodeAddress(token_b);
}
