#pragma once
#include <string>
#include <vector>

// Calldata for the Uniswap-style router, factory, pair and quoter methods we
// read from or send to. Every builder returns 0x-prefixed hex.
class DexRouter {
public:
  // swapExactTokensForTokens(uint256,uint256,address[],address,uint256) 0x38ed1739
  static std::string BuildV2SwapExactTokensCall(long double amount_in,
                                                long double amount_out_min,
                                                const std::vector<std::string>& path,
                                                const std::string& to,
                                                unsigned long long deadline);

  // SwapRouter exactInputSingle((address,address,uint24,address,uint256,uint256,uint256,uint160)) 0x414bf389
  static std::string BuildV3ExactInputSingleCall(const std::string& token_in,
                                                 const std::string& token_out,
                                                 unsigned fee,
                                                 const std::string& recipient,
                                                 unsigned long long deadline,
                                                 long double amount_in,
                                                 long double amount_out_min);

  // getAmountsOut(uint256,address[]) 0xd06ca61f
  static std::string EncodeGetAmountsOut(long double amount_in, const std::vector<std::string>& path);
  // Decodes the uint256[] returned by getAmountsOut.
  static std::vector<long double> DecodeAmounts(const std::string& result_hex);

  // QuoterV2 quoteExactInputSingle((address,address,uint256,uint24,uint160)) 0xc6a5026a
  static std::string EncodeQuoteExactInputSingle(const std::string& token_in,
                                                 const std::string& token_out,
                                                 long double amount_in,
                                                 unsigned fee);

  // getPair(address,address) 0xe6a43905
  static std::string EncodeGetPair(const std::string& token_a, const std::string& token_b);
  static const char* kGetReserves; // getReserves() 0x0902f1ac
  static const char* kToken0;      // token0() 0x0dfe1681
};
