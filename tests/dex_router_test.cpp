#include <gtest/gtest.h>
#include "routing/dex_router.hpp"
#include "utils/abi.hpp"
#include "test_support.hpp"

using namespace testing_support;

TEST(DexRouter, V2SwapLayout) {
  std::string data = DexRouter::BuildV2SwapExactTokensCall(1000.0L, 990.0L, {kWeth, kDai, kUsdc}, kRecipient, 1700000000ULL);
  EXPECT_EQ(data.substr(0, 10), "0x38ed1739");
  std::string body = "0x" + data.substr(10);
  EXPECT_EQ(Abi::WordToULL(body, 0), 1000u);
  EXPECT_EQ(Abi::WordToULL(body, 1), 990u);
  EXPECT_EQ(Abi::WordToULL(body, 2), 0xa0u);
  EXPECT_EQ(Abi::WordToAddress(body, 3), ToLowerHex(kRecipient));
  EXPECT_EQ(Abi::WordToULL(body, 4), 1700000000u);
  EXPECT_EQ(Abi::WordToULL(body, 5), 3u);
  EXPECT_EQ(Abi::WordToAddress(body, 6), ToLowerHex(kWeth));
  EXPECT_EQ(Abi::WordToAddress(body, 8), ToLowerHex(kUsdc));
  EXPECT_EQ(Abi::WordCount(body), 9u);
}

TEST(DexRouter, V3ExactInputSingleIsStatic) {
  std::string data = DexRouter::BuildV3ExactInputSingleCall(kWeth, kUsdc, 500, kRecipient, 42, 1000.0L, 990.0L);
  EXPECT_EQ(data.substr(0, 10), "0x414bf389");
  std::string body = "0x" + data.substr(10);
  EXPECT_EQ(Abi::WordCount(body), 8u);
  EXPECT_EQ(Abi::WordToULL(body, 2), 500u);
  EXPECT_EQ(Abi::WordToULL(body, 5), 1000u);
  EXPECT_EQ(Abi::WordToULL(body, 7), 0u);
}

TEST(DexRouter, ReadCallSelectors) {
  EXPECT_EQ(DexRouter::EncodeGetAmountsOut(5.0L, {kWeth, kUsdc}).substr(0, 10), "0xd06ca61f");
  EXPECT_EQ(DexRouter::EncodeQuoteExactInputSingle(kWeth, kUsdc, 5.0L, 3000).substr(0, 10), "0xc6a5026a");
  std::string pair = DexRouter::EncodeGetPair(kWeth, kUsdc);
  EXPECT_EQ(pair.substr(0, 10), "0xe6a43905");
  EXPECT_EQ(pair.size(), 10u + 128u);
  EXPECT_THROW(DexRouter::EncodeGetPair("0x1234", kUsdc), std::invalid_argument);
}

TEST(DexRouter, DecodesAmountsArray) {
  std::string result = "0x" + Abi::EncodeUint(0x20) + Abi::EncodeUint(2) + Abi::EncodeUint(1000) + Abi::EncodeUint(1990);
  std::vector<long double> amounts = DexRouter::DecodeAmounts(result);
  ASSERT_EQ(amounts.size(), 2u);
  EXPECT_EQ(amounts[0], 1000.0L);
  EXPECT_EQ(amounts[1], 1990.0L);

  EXPECT_THROW(DexRouter::DecodeAmounts("0x" + Abi::EncodeUint(0x20) + Abi::EncodeUint(2) + Abi::EncodeUint(1)),
               std::runtime_error);
  EXPECT_THROW(DexRouter::DecodeAmounts("0x" + Abi::EncodeUint(0x20) + Abi::EncodeUint(1000)), std::runtime_error);
}
