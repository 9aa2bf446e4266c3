/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace parabridge::common;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected encoding
 */
TEST(Common, Hexutil_Hex) {
  auto bin = "00010204081020FF"_unhex;
  ASSERT_EQ(hex_lower(bin), "00010204081020ff"s);
  ASSERT_EQ(hex_lower_0x(bin), "0x00010204081020ff"s);
}

/**
 * @given Hexencoded string of even length
 * @when unhex
 * @then no exception, result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  auto s = "00010204081020ff"s;

  std::vector<uint8_t> actual;
  ASSERT_NO_THROW(actual = unhex(s).value())
      << "unhex result does not contain expected std::vector<uint8_t>";

  std::vector<uint8_t> expected{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};

  ASSERT_EQ(actual, expected);
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexOdd) {
  EXPECT_EC(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexInvalid) {
  EXPECT_EC(unhex("keks"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given 0x-prefixed and bare hex strings
 * @when unhex them as prefixed
 * @then only the prefixed one is accepted
 */
TEST(Common, Hexutil_UnhexWith0x) {
  EXPECT_OUTCOME_TRUE(bytes, unhexWith0x("0xdead"));
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0xde, 0xad}));
  EXPECT_EC(unhexWith0x("dead"), UnhexError::MISSING_0X_PREFIX);
}

struct UnhexNumber32Test
    : public ::testing::TestWithParam<std::pair<std::string, size_t>> {};

namespace {
  std::pair<std::string, size_t> makePair(std::string s, size_t v) {
    return std::make_pair(std::move(s), v);
  }
}  // namespace

TEST_P(UnhexNumber32Test, Unhex32Success) {
  auto &&[hex, val] = GetParam();
  EXPECT_OUTCOME_TRUE(decimal, unhexNumber<uint32_t>(hex));
  EXPECT_EQ(decimal, val);
}

INSTANTIATE_TEST_SUITE_P(UnhexNumberTestCases,
                         UnhexNumber32Test,
                         ::testing::Values(makePair("0x64", 100),
                                           makePair("0x1", 1),
                                           makePair("0x0", 0),
                                           makePair("0x0000012c", 300),
                                           makePair("0xbc614e", 12345678)));

TEST(UnhexNumberTest, Overflow) {
  std::string encoded = "0x01FF";
  EXPECT_EC(unhexNumber<uint8_t>(encoded), UnhexError::VALUE_OUT_OF_RANGE);
}

TEST(UnhexNumberTest, WrongFormat) {
  std::string encoded = "64";
  EXPECT_EC(unhexNumber<uint8_t>(encoded), UnhexError::MISSING_0X_PREFIX);
}

/**
 * @given signed and unsigned integer types
 * @when unhexNumber is named with them
 * @then only unsigned types are accepted
 */
template <typename T>
concept UnhexableNumber = requires(std::string_view value) {
  unhexNumber<T>(value);
};

TEST(UnhexNumberTest, UnsignedOnly) {
  static_assert(UnhexableNumber<uint8_t>);
  static_assert(UnhexableNumber<uint64_t>);
  static_assert(not UnhexableNumber<int32_t>);
  static_assert(not UnhexableNumber<int64_t>);
}
