/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
/* --------------------------------------------------------------------------
 * Copyright (c) 2025 ByteDance Ltd. and/or its affiliates.
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file has been modified by ByteDance Ltd. and/or its affiliates on
 * 2025-11-11.
 *
 * Original file was released under the Apache License 2.0,
 * with the full license text available at:
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * This modified file is released under the same license.
 * --------------------------------------------------------------------------
 */


#include <gtest/gtest.h>

#include "kairos/type/DigitScanner.h"

namespace kairos::util {
namespace {

TEST(DigitScannerTest, scanDigits) {
  const std::string_view input = "12345";
  size_t pos = 0;
  auto value = scanDigits(input.data(), input.size(), pos, 2, 4);
  ASSERT_TRUE(value.hasValue());
  EXPECT_EQ(1234, value.value());
  EXPECT_EQ(4, pos);

  value = scanDigits(input.data(), input.size(), pos, 1, 4);
  ASSERT_TRUE(value.hasValue());
  EXPECT_EQ(5, value.value());
  EXPECT_EQ(5, pos);
}

TEST(DigitScannerTest, scanDigitsFailureLeavesPosition) {
  std::string_view input = "1a";
  size_t pos = 0;
  auto value = scanDigits(input.data(), input.size(), pos, 2, 2);
  ASSERT_TRUE(value.hasError());
  EXPECT_EQ(ParseError(ParseErrorKind::kInvalidCharacter, 1), value.error());
  EXPECT_EQ(0, pos);

  input = "1";
  value = scanFixedDigits(input.data(), input.size(), pos, 2);
  ASSERT_TRUE(value.hasError());
  EXPECT_EQ(ParseError(ParseErrorKind::kTooShort, 1), value.error());
  EXPECT_EQ(0, pos);
}

TEST(DigitScannerTest, scanSeparator) {
  const std::string_view input = "-x";
  size_t pos = 0;
  EXPECT_TRUE(scanSeparator(input.data(), input.size(), pos, '-').hasValue());
  EXPECT_EQ(1, pos);

  auto result = scanSeparator(input.data(), input.size(), pos, '-');
  ASSERT_TRUE(result.hasError());
  EXPECT_EQ(ParseError(ParseErrorKind::kInvalidCharacter, 1), result.error());

  pos = 2;
  result = scanSeparator(input.data(), input.size(), pos, '-');
  ASSERT_TRUE(result.hasError());
  EXPECT_EQ(ParseError(ParseErrorKind::kTooShort, 2), result.error());
}

TEST(DigitScannerTest, scanFraction) {
  auto scan = [](std::string_view input,
                 MicrosecondsPrecisionOverflowBehavior behavior,
                 size_t& pos) {
    return scanFraction(input.data(), input.size(), pos, 6, behavior);
  };
  const auto kTruncate = MicrosecondsPrecisionOverflowBehavior::kTruncate;
  const auto kError = MicrosecondsPrecisionOverflowBehavior::kError;

  size_t pos = 0;
  auto value = scan("5", kError, pos);
  ASSERT_TRUE(value.hasValue());
  EXPECT_EQ(500'000, value.value());
  EXPECT_EQ(1, pos);

  pos = 0;
  value = scan("000001Z", kError, pos);
  ASSERT_TRUE(value.hasValue());
  EXPECT_EQ(1, value.value());
  EXPECT_EQ(6, pos);

  pos = 0;
  value = scan("1234567", kTruncate, pos);
  ASSERT_TRUE(value.hasValue());
  EXPECT_EQ(123'456, value.value());
  EXPECT_EQ(7, pos);

  pos = 0;
  value = scan("1234567", kError, pos);
  ASSERT_TRUE(value.hasError());
  EXPECT_EQ(
      ParseError(ParseErrorKind::kSecondFractionTooLong, 6), value.error());
  EXPECT_EQ(0, pos);

  value = scan("Z", kError, pos);
  ASSERT_TRUE(value.hasError());
  EXPECT_EQ(
      ParseError(ParseErrorKind::kSecondFractionMissing, 0), value.error());
}

TEST(DigitScannerTest, scanFractionMilliseconds) {
  const std::string_view input = "1234";
  size_t pos = 0;
  auto value = scanFraction(
      input.data(),
      input.size(),
      pos,
      3,
      MicrosecondsPrecisionOverflowBehavior::kError,
      ParseErrorKind::kMillisecondFractionTooLong);
  ASSERT_TRUE(value.hasError());
  EXPECT_EQ(
      ParseError(ParseErrorKind::kMillisecondFractionTooLong, 3),
      value.error());
}

TEST(DigitScannerTest, scanUnicodeMinus) {
  std::string_view input = "\xE2\x88\x92"
                           "05";
  size_t pos = 0;
  EXPECT_TRUE(scanUnicodeMinus(input.data(), input.size(), pos));
  EXPECT_EQ(3, pos);

  input = "\xE2\x88";
  pos = 0;
  EXPECT_FALSE(scanUnicodeMinus(input.data(), input.size(), pos));
  EXPECT_EQ(0, pos);

  input = "-05";
  EXPECT_FALSE(scanUnicodeMinus(input.data(), input.size(), pos));
}

TEST(DigitScannerTest, countDigits) {
  const std::string_view input = "2022-01";
  EXPECT_EQ(4, countDigits(input.data(), input.size(), 0));
  EXPECT_EQ(0, countDigits(input.data(), input.size(), 4));
  EXPECT_EQ(2, countDigits(input.data(), input.size(), 5));
  EXPECT_EQ(0, countDigits(input.data(), input.size(), 7));
  EXPECT_TRUE(isDecimalMark('.'));
  EXPECT_TRUE(isDecimalMark(','));
  EXPECT_FALSE(isDecimalMark(':'));
}

} // namespace
} // namespace kairos::util
