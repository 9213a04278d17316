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
#include <sstream>
#include <unordered_set>

#include "kairos/common/base/tests/GTestUtils.h"
#include "kairos/type/Date.h"

namespace kairos {
namespace {

Date parseDate(
    std::string_view input,
    const DateConfig& config = DateConfig()) {
  auto result = Date::parse(input, config);
  KAIROS_CHECK(
      result.hasValue(),
      "Failed to parse '{}': {}",
      input,
      result.error().message());
  return result.value();
}

ParseError parseDateError(
    std::string_view input,
    const DateConfig& config = DateConfig()) {
  auto result = Date::parse(input, config);
  KAIROS_CHECK(result.hasError(), "Expected '{}' to fail", input);
  return result.error();
}

TEST(DateTest, parse) {
  auto date = parseDate("2022-01-01");
  EXPECT_EQ(2022, date.year());
  EXPECT_EQ(1, date.month());
  EXPECT_EQ(1, date.day());
  EXPECT_EQ("2022-01-01", date.toString());

  EXPECT_EQ(Date(0, 1, 1), parseDate("0000-01-01"));
  EXPECT_EQ(Date(9999, 12, 31), parseDate("9999-12-31"));
  EXPECT_EQ(Date(2023, 4, 30), parseDate("2023-04-30"));
}

TEST(DateTest, leapYears) {
  EXPECT_EQ(Date(2024, 2, 29), parseDate("2024-02-29"));
  EXPECT_EQ(Date(2000, 2, 29), parseDate("2000-02-29"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kOutOfRangeDay, 8),
      parseDateError("2023-02-29"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kOutOfRangeDay, 8),
      parseDateError("1900-02-29"));
}

TEST(DateTest, malformed) {
  EXPECT_EQ(
      ParseError(ParseErrorKind::kOutOfRangeMonth, 5),
      parseDateError("2022-13-01"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kOutOfRangeMonth, 5),
      parseDateError("2022-00-01"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kOutOfRangeDay, 8),
      parseDateError("2022-01-32"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kOutOfRangeDay, 8),
      parseDateError("2022-04-31"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kOutOfRangeDay, 8),
      parseDateError("2022-01-00"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidCharacter, 0),
      parseDateError("not-a-date"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidCharacter, 4),
      parseDateError("2022/01/01"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidCharacter, 9),
      parseDateError("2022-01-0a"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidLength), parseDateError("2022-01-1"));
  EXPECT_EQ(ParseError(ParseErrorKind::kInvalidLength), parseDateError(""));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kTrailingCharacters, 10),
      parseDateError("2022-01-01T"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kTrailingCharacters, 10),
      parseDateError("2022-01-01 12:00"));
}

TEST(DateTest, timestamp) {
  EXPECT_EQ(Date(2022, 6, 8), parseDate("1654646400"));
  EXPECT_EQ(Date(2022, 6, 7), parseDate("1654646399"));
  EXPECT_EQ(Date(2022, 6, 8), parseDate("1654646400000"));
  EXPECT_EQ(Date(1970, 1, 1), parseDate("0"));
  EXPECT_EQ(Date(1969, 12, 31), parseDate("-1"));

  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidTimestamp, 10),
      parseDateError("1654646400.5"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kDateTooLarge),
      parseDateError("99999999999999999999"));
}

TEST(DateTest, timestampConfig) {
  auto millis = DateConfig::builder()
                    .timestampUnit(TimestampUnit::kMillisecond)
                    .build();
  EXPECT_EQ(Date(1970, 1, 20), parseDate("1654646400", millis));

  auto seconds =
      DateConfig::builder().timestampUnit(TimestampUnit::kSecond).build();
  EXPECT_EQ(
      ParseError(ParseErrorKind::kDateTooLarge),
      parseDateError("1654646400000", seconds));

  auto shifted = DateConfig::builder().unixTimestampOffset(3600).build();
  EXPECT_EQ(Date(2022, 6, 8), parseDate("1654646399", shifted));

  auto behind = DateConfig::builder().unixTimestampOffset(-1).build();
  EXPECT_EQ(Date(2022, 6, 7), parseDate("1654646400", behind));
}

TEST(DateTest, fromTimestamp) {
  auto date = Date::fromTimestamp(1654646400);
  ASSERT_TRUE(date.hasValue());
  EXPECT_EQ(Date(2022, 6, 8), date.value());

  date = Date::fromTimestamp(1654646400000);
  ASSERT_TRUE(date.hasValue());
  EXPECT_EQ(Date(2022, 6, 8), date.value());

  date = Date::fromTimestamp(-11'676'096'000);
  ASSERT_TRUE(date.hasValue());
  EXPECT_EQ(Date(1600, 1, 1), date.value());

  date = Date::fromTimestamp(
      -11'676'096'001,
      DateConfig::builder().timestampUnit(TimestampUnit::kSecond).build());
  ASSERT_TRUE(date.hasError());
  EXPECT_EQ(ParseError(ParseErrorKind::kDateTooSmall), date.error());
}

TEST(DateTest, daysSinceEpoch) {
  EXPECT_EQ(0, Date().daysSinceEpoch());
  EXPECT_EQ(19151, Date(2022, 6, 8).daysSinceEpoch());
  EXPECT_EQ(1654646400, Date(2022, 6, 8).timestamp());
  EXPECT_EQ(-86400, Date(1969, 12, 31).timestamp());

  auto date = Date::fromDaysSinceEpoch(19151);
  ASSERT_TRUE(date.hasValue());
  EXPECT_EQ(Date(2022, 6, 8), date.value());

  date = Date::fromDaysSinceEpoch(-719529);
  ASSERT_TRUE(date.hasError());
  EXPECT_EQ(ParseError(ParseErrorKind::kDateTooSmall), date.error());

  date = Date::fromDaysSinceEpoch(2932897);
  ASSERT_TRUE(date.hasError());
  EXPECT_EQ(ParseError(ParseErrorKind::kDateTooLarge), date.error());
}

TEST(DateTest, invalidFields) {
  KAIROS_ASSERT_USER_THROW(Date(2023, 2, 29), "Invalid date: 2023-2-29");
  KAIROS_ASSERT_USER_THROW(Date(2023, 0, 1), "Invalid date: 2023-0-1");
  KAIROS_ASSERT_USER_THROW(Date(10000, 1, 1), "Invalid date: 10000-1-1");
}

TEST(DateTest, compare) {
  EXPECT_LT(Date(2022, 1, 1), Date(2022, 1, 2));
  EXPECT_LT(Date(2022, 1, 31), Date(2022, 2, 1));
  EXPECT_LT(Date(2022, 12, 31), Date(2023, 1, 1));
  EXPECT_GE(Date(2022, 1, 1), Date(2022, 1, 1));
  EXPECT_NE(Date(2022, 1, 1), Date(2022, 1, 2));

  std::unordered_set<Date> dates{Date(2022, 1, 1), Date(2022, 1, 1)};
  EXPECT_EQ(1, dates.size());
}

TEST(DateTest, format) {
  EXPECT_EQ("0001-02-03", Date(1, 2, 3).toString());
  EXPECT_EQ("2022-06-08", fmt::format("{}", Date(2022, 6, 8)));

  std::ostringstream out;
  out << Date(2022, 6, 8);
  EXPECT_EQ("2022-06-08", out.str());

  for (const auto& date :
       {Date(0, 1, 1),
        Date(1600, 2, 29),
        Date(1999, 12, 31),
        Date(9999, 12, 31)}) {
    EXPECT_EQ(date, parseDate(date.toString()));
  }
}

} // namespace
} // namespace kairos
