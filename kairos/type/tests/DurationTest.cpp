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
#include <limits>
#include <sstream>
#include <unordered_set>

#include "kairos/common/base/tests/GTestUtils.h"
#include "kairos/type/Duration.h"

namespace kairos {
namespace {

Duration parseDuration(
    std::string_view input,
    const TimeConfig& config = TimeConfig()) {
  auto result = Duration::parse(input, config);
  KAIROS_CHECK(
      result.hasValue(),
      "Failed to parse '{}': {}",
      input,
      result.error().message());
  return result.value();
}

ParseError parseDurationError(std::string_view input) {
  auto result = Duration::parse(input);
  KAIROS_CHECK(result.hasError(), "Expected '{}' to fail", input);
  return result.error();
}

TEST(DurationTest, equivalentForms) {
  const Duration expected(true, 1, 7200, 0);
  EXPECT_EQ(expected, parseDuration("P1DT2H"));
  EXPECT_EQ(expected, parseDuration("PT26H"));
  EXPECT_EQ(expected, parseDuration("1 day, 02:00:00"));
  EXPECT_EQ(expected, parseDuration("26:00:00"));
  EXPECT_EQ(expected, parseDuration("+26:00"));

  EXPECT_EQ(-expected, parseDuration("-P1DT2H"));
  EXPECT_EQ(-expected, parseDuration("-1 day, 02:00:00"));
  EXPECT_EQ(-expected, parseDuration("-26:00:00"));
}

TEST(DurationTest, iso) {
  auto duration = parseDuration("P1Y2M3DT4H5M6.7S");
  EXPECT_TRUE(duration.positive());
  EXPECT_EQ(428, duration.day());
  EXPECT_EQ(14'706, duration.second());
  EXPECT_EQ(700'000, duration.microsecond());
  EXPECT_EQ("P428DT4H5M6.7S", duration.toString());

  EXPECT_EQ(Duration(true, 14, 0, 0), parseDuration("P2W"));
  EXPECT_EQ(Duration(true, 0, 90, 0), parseDuration("PT1M30S"));
  EXPECT_EQ(Duration(true, 0, 1, 500'000), parseDuration("PT1,5S"));
  EXPECT_EQ(Duration(true, 0, 5400, 0), parseDuration("PT90M"));

  auto truncate = TimeConfig::builder()
                      .microsecondsPrecisionOverflowBehavior(
                          MicrosecondsPrecisionOverflowBehavior::kTruncate)
                      .build();
  EXPECT_EQ(
      Duration(true, 0, 1, 123'456),
      parseDuration("PT1.1234567S", truncate));
}

TEST(DurationTest, zero) {
  for (const auto* input : {"PT0S", "-PT0S", "P0D", "00:00", "-0 days"}) {
    auto duration = parseDuration(input);
    EXPECT_TRUE(duration.isZero()) << input;
    EXPECT_TRUE(duration.positive()) << input;
    EXPECT_EQ("PT0S", duration.toString()) << input;
  }
  EXPECT_EQ(Duration(), -Duration());
  EXPECT_TRUE(Duration(false, 0, 0, 0).positive());
}

TEST(DurationTest, clock) {
  EXPECT_EQ(Duration(true, 0, 3723, 0), parseDuration("1:02:03"));
  EXPECT_EQ(Duration(true, 0, 3723, 450'000), parseDuration("01:02:03.45"));
  EXPECT_EQ(Duration(true, 4, 0, 0), parseDuration("96:00"));
  EXPECT_EQ(
      Duration(true, 100'000'000, 0, 0), parseDuration("2400000000:00:00"));
}

TEST(DurationTest, days) {
  EXPECT_EQ(Duration(true, 3, 0, 0), parseDuration("3d"));
  EXPECT_EQ(Duration(true, 3, 0, 0), parseDuration("3 DAYS"));
  EXPECT_EQ(Duration(true, 3, 0, 0), parseDuration("3 Day"));
  EXPECT_EQ(Duration(true, 3, 14'700, 0), parseDuration("3 days 04:05"));
  EXPECT_EQ(Duration(true, 3, 14'700, 0), parseDuration("3d,04:05"));
  EXPECT_EQ(
      Duration(true, 2, 86'399, 500'000), parseDuration("2 day, 23:59:59.5"));
}

TEST(DurationTest, unicodeMinus) {
  EXPECT_EQ(Duration(false, 1, 0, 0), parseDuration("−P1D"));
  EXPECT_EQ(Duration(false, 0, 3600, 0), parseDuration("−01:00"));
}

TEST(DurationTest, structuralErrors) {
  EXPECT_EQ(ParseError(ParseErrorKind::kTooShort, 1), parseDurationError("P"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kTooShort, 2), parseDurationError("PT"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kTooShort, 2), parseDurationError("P1"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidCharacter, 2),
      parseDurationError("P1X"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidCharacter, 4),
      parseDurationError("P1D2Y"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidCharacter, 4),
      parseDurationError("P1W2D"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidCharacter, 5),
      parseDurationError("PT1.5H"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kSecondFractionTooLong, 10),
      parseDurationError("PT1.1234567S"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kTrailingCharacters, 8),
      parseDurationError("10:00:00x"));
}

TEST(DurationTest, unrecognizedInput) {
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidDurationFormat, 0),
      parseDurationError("abc"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidDurationFormat, 0),
      parseDurationError(""));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidDurationFormat, 1),
      parseDurationError("-"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kInvalidDurationFormat, 1),
      parseDurationError("+x"));
}

TEST(DurationTest, rangeErrors) {
  EXPECT_EQ(
      ParseError(ParseErrorKind::kOutOfRangeHour, 7),
      parseDurationError("1 day, 25:00:00"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kOutOfRangeMinute, 3),
      parseDurationError("10:60:00"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kDurationDaysTooLarge),
      parseDurationError("1000000000 days"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kDurationDaysTooLarge),
      parseDurationError("P1000000000D"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kDurationValueTooLarge),
      parseDurationError("2400000001:00:00"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kDurationValueTooLarge),
      parseDurationError("24000000000:00:00"));
  EXPECT_EQ(
      ParseError(ParseErrorKind::kDurationValueTooLarge, 1),
      parseDurationError("P1234567890123D"));
}

TEST(DurationTest, normalization) {
  Duration duration(true, 0, 90'061, 1'500'000);
  EXPECT_EQ(1, duration.day());
  EXPECT_EQ(3662, duration.second());
  EXPECT_EQ(500'000, duration.microsecond());

  auto parts = Duration::fromParts(false, Duration::kMaxDays, 86'400, 0);
  ASSERT_TRUE(parts.hasError());
  EXPECT_EQ(ParseError(ParseErrorKind::kDurationDaysTooLarge), parts.error());

  parts = Duration::fromParts(
      true, 0, std::numeric_limits<uint64_t>::max(), 1'000'000);
  ASSERT_TRUE(parts.hasError());
  EXPECT_EQ(ParseError(ParseErrorKind::kDurationValueTooLarge), parts.error());

  KAIROS_ASSERT_USER_THROW(
      Duration(true, -1, 0, 0), "Duration fields must not be negative");
  KAIROS_ASSERT_USER_THROW(
      Duration(true, Duration::kMaxDays + 1, 0, 0), "Invalid duration");
}

TEST(DurationTest, signedTotals) {
  Duration duration(false, 1, 1, 250'000);
  EXPECT_EQ(-86'401, duration.signedTotalSeconds());
  EXPECT_EQ(-250'000, duration.signedMicroseconds());
  EXPECT_EQ(86'401, (-duration).signedTotalSeconds());
  EXPECT_EQ(250'000, (-duration).signedMicroseconds());
}

TEST(DurationTest, micros) {
  EXPECT_EQ(-86'401'000'001, Duration(false, 1, 1, 1).toMicros());
  EXPECT_EQ(Duration(false, 1, 1, 1), Duration::fromMicros(-86'401'000'001));
  EXPECT_EQ(Duration(), Duration::fromMicros(0));

  const auto min = std::numeric_limits<int64_t>::min();
  EXPECT_EQ(min, Duration::fromMicros(min).toMicros());
  const auto max = std::numeric_limits<int64_t>::max();
  EXPECT_EQ(max, Duration::fromMicros(max).toMicros());

  KAIROS_ASSERT_USER_THROW(
      Duration(true, Duration::kMaxDays, 0, 0).toMicros(),
      "Could not convert Duration");
}

TEST(DurationTest, compare) {
  EXPECT_LT(parseDuration("-P2D"), parseDuration("-P1D"));
  EXPECT_LT(parseDuration("-PT1S"), parseDuration("PT0S"));
  EXPECT_LT(parseDuration("PT59S"), parseDuration("PT1M"));
  EXPECT_LT(parseDuration("PT1S"), parseDuration("PT1.000001S"));
  EXPECT_GE(parseDuration("P1D"), parseDuration("23:59:59.999999"));
  EXPECT_EQ(parseDuration("P7D"), parseDuration("P1W"));

  std::unordered_set<Duration> set{
      parseDuration("P1D"), parseDuration("24:00"), parseDuration("-P1D")};
  EXPECT_EQ(2, set.size());
}

TEST(DurationTest, serialize) {
  for (const auto* input : {"P1DT2H3M4.5S", "-PT0.000001S", "PT0S"}) {
    auto duration = parseDuration(input);
    EXPECT_EQ(duration, Duration::create(duration.serialize()));
  }

  auto obj = Duration(false, 3, 4, 5).serialize();
  EXPECT_FALSE(obj["positive"].asBool());
  EXPECT_EQ(3, obj["day"].asInt());

  obj["second"] = -1;
  KAIROS_ASSERT_USER_THROW(
      Duration::create(obj), "Duration fields must not be negative");
}

TEST(DurationTest, format) {
  EXPECT_EQ("P1D", Duration(true, 1, 0, 0).toString());
  EXPECT_EQ("-PT1H1S", Duration(false, 0, 3601, 0).toString());
  EXPECT_EQ("PT0.25S", Duration(true, 0, 0, 250'000).toString());
  EXPECT_EQ("P2DT3M", Duration(true, 2, 180, 0).toString());
  EXPECT_EQ("-P1DT2H", fmt::format("{}", parseDuration("-26:00")));

  std::ostringstream out;
  out << Duration(true, 0, 61, 0);
  EXPECT_EQ("PT1M1S", out.str());

  for (const auto& value :
       {Duration(true, 428, 14'706, 700'000),
        Duration(false, Duration::kMaxDays, 86'399, 999'999),
        Duration(false, 0, 0, 1)}) {
    EXPECT_EQ(value, parseDuration(value.toString()));
  }
}

} // namespace
} // namespace kairos
