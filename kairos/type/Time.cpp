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


#include "kairos/type/Time.h"

#include <cstdlib>
#include <iterator>

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/DigitScanner.h"
#include "kairos/type/TimestampConversion.h"

namespace kairos {

namespace detail {

ParseResult<ClockFields> parseClockFields(
    const char* buf,
    size_t len,
    size_t& pos,
    int32_t minHourDigits,
    int32_t maxHourDigits,
    MicrosecondsPrecisionOverflowBehavior overflowBehavior) {
  size_t cursor = pos;
  auto hour = util::scanDigits(buf, len, cursor, minHourDigits, maxHourDigits);
  if (hour.hasError()) {
    return folly::makeUnexpected(hour.error());
  }
  auto separator = util::scanSeparator(buf, len, cursor, ':');
  if (separator.hasError()) {
    return folly::makeUnexpected(separator.error());
  }

  const size_t minuteOffset = cursor;
  auto minute = util::scanFixedDigits(buf, len, cursor, 2);
  if (minute.hasError()) {
    return folly::makeUnexpected(minute.error());
  }
  if (minute.value() >= util::kMinsPerHour) {
    return parseError(ParseErrorKind::kOutOfRangeMinute, minuteOffset);
  }

  ClockFields fields{
      static_cast<int64_t>(hour.value()),
      static_cast<int32_t>(minute.value()),
      0,
      0};
  if (cursor < len && buf[cursor] == ':') {
    ++cursor;
    const size_t secondOffset = cursor;
    auto second = util::scanFixedDigits(buf, len, cursor, 2);
    if (second.hasError()) {
      return folly::makeUnexpected(second.error());
    }
    if (second.value() >= util::kSecsPerMinute) {
      return parseError(ParseErrorKind::kOutOfRangeSecond, secondOffset);
    }
    fields.second = static_cast<int32_t>(second.value());

    if (cursor < len && util::isDecimalMark(buf[cursor])) {
      ++cursor;
      auto fraction = util::scanFraction(buf, len, cursor, 6, overflowBehavior);
      if (fraction.hasError()) {
        return folly::makeUnexpected(fraction.error());
      }
      fields.microsecond = fraction.value();
    }
  }
  pos = cursor;
  return fields;
}

ParseResult<int32_t>
parseTimezoneOffset(const char* buf, size_t len, size_t& pos) {
  size_t cursor = pos;
  if (cursor >= len) {
    return parseError(ParseErrorKind::kTooShort, cursor);
  }
  if (buf[cursor] == 'Z' || buf[cursor] == 'z') {
    pos = cursor + 1;
    return 0;
  }

  int32_t sign;
  if (buf[cursor] == '+') {
    sign = 1;
    ++cursor;
  } else if (buf[cursor] == '-') {
    sign = -1;
    ++cursor;
  } else if (util::scanUnicodeMinus(buf, len, cursor)) {
    sign = -1;
  } else {
    return parseError(ParseErrorKind::kInvalidCharacter, cursor);
  }

  auto hours = util::scanFixedDigits(buf, len, cursor, 2);
  if (hours.hasError()) {
    return folly::makeUnexpected(hours.error());
  }
  int32_t magnitude = static_cast<int32_t>(hours.value()) * util::kSecsPerHour;

  // Minutes, then seconds. Each is optional and may be preceded by ':'.
  for (int32_t unit : {util::kSecsPerMinute, 1}) {
    if (cursor < len && buf[cursor] == ':') {
      ++cursor;
    } else if (cursor >= len || !util::characterIsDigit(buf[cursor])) {
      break;
    }
    const size_t fieldOffset = cursor;
    auto value = util::scanFixedDigits(buf, len, cursor, 2);
    if (value.hasError()) {
      return folly::makeUnexpected(value.error());
    }
    if (value.value() >= 60) {
      return parseError(ParseErrorKind::kOutOfRangeTz, fieldOffset);
    }
    magnitude += static_cast<int32_t>(value.value()) * unit;
  }

  if (magnitude > Time::kMaxTzOffset) {
    return parseError(ParseErrorKind::kOutOfRangeTz, pos);
  }
  pos = cursor;
  return sign * magnitude;
}

} // namespace detail

namespace {

bool isTimezoneStart(char c) {
  return c == 'Z' || c == 'z' || c == '+' || c == '-' ||
      static_cast<unsigned char>(c) == 0xE2;
}

bool isValidTzOffset(int32_t tzOffset) {
  return std::abs(tzOffset) <= Time::kMaxTzOffset;
}

} // namespace

Time::Time(
    int32_t hour,
    int32_t minute,
    int32_t second,
    int32_t microsecond,
    std::optional<int32_t> tzOffset) {
  KAIROS_USER_CHECK(hour >= 0 && hour < 24, "Invalid hour: {}", hour);
  KAIROS_USER_CHECK(minute >= 0 && minute < 60, "Invalid minute: {}", minute);
  KAIROS_USER_CHECK(second >= 0 && second < 60, "Invalid second: {}", second);
  KAIROS_USER_CHECK(
      microsecond >= 0 && microsecond < util::kMicrosPerSec,
      "Invalid microsecond: {}",
      microsecond);
  KAIROS_USER_CHECK(
      !tzOffset.has_value() || isValidTzOffset(*tzOffset),
      "Timezone offset must be within (-86400, 86400) seconds, got {}",
      tzOffset.value_or(0));
  hour_ = hour;
  minute_ = minute;
  second_ = second;
  microsecond_ = microsecond;
  tzOffset_ = tzOffset;
}

// static
ParseResult<Time> Time::parse(
    std::string_view input,
    const TimeConfig& config) {
  return parseAt(input, 0, config);
}

// static
ParseResult<Time>
Time::parseAt(std::string_view input, size_t pos, const TimeConfig& config) {
  const char* buf = input.data();
  const size_t len = input.size();
  size_t cursor = pos;

  auto clock = detail::parseClockFields(
      buf, len, cursor, 2, 2, config.microsecondsPrecisionOverflowBehavior());
  if (clock.hasError()) {
    return folly::makeUnexpected(clock.error());
  }
  if (clock->hour >= util::kHoursPerDay) {
    return parseError(ParseErrorKind::kOutOfRangeHour, pos);
  }

  std::optional<int32_t> tzOffset;
  if (cursor < len && isTimezoneStart(buf[cursor])) {
    auto offset = detail::parseTimezoneOffset(buf, len, cursor);
    if (offset.hasError()) {
      return folly::makeUnexpected(offset.error());
    }
    tzOffset = offset.value();
  }
  if (cursor < len) {
    return parseError(ParseErrorKind::kTrailingCharacters, cursor);
  }

  return Time(
      static_cast<int32_t>(clock->hour),
      clock->minute,
      clock->second,
      static_cast<int32_t>(clock->microsecond),
      tzOffset);
}

// static
ParseResult<Time> Time::fromSecondsOfDay(
    int64_t seconds,
    int64_t microsecond,
    const TimeConfig& config) {
  KAIROS_USER_CHECK_GE(seconds, 0, "Seconds of day must not be negative");
  KAIROS_USER_CHECK_GE(microsecond, 0, "Microseconds must not be negative");
  seconds += microsecond / util::kMicrosPerSec;
  microsecond %= util::kMicrosPerSec;
  if (seconds >= util::kSecsPerDay) {
    return parseError(ParseErrorKind::kTimeTooLarge);
  }
  return Time(
      static_cast<int32_t>(seconds / util::kSecsPerHour),
      static_cast<int32_t>(seconds % util::kSecsPerHour / util::kSecsPerMinute),
      static_cast<int32_t>(seconds % util::kSecsPerMinute),
      static_cast<int32_t>(microsecond),
      config.unixTimestampOffset());
}

int32_t Time::totalSeconds() const {
  return static_cast<int32_t>(util::fromTime(hour_, minute_, second_));
}

int32_t Time::totalMillis() const {
  return static_cast<int32_t>(
      totalSeconds() * util::kMsecsPerSec +
      microsecond_ / util::kMicrosPerMsec);
}

ParseResult<Time> Time::withTimezoneOffset(
    std::optional<int32_t> tzOffset) const {
  if (tzOffset.has_value() && !isValidTzOffset(*tzOffset)) {
    return parseError(ParseErrorKind::kOutOfRangeTz);
  }
  Time result = *this;
  result.tzOffset_ = tzOffset;
  return result;
}

ParseResult<Time> Time::inTimezone(int32_t tzOffset) const {
  if (!isValidTzOffset(tzOffset)) {
    return parseError(ParseErrorKind::kOutOfRangeTz);
  }
  if (!tzOffset_.has_value()) {
    return parseError(ParseErrorKind::kTzRequired);
  }
  int64_t secondsOfDay;
  util::floorDays(
      static_cast<int64_t>(totalSeconds()) + tzOffset - *tzOffset_,
      secondsOfDay);
  TimeConfig config =
      TimeConfig::builder().unixTimestampOffset(tzOffset).build();
  return fromSecondsOfDay(secondsOfDay, microsecond_, config);
}

std::string Time::toString() const {
  std::string result =
      fmt::format("{:02}:{:02}:{:02}", hour_, minute_, second_);
  util::appendFractionalSeconds(microsecond_, result);
  if (tzOffset_.has_value()) {
    appendTimezoneOffset(*tzOffset_, result);
  }
  return result;
}

int32_t Time::compare(const Time& other) const {
  int64_t lhs = totalSeconds();
  int64_t rhs = other.totalSeconds();
  if (tzOffset_.has_value() && other.tzOffset_.has_value()) {
    lhs -= *tzOffset_;
    rhs -= *other.tzOffset_;
  }
  if (lhs != rhs) {
    return lhs < rhs ? -1 : 1;
  }
  if (microsecond_ != other.microsecond_) {
    return microsecond_ < other.microsecond_ ? -1 : 1;
  }
  return 0;
}

void appendTimezoneOffset(int32_t tzOffset, std::string& out) {
  if (tzOffset == 0) {
    out.push_back('Z');
    return;
  }
  const int32_t magnitude = std::abs(tzOffset);
  fmt::format_to(
      std::back_inserter(out),
      "{}{:02}:{:02}",
      tzOffset < 0 ? '-' : '+',
      magnitude / util::kSecsPerHour,
      magnitude % util::kSecsPerHour / util::kSecsPerMinute);
  if (magnitude % util::kSecsPerMinute != 0) {
    fmt::format_to(
        std::back_inserter(out), ":{:02}", magnitude % util::kSecsPerMinute);
  }
}

std::ostream& operator<<(std::ostream& os, const Time& time) {
  return os << time.toString();
}

} // namespace kairos
