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


#include "kairos/type/TimestampConversion.h"

#include <date/date.h>
#include <fmt/format.h>

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/DigitScanner.h"

namespace kairos::util {

namespace {

constexpr int32_t kLeapDays[] =
    {0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
constexpr int32_t kNormalDays[] =
    {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

// Integer parts above this are outside any supported range in either unit,
// and small enough that seconds * kMicrosPerSec cannot overflow later.
constexpr uint64_t kMaxTimestampMagnitude{1'000'000'000'000'000'000ULL};

} // namespace

bool isLeapYear(int32_t year) {
  return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

bool isValidDate(int32_t year, int32_t month, int32_t day) {
  if (month < 1 || month > 12) {
    return false;
  }
  if (year < kMinYear || year > kMaxYear) {
    return false;
  }
  if (day < 1) {
    return false;
  }
  return isLeapYear(year) ? day <= kLeapDays[month] : day <= kNormalDays[month];
}

int32_t getMaxDayOfMonth(int32_t year, int32_t month) {
  KAIROS_DCHECK(month >= 1 && month <= 12, "Invalid month {}", month);
  return isLeapYear(year) ? kLeapDays[month] : kNormalDays[month];
}

int64_t daysSinceEpochFromDate(int32_t year, int32_t month, int32_t day) {
  const auto ymd = ::date::year{year} /
      ::date::month{static_cast<unsigned>(month)} /
      ::date::day{static_cast<unsigned>(day)};
  return ::date::sys_days{ymd}.time_since_epoch().count();
}

CivilDate civilFromDaysSinceEpoch(int64_t daysSinceEpoch) {
  const ::date::year_month_day ymd{::date::sys_days{
      ::date::days{static_cast<int32_t>(daysSinceEpoch)}}};
  return {
      static_cast<int32_t>(ymd.year()),
      static_cast<int32_t>(static_cast<unsigned>(ymd.month())),
      static_cast<int32_t>(static_cast<unsigned>(ymd.day()))};
}

int64_t floorDays(int64_t seconds, int64_t& secondsInDay) {
  int64_t days = seconds / kSecsPerDay;
  secondsInDay = seconds % kSecsPerDay;
  if (secondsInDay < 0) {
    secondsInDay += kSecsPerDay;
    days--;
  }
  return days;
}

int64_t fromTime(int32_t hour, int32_t minute, int32_t second) {
  int64_t result;
  result = hour; // hours
  result = result * kMinsPerHour + minute; // hours -> minutes
  result = result * kSecsPerMinute + second; // minutes -> seconds
  return result;
}

void appendFractionalSeconds(uint32_t microsecond, std::string& out) {
  if (microsecond == 0) {
    return;
  }
  auto digits = fmt::format("{:06}", microsecond);
  digits.erase(digits.find_last_not_of('0') + 1);
  out.push_back('.');
  out.append(digits);
}

bool isNumericTimestamp(std::string_view input, bool allowFraction) {
  const char* buf = input.data();
  const size_t len = input.size();
  size_t pos = 0;
  if (pos < len && buf[pos] == '-') {
    pos++;
  }
  const auto integerDigits = countDigits(buf, len, pos);
  if (integerDigits == 0) {
    return false;
  }
  pos += integerDigits;
  if (pos == len) {
    return true;
  }
  if (!allowFraction || buf[pos] != '.') {
    return false;
  }
  pos++;
  const auto fractionDigits = countDigits(buf, len, pos);
  return fractionDigits > 0 && pos + fractionDigits == len;
}

bool isMillisecondsTimestamp(uint64_t magnitude, TimestampUnit unit) {
  switch (unit) {
    case TimestampUnit::kSecond:
      return false;
    case TimestampUnit::kMillisecond:
      return true;
    case TimestampUnit::kInfer:
      return magnitude > static_cast<uint64_t>(kMillisecondsWatershed);
  }
  KAIROS_UNREACHABLE();
}

ParseResult<EpochTime> parseNumericTimestamp(
    std::string_view input,
    TimestampUnit unit,
    MicrosecondsPrecisionOverflowBehavior overflowBehavior) {
  const char* buf = input.data();
  const size_t len = input.size();
  size_t pos = 0;

  const bool negative = pos < len && buf[pos] == '-';
  if (negative) {
    pos++;
  }
  if (pos >= len || !characterIsDigit(buf[pos])) {
    return parseError(ParseErrorKind::kInvalidTimestamp, pos);
  }

  uint64_t magnitude = 0;
  bool saturated = false;
  for (; pos < len && characterIsDigit(buf[pos]); pos++) {
    if (magnitude > kMaxTimestampMagnitude / 10) {
      saturated = true;
      continue;
    }
    magnitude = magnitude * 10 + (buf[pos] - '0');
  }
  if (saturated || magnitude > kMaxTimestampMagnitude) {
    return parseError(
        negative ? ParseErrorKind::kDateTooSmall
                 : ParseErrorKind::kDateTooLarge);
  }

  const bool milliseconds = isMillisecondsTimestamp(magnitude, unit);
  uint32_t fraction = 0;
  if (pos < len) {
    if (buf[pos] != '.') {
      return parseError(ParseErrorKind::kInvalidTimestamp, pos);
    }
    pos++;
    auto scanned = milliseconds
        ? scanFraction(
              buf,
              len,
              pos,
              3,
              overflowBehavior,
              ParseErrorKind::kMillisecondFractionTooLong)
        : scanFraction(buf, len, pos, 6, overflowBehavior);
    if (scanned.hasError()) {
      return folly::makeUnexpected(scanned.error());
    }
    fraction = scanned.value();
    if (pos < len) {
      return parseError(ParseErrorKind::kInvalidTimestamp, pos);
    }
  }

  int64_t seconds;
  int64_t micros;
  if (milliseconds) {
    seconds = static_cast<int64_t>(magnitude / kMsecsPerSec);
    micros = static_cast<int64_t>(magnitude % kMsecsPerSec) * kMicrosPerMsec +
        fraction;
  } else {
    seconds = static_cast<int64_t>(magnitude);
    micros = fraction;
  }
  if (negative) {
    seconds = -seconds;
    if (micros > 0) {
      seconds -= 1;
      micros = kMicrosPerSec - micros;
    }
  }
  return EpochTime{seconds, static_cast<uint32_t>(micros)};
}

EpochTime toEpochTime(int64_t timestamp, TimestampUnit unit) {
  const uint64_t magnitude = timestamp < 0
      ? static_cast<uint64_t>(-(timestamp + 1)) + 1
      : static_cast<uint64_t>(timestamp);
  if (!isMillisecondsTimestamp(magnitude, unit)) {
    return {timestamp, 0};
  }
  int64_t seconds = timestamp / kMsecsPerSec;
  int64_t millis = timestamp % kMsecsPerSec;
  if (millis < 0) {
    millis += kMsecsPerSec;
    seconds -= 1;
  }
  return {seconds, static_cast<uint32_t>(millis * kMicrosPerMsec)};
}

ParseResult<EpochTime> toLocalEpochTime(EpochTime time, int32_t offset) {
  if (time.seconds < kMinTimestampSeconds - kSecsPerDay) {
    return parseError(ParseErrorKind::kDateTooSmall);
  }
  if (time.seconds > kMaxTimestampSeconds + kSecsPerDay) {
    return parseError(ParseErrorKind::kDateTooLarge);
  }
  const int64_t local = time.seconds + offset;
  if (local < kMinTimestampSeconds) {
    return parseError(ParseErrorKind::kDateTooSmall);
  }
  if (local > kMaxTimestampSeconds) {
    return parseError(ParseErrorKind::kDateTooLarge);
  }
  return EpochTime{local, time.microsecond};
}

} // namespace kairos::util
