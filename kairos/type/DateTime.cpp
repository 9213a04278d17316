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


#include "kairos/type/DateTime.h"

#include <chrono>
#include <cstdlib>
#include <limits>

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/TimestampConversion.h"

namespace kairos {

namespace {

bool isDateTimeSeparator(char c) {
  return c == 'T' || c == 't' || c == ' ' || c == '_';
}

/// Builds a date-time from local seconds since the epoch, labelled with
/// `tzOffset`.
ParseResult<DateTime> fromLocalSeconds(
    int64_t seconds,
    uint32_t microsecond,
    std::optional<int32_t> tzOffset) {
  int64_t secondsOfDay;
  const auto days = util::floorDays(seconds, secondsOfDay);
  auto date = Date::fromDaysSinceEpoch(days);
  if (date.hasError()) {
    return folly::makeUnexpected(date.error());
  }
  auto time = Time::fromSecondsOfDay(
      secondsOfDay,
      microsecond,
      TimeConfig::builder().unixTimestampOffset(tzOffset).build());
  if (time.hasError()) {
    return folly::makeUnexpected(time.error());
  }
  return DateTime(*date, *time);
}

/// A numeric timestamp is an instant in UTC, shown at the configured offset.
ParseResult<DateTime> fromEpochTime(
    util::EpochTime epoch,
    std::optional<int32_t> unixTimestampOffset) {
  const int32_t offset = unixTimestampOffset.value_or(0);
  auto local = util::toLocalEpochTime(epoch, offset);
  if (local.hasError()) {
    return folly::makeUnexpected(local.error());
  }
  return fromLocalSeconds(local->seconds, local->microsecond, offset);
}

int32_t intField(const folly::dynamic& obj, const char* key) {
  const auto value = obj[key].asInt();
  KAIROS_USER_CHECK(
      value >= std::numeric_limits<int32_t>::min() &&
          value <= std::numeric_limits<int32_t>::max(),
      "DateTime field '{}' out of range: {}",
      key,
      value);
  return static_cast<int32_t>(value);
}

} // namespace

// static
ParseResult<DateTime> DateTime::parse(
    std::string_view input,
    const DateTimeConfig& config) {
  if (util::isNumericTimestamp(input, /*allowFraction=*/true)) {
    auto epoch = util::parseNumericTimestamp(
        input,
        config.timestampUnit(),
        config.microsecondsPrecisionOverflowBehavior());
    if (epoch.hasError()) {
      return folly::makeUnexpected(epoch.error());
    }
    return fromEpochTime(epoch.value(), config.unixTimestampOffset());
  }

  const char* buf = input.data();
  const size_t len = input.size();
  size_t pos = 0;
  auto date = Date::parsePrefix(buf, len, pos);
  if (date.hasError()) {
    return folly::makeUnexpected(date.error());
  }
  if (pos >= len) {
    return parseError(ParseErrorKind::kTooShort, pos);
  }
  if (!isDateTimeSeparator(buf[pos])) {
    return parseError(ParseErrorKind::kInvalidCharacter, pos);
  }
  auto time = Time::parseAt(input, pos + 1, config.timeConfig());
  if (time.hasError()) {
    return folly::makeUnexpected(time.error());
  }
  return DateTime(*date, *time);
}

// static
ParseResult<DateTime> DateTime::fromTimestamp(
    int64_t timestamp,
    uint32_t microsecond,
    const DateTimeConfig& config) {
  auto epoch = util::toEpochTime(timestamp, config.timestampUnit());
  // Keeps the carry below from overflowing, toLocalEpochTime() rejects
  // anything this large anyway.
  if (epoch.seconds > util::kMaxTimestampSeconds + util::kSecsPerDay) {
    return parseError(ParseErrorKind::kDateTooLarge);
  }
  const uint64_t micros =
      static_cast<uint64_t>(epoch.microsecond) + microsecond;
  epoch.seconds += static_cast<int64_t>(micros / util::kMicrosPerSec);
  epoch.microsecond = static_cast<uint32_t>(micros % util::kMicrosPerSec);
  return fromEpochTime(epoch, config.unixTimestampOffset());
}

// static
ParseResult<DateTime> DateTime::now(int32_t tzOffset) {
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  int64_t seconds = micros / util::kMicrosPerSec;
  int64_t microsecond = micros % util::kMicrosPerSec;
  if (microsecond < 0) {
    microsecond += util::kMicrosPerSec;
    --seconds;
  }
  auto utc =
      fromLocalSeconds(seconds, static_cast<uint32_t>(microsecond), 0);
  if (utc.hasError() || tzOffset == 0) {
    return utc;
  }
  return utc->inTimezone(tzOffset);
}

// static
DateTime DateTime::create(const folly::dynamic& obj) {
  std::optional<int32_t> tzOffset;
  const auto tz = obj.getDefault("tz_offset", nullptr);
  if (!tz.isNull()) {
    tzOffset = intField(obj, "tz_offset");
  }
  return DateTime(
      Date(intField(obj, "year"), intField(obj, "month"), intField(obj, "day")),
      Time(
          intField(obj, "hour"),
          intField(obj, "minute"),
          intField(obj, "second"),
          intField(obj, "microsecond"),
          tzOffset));
}

int64_t DateTime::timestamp() const {
  return date_.timestamp() + time_.totalSeconds();
}

int64_t DateTime::timestampTz() const {
  return timestamp() - time_.tzOffset().value_or(0);
}

ParseResult<DateTime> DateTime::withTimezoneOffset(
    std::optional<int32_t> tzOffset) const {
  auto time = time_.withTimezoneOffset(tzOffset);
  if (time.hasError()) {
    return folly::makeUnexpected(time.error());
  }
  return DateTime(date_, *time);
}

ParseResult<DateTime> DateTime::inTimezone(int32_t tzOffset) const {
  if (std::abs(tzOffset) > Time::kMaxTzOffset) {
    return parseError(ParseErrorKind::kOutOfRangeTz);
  }
  if (!time_.tzOffset().has_value()) {
    return parseError(ParseErrorKind::kTzRequired);
  }
  return fromLocalSeconds(
      timestampTz() + tzOffset, time_.microsecond(), tzOffset);
}

std::string DateTime::toString() const {
  return fmt::format("{}T{}", date_.toString(), time_.toString());
}

folly::dynamic DateTime::serialize() const {
  folly::dynamic obj = folly::dynamic::object;
  obj["year"] = date_.year();
  obj["month"] = date_.month();
  obj["day"] = date_.day();
  obj["hour"] = time_.hour();
  obj["minute"] = time_.minute();
  obj["second"] = time_.second();
  obj["microsecond"] = time_.microsecond();
  if (time_.tzOffset().has_value()) {
    obj["tz_offset"] = *time_.tzOffset();
  } else {
    obj["tz_offset"] = nullptr;
  }
  return obj;
}

int32_t DateTime::compare(const DateTime& other) const {
  const bool instants =
      time_.tzOffset().has_value() && other.time_.tzOffset().has_value();
  const int64_t lhs = instants ? timestampTz() : timestamp();
  const int64_t rhs = instants ? other.timestampTz() : other.timestamp();
  if (lhs != rhs) {
    return lhs < rhs ? -1 : 1;
  }
  if (time_.microsecond() != other.time_.microsecond()) {
    return time_.microsecond() < other.time_.microsecond() ? -1 : 1;
  }
  return 0;
}

std::ostream& operator<<(std::ostream& os, const DateTime& dateTime) {
  return os << dateTime.toString();
}

} // namespace kairos
