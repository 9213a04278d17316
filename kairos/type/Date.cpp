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


#include "kairos/type/Date.h"

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/DigitScanner.h"
#include "kairos/type/TimestampConversion.h"

namespace kairos {

namespace {

constexpr size_t kDateLength = 10;

ParseResult<Date> dateFromEpochTime(
    util::EpochTime time,
    std::optional<int32_t> unixTimestampOffset) {
  auto local = util::toLocalEpochTime(time, unixTimestampOffset.value_or(0));
  if (local.hasError()) {
    return folly::makeUnexpected(local.error());
  }
  int64_t secondsOfDay;
  const auto days = util::floorDays(local->seconds, secondsOfDay);
  return Date::fromDaysSinceEpoch(days);
}

} // namespace

Date::Date(int32_t year, int32_t month, int32_t day) {
  KAIROS_USER_CHECK(
      util::isValidDate(year, month, day),
      "Invalid date: {}-{}-{}",
      year,
      month,
      day);
  year_ = year;
  month_ = month;
  day_ = day;
}

// static
ParseResult<Date> Date::parse(
    std::string_view input,
    const DateConfig& config) {
  if (util::isNumericTimestamp(input, /*allowFraction=*/true)) {
    const auto mark = input.find('.');
    if (mark != std::string_view::npos) {
      return parseError(ParseErrorKind::kInvalidTimestamp, mark);
    }
    auto epoch = util::parseNumericTimestamp(
        input,
        config.timestampUnit(),
        MicrosecondsPrecisionOverflowBehavior::kTruncate);
    if (epoch.hasError()) {
      return folly::makeUnexpected(epoch.error());
    }
    return dateFromEpochTime(epoch.value(), config.unixTimestampOffset());
  }

  if (input.size() < kDateLength) {
    return parseError(ParseErrorKind::kInvalidLength);
  }
  size_t pos = 0;
  auto date = parsePrefix(input.data(), input.size(), pos);
  if (date.hasError()) {
    return date;
  }
  if (pos < input.size()) {
    return parseError(ParseErrorKind::kTrailingCharacters, pos);
  }
  return date;
}

// static
ParseResult<Date> Date::parsePrefix(const char* buf, size_t len, size_t& pos) {
  size_t cursor = pos;
  auto year = util::scanFixedDigits(buf, len, cursor, 4);
  if (year.hasError()) {
    return folly::makeUnexpected(year.error());
  }
  auto separator = util::scanSeparator(buf, len, cursor, '-');
  if (separator.hasError()) {
    return folly::makeUnexpected(separator.error());
  }

  const size_t monthOffset = cursor;
  auto month = util::scanFixedDigits(buf, len, cursor, 2);
  if (month.hasError()) {
    return folly::makeUnexpected(month.error());
  }
  if (month.value() < 1 || month.value() > 12) {
    return parseError(ParseErrorKind::kOutOfRangeMonth, monthOffset);
  }
  separator = util::scanSeparator(buf, len, cursor, '-');
  if (separator.hasError()) {
    return folly::makeUnexpected(separator.error());
  }

  const size_t dayOffset = cursor;
  auto day = util::scanFixedDigits(buf, len, cursor, 2);
  if (day.hasError()) {
    return folly::makeUnexpected(day.error());
  }
  const auto y = static_cast<int32_t>(year.value());
  const auto m = static_cast<int32_t>(month.value());
  const auto d = static_cast<int32_t>(day.value());
  if (d < 1 || d > util::getMaxDayOfMonth(y, m)) {
    return parseError(ParseErrorKind::kOutOfRangeDay, dayOffset);
  }

  pos = cursor;
  return Date(y, m, d);
}

// static
ParseResult<Date> Date::fromTimestamp(
    int64_t timestamp,
    const DateConfig& config) {
  return dateFromEpochTime(
      util::toEpochTime(timestamp, config.timestampUnit()),
      config.unixTimestampOffset());
}

// static
ParseResult<Date> Date::fromDaysSinceEpoch(int64_t days) {
  if (days < util::daysSinceEpochFromDate(util::kMinYear, 1, 1)) {
    return parseError(ParseErrorKind::kDateTooSmall);
  }
  if (days > util::daysSinceEpochFromDate(util::kMaxYear, 12, 31)) {
    return parseError(ParseErrorKind::kDateTooLarge);
  }
  const auto civil = util::civilFromDaysSinceEpoch(days);
  return Date(civil.year, civil.month, civil.day);
}

int64_t Date::daysSinceEpoch() const {
  return util::daysSinceEpochFromDate(year_, month_, day_);
}

int64_t Date::timestamp() const {
  return daysSinceEpoch() * util::kSecsPerDay;
}

std::string Date::toString() const {
  return fmt::format("{:04}-{:02}-{:02}", year_, month_, day_);
}

std::ostream& operator<<(std::ostream& os, const Date& date) {
  return os << date.toString();
}

} // namespace kairos
