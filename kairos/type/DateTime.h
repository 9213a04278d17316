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


#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <folly/dynamic.h>

#include "kairos/type/Date.h"
#include "kairos/type/ParseConfig.h"
#include "kairos/type/ParseError.h"
#include "kairos/type/Time.h"

namespace kairos {

/// A Date and a Time. The offset of the time applies to the whole value.
class DateTime {
 public:
  DateTime() = default;

  DateTime(Date date, Time time) : date_(date), time_(time) {}

  /// Parses YYYY-MM-DD followed by one of 'T', 't', ' ' or '_' and a time
  /// accepted by Time::parse(). An input that is entirely a decimal number,
  /// optionally negative and with a fraction, is read as a unix timestamp
  /// (see DateTimeConfig).
  static ParseResult<DateTime> parse(
      std::string_view input,
      const DateTimeConfig& config = DateTimeConfig());

  /// Creates a date-time from a unix timestamp in seconds or milliseconds
  /// (per `config.timestampUnit()`) plus `microsecond`. The result is in UTC
  /// unless `config.unixTimestampOffset()` is set, in which case the wall
  /// clock is shifted to that offset. Fails with kDateTooSmall or
  /// kDateTooLarge outside 1600-01-01 to 9999-12-31.
  static ParseResult<DateTime> fromTimestamp(
      int64_t timestamp,
      uint32_t microsecond = 0,
      const DateTimeConfig& config = DateTimeConfig());

  /// Returns the current time at `tzOffset` seconds east of UTC.
  static ParseResult<DateTime> now(int32_t tzOffset = 0);

  /// Creates a date-time from the output of serialize(). Throws
  /// KairosUserError on invalid fields.
  static DateTime create(const folly::dynamic& obj);

  const Date& date() const {
    return date_;
  }

  const Time& time() const {
    return time_;
  }

  /// Seconds since the unix epoch of the wall clock, ignoring the offset.
  int64_t timestamp() const;

  /// Seconds since the unix epoch in UTC. Equal to timestamp() for a naive
  /// date-time.
  int64_t timestampTz() const;

  /// Returns a copy labelled with `tzOffset`, keeping the wall clock.
  ParseResult<DateTime> withTimezoneOffset(
      std::optional<int32_t> tzOffset) const;

  /// Returns the same instant with the wall clock at `tzOffset`. Fails with
  /// kTzRequired if this date-time is naive.
  ParseResult<DateTime> inTimezone(int32_t tzOffset) const;

  /// Canonical form: Date::toString(), 'T', Time::toString().
  std::string toString() const;

  folly::dynamic serialize() const;

  bool operator==(const DateTime& other) const {
    return date_ == other.date_ && time_ == other.time_;
  }

  bool operator!=(const DateTime& other) const {
    return !(*this == other);
  }

  // Compared as instants when both sides carry an offset, otherwise by wall
  // clock.
  bool operator<(const DateTime& other) const {
    return compare(other) < 0;
  }

  bool operator<=(const DateTime& other) const {
    return compare(other) <= 0;
  }

  bool operator>(const DateTime& other) const {
    return compare(other) > 0;
  }

  bool operator>=(const DateTime& other) const {
    return compare(other) >= 0;
  }

 private:
  int32_t compare(const DateTime& other) const;

  Date date_;
  Time time_;
};

std::ostream& operator<<(std::ostream& os, const DateTime& dateTime);

} // namespace kairos

template <>
struct fmt::formatter<kairos::DateTime> : formatter<std::string> {
  auto format(const kairos::DateTime& dateTime, format_context& ctx) const {
    return formatter<std::string>::format(dateTime.toString(), ctx);
  }
};
