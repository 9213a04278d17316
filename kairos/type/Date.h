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
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "kairos/type/ParseConfig.h"
#include "kairos/type/ParseError.h"

namespace kairos {

/// Calendar date in the proleptic Gregorian calendar, year 0000 to 9999.
class Date {
 public:
  /// 1970-01-01.
  Date() = default;

  /// Throws KairosUserError if the fields do not form a valid date.
  Date(int32_t year, int32_t month, int32_t day);

  /// Parses YYYY-MM-DD, or a unix timestamp in seconds or milliseconds when
  /// the whole input is an integer (see DateConfig). The time of day of a
  /// timestamp is discarded.
  static ParseResult<Date> parse(
      std::string_view input,
      const DateConfig& config = DateConfig());

  /// Parses YYYY-MM-DD starting at `pos` and advances `pos` past it. Trailing
  /// input is left to the caller.
  static ParseResult<Date>
  parsePrefix(const char* buf, size_t len, size_t& pos);

  /// Returns the date of a unix timestamp, shifted by
  /// `config.unixTimestampOffset()`.
  static ParseResult<Date> fromTimestamp(
      int64_t timestamp,
      const DateConfig& config = DateConfig());

  /// Returns the date `days` days after 1970-01-01. Fails with kDateTooSmall
  /// or kDateTooLarge outside year 0000 to 9999.
  static ParseResult<Date> fromDaysSinceEpoch(int64_t days);

  int32_t year() const {
    return year_;
  }

  int32_t month() const {
    return month_;
  }

  int32_t day() const {
    return day_;
  }

  /// Signed number of days since 1970-01-01.
  int64_t daysSinceEpoch() const;

  /// Unix timestamp of midnight UTC at the start of this date.
  int64_t timestamp() const;

  /// Canonical form: zero padded YYYY-MM-DD.
  std::string toString() const;

  bool operator==(const Date& other) const {
    return year_ == other.year_ && month_ == other.month_ &&
        day_ == other.day_;
  }

  bool operator!=(const Date& other) const {
    return !(*this == other);
  }

  bool operator<(const Date& other) const {
    return packed() < other.packed();
  }

  bool operator<=(const Date& other) const {
    return packed() <= other.packed();
  }

  bool operator>(const Date& other) const {
    return packed() > other.packed();
  }

  bool operator>=(const Date& other) const {
    return packed() >= other.packed();
  }

 private:
  int32_t packed() const {
    return year_ * 10'000 + month_ * 100 + day_;
  }

  uint16_t year_{1970};
  uint8_t month_{1};
  uint8_t day_{1};
};

std::ostream& operator<<(std::ostream& os, const Date& date);

} // namespace kairos

namespace std {
template <>
struct hash<::kairos::Date> {
  size_t operator()(const ::kairos::Date& value) const {
    return std::hash<int64_t>()(value.daysSinceEpoch());
  }
};
} // namespace std

template <>
struct fmt::formatter<kairos::Date> : formatter<std::string> {
  auto format(const kairos::Date& date, format_context& ctx) const {
    return formatter<std::string>::format(date.toString(), ctx);
  }
};
