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

#include "kairos/type/ParseConfig.h"
#include "kairos/type/ParseError.h"

namespace kairos {

namespace detail {

/// Wall clock reading without an offset. `hour` is unbounded so that
/// clock-style durations ("36:00:00") can share the grammar.
struct ClockFields {
  int64_t hour;
  int32_t minute;
  int32_t second;
  uint32_t microsecond;
};

/// Parses HH:MM[:SS[(.|,)ffffff]] starting at `pos`, with the hour taking
/// between `minHourDigits` and `maxHourDigits` digits. Minute and second are
/// range checked, the hour is left to the caller. Advances `pos` on success.
ParseResult<ClockFields> parseClockFields(
    const char* buf,
    size_t len,
    size_t& pos,
    int32_t minHourDigits,
    int32_t maxHourDigits,
    MicrosecondsPrecisionOverflowBehavior overflowBehavior);

/// Parses a UTC offset suffix: 'Z', 'z' or a sign ('+', '-', U+2212)
/// followed by HH[[:]MM[[:]SS]]. Returns the offset in seconds east of UTC.
ParseResult<int32_t>
parseTimezoneOffset(const char* buf, size_t len, size_t& pos);

} // namespace detail

/// Time of day with microsecond precision and an optional offset from UTC in
/// seconds. A time with no offset is naive, Some(0) is explicit UTC and is
/// formatted as 'Z'.
class Time {
 public:
  static constexpr int32_t kMaxTzOffset = 86'399;

  Time() = default;

  /// Throws KairosUserError if any field is out of range.
  Time(
      int32_t hour,
      int32_t minute,
      int32_t second,
      int32_t microsecond = 0,
      std::optional<int32_t> tzOffset = std::nullopt);

  /// Parses HH:MM[:SS[.ffffff]][Z|±HH[:MM[:SS]]]. The whole input must be
  /// consumed.
  static ParseResult<Time> parse(
      std::string_view input,
      const TimeConfig& config = TimeConfig());

  /// Parses a time starting at `pos` of `input` and running to its end.
  /// Errors carry offsets into `input`.
  static ParseResult<Time>
  parseAt(std::string_view input, size_t pos, const TimeConfig& config);

  /// Creates a time from seconds since midnight. Microseconds of 1e6 or more
  /// carry into the seconds. The offset is taken from
  /// `config.unixTimestampOffset()`. Fails with kTimeTooLarge if the result
  /// is not within one day.
  static ParseResult<Time> fromSecondsOfDay(
      int64_t seconds,
      int64_t microsecond = 0,
      const TimeConfig& config = TimeConfig());

  int32_t hour() const {
    return hour_;
  }

  int32_t minute() const {
    return minute_;
  }

  int32_t second() const {
    return second_;
  }

  int32_t microsecond() const {
    return microsecond_;
  }

  std::optional<int32_t> tzOffset() const {
    return tzOffset_;
  }

  /// Seconds since midnight, ignoring the offset.
  int32_t totalSeconds() const;

  /// Milliseconds since midnight, ignoring the offset.
  int32_t totalMillis() const;

  /// Returns a copy labelled with `tzOffset`. The wall clock is unchanged, so
  /// the result denotes a different instant.
  ParseResult<Time> withTimezoneOffset(std::optional<int32_t> tzOffset) const;

  /// Returns the same instant as seen at `tzOffset`, wrapping around
  /// midnight. Fails with kTzRequired if this time is naive.
  ParseResult<Time> inTimezone(int32_t tzOffset) const;

  /// Canonical form: HH:MM:SS, the fraction with trailing zeros trimmed when
  /// non-zero, then 'Z', ±HH:MM or ±HH:MM:SS when an offset is present.
  std::string toString() const;

  bool operator==(const Time& other) const {
    return hour_ == other.hour_ && minute_ == other.minute_ &&
        second_ == other.second_ && microsecond_ == other.microsecond_ &&
        tzOffset_ == other.tzOffset_;
  }

  bool operator!=(const Time& other) const {
    return !(*this == other);
  }

  // Two times carrying offsets are compared as instants, otherwise by their
  // wall clock.
  bool operator<(const Time& other) const {
    return compare(other) < 0;
  }

  bool operator<=(const Time& other) const {
    return compare(other) <= 0;
  }

  bool operator>(const Time& other) const {
    return compare(other) > 0;
  }

  bool operator>=(const Time& other) const {
    return compare(other) >= 0;
  }

 private:
  int32_t compare(const Time& other) const;

  uint8_t hour_{0};
  uint8_t minute_{0};
  uint8_t second_{0};
  uint32_t microsecond_{0};
  std::optional<int32_t> tzOffset_;
};

/// Appends the canonical form of `tzOffset` ('Z', ±HH:MM or ±HH:MM:SS) to
/// `out`.
void appendTimezoneOffset(int32_t tzOffset, std::string& out);

std::ostream& operator<<(std::ostream& os, const Time& time);

} // namespace kairos

template <>
struct fmt::formatter<kairos::Time> : formatter<std::string> {
  auto format(const kairos::Time& time, format_context& ctx) const {
    return formatter<std::string>::format(time.toString(), ctx);
  }
};
