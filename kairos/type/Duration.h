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
#include <folly/dynamic.h>

#include "kairos/type/ParseConfig.h"
#include "kairos/type/ParseError.h"

namespace kairos {

/// Signed interval with microsecond precision, normalized to a sign, a day
/// count, seconds within the day and microseconds within the second. The
/// zero duration is always positive.
class Duration {
 public:
  static constexpr int64_t kMaxDays = 999'999'999;

  // Hours accepted by the clock-style grammar ("36:00:00").
  static constexpr int64_t kMaxClockHours = 2'400'000'000;

  Duration() = default;

  /// Carries microseconds into seconds and seconds into days. Throws
  /// KairosUserError on negative fields or more than kMaxDays days.
  Duration(bool positive, int64_t day, int64_t second, int64_t microsecond);

  /// Non-throwing counterpart of the constructor. Fails with
  /// kDurationDaysTooLarge or kDurationValueTooLarge.
  static ParseResult<Duration>
  fromParts(bool positive, uint64_t day, uint64_t second, uint64_t microsecond);

  /// Parses an optionally signed ('+', '-' or U+2212) duration in one of
  /// these forms, tried in order:
  ///   ISO 8601 period: P[nY][nM][nD][T[nH][nM][n[.f]S]] or PnW. Y is 365
  ///   days, M is 30 days.
  ///   Clock: H...H:MM[:SS[.ffffff]], hours up to kMaxClockHours.
  ///   Days: <n> [d|day|days][,] [HH:MM[:SS[.ffffff]]], case-insensitive.
  /// The first form that matches wins. Otherwise the error of the form that
  /// got furthest is returned, or kInvalidDurationFormat if none got past
  /// the first character.
  static ParseResult<Duration> parse(
      std::string_view input,
      const TimeConfig& config = TimeConfig());

  /// Inverse of toMicros().
  static Duration fromMicros(int64_t micros);

  /// Creates a duration from the output of serialize(). Throws
  /// KairosUserError on invalid fields.
  static Duration create(const folly::dynamic& obj);

  bool positive() const {
    return positive_;
  }

  uint32_t day() const {
    return day_;
  }

  uint32_t second() const {
    return second_;
  }

  uint32_t microsecond() const {
    return microsecond_;
  }

  /// Days and seconds as seconds, negative when the duration is.
  int64_t signedTotalSeconds() const;

  /// Microseconds, negative when the duration is.
  int32_t signedMicroseconds() const;

  /// Total signed microseconds. Throws KairosUserError if the value does not
  /// fit in int64_t (more than about 106,751 days).
  int64_t toMicros() const;

  bool isZero() const {
    return day_ == 0 && second_ == 0 && microsecond_ == 0;
  }

  Duration operator-() const;

  /// Canonical form: [-]P[nD][T[nH][nM][n[.ffffff]S]], or PT0S for zero.
  /// Only days are used for the date part.
  std::string toString() const;

  folly::dynamic serialize() const;

  bool operator==(const Duration& other) const {
    return positive_ == other.positive_ && day_ == other.day_ &&
        second_ == other.second_ && microsecond_ == other.microsecond_;
  }

  bool operator!=(const Duration& other) const {
    return !(*this == other);
  }

  bool operator<(const Duration& other) const {
    return compare(other) < 0;
  }

  bool operator<=(const Duration& other) const {
    return compare(other) <= 0;
  }

  bool operator>(const Duration& other) const {
    return compare(other) > 0;
  }

  bool operator>=(const Duration& other) const {
    return compare(other) >= 0;
  }

 private:
  int32_t compare(const Duration& other) const;

  bool positive_{true};
  uint32_t day_{0};
  uint32_t second_{0};
  uint32_t microsecond_{0};
};

std::ostream& operator<<(std::ostream& os, const Duration& duration);

} // namespace kairos

namespace std {
template <>
struct hash<::kairos::Duration> {
  size_t operator()(const ::kairos::Duration& value) const {
    return std::hash<int64_t>()(value.signedTotalSeconds()) ^
        (std::hash<int32_t>()(value.signedMicroseconds()) << 1);
  }
};
} // namespace std

template <>
struct fmt::formatter<kairos::Duration> : formatter<std::string> {
  auto format(const kairos::Duration& duration, format_context& ctx) const {
    return formatter<std::string>::format(duration.toString(), ctx);
  }
};
