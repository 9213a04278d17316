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
#include <string>
#include <string_view>
#include <unordered_map>

#include <fmt/format.h>

namespace kairos {

/// How a purely numeric Date or DateTime input is interpreted.
enum class TimestampUnit : int8_t {
  // Seconds since the unix epoch.
  kSecond,
  // Milliseconds since the unix epoch.
  kMillisecond,
  // Seconds when the magnitude is at most kMillisecondsWatershed,
  // milliseconds otherwise.
  kInfer,
};

/// What to do when a fractional second carries more than microsecond
/// precision.
enum class MicrosecondsPrecisionOverflowBehavior : int8_t {
  // Keep the first six digits, drop the rest without rounding.
  kTruncate,
  // Fail with kSecondFractionTooLong.
  kError,
};

/// Accepts "s", "ms" and "infer", case-insensitively.
std::optional<TimestampUnit> timestampUnitFromString(std::string_view value);

/// Accepts "truncate" and "error", case-insensitively.
std::optional<MicrosecondsPrecisionOverflowBehavior> overflowBehaviorFromString(
    std::string_view value);

std::string_view toString(TimestampUnit unit);

std::string_view toString(MicrosecondsPrecisionOverflowBehavior behavior);

/// Keys understood by the fromConfigMap() factories.
struct ParseConfigKeys {
  static constexpr const char* kTimestampUnit = "timestamp_unit";
  static constexpr const char* kMicrosecondsPrecisionOverflowBehavior =
      "microseconds_precision_overflow_behavior";
  static constexpr const char* kUnixTimestampOffset = "unix_timestamp_offset";
};

/// Options for Time::parse() and Duration::parse().
class TimeConfig {
 public:
  class Builder {
   public:
    Builder& microsecondsPrecisionOverflowBehavior(
        MicrosecondsPrecisionOverflowBehavior behavior) {
      overflowBehavior_ = behavior;
      return *this;
    }

    /// Offset in seconds, east of UTC, attached to times created from a
    /// number of seconds. Must be within (-24h, 24h).
    Builder& unixTimestampOffset(std::optional<int32_t> offset) {
      unixTimestampOffset_ = offset;
      return *this;
    }

    /// Throws KairosUserError if the offset is out of range.
    TimeConfig build() const;

   private:
    std::optional<MicrosecondsPrecisionOverflowBehavior> overflowBehavior_;
    std::optional<int32_t> unixTimestampOffset_;
  };

  static Builder builder() {
    return Builder();
  }

  /// Builds a config from string key/value pairs, see ParseConfigKeys. Keys
  /// not used by TimeConfig are ignored. Throws KairosUserError on invalid
  /// values.
  static TimeConfig fromConfigMap(
      const std::unordered_map<std::string, std::string>& values);

  TimeConfig() = default;

  MicrosecondsPrecisionOverflowBehavior microsecondsPrecisionOverflowBehavior()
      const {
    return overflowBehavior_;
  }

  std::optional<int32_t> unixTimestampOffset() const {
    return unixTimestampOffset_;
  }

  bool operator==(const TimeConfig& other) const {
    return overflowBehavior_ == other.overflowBehavior_ &&
        unixTimestampOffset_ == other.unixTimestampOffset_;
  }

  bool operator!=(const TimeConfig& other) const {
    return !(*this == other);
  }

 private:
  friend class DateTimeConfig;

  TimeConfig(
      MicrosecondsPrecisionOverflowBehavior overflowBehavior,
      std::optional<int32_t> unixTimestampOffset)
      : overflowBehavior_(overflowBehavior),
        unixTimestampOffset_(unixTimestampOffset) {}

  MicrosecondsPrecisionOverflowBehavior overflowBehavior_{
      MicrosecondsPrecisionOverflowBehavior::kError};
  std::optional<int32_t> unixTimestampOffset_;
};

/// Options for Date::parse().
class DateConfig {
 public:
  class Builder {
   public:
    Builder& timestampUnit(TimestampUnit unit) {
      timestampUnit_ = unit;
      return *this;
    }

    /// Seconds east of UTC applied to numeric timestamps before the calendar
    /// date is taken. Must be within (-24h, 24h).
    Builder& unixTimestampOffset(std::optional<int32_t> offset) {
      unixTimestampOffset_ = offset;
      return *this;
    }

    DateConfig build() const;

   private:
    std::optional<TimestampUnit> timestampUnit_;
    std::optional<int32_t> unixTimestampOffset_;
  };

  static Builder builder() {
    return Builder();
  }

  static DateConfig fromConfigMap(
      const std::unordered_map<std::string, std::string>& values);

  DateConfig() = default;

  TimestampUnit timestampUnit() const {
    return timestampUnit_;
  }

  std::optional<int32_t> unixTimestampOffset() const {
    return unixTimestampOffset_;
  }

  bool operator==(const DateConfig& other) const {
    return timestampUnit_ == other.timestampUnit_ &&
        unixTimestampOffset_ == other.unixTimestampOffset_;
  }

  bool operator!=(const DateConfig& other) const {
    return !(*this == other);
  }

 private:
  friend class DateTimeConfig;

  DateConfig(TimestampUnit unit, std::optional<int32_t> unixTimestampOffset)
      : timestampUnit_(unit), unixTimestampOffset_(unixTimestampOffset) {}

  TimestampUnit timestampUnit_{TimestampUnit::kInfer};
  std::optional<int32_t> unixTimestampOffset_;
};

/// Options for DateTime::parse(). Combines the numeric timestamp options of
/// DateConfig with the fractional second policy of TimeConfig.
class DateTimeConfig {
 public:
  class Builder {
   public:
    Builder& timestampUnit(TimestampUnit unit) {
      timestampUnit_ = unit;
      return *this;
    }

    Builder& microsecondsPrecisionOverflowBehavior(
        MicrosecondsPrecisionOverflowBehavior behavior) {
      overflowBehavior_ = behavior;
      return *this;
    }

    Builder& unixTimestampOffset(std::optional<int32_t> offset) {
      unixTimestampOffset_ = offset;
      return *this;
    }

    DateTimeConfig build() const;

   private:
    std::optional<TimestampUnit> timestampUnit_;
    std::optional<MicrosecondsPrecisionOverflowBehavior> overflowBehavior_;
    std::optional<int32_t> unixTimestampOffset_;
  };

  static Builder builder() {
    return Builder();
  }

  static DateTimeConfig fromConfigMap(
      const std::unordered_map<std::string, std::string>& values);

  DateTimeConfig() = default;

  TimestampUnit timestampUnit() const {
    return timestampUnit_;
  }

  MicrosecondsPrecisionOverflowBehavior microsecondsPrecisionOverflowBehavior()
      const {
    return overflowBehavior_;
  }

  std::optional<int32_t> unixTimestampOffset() const {
    return unixTimestampOffset_;
  }

  /// The options that apply to the time component.
  TimeConfig timeConfig() const;

  /// The options that apply to the date component.
  DateConfig dateConfig() const;

  bool operator==(const DateTimeConfig& other) const {
    return timestampUnit_ == other.timestampUnit_ &&
        overflowBehavior_ == other.overflowBehavior_ &&
        unixTimestampOffset_ == other.unixTimestampOffset_;
  }

  bool operator!=(const DateTimeConfig& other) const {
    return !(*this == other);
  }

 private:
  DateTimeConfig(
      TimestampUnit unit,
      MicrosecondsPrecisionOverflowBehavior overflowBehavior,
      std::optional<int32_t> unixTimestampOffset)
      : timestampUnit_(unit),
        overflowBehavior_(overflowBehavior),
        unixTimestampOffset_(unixTimestampOffset) {}

  TimestampUnit timestampUnit_{TimestampUnit::kInfer};
  MicrosecondsPrecisionOverflowBehavior overflowBehavior_{
      MicrosecondsPrecisionOverflowBehavior::kError};
  std::optional<int32_t> unixTimestampOffset_;
};

} // namespace kairos

template <>
struct fmt::formatter<kairos::TimestampUnit> : formatter<std::string_view> {
  auto format(kairos::TimestampUnit unit, format_context& ctx) const {
    return formatter<std::string_view>::format(kairos::toString(unit), ctx);
  }
};

template <>
struct fmt::formatter<kairos::MicrosecondsPrecisionOverflowBehavior>
    : formatter<std::string_view> {
  auto format(
      kairos::MicrosecondsPrecisionOverflowBehavior behavior,
      format_context& ctx) const {
    return formatter<std::string_view>::format(
        kairos::toString(behavior), ctx);
  }
};
