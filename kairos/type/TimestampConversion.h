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
#include <string>
#include <string_view>

#include "kairos/type/ParseConfig.h"
#include "kairos/type/ParseError.h"

namespace kairos::util {

constexpr const int32_t kHoursPerDay{24};
constexpr const int32_t kMinsPerHour{60};
constexpr const int32_t kSecsPerMinute{60};
constexpr const int64_t kMsecsPerSec{1000};

constexpr const int64_t kMicrosPerMsec{1000};
constexpr const int64_t kMicrosPerSec{kMicrosPerMsec * kMsecsPerSec};

constexpr const int32_t kSecsPerHour{kSecsPerMinute * kMinsPerHour};
constexpr const int32_t kSecsPerDay{kSecsPerHour * kHoursPerDay};

constexpr const int32_t kMinYear{0};
constexpr const int32_t kMaxYear{9999};

// Numeric timestamps with a magnitude above this value are taken to be
// milliseconds when the unit is inferred. 2e10 seconds is 2603-10-11, 2e10
// milliseconds is 1970-08-20.
constexpr const int64_t kMillisecondsWatershed{20'000'000'000};

// Range of local seconds a numeric timestamp may resolve to:
// 1600-01-01T00:00:00 to 9999-12-31T23:59:59.
constexpr const int64_t kMinTimestampSeconds{-11'676'096'000};
constexpr const int64_t kMaxTimestampSeconds{253'402'300'799};

// Returns true if leap year, false otherwise
bool isLeapYear(int32_t year);

// Returns true if year, month, day corresponds to valid date, false otherwise
bool isValidDate(int32_t year, int32_t month, int32_t day);

// Returns max day of month for inputted month of inputted year
int32_t getMaxDayOfMonth(int32_t year, int32_t month);

/// Returns the (signed) number of days since unix epoch (1970-01-01). Does
/// not validate the date.
int64_t daysSinceEpochFromDate(int32_t year, int32_t month, int32_t day);

/// @brief Civil Date
struct CivilDate {
  int32_t year;
  int32_t month;
  int32_t day;
};

/// Converts days since the unix epoch to a proleptic Gregorian date.
CivilDate civilFromDaysSinceEpoch(int64_t daysSinceEpoch);

/// Floor division of seconds since the epoch into whole days, with the
/// remaining seconds of that day in [0, 86400).
int64_t floorDays(int64_t seconds, int64_t& secondsInDay);

/// Returns the cumulative number of seconds.
/// Does not perform any sanity checks.
int64_t fromTime(int32_t hour, int32_t minute, int32_t second);

/// Appends '.' and `microsecond` as six digits with trailing zeros removed,
/// e.g. 120000 becomes ".12". Appends nothing for zero.
void appendFractionalSeconds(uint32_t microsecond, std::string& out);

/// Seconds and microseconds since the unix epoch. microsecond is always in
/// [0, 999999], negative instants carry a negative seconds value.
struct EpochTime {
  int64_t seconds;
  uint32_t microsecond;
};

/// Returns true if `input` is an unbroken decimal number, optionally preceded
/// by '-'. When `allowFraction` is true a single '.' followed by digits is
/// also accepted.
bool isNumericTimestamp(std::string_view input, bool allowFraction);

/// Returns true if `magnitude` is interpreted as milliseconds under `unit`.
bool isMillisecondsTimestamp(uint64_t magnitude, TimestampUnit unit);

/// Interprets an input accepted by isNumericTimestamp() as a unix timestamp.
/// Fraction digits beyond microsecond precision (6 digits for seconds, 3 for
/// milliseconds) follow `overflowBehavior`. Values too large to be
/// represented fail with kDateTooLarge / kDateTooSmall.
ParseResult<EpochTime> parseNumericTimestamp(
    std::string_view input,
    TimestampUnit unit,
    MicrosecondsPrecisionOverflowBehavior overflowBehavior);

/// Splits an integer timestamp into seconds and microseconds.
EpochTime toEpochTime(int64_t timestamp, TimestampUnit unit);

/// Applies `offset` seconds east of UTC to `time` and checks that the result
/// lies within [kMinTimestampSeconds, kMaxTimestampSeconds].
ParseResult<EpochTime> toLocalEpochTime(EpochTime time, int32_t offset);

} // namespace kairos::util
