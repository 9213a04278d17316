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


#include "kairos/type/Duration.h"

#include <iterator>
#include <limits>
#include <optional>

#include <boost/algorithm/string/predicate.hpp>

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/DigitScanner.h"
#include "kairos/type/Time.h"
#include "kairos/type/TimestampConversion.h"

namespace kairos {

namespace {

// Widest integer accepted for a single duration component. Keeps every
// intermediate sum well inside uint64_t.
constexpr int32_t kMaxComponentDigits = 12;
constexpr int32_t kMaxClockHourDigits = 10;

/// One duration syntax. Parses `buf[pos, len)` completely or fails.
using DurationGrammar = ParseResult<Duration> (*)(
    const char* buf,
    size_t len,
    size_t pos,
    bool positive,
    const TimeConfig& config);

ParseResult<uint64_t> scanComponent(const char* buf, size_t len, size_t& pos) {
  if (util::countDigits(buf, len, pos) >
      static_cast<size_t>(kMaxComponentDigits)) {
    return parseError(ParseErrorKind::kDurationValueTooLarge, pos);
  }
  return util::scanDigits(buf, len, pos, 1, kMaxComponentDigits);
}

void skipSpaces(const char* buf, size_t len, size_t& pos) {
  while (pos < len && buf[pos] == ' ') {
    ++pos;
  }
}

uint64_t clockSeconds(const detail::ClockFields& clock) {
  return static_cast<uint64_t>(clock.hour) * util::kSecsPerHour +
      clock.minute * util::kSecsPerMinute + clock.second;
}

/// P[nY][nM][nD][T[nH][nM][n[.f]S]] or PnW.
ParseResult<Duration> parseIsoDuration(
    const char* buf,
    size_t len,
    size_t pos,
    bool positive,
    const TimeConfig& config) {
  static constexpr std::string_view kDateDesignators = "YMWD";
  static constexpr uint64_t kDaysPerUnit[] = {365, 30, 7, 1};
  static constexpr size_t kWeek = 2;
  static constexpr std::string_view kTimeDesignators = "HMS";
  static constexpr uint64_t kSecondsPerUnit[] = {3600, 60, 1};
  static constexpr size_t kSecond = 2;

  size_t cursor = pos;
  auto introducer = util::scanSeparator(buf, len, cursor, 'P');
  if (introducer.hasError()) {
    return folly::makeUnexpected(introducer.error());
  }

  uint64_t days = 0;
  uint64_t seconds = 0;
  uint32_t micros = 0;
  int32_t components = 0;

  std::optional<size_t> last;
  while (cursor < len && buf[cursor] != 'T') {
    auto value = scanComponent(buf, len, cursor);
    if (value.hasError()) {
      return folly::makeUnexpected(value.error());
    }
    if (cursor >= len) {
      return parseError(ParseErrorKind::kTooShort, cursor);
    }
    const auto index = kDateDesignators.find(buf[cursor]);
    if (index == std::string_view::npos ||
        (last.has_value() && index <= *last) ||
        (index == kWeek && last.has_value()) || last == kWeek) {
      return parseError(ParseErrorKind::kInvalidCharacter, cursor);
    }
    days += value.value() * kDaysPerUnit[index];
    last = index;
    ++components;
    ++cursor;
  }

  if (cursor < len) {
    // Skip the 'T'.
    ++cursor;
    std::optional<size_t> lastTime;
    while (cursor < len) {
      auto value = scanComponent(buf, len, cursor);
      if (value.hasError()) {
        return folly::makeUnexpected(value.error());
      }
      std::optional<uint32_t> fraction;
      if (cursor < len && util::isDecimalMark(buf[cursor])) {
        ++cursor;
        auto scanned = util::scanFraction(
            buf,
            len,
            cursor,
            6,
            config.microsecondsPrecisionOverflowBehavior());
        if (scanned.hasError()) {
          return folly::makeUnexpected(scanned.error());
        }
        fraction = scanned.value();
      }
      if (cursor >= len) {
        return parseError(ParseErrorKind::kTooShort, cursor);
      }
      const auto index = kTimeDesignators.find(buf[cursor]);
      if (index == std::string_view::npos ||
          (lastTime.has_value() && index <= *lastTime) ||
          (fraction.has_value() && index != kSecond)) {
        return parseError(ParseErrorKind::kInvalidCharacter, cursor);
      }
      seconds += value.value() * kSecondsPerUnit[index];
      micros = fraction.value_or(0);
      lastTime = index;
      ++components;
      ++cursor;
    }
    if (!lastTime.has_value()) {
      return parseError(ParseErrorKind::kTooShort, cursor);
    }
  }

  if (components == 0) {
    return parseError(ParseErrorKind::kTooShort, cursor);
  }
  return Duration::fromParts(positive, days, seconds, micros);
}

/// H...H:MM[:SS[.ffffff]].
ParseResult<Duration> parseClockDuration(
    const char* buf,
    size_t len,
    size_t pos,
    bool positive,
    const TimeConfig& config) {
  const auto hourDigits = util::countDigits(buf, len, pos);
  if (hourDigits > static_cast<size_t>(kMaxClockHourDigits) &&
      pos + hourDigits < len && buf[pos + hourDigits] == ':') {
    return parseError(ParseErrorKind::kDurationValueTooLarge);
  }
  size_t cursor = pos;
  auto clock = detail::parseClockFields(
      buf,
      len,
      cursor,
      1,
      kMaxClockHourDigits,
      config.microsecondsPrecisionOverflowBehavior());
  if (clock.hasError()) {
    return folly::makeUnexpected(clock.error());
  }
  if (clock->hour > Duration::kMaxClockHours) {
    return parseError(ParseErrorKind::kDurationValueTooLarge);
  }
  if (cursor < len) {
    return parseError(ParseErrorKind::kTrailingCharacters, cursor);
  }
  return Duration::fromParts(
      positive, 0, clockSeconds(*clock), clock->microsecond);
}

/// <n> [d|day|days][,] [HH:MM[:SS[.ffffff]]].
ParseResult<Duration> parseDaysDuration(
    const char* buf,
    size_t len,
    size_t pos,
    bool positive,
    const TimeConfig& config) {
  size_t cursor = pos;
  auto days = scanComponent(buf, len, cursor);
  if (days.hasError()) {
    return folly::makeUnexpected(days.error());
  }
  skipSpaces(buf, len, cursor);

  const std::string_view rest(buf + cursor, len - cursor);
  if (boost::algorithm::istarts_with(rest, "days")) {
    cursor += 4;
  } else if (boost::algorithm::istarts_with(rest, "day")) {
    cursor += 3;
  } else if (boost::algorithm::istarts_with(rest, "d")) {
    cursor += 1;
  } else {
    return parseError(
        rest.empty() ? ParseErrorKind::kTooShort
                     : ParseErrorKind::kInvalidCharacter,
        cursor);
  }
  if (cursor < len && buf[cursor] == ',') {
    ++cursor;
  }
  skipSpaces(buf, len, cursor);
  if (cursor == len) {
    return Duration::fromParts(positive, days.value(), 0, 0);
  }

  const size_t clockOffset = cursor;
  auto clock = detail::parseClockFields(
      buf, len, cursor, 2, 2, config.microsecondsPrecisionOverflowBehavior());
  if (clock.hasError()) {
    return folly::makeUnexpected(clock.error());
  }
  if (clock->hour >= util::kHoursPerDay) {
    return parseError(ParseErrorKind::kOutOfRangeHour, clockOffset);
  }
  if (cursor < len) {
    return parseError(ParseErrorKind::kTrailingCharacters, cursor);
  }
  return Duration::fromParts(
      positive, days.value(), clockSeconds(*clock), clock->microsecond);
}

// Errors without an offset come from a fully matched input.
size_t progress(const ParseError& error, size_t len) {
  return error.offset().value_or(len);
}

} // namespace

Duration::Duration(
    bool positive,
    int64_t day,
    int64_t second,
    int64_t microsecond) {
  KAIROS_USER_CHECK(
      day >= 0 && second >= 0 && microsecond >= 0,
      "Duration fields must not be negative: day {}, second {}, microsecond {}",
      day,
      second,
      microsecond);
  auto normalized = fromParts(positive, day, second, microsecond);
  if (normalized.hasError()) {
    KAIROS_USER_FAIL("Invalid duration: {}", normalized.error().message());
  }
  *this = normalized.value();
}

// static
ParseResult<Duration> Duration::fromParts(
    bool positive,
    uint64_t day,
    uint64_t second,
    uint64_t microsecond) {
  const uint64_t carry = microsecond / util::kMicrosPerSec;
  if (second > std::numeric_limits<uint64_t>::max() - carry) {
    return parseError(ParseErrorKind::kDurationValueTooLarge);
  }
  second += carry;
  if (day > kMaxDays) {
    return parseError(ParseErrorKind::kDurationDaysTooLarge);
  }
  day += second / util::kSecsPerDay;
  if (day > kMaxDays) {
    return parseError(ParseErrorKind::kDurationDaysTooLarge);
  }

  Duration result;
  result.day_ = static_cast<uint32_t>(day);
  result.second_ = static_cast<uint32_t>(second % util::kSecsPerDay);
  result.microsecond_ =
      static_cast<uint32_t>(microsecond % util::kMicrosPerSec);
  result.positive_ = positive || result.isZero();
  return result;
}

// static
ParseResult<Duration> Duration::parse(
    std::string_view input,
    const TimeConfig& config) {
  static constexpr DurationGrammar kGrammars[] = {
      parseIsoDuration, parseClockDuration, parseDaysDuration};

  const char* buf = input.data();
  const size_t len = input.size();
  size_t pos = 0;
  bool positive = true;
  if (pos < len && buf[pos] == '+') {
    ++pos;
  } else if (pos < len && buf[pos] == '-') {
    positive = false;
    ++pos;
  } else if (util::scanUnicodeMinus(buf, len, pos)) {
    positive = false;
  }

  std::optional<ParseError> furthest;
  for (const auto grammar : kGrammars) {
    auto result = grammar(buf, len, pos, positive, config);
    if (result.hasValue()) {
      return result;
    }
    if (!furthest.has_value() ||
        progress(result.error(), len) > progress(*furthest, len)) {
      furthest = result.error();
    }
  }

  KAIROS_DCHECK(furthest.has_value(), "No duration grammar was attempted");
  const auto kind = furthest->kind();
  if (progress(*furthest, len) == pos &&
      (kind == ParseErrorKind::kInvalidCharacter ||
       kind == ParseErrorKind::kTooShort)) {
    return parseError(ParseErrorKind::kInvalidDurationFormat, pos);
  }
  return folly::makeUnexpected(*furthest);
}

// static
Duration Duration::fromMicros(int64_t micros) {
  const bool positive = micros >= 0;
  const uint64_t magnitude = positive ? static_cast<uint64_t>(micros)
                                      : 0 - static_cast<uint64_t>(micros);
  return Duration(
      positive,
      0,
      static_cast<int64_t>(magnitude / util::kMicrosPerSec),
      static_cast<int64_t>(magnitude % util::kMicrosPerSec));
}

// static
Duration Duration::create(const folly::dynamic& obj) {
  return Duration(
      obj["positive"].asBool(),
      obj["day"].asInt(),
      obj["second"].asInt(),
      obj["microsecond"].asInt());
}

int64_t Duration::signedTotalSeconds() const {
  const int64_t total =
      static_cast<int64_t>(day_) * util::kSecsPerDay + second_;
  return positive_ ? total : -total;
}

int32_t Duration::signedMicroseconds() const {
  const auto micros = static_cast<int32_t>(microsecond_);
  return positive_ ? micros : -micros;
}

int64_t Duration::toMicros() const {
  // The largest duration needs about 67 bits.
  const __int128_t magnitude =
      (static_cast<__int128_t>(day_) * util::kSecsPerDay + second_) *
          util::kMicrosPerSec +
      microsecond_;
  const __int128_t result = positive_ ? magnitude : -magnitude;
  if (result < std::numeric_limits<int64_t>::min() ||
      result > std::numeric_limits<int64_t>::max()) {
    KAIROS_USER_FAIL(
        "Could not convert Duration {} to microseconds", toString());
  }
  return static_cast<int64_t>(result);
}

Duration Duration::operator-() const {
  Duration result = *this;
  result.positive_ = !positive_ || isZero();
  return result;
}

std::string Duration::toString() const {
  std::string result = positive_ ? "P" : "-P";
  auto out = std::back_inserter(result);
  if (day_ != 0) {
    fmt::format_to(out, "{}D", day_);
  }
  if (second_ != 0 || microsecond_ != 0) {
    result.push_back('T');
    const auto hours = second_ / util::kSecsPerHour;
    const auto minutes = second_ % util::kSecsPerHour / util::kSecsPerMinute;
    const auto seconds = second_ % util::kSecsPerMinute;
    if (hours != 0) {
      fmt::format_to(out, "{}H", hours);
    }
    if (minutes != 0) {
      fmt::format_to(out, "{}M", minutes);
    }
    if (seconds != 0 || microsecond_ != 0) {
      fmt::format_to(out, "{}", seconds);
      util::appendFractionalSeconds(microsecond_, result);
      result.push_back('S');
    }
  }
  if (isZero()) {
    result.append("T0S");
  }
  return result;
}

folly::dynamic Duration::serialize() const {
  folly::dynamic obj = folly::dynamic::object;
  obj["positive"] = positive_;
  obj["day"] = day_;
  obj["second"] = second_;
  obj["microsecond"] = microsecond_;
  return obj;
}

int32_t Duration::compare(const Duration& other) const {
  if (positive_ != other.positive_) {
    return positive_ ? 1 : -1;
  }
  int32_t magnitude = 0;
  if (day_ != other.day_) {
    magnitude = day_ < other.day_ ? -1 : 1;
  } else if (second_ != other.second_) {
    magnitude = second_ < other.second_ ? -1 : 1;
  } else if (microsecond_ != other.microsecond_) {
    magnitude = microsecond_ < other.microsecond_ ? -1 : 1;
  }
  return positive_ ? magnitude : -magnitude;
}

std::ostream& operator<<(std::ostream& os, const Duration& duration) {
  return os << duration.toString();
}

} // namespace kairos
