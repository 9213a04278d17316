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
#include <folly/Expected.h>

namespace kairos {

/// Closed set of reasons a Date, Time, DateTime or Duration failed to parse.
enum class ParseErrorKind : int8_t {
  // Structural errors.
  kTooShort,
  kInvalidLength,
  kInvalidCharacter,
  kTrailingCharacters,
  kSecondFractionMissing,

  // Range errors.
  kOutOfRangeMonth,
  kOutOfRangeDay,
  kOutOfRangeHour,
  kOutOfRangeMinute,
  kOutOfRangeSecond,
  kOutOfRangeTz,
  kDateTooSmall,
  kDateTooLarge,
  kTimeTooLarge,
  kDurationValueTooLarge,
  kDurationDaysTooLarge,

  // Semantic errors.
  kSecondFractionTooLong,
  kMillisecondFractionTooLong,
  kInvalidTimestamp,
  kTzRequired,
  kInvalidDurationFormat,
};

/// Returns the stable snake_case identifier of `kind`, e.g.
/// "out_of_range_month".
std::string_view parseErrorKindName(ParseErrorKind kind);

/// Returns a short human readable description of `kind`.
std::string_view parseErrorKindDescription(ParseErrorKind kind);

/// A parse failure: what went wrong and, where meaningful, the byte offset in
/// the input at which it was detected. Whole-value errors (e.g. a timestamp
/// outside the supported range) carry no offset.
class ParseError {
 public:
  explicit ParseError(
      ParseErrorKind kind,
      std::optional<size_t> offset = std::nullopt)
      : kind_(kind), offset_(offset) {}

  ParseErrorKind kind() const {
    return kind_;
  }

  std::optional<size_t> offset() const {
    return offset_;
  }

  std::string_view kindName() const {
    return parseErrorKindName(kind_);
  }

  /// Human readable text, e.g. "month value is outside expected range of 1-12
  /// (at offset 5)". The text is informational, callers should branch on
  /// kind() and offset().
  std::string message() const;

  bool operator==(const ParseError& other) const {
    return kind_ == other.kind_ && offset_ == other.offset_;
  }

  bool operator!=(const ParseError& other) const {
    return !(*this == other);
  }

 private:
  ParseErrorKind kind_;
  std::optional<size_t> offset_;
};

template <typename T>
using ParseResult = folly::Expected<T, ParseError>;

inline folly::Unexpected<ParseError> parseError(
    ParseErrorKind kind,
    std::optional<size_t> offset = std::nullopt) {
  return folly::makeUnexpected(ParseError(kind, offset));
}

std::ostream& operator<<(std::ostream& os, ParseErrorKind kind);

std::ostream& operator<<(std::ostream& os, const ParseError& error);

} // namespace kairos

template <>
struct fmt::formatter<kairos::ParseErrorKind> : formatter<std::string_view> {
  auto format(kairos::ParseErrorKind kind, format_context& ctx) const {
    return formatter<std::string_view>::format(
        kairos::parseErrorKindName(kind), ctx);
  }
};

template <>
struct fmt::formatter<kairos::ParseError> : formatter<std::string> {
  auto format(const kairos::ParseError& error, format_context& ctx) const {
    return formatter<std::string>::format(error.message(), ctx);
  }
};
