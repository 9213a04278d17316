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


#include "kairos/type/ParseError.h"

#include "kairos/common/base/Exceptions.h"

namespace kairos {

std::string_view parseErrorKindName(ParseErrorKind kind) {
  switch (kind) {
    case ParseErrorKind::kTooShort:
      return "too_short";
    case ParseErrorKind::kInvalidLength:
      return "invalid_length";
    case ParseErrorKind::kInvalidCharacter:
      return "invalid_character";
    case ParseErrorKind::kTrailingCharacters:
      return "trailing_characters";
    case ParseErrorKind::kSecondFractionMissing:
      return "second_fraction_missing";
    case ParseErrorKind::kOutOfRangeMonth:
      return "out_of_range_month";
    case ParseErrorKind::kOutOfRangeDay:
      return "out_of_range_day";
    case ParseErrorKind::kOutOfRangeHour:
      return "out_of_range_hour";
    case ParseErrorKind::kOutOfRangeMinute:
      return "out_of_range_minute";
    case ParseErrorKind::kOutOfRangeSecond:
      return "out_of_range_second";
    case ParseErrorKind::kOutOfRangeTz:
      return "out_of_range_tz";
    case ParseErrorKind::kDateTooSmall:
      return "date_too_small";
    case ParseErrorKind::kDateTooLarge:
      return "date_too_large";
    case ParseErrorKind::kTimeTooLarge:
      return "time_too_large";
    case ParseErrorKind::kDurationValueTooLarge:
      return "duration_value_too_large";
    case ParseErrorKind::kDurationDaysTooLarge:
      return "duration_days_too_large";
    case ParseErrorKind::kSecondFractionTooLong:
      return "second_fraction_too_long";
    case ParseErrorKind::kMillisecondFractionTooLong:
      return "millisecond_fraction_too_long";
    case ParseErrorKind::kInvalidTimestamp:
      return "invalid_timestamp";
    case ParseErrorKind::kTzRequired:
      return "tz_required";
    case ParseErrorKind::kInvalidDurationFormat:
      return "invalid_duration_format";
  }
  KAIROS_UNREACHABLE();
}

std::string_view parseErrorKindDescription(ParseErrorKind kind) {
  switch (kind) {
    case ParseErrorKind::kTooShort:
      return "input is too short";
    case ParseErrorKind::kInvalidLength:
      return "input has an invalid length";
    case ParseErrorKind::kInvalidCharacter:
      return "unexpected character";
    case ParseErrorKind::kTrailingCharacters:
      return "unexpected extra characters at the end of the input";
    case ParseErrorKind::kSecondFractionMissing:
      return "second fraction digits missing after the decimal mark";
    case ParseErrorKind::kOutOfRangeMonth:
      return "month value is outside expected range of 1-12";
    case ParseErrorKind::kOutOfRangeDay:
      return "day value is outside expected range";
    case ParseErrorKind::kOutOfRangeHour:
      return "hour value is outside expected range of 0-23";
    case ParseErrorKind::kOutOfRangeMinute:
      return "minute value is outside expected range of 0-59";
    case ParseErrorKind::kOutOfRangeSecond:
      return "second value is outside expected range of 0-59";
    case ParseErrorKind::kOutOfRangeTz:
      return "timezone offset must be less than 24 hours";
    case ParseErrorKind::kDateTooSmall:
      return "date is earlier than the supported range";
    case ParseErrorKind::kDateTooLarge:
      return "date is later than the supported range";
    case ParseErrorKind::kTimeTooLarge:
      return "numeric times may not exceed 86,399 seconds";
    case ParseErrorKind::kDurationValueTooLarge:
      return "a numeric value in the duration is too large";
    case ParseErrorKind::kDurationDaysTooLarge:
      return "durations may not exceed 999,999,999 days";
    case ParseErrorKind::kSecondFractionTooLong:
      return "second fraction value is more than 6 digits long";
    case ParseErrorKind::kMillisecondFractionTooLong:
      return "millisecond fraction value is more than 3 digits long";
    case ParseErrorKind::kInvalidTimestamp:
      return "invalid unix timestamp";
    case ParseErrorKind::kTzRequired:
      return "timezone is required to adjust to a new timezone";
    case ParseErrorKind::kInvalidDurationFormat:
      return "input does not match any duration format";
  }
  KAIROS_UNREACHABLE();
}

std::string ParseError::message() const {
  if (offset_.has_value()) {
    return fmt::format(
        "{} (at offset {})", parseErrorKindDescription(kind_), *offset_);
  }
  return std::string(parseErrorKindDescription(kind_));
}

std::ostream& operator<<(std::ostream& os, ParseErrorKind kind) {
  return os << parseErrorKindName(kind);
}

std::ostream& operator<<(std::ostream& os, const ParseError& error) {
  os << error.kindName();
  if (error.offset().has_value()) {
    os << "@" << *error.offset();
  }
  return os;
}

} // namespace kairos
