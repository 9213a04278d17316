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


#include "kairos/type/ParseConfig.h"

#include <boost/algorithm/string.hpp>
#include <folly/Conv.h>

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/TimestampConversion.h"

namespace kairos {

namespace {

void checkUnixTimestampOffset(std::optional<int32_t> offset) {
  if (offset.has_value()) {
    KAIROS_USER_CHECK(
        *offset > -util::kSecsPerDay && *offset < util::kSecsPerDay,
        "Unix timestamp offset must be less than 24 hours: {}",
        *offset);
  }
}

const std::string* findValue(
    const std::unordered_map<std::string, std::string>& values,
    const char* key) {
  auto it = values.find(key);
  return it == values.end() ? nullptr : &it->second;
}

std::optional<TimestampUnit> timestampUnitFromMap(
    const std::unordered_map<std::string, std::string>& values) {
  const auto* value = findValue(values, ParseConfigKeys::kTimestampUnit);
  if (value == nullptr) {
    return std::nullopt;
  }
  auto unit = timestampUnitFromString(*value);
  KAIROS_USER_CHECK(
      unit.has_value(),
      "Invalid {}: '{}', expected one of 's', 'ms' or 'infer'",
      ParseConfigKeys::kTimestampUnit,
      *value);
  return unit;
}

std::optional<MicrosecondsPrecisionOverflowBehavior> overflowBehaviorFromMap(
    const std::unordered_map<std::string, std::string>& values) {
  const auto* value = findValue(
      values, ParseConfigKeys::kMicrosecondsPrecisionOverflowBehavior);
  if (value == nullptr) {
    return std::nullopt;
  }
  auto behavior = overflowBehaviorFromString(*value);
  KAIROS_USER_CHECK(
      behavior.has_value(),
      "Invalid {}: '{}', expected one of 'truncate' or 'error'",
      ParseConfigKeys::kMicrosecondsPrecisionOverflowBehavior,
      *value);
  return behavior;
}

std::optional<int32_t> unixTimestampOffsetFromMap(
    const std::unordered_map<std::string, std::string>& values) {
  const auto* value =
      findValue(values, ParseConfigKeys::kUnixTimestampOffset);
  if (value == nullptr) {
    return std::nullopt;
  }
  auto offset = folly::tryTo<int32_t>(*value);
  KAIROS_USER_CHECK(
      offset.hasValue(),
      "Invalid {}: '{}', expected a number of seconds",
      ParseConfigKeys::kUnixTimestampOffset,
      *value);
  return offset.value();
}

} // namespace

std::optional<TimestampUnit> timestampUnitFromString(std::string_view value) {
  if (boost::algorithm::iequals(value, "s")) {
    return TimestampUnit::kSecond;
  }
  if (boost::algorithm::iequals(value, "ms")) {
    return TimestampUnit::kMillisecond;
  }
  if (boost::algorithm::iequals(value, "infer")) {
    return TimestampUnit::kInfer;
  }
  return std::nullopt;
}

std::optional<MicrosecondsPrecisionOverflowBehavior> overflowBehaviorFromString(
    std::string_view value) {
  if (boost::algorithm::iequals(value, "truncate")) {
    return MicrosecondsPrecisionOverflowBehavior::kTruncate;
  }
  if (boost::algorithm::iequals(value, "error")) {
    return MicrosecondsPrecisionOverflowBehavior::kError;
  }
  return std::nullopt;
}

std::string_view toString(TimestampUnit unit) {
  switch (unit) {
    case TimestampUnit::kSecond:
      return "s";
    case TimestampUnit::kMillisecond:
      return "ms";
    case TimestampUnit::kInfer:
      return "infer";
  }
  KAIROS_UNREACHABLE();
}

std::string_view toString(MicrosecondsPrecisionOverflowBehavior behavior) {
  switch (behavior) {
    case MicrosecondsPrecisionOverflowBehavior::kTruncate:
      return "truncate";
    case MicrosecondsPrecisionOverflowBehavior::kError:
      return "error";
  }
  KAIROS_UNREACHABLE();
}

TimeConfig TimeConfig::Builder::build() const {
  checkUnixTimestampOffset(unixTimestampOffset_);
  return TimeConfig(
      overflowBehavior_.value_or(MicrosecondsPrecisionOverflowBehavior::kError),
      unixTimestampOffset_);
}

// static
TimeConfig TimeConfig::fromConfigMap(
    const std::unordered_map<std::string, std::string>& values) {
  Builder builder;
  if (auto behavior = overflowBehaviorFromMap(values)) {
    builder.microsecondsPrecisionOverflowBehavior(*behavior);
  }
  builder.unixTimestampOffset(unixTimestampOffsetFromMap(values));
  return builder.build();
}

DateConfig DateConfig::Builder::build() const {
  checkUnixTimestampOffset(unixTimestampOffset_);
  return DateConfig(
      timestampUnit_.value_or(TimestampUnit::kInfer), unixTimestampOffset_);
}

// static
DateConfig DateConfig::fromConfigMap(
    const std::unordered_map<std::string, std::string>& values) {
  Builder builder;
  if (auto unit = timestampUnitFromMap(values)) {
    builder.timestampUnit(*unit);
  }
  builder.unixTimestampOffset(unixTimestampOffsetFromMap(values));
  return builder.build();
}

DateTimeConfig DateTimeConfig::Builder::build() const {
  checkUnixTimestampOffset(unixTimestampOffset_);
  return DateTimeConfig(
      timestampUnit_.value_or(TimestampUnit::kInfer),
      overflowBehavior_.value_or(MicrosecondsPrecisionOverflowBehavior::kError),
      unixTimestampOffset_);
}

// static
DateTimeConfig DateTimeConfig::fromConfigMap(
    const std::unordered_map<std::string, std::string>& values) {
  Builder builder;
  if (auto unit = timestampUnitFromMap(values)) {
    builder.timestampUnit(*unit);
  }
  if (auto behavior = overflowBehaviorFromMap(values)) {
    builder.microsecondsPrecisionOverflowBehavior(*behavior);
  }
  builder.unixTimestampOffset(unixTimestampOffsetFromMap(values));
  return builder.build();
}

TimeConfig DateTimeConfig::timeConfig() const {
  return TimeConfig(overflowBehavior_, unixTimestampOffset_);
}

DateConfig DateTimeConfig::dateConfig() const {
  return DateConfig(timestampUnit_, unixTimestampOffset_);
}

} // namespace kairos
