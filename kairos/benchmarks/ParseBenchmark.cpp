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


#include <string>
#include <vector>

#include <folly/Benchmark.h>
#include <folly/init/Init.h>
#include <folly/logging/xlog.h>

#include "kairos/type/Date.h"
#include "kairos/type/DateTime.h"
#include "kairos/type/Duration.h"
#include "kairos/type/Time.h"

namespace {

const std::vector<std::string> kDates = {
    "2022-06-08", "1999-12-31", "0001-01-01", "9999-12-31", "2024-02-29"};

const std::vector<std::string> kTimes = {
    "12:13:14", "00:00:00.000001", "23:59:59.999999+08:00", "07:30Z"};

const std::vector<std::string> kDateTimes = {
    "2022-06-08T12:13:14Z",
    "2022-06-08 12:13:14.123456+05:30",
    "1999-12-31T23:59:59",
    "1654646400",
    "1654646400123.5"};

const std::vector<std::string> kDurations = {
    "P1Y2M3DT4H5M6.7S", "26:00:00", "-1 day, 02:00:00", "PT0.000001S"};

template <typename T>
size_t parseAll(size_t iters, const std::vector<std::string>& inputs) {
  size_t parsed = 0;
  for (size_t i = 0; i < iters; ++i) {
    for (const auto& input : inputs) {
      auto result = T::parse(input);
      parsed += result.hasValue();
      folly::doNotOptimizeAway(result);
    }
  }
  return parsed;
}

template <typename T>
void formatAll(size_t iters, const std::vector<std::string>& inputs) {
  std::vector<T> values;
  BENCHMARK_SUSPEND {
    for (const auto& input : inputs) {
      values.push_back(T::parse(input).value());
    }
  }
  for (size_t i = 0; i < iters; ++i) {
    for (const auto& value : values) {
      auto text = value.toString();
      folly::doNotOptimizeAway(text);
    }
  }
}

BENCHMARK(parseDate, iters) {
  folly::doNotOptimizeAway(parseAll<kairos::Date>(iters, kDates));
}

BENCHMARK_RELATIVE(parseTime, iters) {
  folly::doNotOptimizeAway(parseAll<kairos::Time>(iters, kTimes));
}

BENCHMARK_RELATIVE(parseDateTime, iters) {
  folly::doNotOptimizeAway(parseAll<kairos::DateTime>(iters, kDateTimes));
}

BENCHMARK_RELATIVE(parseDuration, iters) {
  folly::doNotOptimizeAway(parseAll<kairos::Duration>(iters, kDurations));
}

BENCHMARK_DRAW_LINE();

BENCHMARK(formatDateTime, iters) {
  formatAll<kairos::DateTime>(iters, kDateTimes);
}

BENCHMARK_RELATIVE(formatDuration, iters) {
  formatAll<kairos::Duration>(iters, kDurations);
}

} // namespace

int main(int argc, char** argv) {
  folly::Init init{&argc, &argv};
  const auto inputs =
      kDates.size() + kTimes.size() + kDateTimes.size() + kDurations.size();
  XLOG(INFO) << "Parsing " << inputs << " inputs per iteration";
  folly::runBenchmarks();
  return 0;
}
