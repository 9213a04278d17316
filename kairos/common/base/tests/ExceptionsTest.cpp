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


#include <gtest/gtest.h>

#include "kairos/common/base/Exceptions.h"
#include "kairos/common/base/tests/GTestUtils.h"

namespace kairos {
namespace {

int32_t checkedMonth(int32_t month) {
  KAIROS_USER_CHECK(
      month >= 1 && month <= 12, "Month out of range: {}", month);
  return month;
}

TEST(ExceptionsTest, userCheck) {
  EXPECT_EQ(3, checkedMonth(3));
  KAIROS_ASSERT_USER_THROW(checkedMonth(13), "Month out of range: 13");
  EXPECT_THROW(checkedMonth(0), KairosUserError);
}

TEST(ExceptionsTest, runtimeCheck) {
  auto fail = [](int value) {
    KAIROS_CHECK(value > 0, "Expected a positive value, got {}", value);
    return value;
  };
  EXPECT_EQ(1, fail(1));
  KAIROS_ASSERT_RUNTIME_THROW(fail(-2), "Expected a positive value, got -2");
}

TEST(ExceptionsTest, exceptionContext) {
  try {
    KAIROS_USER_FAIL("Unable to build config: {}", "bad offset");
    FAIL() << "Expected an exception";
  } catch (const KairosUserError& e) {
    EXPECT_EQ("Unable to build config: bad offset", e.message());
    EXPECT_EQ(KairosException::Type::kUser, e.exceptionType());
    EXPECT_TRUE(e.failingExpression().empty());
    EXPECT_NE(std::string(e.what()).find("KairosUserError"), std::string::npos);
    EXPECT_NE(
        std::string(e.file()).find("ExceptionsTest.cpp"), std::string::npos);
  }

  try {
    checkedMonth(42);
    FAIL() << "Expected an exception";
  } catch (const KairosException& e) {
    EXPECT_EQ("month >= 1 && month <= 12", e.failingExpression());
    EXPECT_NE(
        std::string(e.what()).find("Expression: month >= 1 && month <= 12"),
        std::string::npos);
  }
}

TEST(ExceptionsTest, unreachable) {
  auto unreachable = []() -> int { KAIROS_UNREACHABLE(); };
  EXPECT_THROW(unreachable(), KairosRuntimeError);
}

} // namespace
} // namespace kairos
