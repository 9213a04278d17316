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

#include <gtest/gtest.h>

#include "kairos/common/base/Exceptions.h"

// Asserts that `expression` throws a KairosException whose message contains
// `errorMessage`.
#define KAIROS_ASSERT_THROW_IMPL(_type, _expression, _errorMessage)        \
  try {                                                                    \
    (_expression);                                                         \
    FAIL() << "Expected an exception";                                     \
  } catch (const _type& e) {                                               \
    ASSERT_TRUE(e.message().find(_errorMessage) != std::string::npos)      \
        << "Expected error message to contain '" << (_errorMessage)        \
        << "', but received '" << e.message() << "'.";                     \
  }

#define KAIROS_ASSERT_THROW(_expression, _errorMessage) \
  KAIROS_ASSERT_THROW_IMPL(                             \
      ::kairos::KairosException, _expression, _errorMessage)

#define KAIROS_ASSERT_USER_THROW(_expression, _errorMessage) \
  KAIROS_ASSERT_THROW_IMPL(                                  \
      ::kairos::KairosUserError, _expression, _errorMessage)

#define KAIROS_ASSERT_RUNTIME_THROW(_expression, _errorMessage) \
  KAIROS_ASSERT_THROW_IMPL(                                     \
      ::kairos::KairosRuntimeError, _expression, _errorMessage)
