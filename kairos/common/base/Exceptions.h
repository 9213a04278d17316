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
#include <exception>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <folly/Likely.h>

namespace kairos {

/// Base class of every exception raised by kairos. Parsing never throws: it
/// reports malformed input through ParseError. Exceptions are reserved for
/// misuse of the API (invalid explicit field values, bad configuration) and
/// for broken internal invariants.
class KairosException : public std::exception {
 public:
  enum class Type : int8_t {
    // Caused by the caller, e.g. an out of range field passed to a
    // constructor.
    kUser = 0,
    // Internal invariant violated.
    kSystem = 1,
  };

  KairosException(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string message,
      Type type);

  const char* what() const noexcept override {
    return what_.c_str();
  }

  const std::string& message() const {
    return message_;
  }

  const std::string& failingExpression() const {
    return failingExpression_;
  }

  const char* file() const {
    return file_;
  }

  size_t line() const {
    return line_;
  }

  const char* function() const {
    return function_;
  }

  Type exceptionType() const {
    return type_;
  }

 private:
  const char* file_;
  size_t line_;
  const char* function_;
  std::string failingExpression_;
  std::string message_;
  Type type_;
  std::string what_;
};

class KairosUserError : public KairosException {
 public:
  KairosUserError(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string message)
      : KairosException(
            file,
            line,
            function,
            failingExpression,
            std::move(message),
            Type::kUser) {}
};

class KairosRuntimeError : public KairosException {
 public:
  KairosRuntimeError(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string message)
      : KairosException(
            file,
            line,
            function,
            failingExpression,
            std::move(message),
            Type::kSystem) {}
};

namespace detail {

struct KairosCheckFailArgs {
  const char* file;
  size_t line;
  const char* function;
  const char* expression;
};

// Out of line so that the throwing path stays off the callers' hot path.
template <typename Exception>
[[noreturn]] void kairosCheckFail(
    const KairosCheckFailArgs& args,
    std::string message);

extern template void kairosCheckFail<KairosUserError>(
    const KairosCheckFailArgs& args,
    std::string message);
extern template void kairosCheckFail<KairosRuntimeError>(
    const KairosCheckFailArgs& args,
    std::string message);

} // namespace detail
} // namespace kairos

#define _KAIROS_THROW_IMPL(exception, exprStr, ...)                   \
  do {                                                                \
    static constexpr ::kairos::detail::KairosCheckFailArgs            \
        kairosCheckFailArgs = {__FILE__, __LINE__, __FUNCTION__, exprStr}; \
    ::kairos::detail::kairosCheckFail<exception>(                     \
        kairosCheckFailArgs, ::fmt::format(__VA_ARGS__));             \
  } while (0)

#define _KAIROS_CHECK_IMPL(exception, expr, ...)                \
  do {                                                          \
    if (FOLLY_UNLIKELY(!(expr))) {                              \
      _KAIROS_THROW_IMPL(exception, #expr, __VA_ARGS__);        \
    }                                                           \
  } while (0)

#define KAIROS_USER_CHECK(expr, ...) \
  _KAIROS_CHECK_IMPL(::kairos::KairosUserError, expr, __VA_ARGS__)

#define KAIROS_USER_FAIL(...) \
  _KAIROS_THROW_IMPL(::kairos::KairosUserError, "", __VA_ARGS__)

#define KAIROS_CHECK(expr, ...) \
  _KAIROS_CHECK_IMPL(::kairos::KairosRuntimeError, expr, __VA_ARGS__)

#define KAIROS_FAIL(...) \
  _KAIROS_THROW_IMPL(::kairos::KairosRuntimeError, "", __VA_ARGS__)

#define KAIROS_UNREACHABLE() \
  KAIROS_FAIL("Unreachable code reached in {}", __func__)

#ifndef NDEBUG
#define KAIROS_DCHECK(expr, ...) KAIROS_CHECK(expr, __VA_ARGS__)
#else
#define KAIROS_DCHECK(expr, ...) KAIROS_CHECK(true || (expr), __VA_ARGS__)
#endif

#define KAIROS_USER_CHECK_GE(a, b, ...) \
  KAIROS_USER_CHECK((a) >= (b), __VA_ARGS__)
