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


#include "kairos/common/base/Exceptions.h"

#include <folly/logging/xlog.h>

namespace kairos {

namespace {

std::string buildWhat(
    const char* file,
    size_t line,
    const char* function,
    std::string_view failingExpression,
    const std::string& message,
    KairosException::Type type) {
  std::string what = fmt::format(
      "Exception: {}\nError Source: {}\nReason: {}\n",
      type == KairosException::Type::kUser ? "KairosUserError"
                                           : "KairosRuntimeError",
      type == KairosException::Type::kUser ? "USER" : "RUNTIME",
      message);
  if (!failingExpression.empty()) {
    what += fmt::format("Expression: {}\n", failingExpression);
  }
  what += fmt::format("File: {}\nLine: {}\nFunction: {}", file, line, function);
  return what;
}

} // namespace

KairosException::KairosException(
    const char* file,
    size_t line,
    const char* function,
    std::string_view failingExpression,
    std::string message,
    Type type)
    : file_(file),
      line_(line),
      function_(function),
      failingExpression_(failingExpression),
      message_(std::move(message)),
      type_(type),
      what_(buildWhat(
          file,
          line,
          function,
          failingExpression,
          message_,
          type)) {}

namespace detail {

template <typename Exception>
void kairosCheckFail(const KairosCheckFailArgs& args, std::string message) {
  XLOG(DBG1) << "Check failed at " << args.file << ":" << args.line << " ("
             << args.function << "): " << message;
  throw Exception(
      args.file, args.line, args.function, args.expression, std::move(message));
}

template void kairosCheckFail<KairosUserError>(
    const KairosCheckFailArgs& args,
    std::string message);
template void kairosCheckFail<KairosRuntimeError>(
    const KairosCheckFailArgs& args,
    std::string message);

} // namespace detail
} // namespace kairos
