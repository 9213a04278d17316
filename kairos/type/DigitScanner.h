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

#include <cstddef>
#include <cstdint>

#include <folly/Unit.h>

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/ParseConfig.h"
#include "kairos/type/ParseError.h"

/// Allocation-free scanning of decimal fields, shared by the Date, Time,
/// DateTime and Duration parsers. Every function reads from `buf[pos, len)`
/// and advances `pos` past what it consumed. On failure `pos` is left
/// untouched and the error carries the offset of the offending byte.
namespace kairos::util {

inline bool characterIsDigit(char c) {
  return c >= '0' && c <= '9';
}

/// Returns the number of consecutive digits starting at `pos`.
inline size_t countDigits(const char* buf, size_t len, size_t pos) {
  size_t end = pos;
  while (end < len && characterIsDigit(buf[end])) {
    ++end;
  }
  return end - pos;
}

/// Reads at least `minDigits` and at most `maxDigits` digits. Digits past
/// `maxDigits` are left for the caller. Fails with kTooShort if the input
/// ends before `minDigits` digits were read, kInvalidCharacter if a non-digit
/// is found instead.
inline ParseResult<uint64_t> scanDigits(
    const char* buf,
    size_t len,
    size_t& pos,
    int32_t minDigits,
    int32_t maxDigits) {
  KAIROS_DCHECK(
      minDigits <= maxDigits && maxDigits <= 19,
      "Invalid digit bounds [{}, {}]",
      minDigits,
      maxDigits);
  uint64_t value = 0;
  size_t cursor = pos;
  int32_t count = 0;
  while (count < maxDigits && cursor < len && characterIsDigit(buf[cursor])) {
    value = value * 10 + (buf[cursor] - '0');
    ++cursor;
    ++count;
  }
  if (count < minDigits) {
    return parseError(
        cursor >= len ? ParseErrorKind::kTooShort
                      : ParseErrorKind::kInvalidCharacter,
        cursor);
  }
  pos = cursor;
  return value;
}

/// Reads exactly `digits` digits.
inline ParseResult<uint64_t>
scanFixedDigits(const char* buf, size_t len, size_t& pos, int32_t digits) {
  return scanDigits(buf, len, pos, digits, digits);
}

/// Expects `expected` at `pos` and consumes it.
inline ParseResult<folly::Unit>
scanSeparator(const char* buf, size_t len, size_t& pos, char expected) {
  if (pos >= len) {
    return parseError(ParseErrorKind::kTooShort, pos);
  }
  if (buf[pos] != expected) {
    return parseError(ParseErrorKind::kInvalidCharacter, pos);
  }
  ++pos;
  return folly::unit;
}

inline bool isDecimalMark(char c) {
  return c == '.' || c == ',';
}

/// Reads the digits that follow a decimal mark, `pos` pointing just past the
/// mark. The result is scaled to `maxDigits` digits, e.g. "5" with 6 digits
/// is 500000. Extra digits are dropped under kTruncate, and fail with
/// `tooLongKind` at the first extra digit under kError.
inline ParseResult<uint32_t> scanFraction(
    const char* buf,
    size_t len,
    size_t& pos,
    int32_t maxDigits,
    MicrosecondsPrecisionOverflowBehavior overflowBehavior,
    ParseErrorKind tooLongKind = ParseErrorKind::kSecondFractionTooLong) {
  const auto numDigits = countDigits(buf, len, pos);
  if (numDigits == 0) {
    return parseError(ParseErrorKind::kSecondFractionMissing, pos);
  }
  if (numDigits > static_cast<size_t>(maxDigits) &&
      overflowBehavior == MicrosecondsPrecisionOverflowBehavior::kError) {
    return parseError(tooLongKind, pos + maxDigits);
  }
  uint32_t value = 0;
  int32_t i = 0;
  for (; i < maxDigits; ++i) {
    value *= 10;
    if (static_cast<size_t>(i) < numDigits) {
      value += buf[pos + i] - '0';
    }
  }
  pos += numDigits;
  return value;
}

/// Consumes the UTF-8 encoding of U+2212 MINUS SIGN if present at `pos`.
inline bool scanUnicodeMinus(const char* buf, size_t len, size_t& pos) {
  if (pos + 2 < len && static_cast<unsigned char>(buf[pos]) == 0xE2 &&
      static_cast<unsigned char>(buf[pos + 1]) == 0x88 &&
      static_cast<unsigned char>(buf[pos + 2]) == 0x92) {
    pos += 3;
    return true;
  }
  return false;
}

} // namespace kairos::util
