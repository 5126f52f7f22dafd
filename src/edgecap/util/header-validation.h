// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/common.h>
#include <kj/parse/char.h>
#include <kj/string.h>

namespace edgecap::util {

constexpr auto HTTP_SEPARATOR_CHARS = kj::parse::anyOfChars("()<>@,;:\\\"/[]?={} \t");
// RFC2616 section 2.2: https://www.w3.org/Protocols/rfc2616/rfc2616-sec2.html#sec2.2

constexpr auto HTTP_TOKEN_CHARS = kj::parse::controlChar.orChar('\x7f')
                                      .orGroup(kj::parse::whitespaceChar)
                                      .orGroup(HTTP_SEPARATOR_CHARS)
                                      .invert();

inline constexpr bool isHttpTokenChar(char c) {
  return HTTP_TOKEN_CHARS.contains(c);
}
static_assert(isHttpTokenChar('A'));
static_assert(isHttpTokenChar('-'));
static_assert(!isHttpTokenChar(':'));

// A header name is a non-empty token.
inline bool isValidHeaderName(kj::ArrayPtr<const char> name) {
  if (name.size() == 0) return false;
  for (auto c: name) {
    if (!isHttpTokenChar(c)) return false;
  }
  return true;
}

// Values may contain anything except the bytes that would let them break out of the header line.
inline bool isValidHeaderValue(kj::ArrayPtr<const char> value) {
  for (auto c: value) {
    if (c == '\0' || c == '\r' || c == '\n') {
      return false;
    }
  }
  return true;
}

// HTTP statuses are three digits.
inline constexpr bool isValidStatusCode(uint status) {
  return status >= 100 && status <= 999;
}
static_assert(isValidStatusCode(200));
static_assert(!isValidStatusCode(42));

}  // namespace edgecap::util
