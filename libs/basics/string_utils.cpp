////////////////////////////////////////////////////////////////////////////////
/// DISCLAIMER
///
/// Copyright 2014-2023 ArangoDB GmbH, Cologne, Germany
/// Copyright 2004-2014 triAGENS GmbH, Cologne, Germany
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is ArangoDB GmbH, Cologne, Germany
////////////////////////////////////////////////////////////////////////////////

#include "basics/string_utils.h"

#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include <charconv>
#include <iterator>
#include <system_error>

namespace cdb::basics::string_utils {
namespace {

constexpr char kHexChars[] = "0123456789ABCDEF";

bool IsUnreserved(char c) noexcept {
  return ('0' <= c && c <= '9') || ('a' <= c && c <= 'z') ||
         ('A' <= c && c <= 'Z') || c == '-' || c == '_' || c == '~';
}

}  // namespace

std::string UrlEncode(std::string_view value) {
  std::string result;
  result.reserve(value.size());
  for (char c : value) {
    if (IsUnreserved(c)) {
      result.push_back(c);
    } else {
      auto n = static_cast<uint8_t>(c);
      result.push_back('%');
      result.push_back(kHexChars[n >> 4]);
      result.push_back(kHexChars[n & 0x0F]);
    }
  }
  return result;
}

std::string UrlDecodePath(std::string_view value) {
  std::string result;
  result.reserve(value.size());

  const char* src = value.data();
  const char* end = src + value.size();
  while (src < end) {
    if (*src != '%') {
      result.push_back(*src++);
      continue;
    }
    if (end - src < 3) {
      // truncated escape
      ++src;
      continue;
    }
    int h1 = Hex2int(src[1], -1);
    int h2 = Hex2int(src[2], -1);
    if (h1 == -1 || h2 == -1) {
      ++src;
      continue;
    }
    result.push_back(static_cast<char>(h1 << 4 | h2));
    src += 3;
  }
  return result;
}

ResultOr<uint64_t> TryUint64(std::string_view value) noexcept {
  uint64_t result = 0;
  const char* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, result, 10);
  if (ec == std::errc()) {
    if (ptr != end) {
      return std::unexpected<Result>{std::in_place, ERROR_ILLEGAL_NUMBER};
    }
    return result;
  }
  return std::unexpected<Result>{std::in_place, ERROR_ILLEGAL_NUMBER,
                                 make_error_condition(ec).message()};
}

std::string EncodeHex(std::string_view value) {
  return absl::BytesToHexString(value);
}

std::string DecodeHex(std::string_view value) {
  if (std::string r; absl::HexStringToBytes(value, &r)) {
    return r;
  }
  return {};
}

std::string_view Trim(std::string_view value, std::string_view trim) {
  auto first = value.find_first_not_of(trim);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = value.find_last_not_of(trim);
  return value.substr(first, last - first + 1);
}

std::string FormatSize(uint64_t value) {
  if (value == 1) {
    return "1 byte";
  }
  if (value < 1000) {
    return absl::StrCat(value, " bytes");
  }
  constexpr std::string_view kLabels[] = {"KB", "MB", "GB", "TB", "PB"};
  double scaled = static_cast<double>(value) / 1000.0;
  size_t label = 0;
  while (scaled >= 1000.0 && label + 1 < std::size(kLabels)) {
    scaled /= 1000.0;
    ++label;
  }
  return absl::StrFormat("%.1f %s", scaled, kLabels[label]);
}

}  // namespace cdb::basics::string_utils
