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

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "basics/result_or.h"

namespace cdb::basics::string_utils {

// percent-encodes everything except [A-Za-z0-9-_~], so the result is safe
// to use as a single path segment of an object store key
std::string UrlEncode(std::string_view value);

// reverses UrlEncode. malformed escapes are dropped
std::string UrlDecodePath(std::string_view value);

inline int Hex2int(char ch, int error_value = 0) {
  if ('0' <= ch && ch <= '9') {
    return ch - '0';
  } else if ('A' <= ch && ch <= 'F') {
    return ch - 'A' + 10;
  } else if ('a' <= ch && ch <= 'f') {
    return ch - 'a' + 10;
  }
  return error_value;
}

ResultOr<uint64_t> TryUint64(std::string_view value) noexcept;

std::string EncodeHex(std::string_view value);
std::string DecodeHex(std::string_view value);

std::string_view Trim(std::string_view value,
                      std::string_view trim = " \t\n\r");

/// human readable byte count, e.g. "1.5 MB"
std::string FormatSize(uint64_t value);

}  // namespace cdb::basics::string_utils
