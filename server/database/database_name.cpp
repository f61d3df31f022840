////////////////////////////////////////////////////////////////////////////////
/// DISCLAIMER
///
/// Copyright 2025 SereneDB GmbH, Berlin, Germany
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
/// Copyright holder is SereneDB GmbH, Berlin, Germany
////////////////////////////////////////////////////////////////////////////////

#include "database/database_name.h"

#include <absl/strings/ascii.h>

namespace cdb {
namespace {

bool IsAllowedChar(char c) noexcept {
  return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '_' ||
         c == '-';
}

Result ValidateName(std::string_view kind, std::string_view name) {
  if (name.empty()) {
    return {ERROR_SERVER_ILLEGAL_NAME, kind, " name must not be empty"};
  }
  if (name.size() > kMaxDatabaseNameLength) {
    return {ERROR_SERVER_ILLEGAL_NAME, kind, " name '", name,
            "' is longer than ", kMaxDatabaseNameLength, " characters"};
  }
  for (char c : name) {
    if (!IsAllowedChar(c)) {
      return {ERROR_SERVER_ILLEGAL_NAME, kind, " name '", name,
              "' contains illegal characters"};
    }
  }
  return {};
}

}  // namespace

Result ValidateDatabaseName(std::string_view name) {
  if (auto r = ValidateName("database", name); r.fail()) {
    return r;
  }
  if (name.front() == '_') {
    return {ERROR_SERVER_ILLEGAL_NAME, "database name '", name,
            "' must not start with '_'"};
  }
  return {};
}

Result ValidateTableName(std::string_view name) {
  return ValidateName("table", name);
}

}  // namespace cdb
