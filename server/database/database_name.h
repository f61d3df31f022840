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

#pragma once

#include <string_view>

#include "basics/result.h"

namespace cdb {

inline constexpr size_t kMaxDatabaseNameLength = 64;

// ASCII letters, digits, '_' and '-', 1 to 64 characters, no leading '_'
Result ValidateDatabaseName(std::string_view name);

// table names follow the same character set, without the leading '_' rule
Result ValidateTableName(std::string_view name);

}  // namespace cdb
