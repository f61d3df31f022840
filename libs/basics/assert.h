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

#include <absl/strings/str_cat.h>

#include <source_location>
#include <string_view>

namespace cdb::basics {

[[noreturn]] void AssertionFailed(std::string_view expr, std::string_view message,
                                  std::source_location location) noexcept;

}  // namespace cdb::basics

#ifdef CDB_DEV

#define CDB_ASSERT(expr, ...)                                        \
  do {                                                               \
    if (!(expr)) [[unlikely]] {                                      \
      ::cdb::basics::AssertionFailed(#expr, absl::StrCat(__VA_ARGS__), \
                                     std::source_location::current()); \
    }                                                                \
  } while (false)

#else

#define CDB_ASSERT(expr, ...) \
  while (false) {             \
    (void)(expr);             \
  }                           \
  do {                        \
  } while (false)

#endif
