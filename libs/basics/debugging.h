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

#include <string>
#include <string_view>
#include <vector>

/// macro CDB_IF_FAILURE
/// lets tests make the server fail at named locations. the points at which a
/// failure is actually triggered are registered at runtime with
/// AddFailurePoint().
#ifdef CDB_FAULT_INJECTION

#define CDB_IF_FAILURE(what) if (::cdb::ShouldFail(what))

#else

#define CDB_IF_FAILURE(what) if constexpr (false)

#endif

namespace cdb {

#ifdef CDB_FAULT_INJECTION
bool ShouldFail(std::string_view value) noexcept;
bool AddFailurePoint(std::string_view value);
bool RemoveFailurePoint(std::string_view value);
void ClearFailurePoints() noexcept;
std::vector<std::string> GetFailurePoints();
#else
constexpr bool ShouldFail(std::string_view) noexcept { return false; }
constexpr bool AddFailurePoint(std::string_view) noexcept { return false; }
constexpr bool RemoveFailurePoint(std::string_view) noexcept { return false; }
constexpr void ClearFailurePoints() noexcept {}
inline std::vector<std::string> GetFailurePoints() { return {}; }
#endif

constexpr bool CanUseFailurePoints() {
#ifdef CDB_FAULT_INJECTION
  return true;
#else
  return false;
#endif
}

// activates a failure point for the lifetime of the guard
class FailurePointGuard {
 public:
  explicit FailurePointGuard(std::string_view name) : _name{name} {
    AddFailurePoint(_name);
  }
  ~FailurePointGuard() { RemoveFailurePoint(_name); }

  FailurePointGuard(const FailurePointGuard&) = delete;
  FailurePointGuard& operator=(const FailurePointGuard&) = delete;

 private:
  std::string _name;
};

}  // namespace cdb
