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

#include "basics/debugging.h"

#include <absl/algorithm/container.h>
#include <absl/container/flat_hash_set.h>
#include <absl/synchronization/mutex.h>

#include <atomic>

#include "basics/logger/logger.h"

#ifdef CDB_FAULT_INJECTION
namespace cdb {
namespace {

std::atomic_bool gHasFailurePoints{false};

constinit absl::Mutex gFailurePointsLock{absl::kConstInit};

absl::flat_hash_set<std::string> gFailurePoints
  ABSL_GUARDED_BY(gFailurePointsLock);

}  // namespace

bool ShouldFail(std::string_view value) noexcept {
  if (gHasFailurePoints.load(std::memory_order_relaxed)) {
    absl::ReaderMutexLock read_locker{&gFailurePointsLock};
    return gFailurePoints.contains(value);
  }
  return false;
}

bool AddFailurePoint(std::string_view value) {
  bool added = false;
  {
    absl::WriterMutexLock write_locker{&gFailurePointsLock};
    added = gFailurePoints.emplace(value).second;
    gHasFailurePoints.store(true, std::memory_order_relaxed);
  }
  if (added) {
    CDB_WARN("xxxxx", Logger::FIXME, "activating intentional failure point '",
             value, "'. the server will misbehave!");
  }
  return added;
}

bool RemoveFailurePoint(std::string_view value) {
  bool removed = false;
  {
    absl::WriterMutexLock write_locker{&gFailurePointsLock};
    removed = gFailurePoints.erase(value) != 0;
    if (gFailurePoints.empty()) {
      gHasFailurePoints.store(false, std::memory_order_relaxed);
    }
  }
  if (removed) {
    CDB_DEBUG("xxxxx", Logger::FIXME, "cleared failure point ", value);
  }
  return removed;
}

void ClearFailurePoints() noexcept {
  absl::WriterMutexLock write_locker{&gFailurePointsLock};
  gFailurePoints.clear();
  gHasFailurePoints.store(false, std::memory_order_relaxed);
}

std::vector<std::string> GetFailurePoints() {
  std::vector<std::string> result;
  {
    absl::ReaderMutexLock read_locker{&gFailurePointsLock};
    result.assign(gFailurePoints.begin(), gFailurePoints.end());
  }
  absl::c_sort(result);
  return result;
}

}  // namespace cdb
#endif
