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

#include <absl/container/btree_map.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include <memory>
#include <string>
#include <vector>

#include "basics/result_or.h"
#include "operations/operation.h"

namespace cdb {

class Scheduler;

namespace operations {

struct CancelOutcome {
  bool honored = false;
  // explains why a request was not honored
  std::string note;
};

// Registers long running jobs on the scheduler and keeps their status until
// the caller acknowledges them.
class OperationTracker {
 public:
  explicit OperationTracker(Scheduler& scheduler) noexcept
    : _scheduler{scheduler} {}

  OperationTracker(const OperationTracker&) = delete;
  OperationTracker& operator=(const OperationTracker&) = delete;

  // never blocks on `work`. failures of the work, thrown or returned, end up
  // in the status of the returned operation
  std::shared_ptr<Operation> Spawn(std::string description, OperationWork work,
                                   bool cancellable = false);

  std::shared_ptr<Operation> Find(OperationId id) const;
  ResultOr<OperationInfo> Get(OperationId id) const;

  // ordered by id
  std::vector<OperationInfo> List() const;

  ResultOr<CancelOutcome> Cancel(OperationId id);

  Result Acknowledge(OperationId id);

  // cancellable job sleeping for each of `steps`, used to exercise the
  // tracker from the control surface
  std::shared_ptr<Operation> SpawnDummyJob(std::vector<absl::Duration> steps);

  // waits until every retained operation finished. returns false on timeout
  bool WaitAll(absl::Duration timeout) const;

 private:
  Scheduler& _scheduler;

  mutable absl::Mutex _mutex;
  uint64_t _next_id ABSL_GUARDED_BY(_mutex) = 1;
  absl::btree_map<OperationId, std::shared_ptr<Operation>> _operations
    ABSL_GUARDED_BY(_mutex);
};

}  // namespace operations
}  // namespace cdb
