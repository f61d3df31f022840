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

#include "operations/operation_tracker.h"

#include <absl/strings/str_join.h>
#include <absl/time/clock.h>

#include "basics/exceptions.h"
#include "basics/logger/logger.h"
#include "general_server/scheduler.h"

namespace cdb::operations {

std::shared_ptr<Operation> OperationTracker::Spawn(std::string description,
                                                   OperationWork work,
                                                   bool cancellable) {
  std::shared_ptr<Operation> operation;
  {
    absl::MutexLock lock{&_mutex};
    OperationId id{_next_id++};
    operation =
      std::make_shared<Operation>(id, std::move(description), cancellable);
    _operations.emplace(id, operation);
  }

  CDB_DEBUG("xxxxx", Logger::OPERATIONS, "spawning operation ",
            operation->id(), " '", operation->description(), "'");

  _scheduler
    .queueWithFuture([operation, work = std::move(work)] mutable {
      OperationContext context{*operation};
      if (auto r = context.checkpoint(); r.fail()) {
        return r;
      }
      return basics::SafeCall([&] { return work(context); });
    })
    .ThenInline([operation](Result&& r) {
      CDB_WARN_IF("xxxxx", Logger::OPERATIONS,
                  r.fail() && r.isNot(ERROR_REQUEST_CANCELED), "operation ",
                  operation->id(), " '", operation->description(),
                  "' failed: ", r.errorMessage());
      operation->finish(std::move(r));
    })
    .Detach();

  return operation;
}

std::shared_ptr<Operation> OperationTracker::Find(OperationId id) const {
  absl::MutexLock lock{&_mutex};
  auto it = _operations.find(id);
  return it == _operations.end() ? nullptr : it->second;
}

ResultOr<OperationInfo> OperationTracker::Get(OperationId id) const {
  auto operation = Find(id);
  if (!operation) {
    return std::unexpected<Result>{std::in_place,
                                   ERROR_SERVER_OPERATION_NOT_FOUND,
                                   "operation ", id, " not found"};
  }
  return operation->info();
}

std::vector<OperationInfo> OperationTracker::List() const {
  std::vector<std::shared_ptr<Operation>> operations;
  {
    absl::MutexLock lock{&_mutex};
    operations.reserve(_operations.size());
    for (const auto& [_, operation] : _operations) {
      operations.push_back(operation);
    }
  }
  std::vector<OperationInfo> infos;
  infos.reserve(operations.size());
  for (const auto& operation : operations) {
    infos.push_back(operation->info());
  }
  return infos;
}

ResultOr<CancelOutcome> OperationTracker::Cancel(OperationId id) {
  auto operation = Find(id);
  if (!operation) {
    return std::unexpected<Result>{std::in_place,
                                   ERROR_SERVER_OPERATION_NOT_FOUND,
                                   "operation ", id, " not found"};
  }
  if (operation->isDone()) {
    return CancelOutcome{
      .honored = false,
      .note = absl::StrCat("operation ", id, " already completed"),
    };
  }
  if (!operation->requestCancel()) {
    return CancelOutcome{
      .honored = false,
      .note = absl::StrCat("operation ", id, " '", operation->description(),
                           "' does not support cancellation"),
    };
  }
  CDB_INFO("xxxxx", Logger::OPERATIONS, "cancellation of operation ", id,
           " requested");
  return CancelOutcome{.honored = true, .note = {}};
}

Result OperationTracker::Acknowledge(OperationId id) {
  absl::MutexLock lock{&_mutex};
  auto it = _operations.find(id);
  if (it == _operations.end()) {
    return {ERROR_SERVER_OPERATION_NOT_FOUND, "operation ", id, " not found"};
  }
  if (!it->second->isDone()) {
    return {ERROR_SERVER_INVALID_STATE, "operation ", id,
            " is still running and cannot be acknowledged"};
  }
  _operations.erase(it);
  return {};
}

std::shared_ptr<Operation> OperationTracker::SpawnDummyJob(
  std::vector<absl::Duration> steps) {
  auto description =
    absl::StrCat("dummy job [",
                 absl::StrJoin(steps, ", ",
                               [](std::string* out, absl::Duration d) {
                                 absl::StrAppend(out, absl::FormatDuration(d));
                               }),
                 "]");
  return Spawn(
    std::move(description),
    [steps = std::move(steps)](OperationContext& context) -> Result {
      const auto total = steps.size();
      context.setProgress(0, total);
      for (size_t i = 0; i != total; ++i) {
        if (!context.sleepFor(steps[i])) {
          return context.checkpoint();
        }
        context.setProgress(i + 1, total);
      }
      return {};
    },
    /*cancellable=*/true);
}

bool OperationTracker::WaitAll(absl::Duration timeout) const {
  const auto deadline = absl::Now() + timeout;
  for (const auto& info : List()) {
    auto operation = Find(info.id);
    if (operation && !operation->wait(deadline - absl::Now())) {
      return false;
    }
  }
  return true;
}

}  // namespace cdb::operations
