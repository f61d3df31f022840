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

#include "operations/operation.h"

#include <absl/time/clock.h>

#include "basics/assert.h"
#include "basics/errors.h"

namespace cdb::operations {

std::string_view OperationStatusName(OperationStatus status) noexcept {
  switch (status) {
    case OperationStatus::Running:
      return "Running";
    case OperationStatus::Success:
      return "Success";
    case OperationStatus::Failed:
      return "Failed";
    case OperationStatus::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

Operation::Operation(OperationId id, std::string description, bool cancellable)
  : _id{id},
    _description{std::move(description)},
    _cancellable{cancellable},
    _started{absl::Now()} {}

OperationInfo Operation::info() const {
  absl::MutexLock lock{&_mutex};
  OperationInfo info;
  info.id = _id;
  info.description = _description;
  info.status = _status;
  if (_status == OperationStatus::Failed) {
    info.error = _result.errorMessage();
  }
  info.done = _done;
  info.total = _total;
  info.cancellable = _cancellable;
  info.cancel_requested = _cancel_requested;
  info.started = _started;
  info.finished = _finished;
  return info;
}

OperationStatus Operation::status() const {
  absl::MutexLock lock{&_mutex};
  return _status;
}

bool Operation::isDone() const { return status() != OperationStatus::Running; }

Result Operation::result() const {
  absl::MutexLock lock{&_mutex};
  return _result.clone();
}

bool Operation::requestCancel() {
  if (!_cancellable) {
    return false;
  }
  absl::MutexLock lock{&_mutex};
  _cancel_requested = true;
  return true;
}

bool Operation::isCancelRequested() const {
  absl::MutexLock lock{&_mutex};
  return _cancel_requested;
}

void Operation::setProgress(uint64_t done, uint64_t total) {
  absl::MutexLock lock{&_mutex};
  _done = done;
  _total = total;
}

bool Operation::wait(absl::Duration timeout) const {
  absl::MutexLock lock{&_mutex};
  auto done = [this]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex) {
    return _status != OperationStatus::Running;
  };
  return _mutex.AwaitWithTimeout(absl::Condition{&done}, timeout);
}

bool Operation::waitForCancel(absl::Duration timeout) const {
  absl::MutexLock lock{&_mutex};
  return _mutex.AwaitWithTimeout(absl::Condition{&_cancel_requested}, timeout);
}

void Operation::finish(Result&& result) {
  absl::MutexLock lock{&_mutex};
  CDB_ASSERT(_status == OperationStatus::Running);
  if (result.ok()) {
    _status = OperationStatus::Success;
    if (_total == 0) {
      _total = 1;
    }
    _done = _total;
  } else if (result.is(ERROR_REQUEST_CANCELED) && _cancel_requested) {
    _status = OperationStatus::Cancelled;
  } else {
    _status = OperationStatus::Failed;
  }
  _result = std::move(result);
  _finished = absl::Now();
}

Result OperationContext::checkpoint() const {
  if (isCancelled()) {
    return {ERROR_REQUEST_CANCELED, "operation '",
            _operation.description(), "' was cancelled"};
  }
  return {};
}

}  // namespace cdb::operations
