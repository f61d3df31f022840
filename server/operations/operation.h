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

#include <absl/functional/any_invocable.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "basics/identifier.h"
#include "basics/result.h"

namespace cdb::operations {

class OperationId : public basics::Identifier {
 public:
  using Identifier::Identifier;
};

enum class OperationStatus : uint8_t {
  Running,
  Success,
  Failed,
  Cancelled,
};

std::string_view OperationStatusName(OperationStatus status) noexcept;

// copy of the observable state of an operation at one instant
struct OperationInfo {
  OperationId id;
  std::string description;
  OperationStatus status = OperationStatus::Running;
  // reason of a Failed operation
  std::string error;
  uint64_t done = 0;
  uint64_t total = 0;
  bool cancellable = false;
  bool cancel_requested = false;
  absl::Time started;
  absl::Time finished = absl::InfiniteFuture();
};

class Operation {
 public:
  Operation(OperationId id, std::string description, bool cancellable);

  OperationId id() const noexcept { return _id; }
  std::string_view description() const noexcept { return _description; }
  bool cancellable() const noexcept { return _cancellable; }

  OperationInfo info() const;
  OperationStatus status() const;
  bool isDone() const;

  // result of a completed operation, ok while running
  Result result() const;

  // returns false if the operation cannot observe the request
  bool requestCancel();
  bool isCancelRequested() const;

  void setProgress(uint64_t done, uint64_t total);

  // blocks until the operation completed or the timeout expired.
  // returns true if it completed
  bool wait(absl::Duration timeout) const;

  // blocks until cancellation was requested or the timeout expired.
  // returns true if cancellation was requested
  bool waitForCancel(absl::Duration timeout) const;

  // called exactly once by the tracker with the outcome of the work
  void finish(Result&& result);

 private:
  const OperationId _id;
  const std::string _description;
  const bool _cancellable;
  const absl::Time _started;

  mutable absl::Mutex _mutex;
  OperationStatus _status ABSL_GUARDED_BY(_mutex) = OperationStatus::Running;
  Result _result ABSL_GUARDED_BY(_mutex);
  uint64_t _done ABSL_GUARDED_BY(_mutex) = 0;
  uint64_t _total ABSL_GUARDED_BY(_mutex) = 0;
  bool _cancel_requested ABSL_GUARDED_BY(_mutex) = false;
  absl::Time _finished ABSL_GUARDED_BY(_mutex) = absl::InfiniteFuture();
};

// handed to the work of an operation
class OperationContext {
 public:
  explicit OperationContext(Operation& operation) noexcept
    : _operation{operation} {}

  bool isCancelled() const { return _operation.isCancelRequested(); }

  // ERROR_REQUEST_CANCELED once cancellation was requested
  Result checkpoint() const;

  void setProgress(uint64_t done, uint64_t total) {
    _operation.setProgress(done, total);
  }

  // sleeps for `duration` unless cancelled earlier. returns false on cancel
  bool sleepFor(absl::Duration duration) const {
    return !_operation.waitForCancel(duration);
  }

  const Operation& operation() const noexcept { return _operation; }

 private:
  Operation& _operation;
};

using OperationWork = absl::AnyInvocable<Result(OperationContext&)>;

}  // namespace cdb::operations
