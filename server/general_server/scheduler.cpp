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

#include "general_server/scheduler.h"

#include <folly/executors/thread_factory/NamedThreadFactory.h>

#include <algorithm>
#include <exception>

#include "basics/assert.h"
#include "basics/debugging.h"
#include "basics/logger/logger.h"

namespace cdb {

Scheduler::Scheduler(uint64_t num_threads)
  : _num_threads{std::max<uint64_t>(num_threads, 1)} {}

Scheduler::~Scheduler() { shutdown(); }

bool Scheduler::start() {
  CDB_ASSERT(!_executor);
  _executor = std::make_unique<folly::CPUThreadPoolExecutor>(
    _num_threads, std::make_shared<folly::NamedThreadFactory>("Scheduler"));
  _running.store(true, std::memory_order_release);
  CDB_DEBUG("xxxxx", Logger::THREADS, "scheduler started with ", _num_threads,
            " threads");
  return true;
}

void Scheduler::shutdown() {
  if (!_running.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  // drains queued work before joining
  _executor->join();
  CDB_DEBUG("xxxxx", Logger::THREADS, "scheduler stopped");
}

bool Scheduler::queue(folly::Func func) noexcept {
  if (!isRunning()) {
    CDB_WARN("xxxxx", Logger::THREADS,
             "dropping work item, scheduler is not running");
    return false;
  }
  CDB_IF_FAILURE("Scheduler::queue") {
    CDB_WARN("xxxxx", Logger::THREADS,
             "dropping work item, executor rejected it");
    return false;
  }
  try {
    _executor->add(std::move(func));
    return true;
  } catch (const std::exception& e) {
    CDB_ERROR("xxxxx", Logger::THREADS, "unable to queue work item: ",
              e.what());
    return false;
  }
}

}  // namespace cdb
