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

#include <folly/executors/CPUThreadPoolExecutor.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>
#include <yaclib/async/contract.hpp>
#include <yaclib/async/make.hpp>

#include "basics/errors.h"

namespace cdb {
namespace detail {

template<typename R>
void SetStopped(yaclib::Promise<R>& promise) {
  if constexpr (std::is_constructible_v<R, ErrorCode, std::string_view>) {
    std::move(promise).Set(
      R{ERROR_SHUTTING_DOWN, std::string_view{"scheduler is stopped"}});
  }
}

// fulfills its promise with ERROR_SHUTTING_DOWN when it is destroyed
// without having run, e.g. when the executor drops it
template<typename Func, typename R>
class PromisedWork {
 public:
  PromisedWork(yaclib::Promise<R> promise, Func func)
    : _promise{std::move(promise)}, _func{std::move(func)} {}

  PromisedWork(PromisedWork&&) = default;
  PromisedWork& operator=(PromisedWork&&) = delete;

  ~PromisedWork() {
    if (_promise.Valid()) {
      SetStopped(_promise);
    }
  }

  void operator()() {
    if constexpr (std::is_void_v<R>) {
      _func();
      std::move(_promise).Set();
    } else {
      std::move(_promise).Set(_func());
    }
  }

 private:
  yaclib::Promise<R> _promise;
  Func _func;
};

}  // namespace detail

// shared worker pool for all tracked operations of the server
class Scheduler {
 public:
  explicit Scheduler(uint64_t num_threads);

  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // push an item onto the queue. returns false if the scheduler is not
  // running, the item is then dropped
  [[nodiscard]] bool queue(folly::Func func) noexcept;

  // runs `func` on a worker and fulfills the returned future with its
  // result. results that can carry an error code are fulfilled with
  // ERROR_SHUTTING_DOWN if the work never runs
  template<typename Func, typename R = std::invoke_result_t<Func>>
  yaclib::Future<R> queueWithFuture(Func&& func) {
    auto [f, p] = yaclib::MakeContract<R>();
    if (!isRunning()) {
      detail::SetStopped(p);
      return std::move(f);
    }
    // a dropped item resolves the future from its destructor
    std::ignore = queue(detail::PromisedWork<std::decay_t<Func>, R>{
      std::move(p), std::forward<Func>(func)});
    return std::move(f);
  }

  bool start();
  void shutdown();

  bool isRunning() const noexcept {
    return _running.load(std::memory_order_acquire);
  }

  uint64_t numThreads() const noexcept { return _num_threads; }

 private:
  const uint64_t _num_threads;
  std::unique_ptr<folly::CPUThreadPoolExecutor> _executor;
  std::atomic_bool _running{false};
};

}  // namespace cdb
