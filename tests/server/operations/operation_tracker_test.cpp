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

#include <absl/synchronization/notification.h>

#include <stdexcept>
#include <thread>
#include <vector>

#include "basics/debugging.h"
#include "general_server/scheduler.h"
#include "gtest/gtest.h"

using namespace cdb;
using namespace cdb::operations;

namespace {

constexpr absl::Duration kTimeout = absl::Seconds(30);

class OperationTrackerTest : public ::testing::Test {
 protected:
  OperationTrackerTest() { EXPECT_TRUE(_scheduler.start()); }
  ~OperationTrackerTest() override { _scheduler.shutdown(); }

  Scheduler _scheduler{2};
  OperationTracker _tracker{_scheduler};
};

}  // namespace

TEST_F(OperationTrackerTest, SpawnReturnsBeforeWorkRuns) {
  absl::Notification release;
  auto operation = _tracker.Spawn("blocked", [&](OperationContext&) -> Result {
    release.WaitForNotification();
    return {};
  });
  ASSERT_NE(nullptr, operation);
  EXPECT_EQ(OperationStatus::Running, operation->status());
  EXPECT_EQ("blocked", operation->description());

  release.Notify();
  ASSERT_TRUE(operation->wait(kTimeout));
  auto info = operation->info();
  EXPECT_EQ(OperationStatus::Success, info.status);
  EXPECT_TRUE(info.error.empty());
  EXPECT_LE(info.started, info.finished);
}

TEST_F(OperationTrackerTest, IdsIncreaseAndListIsOrdered) {
  auto first = _tracker.Spawn("a", [](OperationContext&) { return Result{}; });
  auto second = _tracker.Spawn("b", [](OperationContext&) { return Result{}; });
  EXPECT_LT(first->id(), second->id());
  ASSERT_TRUE(_tracker.WaitAll(kTimeout));

  auto list = _tracker.List();
  ASSERT_EQ(2U, list.size());
  EXPECT_EQ(first->id(), list[0].id);
  EXPECT_EQ(second->id(), list[1].id);
}

TEST_F(OperationTrackerTest, FailedWorkIsReported) {
  auto operation = _tracker.Spawn("fails", [](OperationContext&) -> Result {
    return {ERROR_SERVER_IO_ERROR, "disk gone"};
  });
  ASSERT_TRUE(operation->wait(kTimeout));
  auto info = _tracker.Get(operation->id());
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(OperationStatus::Failed, info->status);
  EXPECT_EQ("disk gone", info->error);
  EXPECT_TRUE(operation->result().is(ERROR_SERVER_IO_ERROR));
}

TEST_F(OperationTrackerTest, ThrowingWorkIsCaptured) {
  auto operation = _tracker.Spawn("throws", [](OperationContext&) -> Result {
    throw std::runtime_error{"unexpected"};
  });
  ASSERT_TRUE(operation->wait(kTimeout));
  EXPECT_EQ(OperationStatus::Failed, operation->status());
  EXPECT_EQ("unexpected", operation->info().error);
}

TEST_F(OperationTrackerTest, CancelDummyJob) {
  auto operation = _tracker.SpawnDummyJob({absl::Hours(1)});
  EXPECT_TRUE(operation->cancellable());

  auto outcome = _tracker.Cancel(operation->id());
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->honored);

  ASSERT_TRUE(operation->wait(kTimeout));
  auto info = operation->info();
  EXPECT_EQ(OperationStatus::Cancelled, info.status);
  EXPECT_TRUE(info.cancel_requested);
}

TEST_F(OperationTrackerTest, DummyJobReportsProgress) {
  auto operation = _tracker.SpawnDummyJob(
    {absl::Milliseconds(1), absl::Milliseconds(1), absl::Milliseconds(1)});
  ASSERT_TRUE(operation->wait(kTimeout));
  auto info = operation->info();
  EXPECT_EQ(OperationStatus::Success, info.status);
  EXPECT_EQ(3U, info.done);
  EXPECT_EQ(3U, info.total);
}

TEST_F(OperationTrackerTest, CancelNotCancellable) {
  absl::Notification release;
  auto operation =
    _tracker.Spawn("not cancellable", [&](OperationContext&) -> Result {
      release.WaitForNotification();
      return {};
    });

  auto outcome = _tracker.Cancel(operation->id());
  ASSERT_TRUE(outcome.has_value());
  EXPECT_FALSE(outcome->honored);
  EXPECT_NE(std::string::npos,
            outcome->note.find("does not support cancellation"));

  release.Notify();
  ASSERT_TRUE(operation->wait(kTimeout));
  EXPECT_EQ(OperationStatus::Success, operation->status());

  auto completed = _tracker.Cancel(operation->id());
  ASSERT_TRUE(completed.has_value());
  EXPECT_FALSE(completed->honored);
  EXPECT_NE(std::string::npos, completed->note.find("already completed"));
}

TEST_F(OperationTrackerTest, UnknownOperation) {
  OperationId unknown{12345};
  EXPECT_EQ(ERROR_SERVER_OPERATION_NOT_FOUND,
            _tracker.Get(unknown).error().errorNumber());
  EXPECT_EQ(ERROR_SERVER_OPERATION_NOT_FOUND,
            _tracker.Cancel(unknown).error().errorNumber());
  EXPECT_TRUE(
    _tracker.Acknowledge(unknown).is(ERROR_SERVER_OPERATION_NOT_FOUND));
}

TEST_F(OperationTrackerTest, AcknowledgeOnlyCompleted) {
  absl::Notification release;
  auto operation = _tracker.Spawn("running", [&](OperationContext&) -> Result {
    release.WaitForNotification();
    return {};
  });
  EXPECT_TRUE(
    _tracker.Acknowledge(operation->id()).is(ERROR_SERVER_INVALID_STATE));

  release.Notify();
  ASSERT_TRUE(operation->wait(kTimeout));
  EXPECT_TRUE(_tracker.Acknowledge(operation->id()).ok());
  EXPECT_FALSE(_tracker.Get(operation->id()).has_value());
  EXPECT_TRUE(_tracker.List().empty());
}

TEST_F(OperationTrackerTest, SpawnAfterShutdownFails) {
  _scheduler.shutdown();
  bool ran = false;
  auto operation = _tracker.Spawn("late", [&](OperationContext&) -> Result {
    ran = true;
    return {};
  });
  ASSERT_TRUE(operation->wait(kTimeout));
  EXPECT_FALSE(ran);
  EXPECT_EQ(OperationStatus::Failed, operation->status());
  EXPECT_TRUE(operation->result().is(ERROR_SHUTTING_DOWN));
}

TEST_F(OperationTrackerTest, RejectedWorkFails) {
  bool ran = false;
  {
    FailurePointGuard rejected{"Scheduler::queue"};
    auto operation = _tracker.Spawn("rejected", [&](OperationContext&) {
      ran = true;
      return Result{};
    });
    ASSERT_TRUE(operation->wait(kTimeout));
    EXPECT_EQ(OperationStatus::Failed, operation->status());
    EXPECT_TRUE(operation->result().is(ERROR_SHUTTING_DOWN));
  }
  EXPECT_FALSE(ran);
  EXPECT_TRUE(_tracker.WaitAll(kTimeout));

  auto accepted =
    _tracker.Spawn("accepted", [](OperationContext&) { return Result{}; });
  ASSERT_TRUE(accepted->wait(kTimeout));
  EXPECT_EQ(OperationStatus::Success, accepted->status());
}

TEST_F(OperationTrackerTest, SpawnDuringShutdownAlwaysFinishes) {
  constexpr size_t kThreads = 4;
  constexpr size_t kPerThread = 50;

  std::vector<std::shared_ptr<Operation>> operations[kThreads];
  std::vector<std::thread> spawners;
  for (size_t i = 0; i < kThreads; ++i) {
    spawners.emplace_back([&, i] {
      for (size_t j = 0; j < kPerThread; ++j) {
        operations[i].push_back(_tracker.Spawn(
          "racing", [](OperationContext&) { return Result{}; }));
      }
    });
  }
  _scheduler.shutdown();
  for (auto& spawner : spawners) {
    spawner.join();
  }

  EXPECT_TRUE(_tracker.WaitAll(kTimeout));
  for (const auto& spawned : operations) {
    ASSERT_EQ(kPerThread, spawned.size());
    for (const auto& operation : spawned) {
      ASSERT_TRUE(operation->wait(kTimeout));
      auto status = operation->status();
      if (status == OperationStatus::Failed) {
        EXPECT_TRUE(operation->result().is(ERROR_SHUTTING_DOWN));
      } else {
        EXPECT_EQ(OperationStatus::Success, status);
      }
    }
  }
}
