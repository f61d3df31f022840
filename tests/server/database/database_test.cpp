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

#include "database/database.h"

#include <atomic>
#include <thread>
#include <vector>

#include "basics/debugging.h"
#include "catalog/memory_catalog_store.h"
#include "general_server/scheduler.h"
#include "gtest/gtest.h"
#include "operations/operation_tracker.h"
#include "storage_engine/memory_object_store.h"

using namespace cdb;
using operations::OperationStatus;

namespace {

constexpr absl::Duration kTimeout = absl::Seconds(30);
// 2023-01-01T00:00:00Z
constexpr int64_t kHour0 = 1672531200LL * 1'000'000'000LL;
constexpr std::string_view kKey0 = "2023-01-01T00";

class DatabaseTest : public ::testing::Test {
 protected:
  DatabaseTest() {
    EXPECT_TRUE(_scheduler.start());
    _rules.name = "db";
    _rules.lifecycle.late_arrive_window_seconds = 0;
  }

  ~DatabaseTest() override {
    EXPECT_TRUE(_tracker.WaitAll(kTimeout));
    _scheduler.shutdown();
    ClearFailurePoints();
  }

  std::shared_ptr<Database> Make(DatabaseUuid uuid = DatabaseUuid::Random()) {
    return std::make_shared<Database>(_context, "db", uuid);
  }

  // waits for the spawned operation and returns its final status
  OperationStatus Finish(ResultOr<OperationPtr> operation) {
    EXPECT_TRUE(operation.has_value()) << operation.error().errorMessage();
    if (!operation) {
      return OperationStatus::Running;
    }
    EXPECT_TRUE((*operation)->wait(kTimeout));
    return (*operation)->status();
  }

  std::shared_ptr<Database> Created() {
    auto database = Make();
    EXPECT_EQ(OperationStatus::Success, Finish(database->Create(_rules)));
    EXPECT_TRUE(database->WaitForInit(kTimeout));
    return database;
  }

  void Write(Database& database, size_t n) {
    std::vector<Row> rows;
    for (size_t i = 0; i != n; ++i) {
      rows.push_back(Row{.time = kHour0 + static_cast<int64_t>(i),
                         .series = "s",
                         .value = 1});
    }
    auto written = database.Write("cpu", rows);
    ASSERT_TRUE(written.has_value()) << written.error().errorMessage();
  }

  Scheduler _scheduler{2};
  operations::OperationTracker _tracker{_scheduler};
  MemoryObjectStore _objects;
  catalog::MemoryCatalogStore _store;
  DatabaseContext _context{
    .server_id = "1",
    .objects = _objects,
    .catalog_store = _store,
    .tracker = _tracker,
    .defaults = {},
  };
  DatabaseRules _rules;
};

}  // namespace

TEST_F(DatabaseTest, CreateStoresRulesAndOwner) {
  auto database = Make();
  EXPECT_EQ(DatabaseState::Known, database->state());
  EXPECT_TRUE(
    database->manager().error().is(ERROR_SERVER_NOT_INITIALIZED));

  EXPECT_EQ(OperationStatus::Success, Finish(database->Create(_rules)));
  ASSERT_TRUE(database->WaitForInit(kTimeout));
  EXPECT_EQ(DatabaseState::Initialized, database->state());

  const auto uuid = database->uuid().toString();
  EXPECT_TRUE(_objects.Exists(object_paths::Rules(uuid)));
  EXPECT_TRUE(_objects.Exists(object_paths::Owner(uuid)));
  EXPECT_EQ(_rules, database->providedRules());
  ASSERT_TRUE(database->activeRules().has_value());
  EXPECT_EQ(0U, database->activeRules()->late_arrive_window_seconds);

  // a second create is a state violation
  EXPECT_TRUE(
    database->Create(_rules).error().is(ERROR_SERVER_INVALID_STATE));
}

TEST_F(DatabaseTest, CreateRejectsInvalidRules) {
  auto database = Make();
  auto rules = _rules;
  rules.lifecycle.mub_row_threshold = 0;
  EXPECT_TRUE(database->Create(rules).error().is(ERROR_SERVER_INVALID_RULES));
  EXPECT_EQ(DatabaseState::Known, database->state());
}

TEST_F(DatabaseTest, CreateFailsWhenRulesCannotBeStored) {
  auto database = Make();
  {
    FailurePointGuard guard{"ObjectStore::Put"};
    EXPECT_TRUE(database->Create(_rules).error().is(ERROR_SERVER_IO_ERROR));
  }
  EXPECT_EQ(DatabaseState::Known, database->state());
  // nothing is in flight, the create can be retried
  EXPECT_EQ(OperationStatus::Success, Finish(database->Create(_rules)));
}

TEST_F(DatabaseTest, ChunkOperationsRequireInitialized) {
  auto database = Make();
  std::vector<Row> rows{{.time = kHour0, .series = "s", .value = 1}};
  EXPECT_EQ(ERROR_SERVER_NOT_INITIALIZED,
            database->Write("cpu", rows).error().errorNumber());
  EXPECT_EQ(ERROR_SERVER_NOT_INITIALIZED,
            database->Rollover("cpu", kKey0).error().errorNumber());
  EXPECT_EQ(ERROR_SERVER_NOT_INITIALIZED,
            database->ListPartitions().error().errorNumber());
}

TEST_F(DatabaseTest, ChunkLifecycleThroughOperations) {
  auto database = Created();
  Write(*database, 3);

  EXPECT_EQ(OperationStatus::Success,
            Finish(database->Rollover("cpu", kKey0)));
  auto chunks = database->Chunks();
  ASSERT_TRUE(chunks.has_value());
  ASSERT_EQ(2U, chunks->size());
  EXPECT_EQ(ChunkState::Closing, (*chunks)[0].state);
  EXPECT_EQ(ChunkState::Open, (*chunks)[1].state);

  EXPECT_EQ(OperationStatus::Success,
            Finish(database->PersistPartition("cpu", kKey0, false)));
  chunks = database->Chunks();
  ASSERT_TRUE(chunks.has_value());
  EXPECT_EQ(ChunkState::Persisted, (*chunks)[0].state);
  EXPECT_EQ(ChunkState::Open, (*chunks)[1].state);

  EXPECT_TRUE(database->UnloadChunk("cpu", kKey0, ChunkId{1})
                .is(ERROR_SERVER_INVALID_STATE));
  ASSERT_TRUE(database->UnloadChunk("cpu", kKey0, ChunkId{0}).ok());
  auto rows = database->ReadChunk("cpu", kKey0, ChunkId{0});
  ASSERT_TRUE(rows.has_value());
  EXPECT_EQ(3U, rows->size());

  EXPECT_EQ(OperationStatus::Success,
            Finish(database->DropChunk("cpu", kKey0, ChunkId{0})));
  EXPECT_EQ(OperationStatus::Success,
            Finish(database->DropPartition("cpu", kKey0)));
  auto partitions = database->ListPartitions();
  ASSERT_TRUE(partitions.has_value());
  EXPECT_TRUE(partitions->empty());
}

TEST_F(DatabaseTest, ChunkOperationsCheckTargetsUpFront) {
  auto database = Created();
  EXPECT_EQ(ERROR_SERVER_PARTITION_NOT_FOUND,
            database->PersistPartition("cpu", "nope", true)
              .error()
              .errorNumber());
  Write(*database, 1);
  EXPECT_EQ(ERROR_SERVER_CHUNK_NOT_FOUND,
            database->CloseChunk("cpu", kKey0, ChunkId{9})
              .error()
              .errorNumber());
  EXPECT_EQ(ERROR_SERVER_CHUNK_NOT_FOUND,
            database->DropChunk("cpu", kKey0, ChunkId{9}).error().errorNumber());
  EXPECT_EQ(ERROR_SERVER_PARTITION_NOT_FOUND,
            database->DropPartition("cpu", "nope").error().errorNumber());
}

TEST_F(DatabaseTest, FailedChunkOperationIsReported) {
  auto database = Created();
  Write(*database, 1);
  // an open chunk cannot be dropped
  EXPECT_EQ(OperationStatus::Failed,
            Finish(database->DropChunk("cpu", kKey0, ChunkId{0})));
}

TEST_F(DatabaseTest, UpdateRules) {
  auto database = Created();
  auto rules = _rules;
  rules.lifecycle.immutable = true;
  auto active = database->UpdateRules(rules);
  ASSERT_TRUE(active.has_value());
  EXPECT_TRUE(active->immutable);

  std::vector<Row> rows{{.time = kHour0, .series = "s", .value = 1}};
  EXPECT_EQ(ERROR_SERVER_READ_ONLY,
            database->Write("cpu", rows).error().errorNumber());

  rules.name = "other";
  EXPECT_EQ(ERROR_SERVER_INVALID_RULES,
            database->UpdateRules(rules).error().errorNumber());
}

TEST_F(DatabaseTest, ReplayAfterRestart) {
  auto database = Created();
  Write(*database, 4);
  EXPECT_EQ(OperationStatus::Success,
            Finish(database->PersistPartition("cpu", kKey0, true)));

  auto restarted = Make(database->uuid());
  EXPECT_EQ(OperationStatus::Success, Finish(restarted->Initialize()));
  ASSERT_TRUE(restarted->WaitForInit(kTimeout));
  EXPECT_EQ(DatabaseState::Initialized, restarted->state());
  EXPECT_EQ(_rules, restarted->providedRules());

  auto chunks = restarted->Chunks();
  ASSERT_TRUE(chunks.has_value());
  ASSERT_EQ(2U, chunks->size());
  EXPECT_EQ(ChunkState::Persisted, (*chunks)[0].state);
  EXPECT_EQ(4U, (*chunks)[0].row_count);
  EXPECT_EQ(ChunkState::Open, (*chunks)[1].state);
}

TEST_F(DatabaseTest, MissingRulesFailInitialization) {
  auto database = Make();
  EXPECT_EQ(OperationStatus::Failed, Finish(database->Initialize()));
  ASSERT_TRUE(database->WaitForInit(kTimeout));
  auto status = database->status();
  EXPECT_EQ(DatabaseState::RulesLoadError, status.state);
  ASSERT_TRUE(status.error.has_value());
  EXPECT_NE(std::string::npos, status.error->find("rules"));
}

TEST_F(DatabaseTest, SkipReplayOnlyAfterReplayError) {
  auto database = Created();
  EXPECT_EQ(ERROR_SERVER_INVALID_STATE,
            database->SkipReplay().error().errorNumber());

  Write(*database, 2);
  EXPECT_EQ(OperationStatus::Success,
            Finish(database->PersistPartition("cpu", kKey0, true)));
  auto chunks = database->Chunks();
  ASSERT_TRUE(chunks.has_value());
  ASSERT_TRUE(_objects.Corrupt((*chunks)[0].location));

  auto restarted = Make(database->uuid());
  EXPECT_EQ(OperationStatus::Failed, Finish(restarted->Initialize()));
  EXPECT_EQ(DatabaseState::ReplayError, restarted->state());
  EXPECT_TRUE(restarted->status().error.has_value());

  EXPECT_EQ(OperationStatus::Success, Finish(restarted->SkipReplay()));
  auto status = restarted->status();
  EXPECT_EQ(DatabaseState::Initialized, status.state);
  EXPECT_FALSE(status.error.has_value());
  EXPECT_EQ(2U, status.warnings.size());

  chunks = restarted->Chunks();
  ASSERT_TRUE(chunks.has_value());
  ASSERT_EQ(1U, chunks->size());
  EXPECT_EQ(ChunkId{1}, (*chunks)[0].id);
}

TEST_F(DatabaseTest, ReleaseAndClaim) {
  auto database = Created();
  const auto uuid = database->uuid();
  const auto owner = object_paths::Owner(uuid.toString());

  auto other = DatabaseUuid::Random();
  EXPECT_EQ(ERROR_SERVER_IDENTIFIER_MISMATCH,
            database->Release(other).error().errorNumber());

  auto released = database->Release(uuid);
  ASSERT_TRUE(released.has_value());
  EXPECT_EQ(uuid, *released);
  EXPECT_EQ(DatabaseState::Released, database->state());
  EXPECT_FALSE(_objects.Exists(owner));
  EXPECT_EQ(ERROR_SERVER_INVALID_STATE,
            database->Release(std::nullopt).error().errorNumber());

  EXPECT_TRUE(database->Claim(other).is(ERROR_SERVER_IDENTIFIER_MISMATCH));
  ASSERT_TRUE(database->Claim(uuid).ok());
  EXPECT_EQ(DatabaseState::Initialized, database->state());
  EXPECT_TRUE(_objects.Exists(owner));
  EXPECT_TRUE(database->Claim(uuid).is(ERROR_SERVER_INVALID_STATE));
}

TEST_F(DatabaseTest, WipeRebuildsFromArtifacts) {
  auto database = Created();
  Write(*database, 3);
  EXPECT_EQ(OperationStatus::Success,
            Finish(database->PersistPartition("cpu", kKey0, true)));
  Write(*database, 1);

  EXPECT_EQ(OperationStatus::Success,
            Finish(database->WipePreservedCatalog()));
  ASSERT_TRUE(database->WaitForInit(kTimeout));
  EXPECT_EQ(DatabaseState::Initialized, database->state());

  // only the persisted chunk survives, unloaded
  auto chunks = database->Chunks();
  ASSERT_TRUE(chunks.has_value());
  ASSERT_EQ(1U, chunks->size());
  EXPECT_EQ(ChunkId{0}, (*chunks)[0].id);
  EXPECT_EQ(ChunkState::Unloaded, (*chunks)[0].state);
  EXPECT_EQ(3U, (*chunks)[0].row_count);

  auto rows = database->ReadChunk("cpu", kKey0, ChunkId{0});
  ASSERT_TRUE(rows.has_value());
  EXPECT_EQ(3U, rows->size());

  // new chunks never reuse an id handed out before the wipe, chunk 1 was
  // open and lost
  Write(*database, 1);
  chunks = database->Chunks();
  ASSERT_TRUE(chunks.has_value());
  ASSERT_EQ(2U, chunks->size());
  EXPECT_EQ(ChunkId{2}, (*chunks)[1].id);
}

TEST_F(DatabaseTest, WipeDuringCreation) {
  // with the scheduler stopped the replay never runs and the database stays
  // in its bootstrapping state
  _scheduler.shutdown();
  auto database = Make();
  EXPECT_EQ(OperationStatus::Failed, Finish(database->Create(_rules)));
  EXPECT_EQ(DatabaseState::RulesLoaded, database->state());
  EXPECT_EQ(ERROR_SERVER_DATABASE_CREATING,
            database->WipePreservedCatalog().error().errorNumber());
}

TEST_F(DatabaseTest, WipeRecoversFromReplayError) {
  auto database = Created();
  Write(*database, 2);
  EXPECT_EQ(OperationStatus::Success,
            Finish(database->PersistPartition("cpu", kKey0, true)));
  ASSERT_TRUE(
    _store.Append(database->uuid(), database->catalog().LastSequence().next(),
                  "garbage")
      .ok());

  auto restarted = Make(database->uuid());
  EXPECT_EQ(OperationStatus::Failed, Finish(restarted->Initialize()));
  EXPECT_EQ(DatabaseState::ReplayError, restarted->state());

  EXPECT_EQ(OperationStatus::Success,
            Finish(restarted->WipePreservedCatalog()));
  EXPECT_EQ(DatabaseState::Initialized, restarted->state());
  auto chunks = restarted->Chunks();
  ASSERT_TRUE(chunks.has_value());
  ASSERT_EQ(1U, chunks->size());
  EXPECT_EQ(ChunkState::Unloaded, (*chunks)[0].state);
}

TEST_F(DatabaseTest, SkipReplayKeepsEntriesBeforeInconsistentOne) {
  auto database = Created();
  Write(*database, 2);
  EXPECT_EQ(OperationStatus::Success,
            Finish(database->PersistPartition("cpu", kKey0, true)));
  const auto before = database->catalog().LastSequence();
  auto expected = database->Chunks();
  ASSERT_TRUE(expected.has_value());

  catalog::PreservedCatalog log{database->uuid(), _store};
  ASSERT_TRUE(log.Open().ok());
  auto unknown = catalog::CatalogEntry::ChunkClosed("cpu", kKey0, ChunkId{7});
  ASSERT_TRUE(log.Append(unknown).has_value());
  auto later = catalog::CatalogEntry::PartitionCreated("mem", kKey0);
  ASSERT_TRUE(log.Append(later).has_value());

  auto restarted = Make(database->uuid());
  EXPECT_EQ(OperationStatus::Failed, Finish(restarted->Initialize()));
  EXPECT_EQ(DatabaseState::ReplayError, restarted->state());
  ASSERT_TRUE(restarted->status().error.has_value());
  EXPECT_NE(std::string::npos,
            restarted->status().error->find("ChunkClosed"));

  EXPECT_EQ(OperationStatus::Success, Finish(restarted->SkipReplay()));
  auto status = restarted->status();
  EXPECT_EQ(DatabaseState::Initialized, status.state);
  EXPECT_FALSE(status.error.has_value());
  ASSERT_EQ(2U, status.warnings.size());
  EXPECT_NE(std::string::npos, status.warnings[1].find("chunk does not exist"));

  // the log ends where the replay stopped
  EXPECT_EQ(before, restarted->catalog().LastSequence());
  auto partitions = restarted->ListPartitions();
  ASSERT_TRUE(partitions.has_value());
  ASSERT_EQ(1U, partitions->size());
  EXPECT_EQ("cpu", (*partitions)[0].table);
  auto chunks = restarted->Chunks();
  ASSERT_TRUE(chunks.has_value());
  ASSERT_EQ(expected->size(), chunks->size());
  for (size_t i = 0; i != chunks->size(); ++i) {
    EXPECT_EQ((*expected)[i].id, (*chunks)[i].id);
  }

  // a later restart replays cleanly
  auto again = Make(database->uuid());
  EXPECT_EQ(OperationStatus::Success, Finish(again->Initialize()));
  EXPECT_EQ(DatabaseState::Initialized, again->state());
  EXPECT_TRUE(again->status().warnings.empty());
}

TEST_F(DatabaseTest, SkipReplayCutsLogAtUndecodableEntry) {
  auto database = Created();
  Write(*database, 2);
  const auto before = database->catalog().LastSequence();
  ASSERT_TRUE(_store.Append(database->uuid(), before.next(), "garbage").ok());
  catalog::PreservedCatalog log{database->uuid(), _store};
  ASSERT_TRUE(log.Open().ok());
  auto later = catalog::CatalogEntry::PartitionCreated("mem", kKey0);
  ASSERT_TRUE(log.Append(later).has_value());

  auto restarted = Make(database->uuid());
  EXPECT_EQ(OperationStatus::Failed, Finish(restarted->Initialize()));
  EXPECT_EQ(DatabaseState::ReplayError, restarted->state());

  EXPECT_EQ(OperationStatus::Success, Finish(restarted->SkipReplay()));
  EXPECT_EQ(DatabaseState::Initialized, restarted->state());
  EXPECT_EQ(before, restarted->catalog().LastSequence());
  auto partitions = restarted->ListPartitions();
  ASSERT_TRUE(partitions.has_value());
  EXPECT_EQ(1U, partitions->size());

  // new entries follow the kept ones
  EXPECT_EQ(OperationStatus::Success,
            Finish(restarted->Rollover("cpu", kKey0)));
  EXPECT_LT(before, restarted->catalog().LastSequence());
  auto again = Make(database->uuid());
  EXPECT_EQ(OperationStatus::Success, Finish(again->Initialize()));
}

TEST_F(DatabaseTest, WipeAndReleaseWaitForChunkOperations) {
  auto database = Created();
  Write(*database, 2);

  // both workers stay busy until cancelled, so the rollover stays queued
  auto first = _tracker.SpawnDummyJob({absl::Hours(1)});
  auto second = _tracker.SpawnDummyJob({absl::Hours(1)});
  auto rollover = database->Rollover("cpu", kKey0);
  ASSERT_TRUE(rollover.has_value());

  EXPECT_TRUE(database->WipePreservedCatalog().error().is(
    ERROR_SERVER_INVALID_STATE));
  EXPECT_TRUE(
    database->Release(std::nullopt).error().is(ERROR_SERVER_INVALID_STATE));
  EXPECT_EQ(DatabaseState::Initialized, database->state());

  ASSERT_TRUE(_tracker.Cancel(first->id()).has_value());
  ASSERT_TRUE(_tracker.Cancel(second->id()).has_value());
  EXPECT_EQ(OperationStatus::Success, Finish(std::move(rollover)));

  EXPECT_EQ(OperationStatus::Success,
            Finish(database->WipePreservedCatalog()));
  EXPECT_EQ(DatabaseState::Initialized, database->state());

  // the rebuilt log replays after a restart
  auto restarted = Make(database->uuid());
  EXPECT_EQ(OperationStatus::Success, Finish(restarted->Initialize()));
  EXPECT_EQ(DatabaseState::Initialized, restarted->state());
}

TEST_F(DatabaseTest, TransitionsDuringReplayFail) {
  auto first = _tracker.SpawnDummyJob({absl::Hours(1)});
  auto second = _tracker.SpawnDummyJob({absl::Hours(1)});

  // the replay of the create is queued behind the blocked workers
  auto database = Make();
  auto created = database->Create(_rules);
  ASSERT_TRUE(created.has_value());
  EXPECT_TRUE(IsBootstrapping(database->state()));

  EXPECT_TRUE(database->Create(_rules).error().is(ERROR_SERVER_INVALID_STATE));
  EXPECT_TRUE(database->SkipReplay().error().is(ERROR_SERVER_INVALID_STATE));
  EXPECT_TRUE(
    database->Release(std::nullopt).error().is(ERROR_SERVER_INVALID_STATE));
  EXPECT_TRUE(database->WipePreservedCatalog().error().is(
    ERROR_SERVER_DATABASE_CREATING));
  EXPECT_TRUE(database->Write("cpu", {}).error().is(
    ERROR_SERVER_NOT_INITIALIZED));

  ASSERT_TRUE(_tracker.Cancel(first->id()).has_value());
  ASSERT_TRUE(_tracker.Cancel(second->id()).has_value());
  EXPECT_EQ(OperationStatus::Success, Finish(std::move(created)));
  EXPECT_EQ(DatabaseState::Initialized, database->state());
}

TEST_F(DatabaseTest, ConcurrentRecoveryAcceptsOneTransition) {
  auto database = Created();
  Write(*database, 2);
  EXPECT_EQ(OperationStatus::Success,
            Finish(database->PersistPartition("cpu", kKey0, true)));
  ASSERT_TRUE(
    _store.Append(database->uuid(), database->catalog().LastSequence().next(),
                  "garbage")
      .ok());
  auto restarted = Make(database->uuid());
  EXPECT_EQ(OperationStatus::Failed, Finish(restarted->Initialize()));
  ASSERT_EQ(DatabaseState::ReplayError, restarted->state());

  // the accepted transition cannot finish while the workers are blocked
  auto first = _tracker.SpawnDummyJob({absl::Hours(1)});
  auto second = _tracker.SpawnDummyJob({absl::Hours(1)});

  constexpr size_t kThreads = 8;
  std::atomic<size_t> rejected{0};
  std::vector<OperationPtr> accepted(kThreads);
  std::vector<std::thread> threads;
  for (size_t i = 0; i != kThreads; ++i) {
    threads.emplace_back([&, i] {
      auto operation = i % 2 == 0 ? restarted->SkipReplay()
                                  : restarted->WipePreservedCatalog();
      if (operation) {
        accepted[i] = std::move(*operation);
      } else if (operation.error().is(ERROR_SERVER_INVALID_STATE) ||
                 operation.error().is(ERROR_SERVER_DATABASE_CREATING)) {
        // a running wipe puts the database back into replay
        ++rejected;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(kThreads - 1, rejected.load());

  ASSERT_TRUE(_tracker.Cancel(first->id()).has_value());
  ASSERT_TRUE(_tracker.Cancel(second->id()).has_value());
  for (const auto& operation : accepted) {
    if (operation) {
      ASSERT_TRUE(operation->wait(kTimeout));
      EXPECT_EQ(OperationStatus::Success, operation->status());
    }
  }
  EXPECT_EQ(DatabaseState::Initialized, restarted->state());
}
