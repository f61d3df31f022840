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

#include <absl/base/thread_annotations.h>
#include <absl/functional/any_invocable.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "basics/result_or.h"
#include "catalog/identifiers/database_uuid.h"
#include "catalog/preserved_catalog.h"
#include "database/chunk_manager.h"
#include "database/rules.h"

namespace cdb {

class ObjectStore;

namespace catalog {
class CatalogStore;
}  // namespace catalog
namespace operations {
class Operation;
class OperationContext;
class OperationTracker;
}  // namespace operations

enum class DatabaseState : uint8_t {
  Known,
  RulesLoaded,
  Replaying,
  Initialized,
  RulesLoadError,
  ReplayError,
  Released,
};

std::string_view DatabaseStateName(DatabaseState state) noexcept;

// Known, RulesLoaded and Replaying
bool IsBootstrapping(DatabaseState state) noexcept;

// collaborators shared by every database of a server
struct DatabaseContext {
  std::string server_id;
  ObjectStore& objects;
  catalog::CatalogStore& catalog_store;
  operations::OperationTracker& tracker;
  // overrides of the built-in defaults
  DatabaseRules defaults;
};

struct DatabaseStatus {
  std::string name;
  DatabaseUuid uuid;
  DatabaseState state = DatabaseState::Known;
  std::optional<std::string> error;
  std::vector<std::string> warnings;
};

using OperationPtr = std::shared_ptr<operations::Operation>;

// Lifecycle of one tenant database:
//
//   Known -> RulesLoaded -> Replaying -> Initialized <-> Released
//         \-> RulesLoadError        \-> ReplayError
//
// Transitions are serialized. One that is attempted while another is in
// flight fails with ERROR_SERVER_INVALID_STATE instead of queueing.
class Database : public std::enable_shared_from_this<Database> {
 public:
  Database(DatabaseContext& context, std::string name, DatabaseUuid uuid);

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  const std::string& name() const noexcept { return _name; }
  const DatabaseUuid& uuid() const noexcept { return _uuid; }

  DatabaseState state() const;
  DatabaseStatus status() const;

  std::optional<DatabaseRules> providedRules() const;
  std::optional<ActiveRules> activeRules() const;

  // persists the rules and the ownership marker of a new database and
  // spawns its replay
  ResultOr<OperationPtr> Create(const DatabaseRules& provided);

  // spawns loading the rules from the object store followed by the replay,
  // used for databases found at bootstrap or claimed from storage. a claim
  // writes the ownership marker first
  ResultOr<OperationPtr> Initialize(bool claim = false);

  // blocks until the database left the bootstrapping states. returns false
  // on timeout
  bool WaitForInit(absl::Duration timeout) const;

  ResultOr<ActiveRules> UpdateRules(const DatabaseRules& provided);

  ResultOr<DatabaseUuid> Release(std::optional<DatabaseUuid> expected);
  Result Claim(DatabaseUuid uuid);

  // replays in tolerant mode. the log is cut at its first unreadable or
  // inconsistent entry and chunks with unreadable artifacts are dropped
  ResultOr<OperationPtr> SkipReplay();

  // rebuilds the preserved catalog from the artifacts in the object store
  // and replays it
  ResultOr<OperationPtr> WipePreservedCatalog();

  ResultOr<WriteSummary> Write(std::string_view table,
                               std::span<const Row> rows);
  ResultOr<OperationPtr> Rollover(std::string_view table,
                                  std::string_view key);
  ResultOr<OperationPtr> CloseChunk(std::string_view table,
                                    std::string_view key, ChunkId chunk);
  ResultOr<OperationPtr> PersistPartition(std::string_view table,
                                          std::string_view key, bool force);
  Result UnloadChunk(std::string_view table, std::string_view key,
                     ChunkId chunk);
  ResultOr<std::vector<Row>> ReadChunk(std::string_view table,
                                       std::string_view key,
                                       ChunkId chunk) const;
  ResultOr<OperationPtr> DropChunk(std::string_view table,
                                   std::string_view key, ChunkId chunk);
  ResultOr<OperationPtr> DropPartition(std::string_view table,
                                       std::string_view key);

  ResultOr<std::vector<PartitionSummary>> ListPartitions() const;
  ResultOr<PartitionSummary> GetPartition(std::string_view table,
                                          std::string_view key) const;
  ResultOr<std::vector<ChunkSummary>> PartitionChunks(
    std::string_view table, std::string_view key) const;
  ResultOr<std::vector<ChunkSummary>> Chunks() const;

  // the manager of an initialized database
  ResultOr<std::shared_ptr<ChunkManager>> manager() const;

  const catalog::PreservedCatalog& catalog() const noexcept {
    return _catalog;
  }

 private:
  // the manager of an initialized database. it counts as chunk work, which
  // blocks a wipe or a release, until reset or destroyed
  class ManagerLease {
   public:
    ManagerLease(std::shared_ptr<Database> database,
                 std::shared_ptr<ChunkManager> manager) noexcept
      : _database{std::move(database)}, _manager{std::move(manager)} {}

    ManagerLease(ManagerLease&&) noexcept = default;
    ManagerLease& operator=(ManagerLease&&) = delete;

    ~ManagerLease() { reset(); }

    void reset();

    ChunkManager& operator*() const noexcept { return *_manager; }
    ChunkManager* operator->() const noexcept { return _manager.get(); }

   private:
    std::shared_ptr<Database> _database;
    std::shared_ptr<ChunkManager> _manager;
  };

  std::string Describe() const;

  Result CheckInitialized() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex);

  // ERROR_SERVER_INVALID_STATE while chunk work holds a lease
  Result CheckNoChunkWork(std::string_view what) const
    ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex);

  ResultOr<ManagerLease> LeaseManager();

  // ERROR_SERVER_INVALID_STATE unless the database is in one of `allowed`
  // and no other transition is in flight
  Result CheckTransition(std::span<const DatabaseState> allowed,
                         std::string_view what) const
    ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex);

  Result WriteRules(const DatabaseRules& provided);
  Result WriteOwner();
  Result LoadRules();
  Result Replay(bool tolerant);

  void Fail(DatabaseState state, Result&& r) ABSL_LOCKS_EXCLUDED(_mutex);

  // runs `steps` on the scheduler. the caller marked the transition in
  // flight, it ends once `steps` returned or was discarded
  OperationPtr SpawnTransition(std::string description,
                               absl::AnyInvocable<Result()> steps);

  using ChunkWork =
    absl::AnyInvocable<Result(ChunkManager&, operations::OperationContext&)>;
  OperationPtr SpawnChunkWork(std::string description, ManagerLease lease,
                              ChunkWork work, bool cancellable = false);

  DatabaseContext& _context;
  const std::string _name;
  const DatabaseUuid _uuid;
  const std::string _uuid_string;
  catalog::PreservedCatalog _catalog;

  mutable absl::Mutex _mutex;
  DatabaseState _state ABSL_GUARDED_BY(_mutex) = DatabaseState::Known;
  bool _in_transition ABSL_GUARDED_BY(_mutex) = false;
  std::optional<std::string> _error ABSL_GUARDED_BY(_mutex);
  std::vector<std::string> _warnings ABSL_GUARDED_BY(_mutex);
  std::optional<DatabaseRules> _provided ABSL_GUARDED_BY(_mutex);
  std::optional<ActiveRules> _active ABSL_GUARDED_BY(_mutex);
  std::shared_ptr<ChunkManager> _manager ABSL_GUARDED_BY(_mutex);
  uint64_t _chunk_work ABSL_GUARDED_BY(_mutex) = 0;
};

}  // namespace cdb
