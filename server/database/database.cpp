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

#include <absl/cleanup/cleanup.h>
#include <absl/strings/str_cat.h>
#include <vpack/builder.h>

#include <algorithm>
#include <magic_enum/magic_enum.hpp>

#include "basics/assert.h"
#include "basics/logger/logger.h"
#include "basics/vpack_helper.h"
#include "operations/operation_tracker.h"
#include "storage_engine/object_store.h"

namespace cdb {
namespace {

constexpr DatabaseState kKnownOnly[] = {DatabaseState::Known};
constexpr DatabaseState kInitializedOnly[] = {DatabaseState::Initialized};
constexpr DatabaseState kReplayErrorOnly[] = {DatabaseState::ReplayError};
constexpr DatabaseState kReleasedOnly[] = {DatabaseState::Released};
constexpr DatabaseState kWipeable[] = {DatabaseState::Initialized,
                                       DatabaseState::ReplayError};

constexpr std::string_view kMissingStateWarning =
  "replay skipped unreadable catalog entries, some durable state may be "
  "missing";

template<typename T>
Result Done(ResultOr<T>&& r) {
  if (!r) {
    return std::move(r).error();
  }
  return {};
}

}  // namespace

std::string_view DatabaseStateName(DatabaseState state) noexcept {
  return magic_enum::enum_name(state);
}

bool IsBootstrapping(DatabaseState state) noexcept {
  return state == DatabaseState::Known ||
         state == DatabaseState::RulesLoaded ||
         state == DatabaseState::Replaying;
}

Database::Database(DatabaseContext& context, std::string name,
                   DatabaseUuid uuid)
  : _context{context},
    _name{std::move(name)},
    _uuid{uuid},
    _uuid_string{uuid.toString()},
    _catalog{uuid, context.catalog_store} {}

std::string Database::Describe() const {
  return absl::StrCat("database '", _name, "'");
}

DatabaseState Database::state() const {
  absl::MutexLock lock{&_mutex};
  return _state;
}

DatabaseStatus Database::status() const {
  absl::MutexLock lock{&_mutex};
  return {
    .name = _name,
    .uuid = _uuid,
    .state = _state,
    .error = _error,
    .warnings = _warnings,
  };
}

std::optional<DatabaseRules> Database::providedRules() const {
  absl::MutexLock lock{&_mutex};
  return _provided;
}

std::optional<ActiveRules> Database::activeRules() const {
  absl::MutexLock lock{&_mutex};
  return _active;
}

Result Database::CheckTransition(std::span<const DatabaseState> allowed,
                                 std::string_view what) const {
  if (_in_transition) {
    return {ERROR_SERVER_INVALID_STATE, "cannot ", what, " ", Describe(),
            ", another transition is in flight"};
  }
  if (std::ranges::find(allowed, _state) == allowed.end()) {
    return {ERROR_SERVER_INVALID_STATE, "cannot ", what, " ", Describe(),
            " in state ", DatabaseStateName(_state)};
  }
  return {};
}

Result Database::WriteRules(const DatabaseRules& provided) {
  vpack::Builder builder;
  provided.toVPack(builder);
  return _context.objects
    .Put(object_paths::Rules(_uuid_string),
         basics::VPackHelper::ToBytes(builder.slice()))
    .withContext("cannot store the rules of ", Describe());
}

Result Database::WriteOwner() {
  vpack::Builder builder;
  builder.openObject();
  builder.add("serverId", std::string_view{_context.server_id});
  builder.close();
  return _context.objects
    .Put(object_paths::Owner(_uuid_string),
         basics::VPackHelper::ToBytes(builder.slice()))
    .withContext("cannot store the owner of ", Describe());
}

void Database::Fail(DatabaseState state, Result&& r) {
  CDB_ERROR("xxxxx", Logger::LIFECYCLE, Describe(), " entered ",
            DatabaseStateName(state), ": ", r.errorMessage());
  absl::MutexLock lock{&_mutex};
  _state = state;
  _error = std::string{r.errorMessage()};
}

Result Database::LoadRules() {
  auto rules = [&]() -> ResultOr<DatabaseRules> {
    auto bytes = _context.objects.Get(object_paths::Rules(_uuid_string));
    if (!bytes) {
      return std::unexpected{std::move(bytes).error()};
    }
    auto slice = basics::VPackHelper::FromBytes(*bytes);
    if (!slice) {
      return std::unexpected{std::move(slice).error()};
    }
    auto parsed = DatabaseRules::FromVPack(*slice);
    if (!parsed) {
      return parsed;
    }
    if (parsed->name != _name) {
      return std::unexpected<Result>{
        std::in_place, ERROR_SERVER_INVALID_RULES, "stored rules are named '",
        parsed->name, "'"};
    }
    if (auto r = ValidateRules(*parsed); r.fail()) {
      return std::unexpected{std::move(r)};
    }
    return parsed;
  }();
  if (!rules) {
    auto r =
      std::move(rules).error().withContext("cannot load the rules of ",
                                           Describe());
    Fail(DatabaseState::RulesLoadError, r.clone());
    return r;
  }

  absl::MutexLock lock{&_mutex};
  _active = ActiveRules::Merge(*rules, _context.defaults);
  _provided = std::move(*rules);
  _state = DatabaseState::RulesLoaded;
  return {};
}

Result Database::Replay(bool tolerant) {
  ActiveRules rules;
  {
    absl::MutexLock lock{&_mutex};
    CDB_ASSERT(_active);
    rules = *_active;
    _state = DatabaseState::Replaying;
  }
  CDB_DEBUG("xxxxx", Logger::LIFECYCLE, "replaying ", Describe(),
            tolerant ? " in tolerant mode" : "");

  std::vector<std::string> warnings;
  uint64_t entries = 0;
  auto manager = std::make_shared<ChunkManager>(_name, _uuid, std::move(rules),
                                                _catalog, _context.objects);
  // tolerant mode only
  std::vector<catalog::CatalogEntry> applied;
  auto r = [&]() -> Result {
    if (auto r = _catalog.Open(); r.fail()) {
      return r;
    }
    auto reader = _catalog.Replay();
    Result stopped;
    while (true) {
      auto entry = reader.Next();
      if (!entry) {
        stopped = std::move(entry).error();
        break;
      }
      if (!*entry) {
        break;
      }
      if (auto r = manager->Apply(**entry); r.fail()) {
        stopped = std::move(r);
        break;
      }
      ++entries;
      if (tolerant) {
        applied.push_back(std::move(**entry));
      }
    }
    if (stopped.fail()) {
      if (!tolerant) {
        return stopped;
      }
      CDB_WARN("xxxxx", Logger::LIFECYCLE, "abandoning the replay of ",
               Describe(), " after ", entries,
               " catalog entries: ", stopped.errorMessage());
      warnings.push_back(absl::StrCat("replay stopped after ", entries,
                                      " catalog entries, discarded the rest: ",
                                      stopped.errorMessage()));
      // new entries must follow the ones the manager holds
      if (auto r = _catalog.Rewrite(applied); r.fail()) {
        return r;
      }
    }
    return manager->LoadArtifacts(tolerant, &warnings);
  }();
  if (r.fail()) {
    r = std::move(r).withContext("cannot replay the catalog of ", Describe());
    Fail(DatabaseState::ReplayError, r.clone());
    return r;
  }

  CDB_INFO("xxxxx", Logger::LIFECYCLE, "replayed ", entries,
           " catalog entries of ", Describe());
  absl::MutexLock lock{&_mutex};
  _manager = std::move(manager);
  _state = DatabaseState::Initialized;
  _error.reset();
  if (tolerant) {
    _warnings.emplace_back(kMissingStateWarning);
    _warnings.insert(_warnings.end(), std::make_move_iterator(warnings.begin()),
                     std::make_move_iterator(warnings.end()));
  }
  return {};
}

OperationPtr Database::SpawnTransition(std::string description,
                                       absl::AnyInvocable<Result()> steps) {
  absl::Cleanup end = [self = shared_from_this()] {
    absl::MutexLock lock{&self->_mutex};
    self->_in_transition = false;
  };
  return _context.tracker.Spawn(
    std::move(description),
    [steps = std::move(steps), end = std::move(end)](
      operations::OperationContext&) mutable {
      auto r = steps();
      std::move(end).Invoke();
      return r;
    });
}

ResultOr<OperationPtr> Database::Create(const DatabaseRules& provided) {
  if (auto r = ValidateRules(provided); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  {
    absl::MutexLock lock{&_mutex};
    if (auto r = CheckTransition(kKnownOnly, "create"); r.fail()) {
      return std::unexpected{std::move(r)};
    }
    _in_transition = true;
  }
  auto r = WriteRules(provided);
  if (r.ok()) {
    r = WriteOwner();
  }
  {
    absl::MutexLock lock{&_mutex};
    if (r.fail()) {
      _in_transition = false;
      return std::unexpected{std::move(r)};
    }
    _provided = provided;
    _active = ActiveRules::Merge(provided, _context.defaults);
    _state = DatabaseState::RulesLoaded;
  }
  CDB_INFO("xxxxx", Logger::LIFECYCLE, "created ", Describe(), " with id ",
           _uuid_string);
  return SpawnTransition(absl::StrCat("initialize ", Describe()),
                         [this] { return Replay(false); });
}

ResultOr<OperationPtr> Database::Initialize(bool claim) {
  {
    absl::MutexLock lock{&_mutex};
    if (auto r = CheckTransition(kKnownOnly, "initialize"); r.fail()) {
      return std::unexpected{std::move(r)};
    }
    _in_transition = true;
  }
  if (claim) {
    if (auto r = WriteOwner(); r.fail()) {
      absl::MutexLock lock{&_mutex};
      _in_transition = false;
      return std::unexpected{std::move(r)};
    }
  }
  return SpawnTransition(absl::StrCat("initialize ", Describe()), [this] {
    if (auto r = LoadRules(); r.fail()) {
      return r;
    }
    return Replay(false);
  });
}

bool Database::WaitForInit(absl::Duration timeout) const {
  absl::MutexLock lock{&_mutex};
  auto done = [this]() ABSL_NO_THREAD_SAFETY_ANALYSIS {
    return !_in_transition && !IsBootstrapping(_state);
  };
  return _mutex.AwaitWithTimeout(absl::Condition{&done}, timeout);
}

ResultOr<ActiveRules> Database::UpdateRules(const DatabaseRules& provided) {
  if (auto r = ValidateRules(provided); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  if (provided.name != _name) {
    return std::unexpected<Result>{std::in_place, ERROR_SERVER_INVALID_RULES,
                                   "rules field 'name' is '", provided.name,
                                   "' but must match ", Describe()};
  }
  absl::MutexLock lock{&_mutex};
  if (auto r = CheckTransition(kInitializedOnly, "update the rules of");
      r.fail()) {
    return std::unexpected{std::move(r)};
  }
  if (auto r = WriteRules(provided); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  _provided = provided;
  _active = ActiveRules::Merge(provided, _context.defaults);
  _manager->SetRules(*_active);
  CDB_INFO("xxxxx", Logger::LIFECYCLE, "updated the rules of ", Describe());
  return *_active;
}

ResultOr<DatabaseUuid> Database::Release(std::optional<DatabaseUuid> expected) {
  absl::MutexLock lock{&_mutex};
  if (auto r = CheckTransition(kInitializedOnly, "release"); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  if (auto r = CheckNoChunkWork("release"); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  if (expected && *expected != _uuid) {
    return std::unexpected<Result>{
      std::in_place, ERROR_SERVER_IDENTIFIER_MISMATCH, Describe(),
      " has id ", _uuid_string, ", not ", expected->toString()};
  }
  if (auto r = _context.objects.Delete(object_paths::Owner(_uuid_string));
      r.fail()) {
    return std::unexpected{
      std::move(r).withContext("cannot release ", Describe())};
  }
  _state = DatabaseState::Released;
  CDB_INFO("xxxxx", Logger::LIFECYCLE, "released ", Describe());
  return _uuid;
}

Result Database::Claim(DatabaseUuid uuid) {
  absl::MutexLock lock{&_mutex};
  if (auto r = CheckTransition(kReleasedOnly, "claim"); r.fail()) {
    return r;
  }
  if (uuid != _uuid) {
    return {ERROR_SERVER_IDENTIFIER_MISMATCH, Describe(), " has id ",
            _uuid_string, ", not ", uuid.toString()};
  }
  if (auto r = WriteOwner(); r.fail()) {
    return r;
  }
  _state = DatabaseState::Initialized;
  CDB_INFO("xxxxx", Logger::LIFECYCLE, "claimed ", Describe());
  return {};
}

ResultOr<OperationPtr> Database::SkipReplay() {
  {
    absl::MutexLock lock{&_mutex};
    if (auto r = CheckTransition(kReplayErrorOnly, "skip the replay of");
        r.fail()) {
      return std::unexpected{std::move(r)};
    }
    _in_transition = true;
  }
  CDB_WARN("xxxxx", Logger::LIFECYCLE, "skipping unreadable catalog entries of ",
           Describe());
  return SpawnTransition(absl::StrCat("skip replay of ", Describe()),
                         [this] { return Replay(true); });
}

ResultOr<OperationPtr> Database::WipePreservedCatalog() {
  {
    absl::MutexLock lock{&_mutex};
    if (IsBootstrapping(_state)) {
      return std::unexpected<Result>{
        std::in_place, ERROR_SERVER_DATABASE_CREATING, Describe(),
        " is still being created (", DatabaseStateName(_state), ")"};
    }
    if (auto r = CheckTransition(kWipeable, "wipe the catalog of"); r.fail()) {
      return std::unexpected{std::move(r)};
    }
    if (auto r = CheckNoChunkWork("wipe the catalog of"); r.fail()) {
      return std::unexpected{std::move(r)};
    }
    _in_transition = true;
    _state = DatabaseState::Replaying;
    _manager.reset();
  }
  CDB_WARN("xxxxx", Logger::LIFECYCLE, "wiping the preserved catalog of ",
           Describe());
  return SpawnTransition(
    absl::StrCat("wipe preserved catalog of ", Describe()), [this] {
      if (auto r = _catalog.WipeAndRebuild(_context.objects); r.fail()) {
        r = std::move(r).withContext("cannot rebuild the catalog of ",
                                     Describe());
        Fail(DatabaseState::ReplayError, r.clone());
        return r;
      }
      return Replay(false);
    });
}

Result Database::CheckInitialized() const {
  if (_state != DatabaseState::Initialized) {
    return {ERROR_SERVER_NOT_INITIALIZED, Describe(), " is ",
            DatabaseStateName(_state)};
  }
  CDB_ASSERT(_manager);
  return {};
}

Result Database::CheckNoChunkWork(std::string_view what) const {
  if (_chunk_work != 0) {
    return {ERROR_SERVER_INVALID_STATE, "cannot ", what, " ", Describe(),
            ", ", _chunk_work, " chunk operation(s) are in flight"};
  }
  return {};
}

ResultOr<std::shared_ptr<ChunkManager>> Database::manager() const {
  absl::MutexLock lock{&_mutex};
  if (auto r = CheckInitialized(); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return _manager;
}

ResultOr<Database::ManagerLease> Database::LeaseManager() {
  absl::MutexLock lock{&_mutex};
  if (auto r = CheckInitialized(); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  ++_chunk_work;
  return ManagerLease{shared_from_this(), _manager};
}

void Database::ManagerLease::reset() {
  if (!_database) {
    return;
  }
  _manager.reset();
  {
    absl::MutexLock lock{&_database->_mutex};
    CDB_ASSERT(_database->_chunk_work > 0);
    --_database->_chunk_work;
  }
  _database.reset();
}

OperationPtr Database::SpawnChunkWork(std::string description,
                                      ManagerLease lease, ChunkWork work,
                                      bool cancellable) {
  return _context.tracker.Spawn(
    std::move(description),
    [lease = std::move(lease), work = std::move(work)](
      operations::OperationContext& context) mutable {
      auto r = work(*lease, context);
      lease.reset();
      return r;
    },
    cancellable);
}

ResultOr<WriteSummary> Database::Write(std::string_view table,
                                       std::span<const Row> rows) {
  auto lease = LeaseManager();
  if (!lease) {
    return std::unexpected{std::move(lease).error()};
  }
  return (*lease)->Write(table, rows);
}

ResultOr<OperationPtr> Database::Rollover(std::string_view table,
                                          std::string_view key) {
  auto lease = LeaseManager();
  if (!lease) {
    return std::unexpected{std::move(lease).error()};
  }
  return SpawnChunkWork(
    absl::StrCat("rollover of partition '", table, ":", key, "' in ",
                 Describe()),
    std::move(*lease),
    [table = std::string{table}, key = std::string{key}](
      ChunkManager& manager, operations::OperationContext&) {
      return Done(manager.Rollover(table, key));
    });
}

ResultOr<OperationPtr> Database::CloseChunk(std::string_view table,
                                            std::string_view key,
                                            ChunkId chunk) {
  auto lease = LeaseManager();
  if (!lease) {
    return std::unexpected{std::move(lease).error()};
  }
  if (auto r = (*lease)->CheckChunk(table, key, chunk); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return SpawnChunkWork(
    absl::StrCat("close chunk ", chunk, " of partition '", table, ":", key,
                 "' in ", Describe()),
    std::move(*lease),
    [table = std::string{table}, key = std::string{key}, chunk](
      ChunkManager& manager, operations::OperationContext&) {
      return manager.CloseChunk(table, key, chunk);
    });
}

ResultOr<OperationPtr> Database::PersistPartition(std::string_view table,
                                                  std::string_view key,
                                                  bool force) {
  auto lease = LeaseManager();
  if (!lease) {
    return std::unexpected{std::move(lease).error()};
  }
  if (auto r = (*lease)->CheckPartition(table, key); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  const auto policy = PersistPolicy::From(force, (*lease)->Rules());
  return SpawnChunkWork(
    absl::StrCat("persist partition '", table, ":", key, "' in ", Describe()),
    std::move(*lease),
    [table = std::string{table}, key = std::string{key}, policy](
      ChunkManager& manager, operations::OperationContext& context) {
      return Done(manager.PersistPartition(table, key, policy, &context));
    },
    true);
}

Result Database::UnloadChunk(std::string_view table, std::string_view key,
                             ChunkId chunk) {
  auto lease = LeaseManager();
  if (!lease) {
    return std::move(lease).error();
  }
  return (*lease)->UnloadChunk(table, key, chunk);
}

ResultOr<std::vector<Row>> Database::ReadChunk(std::string_view table,
                                               std::string_view key,
                                               ChunkId chunk) const {
  auto manager = this->manager();
  if (!manager) {
    return std::unexpected{std::move(manager).error()};
  }
  return (*manager)->ReadChunk(table, key, chunk);
}

ResultOr<OperationPtr> Database::DropChunk(std::string_view table,
                                           std::string_view key,
                                           ChunkId chunk) {
  auto lease = LeaseManager();
  if (!lease) {
    return std::unexpected{std::move(lease).error()};
  }
  if (auto r = (*lease)->CheckChunk(table, key, chunk); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return SpawnChunkWork(
    absl::StrCat("drop chunk ", chunk, " of partition '", table, ":", key,
                 "' in ", Describe()),
    std::move(*lease),
    [table = std::string{table}, key = std::string{key}, chunk](
      ChunkManager& manager, operations::OperationContext&) {
      return manager.DropChunk(table, key, chunk);
    });
}

ResultOr<OperationPtr> Database::DropPartition(std::string_view table,
                                               std::string_view key) {
  auto lease = LeaseManager();
  if (!lease) {
    return std::unexpected{std::move(lease).error()};
  }
  if (auto r = (*lease)->CheckPartition(table, key); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return SpawnChunkWork(
    absl::StrCat("drop partition '", table, ":", key, "' in ", Describe()),
    std::move(*lease),
    [table = std::string{table}, key = std::string{key}](
      ChunkManager& manager, operations::OperationContext&) {
      return manager.DropPartition(table, key);
    });
}

ResultOr<std::vector<PartitionSummary>> Database::ListPartitions() const {
  auto manager = this->manager();
  if (!manager) {
    return std::unexpected{std::move(manager).error()};
  }
  return (*manager)->ListPartitions();
}

ResultOr<PartitionSummary> Database::GetPartition(std::string_view table,
                                                  std::string_view key) const {
  auto manager = this->manager();
  if (!manager) {
    return std::unexpected{std::move(manager).error()};
  }
  return (*manager)->GetPartition(table, key);
}

ResultOr<std::vector<ChunkSummary>> Database::PartitionChunks(
  std::string_view table, std::string_view key) const {
  auto manager = this->manager();
  if (!manager) {
    return std::unexpected{std::move(manager).error()};
  }
  return (*manager)->PartitionChunks(table, key);
}

ResultOr<std::vector<ChunkSummary>> Database::Chunks() const {
  auto manager = this->manager();
  if (!manager) {
    return std::unexpected{std::move(manager).error()};
  }
  return (*manager)->Chunks();
}

}  // namespace cdb
