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

#include "rest_server/management_service.h"

#include <magic_enum/magic_enum.hpp>

#include "basics/logger/logger.h"
#include "database/database_name.h"

namespace cdb {
namespace {

Result ValidatePartitionKey(std::string_view key) {
  if (key.empty()) {
    return {ERROR_BAD_PARAMETER, "partition key must not be empty"};
  }
  return {};
}

Result ValidatePartition(std::string_view db, std::string_view table,
                         std::string_view key) {
  if (auto r = ValidateDatabaseName(db); r.fail()) {
    return r;
  }
  if (auto r = ValidateTableName(table); r.fail()) {
    return r;
  }
  return ValidatePartitionKey(key);
}

ResultOr<operations::OperationInfo> Info(ResultOr<OperationPtr>&& operation) {
  if (!operation) {
    return std::unexpected{std::move(operation).error()};
  }
  return (*operation)->info();
}

}  // namespace

ErrorKind ErrorKindOf(const Result& r) noexcept {
  if (r.ok()) {
    return ErrorKind::Ok;
  }
  const auto code = r.errorNumber();
  if (code == ERROR_SERVER_DATABASE_NOT_FOUND ||
      code == ERROR_SERVER_PARTITION_NOT_FOUND ||
      code == ERROR_SERVER_CHUNK_NOT_FOUND ||
      code == ERROR_SERVER_OPERATION_NOT_FOUND || code == ERROR_FILE_NOT_FOUND) {
    return ErrorKind::NotFound;
  }
  if (code == ERROR_SERVER_DUPLICATE_NAME ||
      code == ERROR_SERVER_DATABASE_CREATING) {
    return ErrorKind::AlreadyExists;
  }
  if (code == ERROR_BAD_PARAMETER || code == ERROR_SERVER_ILLEGAL_NAME ||
      code == ERROR_SERVER_INVALID_RULES || code == ERROR_SERVER_INVALID_UUID) {
    return ErrorKind::InvalidArgument;
  }
  if (code == ERROR_SERVER_INVALID_STATE ||
      code == ERROR_SERVER_IDENTIFIER_MISMATCH ||
      code == ERROR_SERVER_CONFLICT || code == ERROR_SERVER_READ_ONLY) {
    return ErrorKind::InvalidState;
  }
  if (code == ERROR_SERVER_NOT_INITIALIZED || code == ERROR_SHUTTING_DOWN) {
    return ErrorKind::Unavailable;
  }
  return ErrorKind::Internal;
}

std::string_view ErrorKindName(ErrorKind kind) noexcept {
  return magic_enum::enum_name(kind);
}

ResultOr<std::shared_ptr<Database>> ManagementService::ActiveDatabase(
  std::string_view name) const {
  if (auto r = ValidateDatabaseName(name); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto database = _registry.GetDatabase(name);
  if (!database) {
    return database;
  }
  if ((*database)->state() == DatabaseState::Released) {
    return std::unexpected<Result>{std::in_place,
                                   ERROR_SERVER_DATABASE_NOT_FOUND, "database '",
                                   name, "' is released"};
  }
  return database;
}

ResultOr<CreateDatabaseResponse> ManagementService::CreateDatabase(
  const DatabaseRules& rules) {
  if (auto r = ValidateRules(rules); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto created = _registry.CreateDatabase(rules);
  if (!created) {
    return std::unexpected{std::move(created).error()};
  }
  return CreateDatabaseResponse{created->uuid, created->operation->info()};
}

ResultOr<DatabaseRules> ManagementService::GetDatabase(
  std::string_view name, bool omit_defaults) const {
  auto database = ActiveDatabase(name);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  if (omit_defaults) {
    if (auto provided = (*database)->providedRules()) {
      return std::move(*provided);
    }
  } else if (auto active = (*database)->activeRules()) {
    return active->toRules();
  }
  return std::unexpected<Result>{std::in_place, ERROR_SERVER_NOT_INITIALIZED,
                                 "rules of database '", name,
                                 "' have not been loaded yet"};
}

ResultOr<std::vector<DatabaseRules>> ManagementService::ListDatabases(
  bool omit_defaults) const {
  std::vector<DatabaseRules> rules;
  for (const auto& database : _registry.Databases()) {
    if (omit_defaults) {
      if (auto provided = database->providedRules()) {
        rules.push_back(std::move(*provided));
      }
    } else if (auto active = database->activeRules()) {
      rules.push_back(active->toRules());
    }
  }
  return rules;
}

ResultOr<std::vector<DetailedDatabase>>
ManagementService::ListDetailedDatabases() const {
  std::vector<DetailedDatabase> databases;
  for (const auto& database : _registry.Databases()) {
    auto status = database->status();
    databases.push_back({
      .name = std::move(status.name),
      .uuid = status.uuid,
      .state = status.state,
      .error = std::move(status.error),
    });
  }
  return databases;
}

ResultOr<DatabaseRules> ManagementService::UpdateDatabaseRules(
  const DatabaseRules& rules) {
  if (auto r = ValidateRules(rules); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto database = ActiveDatabase(rules.name);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  auto active = (*database)->UpdateRules(rules);
  if (!active) {
    return std::unexpected{std::move(active).error()};
  }
  return active->toRules();
}

ResultOr<DatabaseUuid> ManagementService::ReleaseDatabase(
  std::string_view name, std::string_view uuid) {
  if (auto r = ValidateDatabaseName(name); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  std::optional<DatabaseUuid> expected;
  if (!uuid.empty()) {
    auto parsed = DatabaseUuid::Parse(uuid);
    if (!parsed) {
      return std::unexpected{std::move(parsed).error()};
    }
    expected = *parsed;
  }
  return _registry.ReleaseDatabase(name, expected);
}

ResultOr<std::string> ManagementService::ClaimDatabase(std::string_view uuid) {
  auto parsed = DatabaseUuid::Parse(uuid);
  if (!parsed) {
    return std::unexpected{std::move(parsed).error()};
  }
  return _registry.ClaimDatabase(*parsed);
}

ResultOr<operations::OperationInfo> ManagementService::SkipReplay(
  std::string_view name) {
  if (auto r = ValidateDatabaseName(name); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto database = _registry.GetDatabase(name);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return Info((*database)->SkipReplay());
}

ResultOr<std::vector<PartitionSummary>> ManagementService::ListPartitions(
  std::string_view db) const {
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return (*database)->ListPartitions();
}

ResultOr<PartitionSummary> ManagementService::GetPartition(
  std::string_view db, std::string_view table, std::string_view key) const {
  if (auto r = ValidatePartitionKey(key); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  if (!table.empty()) {
    if (auto r = ValidateTableName(table); r.fail()) {
      return std::unexpected{std::move(r)};
    }
  }
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return (*database)->GetPartition(table, key);
}

ResultOr<std::vector<ChunkSummary>> ManagementService::ListPartitionChunks(
  std::string_view db, std::string_view table, std::string_view key) const {
  if (auto r = ValidatePartition(db, table, key); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return (*database)->PartitionChunks(table, key);
}

ResultOr<std::vector<ChunkSummary>> ManagementService::ListChunks(
  std::string_view db) const {
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return (*database)->Chunks();
}

ResultOr<operations::OperationInfo> ManagementService::NewPartitionChunk(
  std::string_view db, std::string_view table, std::string_view key) {
  if (auto r = ValidatePartition(db, table, key); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return Info((*database)->Rollover(table, key));
}

ResultOr<operations::OperationInfo> ManagementService::CloseChunk(
  std::string_view db, std::string_view table, std::string_view key,
  uint64_t chunk_id) {
  if (auto r = ValidatePartition(db, table, key); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return Info((*database)->CloseChunk(table, key, ChunkId{chunk_id}));
}

Result ManagementService::UnloadChunk(std::string_view db,
                                      std::string_view table,
                                      std::string_view key,
                                      uint64_t chunk_id) {
  if (auto r = ValidatePartition(db, table, key); r.fail()) {
    return r;
  }
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::move(database).error();
  }
  return (*database)->UnloadChunk(table, key, ChunkId{chunk_id});
}

ResultOr<operations::OperationInfo> ManagementService::PersistPartition(
  std::string_view db, std::string_view table, std::string_view key,
  bool force) {
  if (auto r = ValidatePartition(db, table, key); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return Info((*database)->PersistPartition(table, key, force));
}

ResultOr<operations::OperationInfo> ManagementService::DropPartition(
  std::string_view db, std::string_view table, std::string_view key) {
  if (auto r = ValidatePartition(db, table, key); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return Info((*database)->DropPartition(table, key));
}

ResultOr<operations::OperationInfo> ManagementService::DropChunk(
  std::string_view db, std::string_view table, std::string_view key,
  uint64_t chunk_id) {
  if (auto r = ValidatePartition(db, table, key); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return Info((*database)->DropChunk(table, key, ChunkId{chunk_id}));
}

ResultOr<operations::OperationInfo> ManagementService::WipePreservedCatalog(
  std::string_view db) {
  if (auto r = ValidateDatabaseName(db); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return Info(_registry.WipePreservedCatalog(db));
}

ServerStatus ManagementService::GetServerStatus() const {
  return _registry.Status();
}

ResultOr<operations::OperationInfo> ManagementService::GetOperation(
  uint64_t id) const {
  return _tracker.Get(operations::OperationId{id});
}

std::vector<operations::OperationInfo> ManagementService::ListOperations()
  const {
  return _tracker.List();
}

ResultOr<operations::CancelOutcome> ManagementService::CancelOperation(
  uint64_t id) {
  return _tracker.Cancel(operations::OperationId{id});
}

Result ManagementService::AcknowledgeOperation(uint64_t id) {
  return _tracker.Acknowledge(operations::OperationId{id});
}

ResultOr<operations::OperationInfo> ManagementService::CreateDummyJob(
  const std::vector<uint64_t>& nanos) {
  std::vector<absl::Duration> steps;
  steps.reserve(nanos.size());
  for (auto n : nanos) {
    steps.push_back(absl::Nanoseconds(n));
  }
  return _tracker.SpawnDummyJob(std::move(steps))->info();
}

ResultOr<WriteSummary> ManagementService::Write(std::string_view db,
                                                std::string_view table,
                                                std::vector<Row> rows) {
  if (auto r = ValidateTableName(table); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return (*database)->Write(table, rows);
}

ResultOr<std::vector<Row>> ManagementService::ReadChunk(
  std::string_view db, std::string_view table, std::string_view key,
  uint64_t chunk_id) const {
  if (auto r = ValidatePartition(db, table, key); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  auto database = ActiveDatabase(db);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return (*database)->ReadChunk(table, key, ChunkId{chunk_id});
}

}  // namespace cdb
