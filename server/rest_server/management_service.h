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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "basics/result_or.h"
#include "database/database.h"
#include "operations/operation.h"
#include "operations/operation_tracker.h"
#include "rest_server/registry.h"

namespace cdb {

// how the transport layer reports a failed call
enum class ErrorKind : uint8_t {
  Ok,
  NotFound,
  AlreadyExists,
  InvalidArgument,
  InvalidState,
  Unavailable,
  Internal,
};

ErrorKind ErrorKindOf(const Result& r) noexcept;
std::string_view ErrorKindName(ErrorKind kind) noexcept;

struct CreateDatabaseResponse {
  DatabaseUuid uuid;
  operations::OperationInfo operation;
};

struct DetailedDatabase {
  std::string name;
  DatabaseUuid uuid;
  DatabaseState state = DatabaseState::Known;
  std::optional<std::string> error;
};

// Administrative surface of the server. Validates names and identifiers,
// routes to the registry and shapes responses; lifecycle logic lives in
// Database and ChunkManager.
class ManagementService {
 public:
  ManagementService(Registry& registry,
                    operations::OperationTracker& tracker) noexcept
    : _registry{registry}, _tracker{tracker} {}

  ResultOr<CreateDatabaseResponse> CreateDatabase(const DatabaseRules& rules);
  ResultOr<DatabaseRules> GetDatabase(std::string_view name,
                                      bool omit_defaults) const;
  // rules of every database that has loaded its rules, sorted by name
  ResultOr<std::vector<DatabaseRules>> ListDatabases(bool omit_defaults) const;
  ResultOr<std::vector<DetailedDatabase>> ListDetailedDatabases() const;
  // returns the active rules
  ResultOr<DatabaseRules> UpdateDatabaseRules(const DatabaseRules& rules);
  ResultOr<DatabaseUuid> ReleaseDatabase(std::string_view name,
                                         std::string_view uuid);
  // returns the name of the claimed database
  ResultOr<std::string> ClaimDatabase(std::string_view uuid);
  ResultOr<operations::OperationInfo> SkipReplay(std::string_view name);

  ResultOr<std::vector<PartitionSummary>> ListPartitions(
    std::string_view db) const;
  // an empty table matches the key in any table if that is unambiguous
  ResultOr<PartitionSummary> GetPartition(std::string_view db,
                                          std::string_view table,
                                          std::string_view key) const;
  ResultOr<std::vector<ChunkSummary>> ListPartitionChunks(
    std::string_view db, std::string_view table, std::string_view key) const;
  ResultOr<std::vector<ChunkSummary>> ListChunks(std::string_view db) const;

  ResultOr<operations::OperationInfo> NewPartitionChunk(
    std::string_view db, std::string_view table, std::string_view key);
  ResultOr<operations::OperationInfo> CloseChunk(std::string_view db,
                                                 std::string_view table,
                                                 std::string_view key,
                                                 uint64_t chunk_id);
  Result UnloadChunk(std::string_view db, std::string_view table,
                     std::string_view key, uint64_t chunk_id);
  ResultOr<operations::OperationInfo> PersistPartition(std::string_view db,
                                                       std::string_view table,
                                                       std::string_view key,
                                                       bool force);
  ResultOr<operations::OperationInfo> DropPartition(std::string_view db,
                                                    std::string_view table,
                                                    std::string_view key);
  ResultOr<operations::OperationInfo> DropChunk(std::string_view db,
                                                std::string_view table,
                                                std::string_view key,
                                                uint64_t chunk_id);
  ResultOr<operations::OperationInfo> WipePreservedCatalog(
    std::string_view db);

  // never fails, also not before bootstrap completed
  ServerStatus GetServerStatus() const;

  ResultOr<operations::OperationInfo> GetOperation(uint64_t id) const;
  std::vector<operations::OperationInfo> ListOperations() const;
  ResultOr<operations::CancelOutcome> CancelOperation(uint64_t id);
  Result AcknowledgeOperation(uint64_t id);
  ResultOr<operations::OperationInfo> CreateDummyJob(
    const std::vector<uint64_t>& nanos);

  ResultOr<WriteSummary> Write(std::string_view db, std::string_view table,
                               std::vector<Row> rows);
  ResultOr<std::vector<Row>> ReadChunk(std::string_view db,
                                       std::string_view table,
                                       std::string_view key,
                                       uint64_t chunk_id) const;

 private:
  // a database that exists and is not released
  ResultOr<std::shared_ptr<Database>> ActiveDatabase(
    std::string_view name) const;

  Registry& _registry;
  operations::OperationTracker& _tracker;
};

}  // namespace cdb
