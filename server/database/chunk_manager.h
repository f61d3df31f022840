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

#include <absl/container/btree_map.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include <atomic>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "basics/result_or.h"
#include "catalog/catalog_entry.h"
#include "catalog/identifiers/database_uuid.h"
#include "database/partition.h"
#include "database/rules.h"

namespace cdb {

class ObjectStore;

namespace catalog {
class PreservedCatalog;
}  // namespace catalog
namespace operations {
class OperationContext;
}  // namespace operations

// which chunks a persist takes
struct PersistPolicy {
  // the open chunk qualifies if it holds rows and its last write is at least
  // `late_arrive_window` old
  bool include_open = false;
  absl::Duration late_arrive_window = absl::ZeroDuration();

  static PersistPolicy From(bool force, const ActiveRules& rules) {
    return {.include_open = force,
            .late_arrive_window = rules.lateArriveWindow()};
  }
};

struct WriteSummary {
  uint64_t rows = 0;
  // partition keys written to, sorted
  std::vector<std::string> partition_keys;
};

struct PersistSummary {
  std::vector<ChunkId> persisted;
};

// Owns the partitions and chunks of one database. Every change of catalogued
// chunk state is appended to the preserved catalog under the partition lock
// before it becomes visible; a failed append leaves memory untouched.
class ChunkManager {
 public:
  ChunkManager(std::string database, DatabaseUuid uuid, ActiveRules rules,
               catalog::PreservedCatalog& catalog, ObjectStore& objects);

  ChunkManager(const ChunkManager&) = delete;
  ChunkManager& operator=(const ChunkManager&) = delete;

  ActiveRules Rules() const;
  void SetRules(ActiveRules rules);

  ResultOr<WriteSummary> Write(std::string_view table,
                               std::span<const Row> rows);

  // closes the open chunk (if any) and opens a new one. returns its id
  ResultOr<ChunkId> Rollover(std::string_view table, std::string_view key);

  Result CheckPartition(std::string_view table, std::string_view key) const;
  // NotFound unless the chunk exists
  Result CheckChunk(std::string_view table, std::string_view key,
                    ChunkId chunk) const;

  Result CloseChunk(std::string_view table, std::string_view key,
                    ChunkId chunk);

  ResultOr<PersistSummary> PersistPartition(
    std::string_view table, std::string_view key, PersistPolicy policy,
    operations::OperationContext* context = nullptr);

  Result UnloadChunk(std::string_view table, std::string_view key,
                     ChunkId chunk);

  // falls back to the artifact for unloaded chunks
  ResultOr<std::vector<Row>> ReadChunk(std::string_view table,
                                       std::string_view key,
                                       ChunkId chunk) const;

  Result DropChunk(std::string_view table, std::string_view key,
                   ChunkId chunk);

  Result DropPartition(std::string_view table, std::string_view key);

  // sorted by table and key
  std::vector<PartitionSummary> ListPartitions() const;

  // an empty table matches a key in any table if it is unambiguous
  ResultOr<PartitionSummary> GetPartition(std::string_view table,
                                          std::string_view key) const;

  ResultOr<std::vector<ChunkSummary>> PartitionChunks(
    std::string_view table, std::string_view key) const;

  // every chunk, sorted by table, key and id
  std::vector<ChunkSummary> Chunks() const;

  // bytes of rows held in memory
  uint64_t BufferBytes() const noexcept {
    return _buffer_bytes.load(std::memory_order_relaxed);
  }

  // replays one catalog entry. entries must come in append order
  Result Apply(const catalog::CatalogEntry& entry);

  // loads the rows of persisted chunks and verifies that the artifacts of
  // unloaded ones are readable. in tolerant mode unreadable chunks are
  // dropped (and the drop catalogued) instead of failing
  Result LoadArtifacts(bool tolerant, std::vector<std::string>* warnings);

 private:
  using PartitionPtr = std::shared_ptr<Partition>;
  using PartitionKey = std::pair<std::string, std::string>;

  std::string Describe(std::string_view table, std::string_view key) const;
  Result PartitionNotFound(std::string_view table, std::string_view key) const;
  Result ChunkNotFound(const Partition& partition, ChunkId chunk) const;

  ResultOr<PartitionPtr> FindPartition(std::string_view table,
                                       std::string_view key) const;
  ResultOr<PartitionPtr> GetOrCreatePartition(std::string_view table,
                                              std::string_view key);

  Result Append(catalog::CatalogEntry entry,
                CatalogSequence* sequence = nullptr);

  // closes the open chunk and opens a new one
  ResultOr<Chunk*> Rotate(Partition& partition)
    ABSL_EXCLUSIVE_LOCKS_REQUIRED(partition.mutex());
  ResultOr<Chunk*> CreateOpenChunk(Partition& partition)
    ABSL_EXCLUSIVE_LOCKS_REQUIRED(partition.mutex());
  Result CloseOpenChunk(Partition& partition)
    ABSL_EXCLUSIVE_LOCKS_REQUIRED(partition.mutex());

  std::string ArtifactPath(const Partition& partition, ChunkId chunk) const;

  Result Inconsistent(const catalog::CatalogEntry& entry,
                      std::string_view reason) const;

  const std::string _database;
  const DatabaseUuid _uuid;
  const std::string _uuid_string;
  catalog::PreservedCatalog& _catalog;
  ObjectStore& _objects;

  mutable absl::Mutex _rules_mutex;
  ActiveRules _rules ABSL_GUARDED_BY(_rules_mutex);

  mutable absl::Mutex _mutex;
  absl::btree_map<PartitionKey, PartitionPtr> _partitions
    ABSL_GUARDED_BY(_mutex);
  // first chunk id of a partition recreated after a drop, so that ids and
  // artifact paths are never reused
  absl::btree_map<PartitionKey, ChunkId> _dropped_next_chunk
    ABSL_GUARDED_BY(_mutex);

  std::atomic_uint64_t _buffer_bytes{0};
};

}  // namespace cdb
