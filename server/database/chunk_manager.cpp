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

#include "database/chunk_manager.h"

#include <absl/time/clock.h>

#include <algorithm>
#include <iterator>

#include "basics/assert.h"
#include "basics/debugging.h"
#include "basics/logger/logger.h"
#include "basics/string_utils.h"
#include "catalog/preserved_catalog.h"
#include "database/database_name.h"
#include "operations/operation.h"
#include "storage_engine/object_store.h"

namespace cdb {
namespace {

struct PendingPersist {
  Chunk* chunk = nullptr;
  ChunkArtifact artifact;
  std::string path;
  std::string bytes;
  Result result;
};

}  // namespace

ChunkManager::ChunkManager(std::string database, DatabaseUuid uuid,
                           ActiveRules rules,
                           catalog::PreservedCatalog& catalog,
                           ObjectStore& objects)
  : _database{std::move(database)},
    _uuid{uuid},
    _uuid_string{uuid.toString()},
    _catalog{catalog},
    _objects{objects},
    _rules{std::move(rules)} {}

ActiveRules ChunkManager::Rules() const {
  absl::MutexLock lock{&_rules_mutex};
  return _rules;
}

void ChunkManager::SetRules(ActiveRules rules) {
  absl::MutexLock lock{&_rules_mutex};
  _rules = std::move(rules);
}

std::string ChunkManager::Describe(std::string_view table,
                                   std::string_view key) const {
  return absl::StrCat("partition '", table, ":", key, "' in database '",
                      _database, "'");
}

Result ChunkManager::PartitionNotFound(std::string_view table,
                                       std::string_view key) const {
  return {ERROR_SERVER_PARTITION_NOT_FOUND, Describe(table, key),
          " not found"};
}

Result ChunkManager::ChunkNotFound(const Partition& partition,
                                   ChunkId chunk) const {
  return {ERROR_SERVER_CHUNK_NOT_FOUND, "chunk ", chunk, " of ",
          Describe(partition.table(), partition.key()), " not found"};
}

ResultOr<ChunkManager::PartitionPtr> ChunkManager::FindPartition(
  std::string_view table, std::string_view key) const {
  absl::MutexLock lock{&_mutex};
  auto it = _partitions.find(PartitionKey{table, key});
  if (it == _partitions.end()) {
    return std::unexpected{PartitionNotFound(table, key)};
  }
  return it->second;
}

ResultOr<ChunkManager::PartitionPtr> ChunkManager::GetOrCreatePartition(
  std::string_view table, std::string_view key) {
  absl::MutexLock lock{&_mutex};
  PartitionKey id{table, key};
  if (auto it = _partitions.find(id); it != _partitions.end()) {
    return it->second;
  }
  if (auto r = Append(catalog::CatalogEntry::PartitionCreated(table, key));
      r.fail()) {
    return std::unexpected{std::move(r)};
  }
  ChunkId first;
  if (auto it = _dropped_next_chunk.find(id); it != _dropped_next_chunk.end()) {
    first = it->second;
  }
  auto partition =
    std::make_shared<Partition>(std::string{table}, std::string{key}, first);
  _partitions.emplace(std::move(id), partition);
  CDB_DEBUG("xxxxx", Logger::ENGINES, "created ", Describe(table, key));
  return partition;
}

Result ChunkManager::Append(catalog::CatalogEntry entry,
                            CatalogSequence* sequence) {
  auto appended = _catalog.Append(entry);
  if (!appended) {
    return std::move(appended).error().withContext(
      "cannot record ", catalog::EntryKindName(entry.kind), " for ",
      Describe(entry.table, entry.partition_key));
  }
  if (sequence != nullptr) {
    *sequence = *appended;
  }
  return {};
}

ResultOr<Chunk*> ChunkManager::CreateOpenChunk(Partition& partition) {
  CDB_ASSERT(partition.openChunk() == nullptr);
  const auto id = partition.nextChunkId();
  if (auto r = Append(catalog::CatalogEntry::ChunkCreated(
        partition.table(), partition.key(), id));
      r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return &partition.addChunk(id);
}

Result ChunkManager::CloseOpenChunk(Partition& partition) {
  auto* open = partition.openChunk();
  if (open == nullptr) {
    return {};
  }
  if (auto r = Append(catalog::CatalogEntry::ChunkClosed(
        partition.table(), partition.key(), open->id()));
      r.fail()) {
    return r;
  }
  open->setState(ChunkState::Closing);
  return {};
}

ResultOr<Chunk*> ChunkManager::Rotate(Partition& partition) {
  if (auto r = CloseOpenChunk(partition); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return CreateOpenChunk(partition);
}

std::string ChunkManager::ArtifactPath(const Partition& partition,
                                       ChunkId chunk) const {
  return object_paths::Chunk(_uuid_string, partition.table(), partition.key(),
                             chunk.id());
}

ResultOr<WriteSummary> ChunkManager::Write(std::string_view table,
                                           std::span<const Row> rows) {
  const auto rules = Rules();
  if (rules.immutable) {
    return std::unexpected<Result>{std::in_place, ERROR_SERVER_READ_ONLY,
                                   "database '", _database,
                                   "' is immutable, writes are rejected"};
  }
  if (auto r = ValidateTableName(table); r.fail()) {
    return std::unexpected{std::move(r)};
  }

  uint64_t incoming = 0;
  for (const auto& row : rows) {
    incoming += Chunk::RowBytes(row);
  }
  const auto buffered = BufferBytes();
  if (rules.buffer_size_hard != 0 &&
      buffered + incoming > rules.buffer_size_hard) {
    return std::unexpected<Result>{
      std::in_place,
      ERROR_SERVER_RESOURCE_LIMIT,
      "write of ",
      basics::string_utils::FormatSize(incoming),
      " to database '",
      _database,
      "' exceeds the hard buffer limit of ",
      basics::string_utils::FormatSize(rules.buffer_size_hard)};
  }
  CDB_WARN_IF("xxxxx", Logger::ENGINES,
              rules.buffer_size_soft != 0 &&
                buffered + incoming > rules.buffer_size_soft,
              "database '", _database, "' exceeds its soft buffer limit of ",
              basics::string_utils::FormatSize(rules.buffer_size_soft));

  absl::btree_map<std::string, std::vector<Row>> groups;
  for (const auto& row : rows) {
    groups[rules.partitionKey(row.time)].push_back(row);
  }

  WriteSummary summary;
  const auto now = absl::Now();
  for (const auto& [key, group] : groups) {
    while (true) {
      auto partition = GetOrCreatePartition(table, key);
      if (!partition) {
        return std::unexpected{std::move(partition).error()};
      }
      auto& p = **partition;
      absl::MutexLock lock{&p.mutex()};
      if (p.dropped()) {
        // dropped concurrently, retry with a fresh partition
        continue;
      }
      std::span<const Row> remaining{group};
      while (!remaining.empty()) {
        Chunk* open = p.openChunk();
        if (open == nullptr) {
          auto created = CreateOpenChunk(p);
          if (!created) {
            return std::unexpected{std::move(created).error()};
          }
          open = *created;
        }
        const auto room =
          rules.mub_row_threshold - std::min(rules.mub_row_threshold,
                                             open->rowCount());
        const auto n = std::min<size_t>(remaining.size(), room);
        const auto before = open->byteSize();
        open->append(remaining.first(n), now);
        _buffer_bytes.fetch_add(open->byteSize() - before,
                                std::memory_order_relaxed);
        summary.rows += n;
        remaining = remaining.subspan(n);
        if (open->rowCount() >= rules.mub_row_threshold) {
          CDB_DEBUG("xxxxx", Logger::ENGINES, "chunk ", open->id(), " of ",
                    Describe(table, key), " reached ", open->rowCount(),
                    " rows, rolling over");
          if (auto rotated = Rotate(p); !rotated) {
            return std::unexpected{std::move(rotated).error()};
          }
        }
      }
      break;
    }
    summary.partition_keys.push_back(key);
  }
  return summary;
}

ResultOr<ChunkId> ChunkManager::Rollover(std::string_view table,
                                         std::string_view key) {
  if (auto r = ValidateTableName(table); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  while (true) {
    auto partition = GetOrCreatePartition(table, key);
    if (!partition) {
      return std::unexpected{std::move(partition).error()};
    }
    auto& p = **partition;
    absl::MutexLock lock{&p.mutex()};
    if (p.dropped()) {
      continue;
    }
    auto open = Rotate(p);
    if (!open) {
      return std::unexpected{std::move(open).error()};
    }
    CDB_DEBUG("xxxxx", Logger::ENGINES, "rolled over ", Describe(table, key),
              ", chunk ", (*open)->id(), " is open");
    return (*open)->id();
  }
}

Result ChunkManager::CheckPartition(std::string_view table,
                                    std::string_view key) const {
  auto partition = FindPartition(table, key);
  if (!partition) {
    return std::move(partition).error();
  }
  absl::MutexLock lock{&(*partition)->mutex()};
  if ((*partition)->dropped()) {
    return PartitionNotFound(table, key);
  }
  return {};
}

Result ChunkManager::CheckChunk(std::string_view table, std::string_view key,
                                ChunkId chunk) const {
  auto partition = FindPartition(table, key);
  if (!partition) {
    return std::move(partition).error();
  }
  auto& p = **partition;
  absl::MutexLock lock{&p.mutex()};
  if (p.dropped()) {
    return PartitionNotFound(table, key);
  }
  auto* c = p.findChunk(chunk);
  if (c == nullptr || c->state() == ChunkState::Dropped) {
    return ChunkNotFound(p, chunk);
  }
  return {};
}

Result ChunkManager::CloseChunk(std::string_view table, std::string_view key,
                                ChunkId chunk) {
  auto partition = FindPartition(table, key);
  if (!partition) {
    return std::move(partition).error();
  }
  auto& p = **partition;
  absl::MutexLock lock{&p.mutex()};
  if (p.dropped()) {
    return PartitionNotFound(table, key);
  }
  auto* c = p.findChunk(chunk);
  if (c == nullptr || c->state() == ChunkState::Dropped) {
    return ChunkNotFound(p, chunk);
  }
  if (c->state() == ChunkState::Open) {
    if (auto rotated = Rotate(p); !rotated) {
      return std::move(rotated).error();
    }
  }
  if (c->state() == ChunkState::Closing) {
    const auto before = c->byteSize();
    c->freeze();
    CDB_ASSERT(before == c->byteSize());
  }
  return {};
}

ResultOr<PersistSummary> ChunkManager::PersistPartition(
  std::string_view table, std::string_view key, PersistPolicy policy,
  operations::OperationContext* context) {
  auto partition = FindPartition(table, key);
  if (!partition) {
    return std::unexpected{std::move(partition).error()};
  }
  auto& p = **partition;

  std::vector<PendingPersist> pending;
  {
    absl::MutexLock lock{&p.mutex()};
    if (p.dropped()) {
      return std::unexpected{PartitionNotFound(table, key)};
    }
    if (auto* open = p.openChunk(); policy.include_open && open != nullptr &&
                                    !open->empty() &&
                                    absl::Now() - open->lastWrite() >=
                                      policy.late_arrive_window) {
      if (auto rotated = Rotate(p); !rotated) {
        return std::unexpected{std::move(rotated).error()};
      }
    }
    p.forEachChunk([&](Chunk& chunk) {
      if (chunk.state() != ChunkState::Closing &&
          chunk.state() != ChunkState::ReadBuffer) {
        return;
      }
      chunk.setState(ChunkState::Persisting);
      PendingPersist job;
      job.chunk = &chunk;
      job.path = ArtifactPath(p, chunk.id());
      job.artifact.table = p.table();
      job.artifact.partition_key = p.key();
      job.artifact.chunk = chunk.id();
      job.artifact.min_time = chunk.minTime();
      job.artifact.max_time = chunk.maxTime();
      job.artifact.rows = chunk.rows();
      pending.push_back(std::move(job));
    });
  }

  const uint64_t total = pending.size();
  uint64_t done = 0;
  for (auto& job : pending) {
    if (context != nullptr) {
      job.result = context->checkpoint();
    }
    if (job.result.ok()) {
      std::ranges::stable_sort(job.artifact.rows, {}, &Row::time);
      job.bytes = job.artifact.Encode();
      job.result = _objects.Put(job.path, job.bytes);
    }
    if (context != nullptr) {
      context->setProgress(++done, total);
    }
  }

  PersistSummary summary;
  Result failure;
  absl::MutexLock lock{&p.mutex()};
  for (auto& job : pending) {
    auto& chunk = *job.chunk;
    if (job.result.ok()) {
      catalog::ChunkLocation location{
        .path = job.path,
        .row_count = job.artifact.rows.size(),
        .byte_size = job.bytes.size(),
        .min_time = job.artifact.min_time,
        .max_time = job.artifact.max_time,
      };
      CatalogSequence sequence;
      job.result = Append(
        catalog::CatalogEntry::ChunkPersisted(p.table(), p.key(), chunk.id(),
                                              location),
        &sequence);
      if (job.result.ok()) {
        chunk.setState(ChunkState::Persisted);
        chunk.setLocation(std::move(location), sequence);
        summary.persisted.push_back(chunk.id());
        continue;
      }
      // the artifact is not referenced by the catalog
      auto r = _objects.Delete(job.path);
      CDB_WARN_IF("xxxxx", Logger::ENGINES, r.fail(),
                  "cannot remove unreferenced artifact '", job.path,
                  "': ", r.errorMessage());
    }
    chunk.abortPersist();
    if (failure.ok()) {
      failure = std::move(job.result);
    }
  }
  if (failure.fail()) {
    return std::unexpected{std::move(failure)};
  }
  CDB_DEBUG("xxxxx", Logger::ENGINES, "persisted ", summary.persisted.size(),
            " chunk(s) of ", Describe(table, key));
  return summary;
}

Result ChunkManager::UnloadChunk(std::string_view table, std::string_view key,
                                 ChunkId chunk) {
  auto partition = FindPartition(table, key);
  if (!partition) {
    return std::move(partition).error();
  }
  auto& p = **partition;
  absl::MutexLock lock{&p.mutex()};
  if (p.dropped()) {
    return PartitionNotFound(table, key);
  }
  auto* c = p.findChunk(chunk);
  if (c == nullptr || c->state() == ChunkState::Dropped) {
    return ChunkNotFound(p, chunk);
  }
  if (c->state() != ChunkState::Persisted) {
    return {ERROR_SERVER_INVALID_STATE,
            "chunk ",
            chunk,
            " of ",
            Describe(table, key),
            " is ",
            ChunkStateName(c->state()),
            "; only Persisted chunks can be unloaded"};
  }
  if (auto r = Append(
        catalog::CatalogEntry::ChunkUnloaded(p.table(), p.key(), chunk));
      r.fail()) {
    return r;
  }
  _buffer_bytes.fetch_sub(c->memoryBytes(), std::memory_order_relaxed);
  c->unload();
  return {};
}

ResultOr<std::vector<Row>> ChunkManager::ReadChunk(std::string_view table,
                                                   std::string_view key,
                                                   ChunkId chunk) const {
  auto partition = FindPartition(table, key);
  if (!partition) {
    return std::unexpected{std::move(partition).error()};
  }
  auto& p = **partition;
  std::string path;
  {
    absl::MutexLock lock{&p.mutex()};
    if (p.dropped()) {
      return std::unexpected{PartitionNotFound(table, key)};
    }
    auto* c = p.findChunk(chunk);
    if (c == nullptr || c->state() == ChunkState::Dropped) {
      return std::unexpected{ChunkNotFound(p, chunk)};
    }
    if (c->state() != ChunkState::Unloaded) {
      return c->rows();
    }
    CDB_ASSERT(c->location());
    path = c->location()->path;
  }

  auto bytes = _objects.Get(path);
  if (!bytes) {
    return std::unexpected{std::move(bytes).error().withContext(
      "cannot read chunk ", chunk, " of ", Describe(table, key))};
  }
  auto artifact = ChunkArtifact::Decode(*bytes);
  if (!artifact) {
    return std::unexpected{std::move(artifact).error().withContext(
      "cannot read chunk ", chunk, " of ", Describe(table, key))};
  }
  return std::move(artifact->rows);
}

Result ChunkManager::DropChunk(std::string_view table, std::string_view key,
                               ChunkId chunk) {
  auto partition = FindPartition(table, key);
  if (!partition) {
    return std::move(partition).error();
  }
  auto& p = **partition;
  std::string path;
  {
    absl::MutexLock lock{&p.mutex()};
    if (p.dropped()) {
      return PartitionNotFound(table, key);
    }
    auto* c = p.findChunk(chunk);
    if (c == nullptr || c->state() == ChunkState::Dropped) {
      return ChunkNotFound(p, chunk);
    }
    if (c->state() == ChunkState::Open ||
        c->state() == ChunkState::Persisting) {
      return {ERROR_SERVER_INVALID_STATE, "chunk ", chunk, " of ",
              Describe(table, key), " is ", ChunkStateName(c->state()),
              " and cannot be dropped"};
    }
    if (auto r = Append(
          catalog::CatalogEntry::ChunkDropped(p.table(), p.key(), chunk));
        r.fail()) {
      return r;
    }
    if (c->location()) {
      path = c->location()->path;
    }
    _buffer_bytes.fetch_sub(c->memoryBytes(), std::memory_order_relaxed);
    c->setState(ChunkState::Dropped);
    p.removeChunk(chunk);
  }

  CDB_DEBUG("xxxxx", Logger::ENGINES, "dropped chunk ", chunk, " of ",
            Describe(table, key));
  if (!path.empty()) {
    return _objects.Delete(path).withContext("cannot delete artifact of chunk ",
                                             chunk, " of ",
                                             Describe(table, key));
  }
  return {};
}

Result ChunkManager::DropPartition(std::string_view table,
                                   std::string_view key) {
  std::vector<std::string> paths;
  {
    absl::MutexLock map_lock{&_mutex};
    PartitionKey id{table, key};
    auto it = _partitions.find(id);
    if (it == _partitions.end()) {
      return PartitionNotFound(table, key);
    }
    auto& p = *it->second;
    absl::MutexLock lock{&p.mutex()};
    bool busy = false;
    p.forEachChunk([&](const Chunk& chunk) {
      busy = busy || chunk.state() == ChunkState::Persisting;
    });
    if (busy) {
      return {ERROR_SERVER_INVALID_STATE, Describe(table, key),
              " has chunks being persisted and cannot be dropped"};
    }
    if (auto r = CloseOpenChunk(p); r.fail()) {
      return r;
    }
    if (auto r =
          Append(catalog::CatalogEntry::PartitionDropped(p.table(), p.key()));
        r.fail()) {
      return r;
    }
    p.forEachChunk([&](const Chunk& chunk) {
      if (chunk.location()) {
        paths.push_back(chunk.location()->path);
      }
      _buffer_bytes.fetch_sub(chunk.memoryBytes(), std::memory_order_relaxed);
    });
    p.markDropped();
    _dropped_next_chunk.insert_or_assign(id, p.nextChunkId());
    _partitions.erase(it);
  }

  CDB_INFO("xxxxx", Logger::ENGINES, "dropped ", Describe(table, key), " with ",
           paths.size(), " persisted chunk(s)");
  Result failure;
  for (const auto& path : paths) {
    if (auto r = _objects.Delete(path); r.fail() && failure.ok()) {
      failure = std::move(r);
    }
  }
  return std::move(failure).withContext("cannot delete artifacts of ",
                                        Describe(table, key));
}

std::vector<PartitionSummary> ChunkManager::ListPartitions() const {
  std::vector<PartitionPtr> partitions;
  {
    absl::MutexLock lock{&_mutex};
    for (const auto& [_, partition] : _partitions) {
      partitions.push_back(partition);
    }
  }
  std::vector<PartitionSummary> summaries;
  summaries.reserve(partitions.size());
  for (const auto& partition : partitions) {
    absl::MutexLock lock{&partition->mutex()};
    if (!partition->dropped()) {
      summaries.push_back(partition->summary());
    }
  }
  return summaries;
}

ResultOr<PartitionSummary> ChunkManager::GetPartition(
  std::string_view table, std::string_view key) const {
  if (!table.empty()) {
    auto partition = FindPartition(table, key);
    if (!partition) {
      return std::unexpected{std::move(partition).error()};
    }
    absl::MutexLock lock{&(*partition)->mutex()};
    if ((*partition)->dropped()) {
      return std::unexpected{PartitionNotFound(table, key)};
    }
    return (*partition)->summary();
  }

  std::vector<PartitionSummary> matches;
  for (auto& summary : ListPartitions()) {
    if (summary.key == key) {
      matches.push_back(std::move(summary));
    }
  }
  if (matches.empty()) {
    return std::unexpected<Result>{
      std::in_place, ERROR_SERVER_PARTITION_NOT_FOUND, "partition '", key,
      "' in database '", _database, "' not found"};
  }
  if (matches.size() > 1) {
    return std::unexpected<Result>{
      std::in_place, ERROR_BAD_PARAMETER, "partition key '", key,
      "' exists in ", matches.size(), " tables of database '", _database,
      "', a table name is required"};
  }
  return std::move(matches.front());
}

ResultOr<std::vector<ChunkSummary>> ChunkManager::PartitionChunks(
  std::string_view table, std::string_view key) const {
  auto partition = FindPartition(table, key);
  if (!partition) {
    return std::unexpected{std::move(partition).error()};
  }
  absl::MutexLock lock{&(*partition)->mutex()};
  if ((*partition)->dropped()) {
    return std::unexpected{PartitionNotFound(table, key)};
  }
  return (*partition)->chunkSummaries();
}

std::vector<ChunkSummary> ChunkManager::Chunks() const {
  std::vector<PartitionPtr> partitions;
  {
    absl::MutexLock lock{&_mutex};
    for (const auto& [_, partition] : _partitions) {
      partitions.push_back(partition);
    }
  }
  std::vector<ChunkSummary> chunks;
  for (const auto& partition : partitions) {
    absl::MutexLock lock{&partition->mutex()};
    if (partition->dropped()) {
      continue;
    }
    auto summaries = partition->chunkSummaries();
    chunks.insert(chunks.end(), std::make_move_iterator(summaries.begin()),
                  std::make_move_iterator(summaries.end()));
  }
  return chunks;
}

Result ChunkManager::Inconsistent(const catalog::CatalogEntry& entry,
                                  std::string_view reason) const {
  return {ERROR_SERVER_CORRUPTED_DATAFILE, "catalog entry ", entry.Describe(),
          " of database '", _database, "' is inconsistent: ", reason};
}

Result ChunkManager::Apply(const catalog::CatalogEntry& entry) {
  using catalog::EntryKind;

  absl::MutexLock map_lock{&_mutex};
  PartitionKey id{entry.table, entry.partition_key};
  auto it = _partitions.find(id);

  if (entry.kind == EntryKind::PartitionCreated) {
    if (it != _partitions.end()) {
      return Inconsistent(entry, "partition already exists");
    }
    ChunkId first;
    if (auto dropped = _dropped_next_chunk.find(id);
        dropped != _dropped_next_chunk.end()) {
      first = dropped->second;
    }
    _partitions.emplace(
      std::move(id),
      std::make_shared<Partition>(entry.table, entry.partition_key, first));
    return {};
  }

  if (it == _partitions.end()) {
    return Inconsistent(entry, "partition does not exist");
  }
  auto& p = *it->second;
  absl::MutexLock lock{&p.mutex()};

  if (entry.kind == EntryKind::PartitionDropped) {
    if (p.openChunk() != nullptr) {
      return Inconsistent(entry, "partition still has an open chunk");
    }
    p.forEachChunk([&](const Chunk& chunk) {
      _buffer_bytes.fetch_sub(chunk.memoryBytes(), std::memory_order_relaxed);
    });
    p.markDropped();
    _dropped_next_chunk.insert_or_assign(id, p.nextChunkId());
    _partitions.erase(it);
    return {};
  }

  if (entry.kind == EntryKind::ChunkCreated) {
    if (entry.chunk < p.nextChunkId()) {
      return Inconsistent(entry, absl::StrCat("chunk id is below ",
                                              p.nextChunkId().id()));
    }
    if (p.openChunk() != nullptr) {
      return Inconsistent(entry, "partition already has an open chunk");
    }
    p.addChunk(entry.chunk);
    return {};
  }

  auto* chunk = p.findChunk(entry.chunk);
  if (chunk == nullptr) {
    return Inconsistent(entry, "chunk does not exist");
  }
  auto expect = [&](ChunkState state) -> Result {
    if (chunk->state() != state) {
      return Inconsistent(entry, absl::StrCat("chunk is ",
                                              ChunkStateName(chunk->state()),
                                              ", expected ",
                                              ChunkStateName(state)));
    }
    return {};
  };

  switch (entry.kind) {
    case EntryKind::ChunkClosed:
      if (auto r = expect(ChunkState::Open); r.fail()) {
        return r;
      }
      chunk->setState(ChunkState::Closing);
      return {};
    case EntryKind::ChunkPersisted:
      if (auto r = expect(ChunkState::Closing); r.fail()) {
        return r;
      }
      chunk->setState(ChunkState::Persisted);
      chunk->setLocation(entry.location, entry.sequence);
      return {};
    case EntryKind::ChunkUnloaded:
      if (auto r = expect(ChunkState::Persisted); r.fail()) {
        return r;
      }
      chunk->setState(ChunkState::Unloaded);
      return {};
    case EntryKind::ChunkDropped:
      if (chunk->state() == ChunkState::Open) {
        return Inconsistent(entry, "an open chunk cannot be dropped");
      }
      _buffer_bytes.fetch_sub(chunk->memoryBytes(), std::memory_order_relaxed);
      p.removeChunk(entry.chunk);
      return {};
    default:
      CDB_ASSERT(false, "unexpected entry kind ",
                 catalog::EntryKindName(entry.kind));
      return Inconsistent(entry, "unexpected entry kind");
  }
}

Result ChunkManager::LoadArtifacts(bool tolerant,
                                   std::vector<std::string>* warnings) {
  for (const auto& partition : [&] {
         absl::MutexLock lock{&_mutex};
         std::vector<PartitionPtr> partitions;
         for (const auto& [_, p] : _partitions) {
           partitions.push_back(p);
         }
         return partitions;
       }()) {
    auto& p = *partition;
    absl::MutexLock lock{&p.mutex()};
    std::vector<ChunkId> unreadable;
    Result failure;
    p.forEachChunk([&](Chunk& chunk) {
      if (failure.fail() || (chunk.state() != ChunkState::Persisted &&
                             chunk.state() != ChunkState::Unloaded)) {
        return;
      }
      const auto& location = *chunk.location();
      auto artifact = [&]() -> ResultOr<ChunkArtifact> {
        auto bytes = _objects.Get(location.path);
        if (!bytes) {
          return std::unexpected{std::move(bytes).error()};
        }
        return ChunkArtifact::Decode(*bytes);
      }();
      if (artifact) {
        if (chunk.state() == ChunkState::Persisted) {
          chunk.restore(std::move(artifact->rows));
          _buffer_bytes.fetch_add(chunk.memoryBytes(),
                                  std::memory_order_relaxed);
        }
        return;
      }
      auto persisted = catalog::CatalogEntry::ChunkPersisted(
        p.table(), p.key(), chunk.id(), location);
      persisted.sequence = chunk.persistedAt();
      auto r = std::move(artifact).error().withContext(
        "catalog entry ", persisted.Describe(), " references unreadable '",
        location.path, "'");
      if (!tolerant) {
        failure = std::move(r);
        return;
      }
      if (warnings != nullptr) {
        warnings->push_back(absl::StrCat("dropped chunk ", chunk.id(), " of ",
                                         Describe(p.table(), p.key()), ": ",
                                         r.errorMessage()));
      }
      unreadable.push_back(chunk.id());
    });
    if (failure.fail()) {
      return failure;
    }
    for (auto id : unreadable) {
      if (auto r =
            Append(catalog::CatalogEntry::ChunkDropped(p.table(), p.key(), id));
          r.fail()) {
        return r;
      }
      p.removeChunk(id);
      CDB_WARN("xxxxx", Logger::ENGINES, "dropped unreadable chunk ", id,
               " of ", Describe(p.table(), p.key()));
    }
  }
  return {};
}

}  // namespace cdb
