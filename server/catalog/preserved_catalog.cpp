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

#include "catalog/preserved_catalog.h"

#include <absl/container/btree_map.h>
#include <vpack/builder.h>
#include <vpack/slice.h>

#include "basics/logger/logger.h"
#include "basics/vpack_helper.h"
#include "storage_engine/chunk_artifact.h"
#include "storage_engine/object_store.h"

namespace cdb::catalog {
namespace {

std::string Serialize(const CatalogEntry& entry) {
  vpack::Builder builder;
  entry.ToVPack(builder);
  return std::string{basics::VPackHelper::ToBytes(builder.slice())};
}

}  // namespace

ResultOr<std::optional<CatalogEntry>> CatalogReader::Next() {
  if (_buffer.empty() && !_exhausted) {
    if (auto r = Fill(); r.fail()) {
      return std::unexpected{std::move(r)};
    }
  }
  if (_buffer.empty()) {
    return std::nullopt;
  }
  auto entry = std::move(_buffer.front());
  _buffer.pop_front();
  return entry;
}

void CatalogReader::Rewind() noexcept {
  _next = CatalogSequence{1};
  _buffer.clear();
  _exhausted = false;
}

Result CatalogReader::Fill() {
  Result failure;
  size_t read = 0;
  auto r = _store.Visit(
    _database, _next, _batch_size,
    [&](CatalogSequence sequence, std::string_view bytes) {
      ++read;
      _next = sequence.next();
      auto slice = basics::VPackHelper::FromBytes(bytes);
      if (!slice) {
        failure = std::move(slice).error();
        return false;
      }
      auto entry = CatalogEntry::FromVPack(*slice);
      if (!entry) {
        failure = std::move(entry).error();
        return false;
      }
      entry->sequence = sequence;
      _buffer.push_back(std::move(*entry));
      return true;
    });
  if (r.fail()) {
    return r;
  }
  if (failure.fail()) {
    return std::move(failure).withContext("catalog entry #", _next.id() - 1,
                                          " of database ", _database);
  }
  if (read < _batch_size) {
    _exhausted = true;
  }
  return {};
}

Result PreservedCatalog::Open() {
  auto last = _store.LastSequence(_database);
  if (!last) {
    return std::move(last).error();
  }
  absl::MutexLock lock{&_mutex};
  _last = *last;
  return {};
}

ResultOr<CatalogSequence> PreservedCatalog::Append(CatalogEntry& entry) {
  absl::MutexLock lock{&_mutex};
  entry.sequence = _last.next();
  auto r = _store.Append(_database, entry.sequence, Serialize(entry));
  if (r.fail()) {
    CDB_ERROR("xxxxx", Logger::CATALOG, "cannot append ", entry.Describe(),
              " to catalog of database ", _database, ": ", r.errorMessage());
    entry.sequence = CatalogSequence::none();
    return std::unexpected{std::move(r)};
  }
  _last = entry.sequence;
  CDB_TRACE("xxxxx", Logger::CATALOG, "database ", _database, " appended ",
            entry.Describe());
  return _last;
}

ResultOr<std::vector<CatalogEntry>> PreservedCatalog::ReadAll() const {
  std::vector<CatalogEntry> entries;
  auto reader = Replay();
  while (true) {
    auto entry = reader.Next();
    if (!entry) {
      return std::unexpected{std::move(entry).error()};
    }
    if (!entry->has_value()) {
      return entries;
    }
    entries.push_back(std::move(**entry));
  }
}

Result PreservedCatalog::WipeAndRebuild(const ObjectStore& objects) {
  const auto uuid = _database.toString();
  auto paths = objects.List(object_paths::DataRoot(uuid));
  if (!paths) {
    return std::move(paths).error();
  }

  // (table, partition key) -> chunk id -> location
  absl::btree_map<std::pair<std::string, std::string>,
                  absl::btree_map<ChunkId, ChunkLocation>>
    partitions;
  for (const auto& path : *paths) {
    auto location = object_paths::ParseChunk(uuid, path);
    if (!location) {
      CDB_WARN("xxxxx", Logger::CATALOG, "ignoring unexpected object '", path,
               "' of database ", _database);
      continue;
    }
    auto bytes = objects.Get(path);
    if (!bytes) {
      return std::move(bytes).error();
    }
    auto artifact = ChunkArtifact::Decode(*bytes);
    if (!artifact) {
      CDB_WARN("xxxxx", Logger::CATALOG, "skipping unreadable artifact '",
               path, "' while rebuilding catalog of database ", _database,
               ": ", artifact.error().errorMessage());
      continue;
    }
    partitions[{location->table, location->partition_key}].insert_or_assign(
      ChunkId{location->chunk_id}, ChunkLocation{
                                     .path = path,
                                     .row_count = artifact->rows.size(),
                                     .byte_size = bytes->size(),
                                     .min_time = artifact->min_time,
                                     .max_time = artifact->max_time,
                                   });
  }

  // highest chunk id per partition in the readable prefix of the old log
  absl::btree_map<std::pair<std::string, std::string>, ChunkId> high_water;
  auto reader = Replay();
  while (true) {
    auto entry = reader.Next();
    if (!entry) {
      CDB_WARN("xxxxx", Logger::CATALOG, "reading the old catalog of database ",
               _database, " stopped: ", entry.error().errorMessage());
      break;
    }
    if (!*entry) {
      break;
    }
    const auto& e = **entry;
    if (e.kind != EntryKind::ChunkCreated) {
      continue;
    }
    auto [it, inserted] =
      high_water.try_emplace(std::pair{e.table, e.partition_key}, e.chunk);
    if (!inserted && it->second < e.chunk) {
      it->second = e.chunk;
    }
    partitions.try_emplace(std::pair{e.table, e.partition_key});
  }

  std::vector<CatalogEntry> entries;
  for (const auto& [partition, chunks] : partitions) {
    const auto& [table, key] = partition;
    entries.push_back(CatalogEntry::PartitionCreated(table, key));
    for (const auto& [chunk, location] : chunks) {
      entries.push_back(CatalogEntry::ChunkCreated(table, key, chunk));
      entries.push_back(CatalogEntry::ChunkClosed(table, key, chunk));
      entries.push_back(
        CatalogEntry::ChunkPersisted(table, key, chunk, location));
      entries.push_back(CatalogEntry::ChunkUnloaded(table, key, chunk));
    }
    // a dropped placeholder keeps new chunk ids above the old ones
    if (auto it = high_water.find(partition);
        it != high_water.end() &&
        (chunks.empty() || chunks.rbegin()->first < it->second)) {
      entries.push_back(CatalogEntry::ChunkCreated(table, key, it->second));
      entries.push_back(CatalogEntry::ChunkClosed(table, key, it->second));
      entries.push_back(CatalogEntry::ChunkDropped(table, key, it->second));
    }
    if (chunks.empty()) {
      entries.push_back(CatalogEntry::PartitionDropped(table, key));
    }
  }

  if (auto r = Rewrite(entries); r.fail()) {
    return std::move(r).withContext("cannot rebuild catalog of database ",
                                    _database);
  }
  CDB_INFO("xxxxx", Logger::CATALOG, "rebuilt catalog of database ", _database,
           " from ", partitions.size(), " partition(s), ", entries.size(),
           " entries");
  return {};
}

Result PreservedCatalog::Rewrite(std::vector<CatalogEntry>& entries) {
  CatalogStore::Batch batch;
  batch.reserve(entries.size());
  CatalogSequence sequence;
  for (auto& entry : entries) {
    sequence = sequence.next();
    entry.sequence = sequence;
    batch.emplace_back(sequence, Serialize(entry));
  }

  absl::MutexLock lock{&_mutex};
  if (auto r = _store.Rewrite(_database, batch); r.fail()) {
    return r;
  }
  _last = sequence;
  return {};
}

CatalogSequence PreservedCatalog::LastSequence() const {
  absl::MutexLock lock{&_mutex};
  return _last;
}

}  // namespace cdb::catalog
