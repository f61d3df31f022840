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
#include <absl/strings/str_cat.h>
#include <absl/synchronization/mutex.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "database/chunk.h"

namespace cdb {

struct PartitionSummary {
  std::string table;
  std::string key;
  uint64_t num_chunks = 0;
  uint64_t row_count = 0;
  std::optional<ChunkId> open_chunk;
};

// Time bucket of one table. Owns its chunks in creation order; at most one
// of them is Open.
class Partition {
 public:
  Partition(std::string table, std::string key, ChunkId first_chunk) noexcept
    : _table{std::move(table)}, _key{std::move(key)}, _next_chunk{first_chunk} {}

  const std::string& table() const noexcept { return _table; }
  const std::string& key() const noexcept { return _key; }

  // "cpu:2023-01-01T00"
  std::string name() const { return absl::StrCat(_table, ":", _key); }

  absl::Mutex& mutex() const ABSL_LOCK_RETURNED(_mutex) { return _mutex; }

  bool dropped() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex) {
    return _dropped;
  }
  void markDropped() ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex) { _dropped = true; }

  Chunk* openChunk() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex);
  Chunk* findChunk(ChunkId id) const ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex);

  // id the next created chunk gets
  ChunkId nextChunkId() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex) {
    return _next_chunk;
  }

  Chunk& addChunk(ChunkId id) ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex);
  void removeChunk(ChunkId id) ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex);

  template<typename F>
  void forEachChunk(F&& f) const ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex) {
    for (const auto& [_, chunk] : _chunks) {
      f(*chunk);
    }
  }

  std::vector<ChunkSummary> chunkSummaries() const
    ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex);
  PartitionSummary summary() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex);

 private:
  const std::string _table;
  const std::string _key;

  mutable absl::Mutex _mutex;
  ChunkId _next_chunk ABSL_GUARDED_BY(_mutex);
  absl::btree_map<ChunkId, std::unique_ptr<Chunk>> _chunks
    ABSL_GUARDED_BY(_mutex);
  bool _dropped ABSL_GUARDED_BY(_mutex) = false;
};

}  // namespace cdb
