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

#include <absl/time/time.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "catalog/catalog_entry.h"
#include "catalog/identifiers/chunk_id.h"
#include "storage_engine/chunk_artifact.h"

namespace cdb {

// Open -> Closing -> (ReadBuffer) -> Persisting -> Persisted -> Unloaded,
// Dropped from every state but Open. States only move forward, except that
// a failed persist returns the chunk to the state it came from.
enum class ChunkState : uint8_t {
  Open,
  Closing,
  ReadBuffer,
  Persisting,
  Persisted,
  Unloaded,
  Dropped,
};

std::string_view ChunkStateName(ChunkState state) noexcept;

struct ChunkSummary {
  std::string table;
  std::string partition_key;
  ChunkId id;
  ChunkState state = ChunkState::Open;
  uint64_t row_count = 0;
  uint64_t byte_size = 0;
  int64_t min_time = 0;
  int64_t max_time = 0;
  absl::Time last_write = absl::InfinitePast();
  // artifact path once persisted
  std::string location;
};

// Rows of one partition written between two rollovers. Guarded by the lock
// of the owning partition.
class Chunk {
 public:
  explicit Chunk(ChunkId id) noexcept : _id{id} {}

  ChunkId id() const noexcept { return _id; }
  ChunkState state() const noexcept { return _state; }

  // catalogued state a replay of the catalog would produce
  ChunkState catalogState() const noexcept;

  uint64_t rowCount() const noexcept;
  uint64_t byteSize() const noexcept { return _byte_size; }
  bool empty() const noexcept { return rowCount() == 0; }
  int64_t minTime() const noexcept { return _min_time; }
  int64_t maxTime() const noexcept { return _max_time; }
  absl::Time lastWrite() const noexcept { return _last_write; }

  // bytes of rows held in memory
  uint64_t memoryBytes() const noexcept;

  const std::vector<Row>& rows() const noexcept { return _rows; }

  void append(std::span<const Row> rows, absl::Time now);

  void setState(ChunkState state) noexcept;

  // returns a Persisting chunk to the state it had before
  void abortPersist() noexcept;

  // moves the rows into the read buffer, sorted by time
  void freeze();

  // drops the in-memory rows of a persisted chunk
  void unload() noexcept;

  // rows restored from a durable artifact
  void restore(std::vector<Row>&& rows);

  const std::optional<catalog::ChunkLocation>& location() const noexcept {
    return _location;
  }
  // sequence of the ChunkPersisted entry
  CatalogSequence persistedAt() const noexcept { return _persisted_at; }
  void setLocation(catalog::ChunkLocation location, CatalogSequence sequence) {
    _location = std::move(location);
    _persisted_at = sequence;
  }

  ChunkSummary summary(std::string_view table,
                       std::string_view partition_key) const;

  static uint64_t RowBytes(const Row& row) noexcept {
    return sizeof(Row::time) + sizeof(Row::value) + row.series.size();
  }

 private:
  const ChunkId _id;
  ChunkState _state = ChunkState::Open;
  // state to return to if persisting fails
  ChunkState _before_persist = ChunkState::Closing;
  std::vector<Row> _rows;
  uint64_t _byte_size = 0;
  int64_t _min_time = 0;
  int64_t _max_time = 0;
  absl::Time _last_write = absl::InfinitePast();
  std::optional<catalog::ChunkLocation> _location;
  CatalogSequence _persisted_at;
};

}  // namespace cdb
