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

#include "database/chunk.h"

#include <algorithm>
#include <magic_enum/magic_enum.hpp>

#include "basics/assert.h"

namespace cdb {

std::string_view ChunkStateName(ChunkState state) noexcept {
  return magic_enum::enum_name(state);
}

ChunkState Chunk::catalogState() const noexcept {
  switch (_state) {
    case ChunkState::ReadBuffer:
      return ChunkState::Closing;
    case ChunkState::Persisting:
      return _before_persist == ChunkState::ReadBuffer ? ChunkState::Closing
                                                       : _before_persist;
    default:
      return _state;
  }
}

uint64_t Chunk::rowCount() const noexcept {
  if (_state == ChunkState::Unloaded && _location) {
    return _location->row_count;
  }
  return _rows.size();
}

uint64_t Chunk::memoryBytes() const noexcept {
  return _state == ChunkState::Unloaded ? 0 : _byte_size;
}

void Chunk::append(std::span<const Row> rows, absl::Time now) {
  CDB_ASSERT(_state == ChunkState::Open);
  if (rows.empty()) {
    return;
  }
  if (_rows.empty()) {
    _min_time = rows.front().time;
    _max_time = rows.front().time;
  }
  _rows.reserve(_rows.size() + rows.size());
  for (const auto& row : rows) {
    _min_time = std::min(_min_time, row.time);
    _max_time = std::max(_max_time, row.time);
    _byte_size += RowBytes(row);
    _rows.push_back(row);
  }
  _last_write = now;
}

void Chunk::setState(ChunkState state) noexcept {
  CDB_ASSERT(state != _state);
  if (state == ChunkState::Persisting) {
    _before_persist = _state;
  }
  _state = state;
}

void Chunk::abortPersist() noexcept {
  CDB_ASSERT(_state == ChunkState::Persisting);
  _state = _before_persist;
}

void Chunk::freeze() {
  CDB_ASSERT(_state == ChunkState::Closing);
  std::ranges::stable_sort(_rows, {}, &Row::time);
  _rows.shrink_to_fit();
  _state = ChunkState::ReadBuffer;
}

void Chunk::unload() noexcept {
  CDB_ASSERT(_state == ChunkState::Persisted);
  _rows.clear();
  _rows.shrink_to_fit();
  _state = ChunkState::Unloaded;
}

void Chunk::restore(std::vector<Row>&& rows) {
  _rows = std::move(rows);
  _byte_size = 0;
  for (const auto& row : _rows) {
    _byte_size += RowBytes(row);
  }
  if (_location) {
    _min_time = _location->min_time;
    _max_time = _location->max_time;
  }
}

ChunkSummary Chunk::summary(std::string_view table,
                            std::string_view partition_key) const {
  return ChunkSummary{
    .table = std::string{table},
    .partition_key = std::string{partition_key},
    .id = _id,
    .state = _state,
    .row_count = rowCount(),
    .byte_size = _location ? _location->byte_size : _byte_size,
    .min_time = _min_time,
    .max_time = _max_time,
    .last_write = _last_write,
    .location = _location ? _location->path : std::string{},
  };
}

}  // namespace cdb
