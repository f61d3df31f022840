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

#include "database/partition.h"

#include "basics/assert.h"

namespace cdb {

Chunk* Partition::openChunk() const {
  // the open chunk, if any, is always the newest one
  if (_chunks.empty()) {
    return nullptr;
  }
  auto& newest = *_chunks.rbegin()->second;
  return newest.state() == ChunkState::Open ? &newest : nullptr;
}

Chunk* Partition::findChunk(ChunkId id) const {
  auto it = _chunks.find(id);
  return it == _chunks.end() ? nullptr : it->second.get();
}

Chunk& Partition::addChunk(ChunkId id) {
  CDB_ASSERT(id >= _next_chunk);
  CDB_ASSERT(openChunk() == nullptr);
  auto [it, inserted] = _chunks.emplace(id, std::make_unique<Chunk>(id));
  CDB_ASSERT(inserted);
  _next_chunk = id.next();
  return *it->second;
}

void Partition::removeChunk(ChunkId id) { _chunks.erase(id); }

std::vector<ChunkSummary> Partition::chunkSummaries() const {
  std::vector<ChunkSummary> summaries;
  summaries.reserve(_chunks.size());
  for (const auto& [_, chunk] : _chunks) {
    summaries.push_back(chunk->summary(_table, _key));
  }
  return summaries;
}

PartitionSummary Partition::summary() const {
  PartitionSummary summary{.table = _table, .key = _key};
  summary.num_chunks = _chunks.size();
  for (const auto& [_, chunk] : _chunks) {
    summary.row_count += chunk->rowCount();
  }
  if (auto* open = openChunk()) {
    summary.open_chunk = open->id();
  }
  return summary;
}

}  // namespace cdb
