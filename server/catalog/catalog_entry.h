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
#include <string>
#include <string_view>

#include "basics/result_or.h"
#include "catalog/identifiers/chunk_id.h"

namespace vpack {
class Builder;
class Slice;
}  // namespace vpack

namespace cdb::catalog {

enum class EntryKind : uint8_t {
  PartitionCreated = 1,
  ChunkCreated,
  ChunkClosed,
  ChunkPersisted,
  ChunkUnloaded,
  ChunkDropped,
  PartitionDropped,
};

// where and what a persisted chunk is
struct ChunkLocation {
  std::string path;
  uint64_t row_count = 0;
  uint64_t byte_size = 0;
  int64_t min_time = 0;
  int64_t max_time = 0;

  bool operator==(const ChunkLocation&) const = default;
};

// One immutable metadata mutation of a database. The sequence number is
// assigned when the entry is appended to the preserved catalog.
struct CatalogEntry {
  static CatalogEntry PartitionCreated(std::string_view table,
                                       std::string_view partition_key);
  static CatalogEntry ChunkCreated(std::string_view table,
                                   std::string_view partition_key,
                                   ChunkId chunk);
  static CatalogEntry ChunkClosed(std::string_view table,
                                  std::string_view partition_key,
                                  ChunkId chunk);
  static CatalogEntry ChunkPersisted(std::string_view table,
                                     std::string_view partition_key,
                                     ChunkId chunk, ChunkLocation location);
  static CatalogEntry ChunkUnloaded(std::string_view table,
                                    std::string_view partition_key,
                                    ChunkId chunk);
  static CatalogEntry ChunkDropped(std::string_view table,
                                   std::string_view partition_key,
                                   ChunkId chunk);
  static CatalogEntry PartitionDropped(std::string_view table,
                                       std::string_view partition_key);

  static ResultOr<CatalogEntry> FromVPack(vpack::Slice slice);
  void ToVPack(vpack::Builder& builder) const;

  bool IsChunkEntry() const noexcept {
    return kind != EntryKind::PartitionCreated &&
           kind != EntryKind::PartitionDropped;
  }

  // e.g. "#12 ChunkClosed cpu:2023-01-01T00/0"
  std::string Describe() const;

  bool operator==(const CatalogEntry&) const = default;

  CatalogSequence sequence;
  EntryKind kind = EntryKind::PartitionCreated;
  std::string table;
  std::string partition_key;
  ChunkId chunk;
  // ChunkPersisted only
  ChunkLocation location;
};

std::string_view EntryKindName(EntryKind kind) noexcept;

}  // namespace cdb::catalog
