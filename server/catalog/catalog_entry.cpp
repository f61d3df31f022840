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

#include "catalog/catalog_entry.h"

#include <vpack/builder.h>
#include <vpack/slice.h>

#include <magic_enum/magic_enum.hpp>

#include "basics/vpack_helper.h"

namespace cdb::catalog {
namespace {

CatalogEntry Make(EntryKind kind, std::string_view table,
                  std::string_view partition_key, ChunkId chunk = {}) {
  CatalogEntry entry;
  entry.kind = kind;
  entry.table = table;
  entry.partition_key = partition_key;
  entry.chunk = chunk;
  return entry;
}

Result Corrupted(std::string_view what) {
  return {ERROR_SERVER_CORRUPTED_DATAFILE, "invalid catalog entry: ", what};
}

}  // namespace

std::string_view EntryKindName(EntryKind kind) noexcept {
  return magic_enum::enum_name(kind);
}

CatalogEntry CatalogEntry::PartitionCreated(std::string_view table,
                                            std::string_view partition_key) {
  return Make(EntryKind::PartitionCreated, table, partition_key);
}

CatalogEntry CatalogEntry::ChunkCreated(std::string_view table,
                                        std::string_view partition_key,
                                        ChunkId chunk) {
  return Make(EntryKind::ChunkCreated, table, partition_key, chunk);
}

CatalogEntry CatalogEntry::ChunkClosed(std::string_view table,
                                       std::string_view partition_key,
                                       ChunkId chunk) {
  return Make(EntryKind::ChunkClosed, table, partition_key, chunk);
}

CatalogEntry CatalogEntry::ChunkPersisted(std::string_view table,
                                          std::string_view partition_key,
                                          ChunkId chunk,
                                          ChunkLocation location) {
  auto entry = Make(EntryKind::ChunkPersisted, table, partition_key, chunk);
  entry.location = std::move(location);
  return entry;
}

CatalogEntry CatalogEntry::ChunkUnloaded(std::string_view table,
                                         std::string_view partition_key,
                                         ChunkId chunk) {
  return Make(EntryKind::ChunkUnloaded, table, partition_key, chunk);
}

CatalogEntry CatalogEntry::ChunkDropped(std::string_view table,
                                        std::string_view partition_key,
                                        ChunkId chunk) {
  return Make(EntryKind::ChunkDropped, table, partition_key, chunk);
}

CatalogEntry CatalogEntry::PartitionDropped(std::string_view table,
                                            std::string_view partition_key) {
  return Make(EntryKind::PartitionDropped, table, partition_key);
}

void CatalogEntry::ToVPack(vpack::Builder& builder) const {
  builder.openObject();
  builder.add("kind", EntryKindName(kind));
  builder.add("table", std::string_view{table});
  builder.add("partitionKey", std::string_view{partition_key});
  if (IsChunkEntry()) {
    builder.add("chunkId", chunk.id());
  }
  if (kind == EntryKind::ChunkPersisted) {
    builder.add("location", vpack::Value(vpack::ValueType::Object));
    builder.add("path", std::string_view{location.path});
    builder.add("rowCount", location.row_count);
    builder.add("byteSize", location.byte_size);
    builder.add("minTime", location.min_time);
    builder.add("maxTime", location.max_time);
    builder.close();
  }
  builder.close();
}

ResultOr<CatalogEntry> CatalogEntry::FromVPack(vpack::Slice slice) {
  if (!slice.isObject()) {
    return std::unexpected{Corrupted("not an object")};
  }
  auto kind_name = basics::VPackHelper::GetString(slice, "kind");
  if (!kind_name) {
    return std::unexpected{Corrupted(kind_name.error().errorMessage())};
  }
  auto kind = magic_enum::enum_cast<EntryKind>(*kind_name);
  if (!kind) {
    return std::unexpected{
      Corrupted(absl::StrCat("unknown kind '", *kind_name, "'"))};
  }
  auto table = basics::VPackHelper::GetString(slice, "table");
  auto partition_key = basics::VPackHelper::GetString(slice, "partitionKey");
  if (!table || !partition_key) {
    return std::unexpected{Corrupted("missing table or partition key")};
  }

  CatalogEntry entry = Make(*kind, *table, *partition_key);
  if (entry.IsChunkEntry()) {
    auto chunk = basics::VPackHelper::GetUInt(slice, "chunkId");
    if (!chunk) {
      return std::unexpected{Corrupted(chunk.error().errorMessage())};
    }
    entry.chunk = ChunkId{*chunk};
  }
  if (entry.kind == EntryKind::ChunkPersisted) {
    auto location = slice.get("location");
    if (!location.isObject()) {
      return std::unexpected{Corrupted("missing location")};
    }
    auto path = basics::VPackHelper::GetString(location, "path");
    auto rows = basics::VPackHelper::GetUInt(location, "rowCount");
    auto bytes = basics::VPackHelper::GetUInt(location, "byteSize");
    auto min_time = location.get("minTime");
    auto max_time = location.get("maxTime");
    if (!path || !rows || !bytes || !min_time.isNumber() ||
        !max_time.isNumber()) {
      return std::unexpected{Corrupted("incomplete location")};
    }
    entry.location = ChunkLocation{
      .path = std::string{*path},
      .row_count = *rows,
      .byte_size = *bytes,
      .min_time = min_time.getNumber<int64_t>(),
      .max_time = max_time.getNumber<int64_t>(),
    };
  }
  return entry;
}

std::string CatalogEntry::Describe() const {
  auto description = absl::StrCat("#", sequence.id(), " ", EntryKindName(kind),
                                  " ", table, ":", partition_key);
  if (IsChunkEntry()) {
    absl::StrAppend(&description, "/", chunk.id());
  }
  return description;
}

}  // namespace cdb::catalog
