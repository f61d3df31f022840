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

#include "storage_engine/object_store.h"

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "basics/string_utils.h"

namespace cdb::object_paths {

using basics::string_utils::UrlDecodePath;
using basics::string_utils::UrlEncode;

std::string ServerConfig(std::string_view server_id) {
  return absl::StrCat("config/", UrlEncode(server_id), "/databases");
}

std::string DatabaseRoot(std::string_view uuid) {
  return absl::StrCat("dbs/", uuid, "/");
}

std::string Rules(std::string_view uuid) {
  return absl::StrCat(DatabaseRoot(uuid), "rules");
}

std::string Owner(std::string_view uuid) {
  return absl::StrCat(DatabaseRoot(uuid), "owner");
}

std::string DataRoot(std::string_view uuid) {
  return absl::StrCat(DatabaseRoot(uuid), "data/");
}

std::string Chunk(std::string_view uuid, std::string_view table,
                  std::string_view partition_key, uint64_t chunk_id) {
  return absl::StrCat(DataRoot(uuid), UrlEncode(table), "/",
                      UrlEncode(partition_key), "/", chunk_id, kChunkSuffix);
}

ResultOr<ChunkLocation> ParseChunk(std::string_view uuid,
                                   std::string_view path) {
  const auto root = DataRoot(uuid);
  auto invalid = [&] {
    return std::unexpected<Result>{std::in_place, ERROR_BAD_PARAMETER,
                                   "'", path, "' is not a chunk artifact path"};
  };
  if (!absl::ConsumePrefix(&path, root) ||
      !absl::ConsumeSuffix(&path, kChunkSuffix)) {
    return invalid();
  }
  std::vector<std::string_view> parts = absl::StrSplit(path, '/');
  if (parts.size() != 3 || parts[0].empty() || parts[1].empty()) {
    return invalid();
  }
  auto id = basics::string_utils::TryUint64(parts[2]);
  if (!id) {
    return invalid();
  }
  return ChunkLocation{
    .table = UrlDecodePath(parts[0]),
    .partition_key = UrlDecodePath(parts[1]),
    .chunk_id = *id,
  };
}

}  // namespace cdb::object_paths
