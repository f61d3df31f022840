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
#include <vector>

#include "basics/result.h"
#include "basics/result_or.h"

namespace cdb {

// Durable blob storage for chunk artifacts, database rules, ownership
// markers and the server configuration. Paths are '/' separated, relative
// and made of percent-encoded segments.
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  virtual std::string_view Name() const noexcept = 0;

  // replaces the object atomically
  virtual Result Put(std::string_view path, std::string_view bytes) = 0;

  // ERROR_FILE_NOT_FOUND if there is no such object
  virtual ResultOr<std::string> Get(std::string_view path) const = 0;

  virtual bool Exists(std::string_view path) const = 0;

  // deleting a missing object succeeds
  virtual Result Delete(std::string_view path) = 0;

  // all object paths starting with `prefix`, sorted
  virtual ResultOr<std::vector<std::string>> List(
    std::string_view prefix) const = 0;
};

namespace object_paths {

inline constexpr std::string_view kChunkSuffix = ".chunk";

std::string ServerConfig(std::string_view server_id);
std::string DatabaseRoot(std::string_view uuid);
std::string Rules(std::string_view uuid);
std::string Owner(std::string_view uuid);
std::string DataRoot(std::string_view uuid);
std::string Chunk(std::string_view uuid, std::string_view table,
                  std::string_view partition_key, uint64_t chunk_id);

struct ChunkLocation {
  std::string table;
  std::string partition_key;
  uint64_t chunk_id = 0;
};

// inverse of Chunk() for paths below DataRoot(uuid)
ResultOr<ChunkLocation> ParseChunk(std::string_view uuid,
                                   std::string_view path);

}  // namespace object_paths
}  // namespace cdb
