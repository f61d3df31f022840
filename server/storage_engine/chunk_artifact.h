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

#include "basics/result_or.h"
#include "catalog/identifiers/chunk_id.h"

namespace cdb {

// single observation, the unit of the write path
struct Row {
  // nanoseconds since epoch
  int64_t time = 0;
  std::string series;
  double value = 0;

  bool operator==(const Row&) const = default;
};

// durable form of a persisted chunk
struct ChunkArtifact {
  std::string table;
  std::string partition_key;
  ChunkId chunk;
  int64_t min_time = 0;
  int64_t max_time = 0;
  std::vector<Row> rows;

  std::string Encode() const;

  // ERROR_SERVER_CORRUPTED_DATAFILE if `bytes` is not an artifact
  static ResultOr<ChunkArtifact> Decode(std::string_view bytes);
};

}  // namespace cdb
