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

#include "storage_engine/chunk_artifact.h"

#include <vpack/builder.h>
#include <vpack/iterator.h>
#include <vpack/slice.h>

#include "basics/vpack_helper.h"

namespace cdb {
namespace {

constexpr uint64_t kFormatVersion = 1;

}  // namespace

std::string ChunkArtifact::Encode() const {
  vpack::Builder builder;
  builder.openObject();
  builder.add("version", kFormatVersion);
  builder.add("table", std::string_view{table});
  builder.add("partitionKey", std::string_view{partition_key});
  builder.add("chunkId", chunk.id());
  builder.add("minTime", min_time);
  builder.add("maxTime", max_time);
  builder.add("rows", vpack::Value(vpack::ValueType::Array));
  for (const auto& row : rows) {
    builder.openArray();
    builder.add(row.time);
    builder.add(std::string_view{row.series});
    builder.add(row.value);
    builder.close();
  }
  builder.close();
  builder.close();
  return std::string{basics::VPackHelper::ToBytes(builder.slice())};
}

ResultOr<ChunkArtifact> ChunkArtifact::Decode(std::string_view bytes) {
  auto slice = basics::VPackHelper::FromBytes(bytes);
  if (!slice) {
    return std::unexpected{std::move(slice).error()};
  }
  auto corrupted = [](std::string_view what) {
    return std::unexpected<Result>{std::in_place,
                                   ERROR_SERVER_CORRUPTED_DATAFILE,
                                   "invalid chunk artifact: ", what};
  };
  if (!slice->isObject()) {
    return corrupted("not an object");
  }
  auto version = basics::VPackHelper::GetUInt(*slice, "version");
  if (!version || *version != kFormatVersion) {
    return corrupted("unsupported format version");
  }
  auto table = basics::VPackHelper::GetString(*slice, "table");
  auto partition_key = basics::VPackHelper::GetString(*slice, "partitionKey");
  auto chunk = basics::VPackHelper::GetUInt(*slice, "chunkId");
  auto min_time = slice->get("minTime");
  auto max_time = slice->get("maxTime");
  auto rows = slice->get("rows");
  if (!table || !partition_key || !chunk || !min_time.isNumber() ||
      !max_time.isNumber() || !rows.isArray()) {
    return corrupted("missing attributes");
  }

  ChunkArtifact artifact;
  artifact.table = *table;
  artifact.partition_key = *partition_key;
  artifact.chunk = ChunkId{*chunk};
  artifact.min_time = min_time.getNumber<int64_t>();
  artifact.max_time = max_time.getNumber<int64_t>();
  artifact.rows.reserve(rows.length());
  for (auto row : vpack::ArrayIterator(rows)) {
    if (!row.isArray() || row.length() != 3 || !row.at(0).isNumber() ||
        !row.at(1).isString() || !row.at(2).isNumber()) {
      return corrupted("malformed row");
    }
    artifact.rows.push_back(Row{
      .time = row.at(0).getNumber<int64_t>(),
      .series = std::string{row.at(1).stringView()},
      .value = row.at(2).getNumber<double>(),
    });
  }
  return artifact;
}

}  // namespace cdb
