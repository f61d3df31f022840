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

#include "gtest/gtest.h"

using namespace cdb;
using namespace cdb::catalog;

namespace {

ResultOr<CatalogEntry> Reparse(const CatalogEntry& entry) {
  vpack::Builder builder;
  entry.ToVPack(builder);
  return CatalogEntry::FromVPack(builder.slice());
}

}  // namespace

TEST(CatalogEntryTest, PersistedEntryKeepsLocation) {
  auto entry = CatalogEntry::ChunkPersisted(
    "cpu", "2023-01-01T00", ChunkId{3},
    ChunkLocation{
      .path = "dbs/x/data/cpu/2023-01-01T00/3.chunk",
      .row_count = 10,
      .byte_size = 512,
      .min_time = -5,
      .max_time = 1700000000000000000,
    });
  auto parsed = Reparse(entry);
  ASSERT_TRUE(parsed.has_value()) << parsed.error().errorMessage();
  EXPECT_EQ(entry, *parsed);
}

TEST(CatalogEntryTest, PartitionEntriesHaveNoChunk) {
  auto entry = CatalogEntry::PartitionDropped("cpu", "k");
  EXPECT_FALSE(entry.IsChunkEntry());
  vpack::Builder builder;
  entry.ToVPack(builder);
  EXPECT_TRUE(builder.slice().get("chunkId").isNone());

  auto parsed = Reparse(entry);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(EntryKind::PartitionDropped, parsed->kind);
  EXPECT_EQ("cpu", parsed->table);
  EXPECT_EQ("k", parsed->partition_key);
}

TEST(CatalogEntryTest, Describe) {
  auto entry = CatalogEntry::ChunkClosed("cpu", "2023-01-01T00", ChunkId{0});
  entry.sequence = CatalogSequence{12};
  EXPECT_EQ("#12 ChunkClosed cpu:2023-01-01T00/0", entry.Describe());

  auto partition = CatalogEntry::PartitionCreated("mem", "a");
  partition.sequence = CatalogSequence{1};
  EXPECT_EQ("#1 PartitionCreated mem:a", partition.Describe());
}

TEST(CatalogEntryTest, RejectsUnknownKind) {
  vpack::Builder builder;
  builder.openObject();
  builder.add("kind", "ChunkExploded");
  builder.add("table", "cpu");
  builder.add("partitionKey", "k");
  builder.close();
  auto parsed = CatalogEntry::FromVPack(builder.slice());
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(ERROR_SERVER_CORRUPTED_DATAFILE, parsed.error().errorNumber());
}

TEST(CatalogEntryTest, RejectsMissingAttributes) {
  {
    vpack::Builder builder;
    builder.openArray();
    builder.close();
    EXPECT_FALSE(CatalogEntry::FromVPack(builder.slice()).has_value());
  }
  {
    vpack::Builder builder;
    builder.openObject();
    builder.add("kind", "ChunkCreated");
    builder.add("table", "cpu");
    builder.add("partitionKey", "k");
    builder.close();
    auto parsed = CatalogEntry::FromVPack(builder.slice());
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(ERROR_SERVER_CORRUPTED_DATAFILE, parsed.error().errorNumber());
  }
  {
    vpack::Builder builder;
    builder.openObject();
    builder.add("kind", "ChunkPersisted");
    builder.add("table", "cpu");
    builder.add("partitionKey", "k");
    builder.add("chunkId", uint64_t{1});
    builder.close();
    auto parsed = CatalogEntry::FromVPack(builder.slice());
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(ERROR_SERVER_CORRUPTED_DATAFILE, parsed.error().errorNumber());
  }
}
