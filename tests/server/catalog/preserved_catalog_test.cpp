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

#include "catalog/preserved_catalog.h"

#include "basics/debugging.h"
#include "catalog/memory_catalog_store.h"
#include "gtest/gtest.h"
#include "storage_engine/chunk_artifact.h"
#include "storage_engine/memory_object_store.h"

using namespace cdb;
using namespace cdb::catalog;

namespace {

class PreservedCatalogTest : public ::testing::Test {
 protected:
  PreservedCatalogTest() { EXPECT_TRUE(_catalog.Open().ok()); }
  ~PreservedCatalogTest() override { ClearFailurePoints(); }

  CatalogSequence Append(CatalogEntry entry) {
    auto sequence = _catalog.Append(entry);
    EXPECT_TRUE(sequence.has_value()) << sequence.error().errorMessage();
    return sequence.value_or(CatalogSequence::none());
  }

  void PutArtifact(std::string_view table, std::string_view key, uint64_t id,
                   std::vector<Row> rows) {
    ChunkArtifact artifact{
      .table = std::string{table},
      .partition_key = std::string{key},
      .chunk = ChunkId{id},
      .min_time = rows.empty() ? 0 : rows.front().time,
      .max_time = rows.empty() ? 0 : rows.back().time,
      .rows = std::move(rows),
    };
    ASSERT_TRUE(_objects
                  .Put(object_paths::Chunk(_uuid.toString(), table, key, id),
                       artifact.Encode())
                  .ok());
  }

  DatabaseUuid _uuid = DatabaseUuid::Random();
  MemoryCatalogStore _store;
  MemoryObjectStore _objects;
  PreservedCatalog _catalog{_uuid, _store};
};

}  // namespace

TEST_F(PreservedCatalogTest, AppendAssignsConsecutiveSequences) {
  EXPECT_FALSE(_catalog.LastSequence().isSet());
  EXPECT_EQ(CatalogSequence{1},
            Append(CatalogEntry::PartitionCreated("cpu", "a")));
  EXPECT_EQ(CatalogSequence{2},
            Append(CatalogEntry::ChunkCreated("cpu", "a", ChunkId{0})));
  EXPECT_EQ(CatalogSequence{2}, _catalog.LastSequence());
  EXPECT_EQ(2U, _store.NumEntries(_uuid));
}

TEST_F(PreservedCatalogTest, OpenResumesAfterLastEntry) {
  Append(CatalogEntry::PartitionCreated("cpu", "a"));
  Append(CatalogEntry::ChunkCreated("cpu", "a", ChunkId{0}));

  PreservedCatalog reopened{_uuid, _store};
  ASSERT_TRUE(reopened.Open().ok());
  EXPECT_EQ(CatalogSequence{2}, reopened.LastSequence());

  auto entry = CatalogEntry::ChunkClosed("cpu", "a", ChunkId{0});
  auto sequence = reopened.Append(entry);
  ASSERT_TRUE(sequence.has_value());
  EXPECT_EQ(CatalogSequence{3}, *sequence);
  EXPECT_EQ(CatalogSequence{3}, entry.sequence);
}

TEST_F(PreservedCatalogTest, ReplayReturnsEntriesInOrder) {
  Append(CatalogEntry::PartitionCreated("cpu", "a"));
  for (uint64_t id = 0; id != 4; ++id) {
    Append(CatalogEntry::ChunkCreated("cpu", "a", ChunkId{id}));
  }

  CatalogReader reader{_store, _uuid, /*batch_size=*/2};
  std::vector<CatalogSequence> sequences;
  while (true) {
    auto entry = reader.Next();
    ASSERT_TRUE(entry.has_value());
    if (!entry->has_value()) {
      break;
    }
    sequences.push_back((*entry)->sequence);
  }
  ASSERT_EQ(5U, sequences.size());
  for (size_t i = 0; i != sequences.size(); ++i) {
    EXPECT_EQ(CatalogSequence{i + 1}, sequences[i]);
  }

  reader.Rewind();
  auto first = reader.Next();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(first->has_value());
  EXPECT_EQ(EntryKind::PartitionCreated, (*first)->kind);
}

TEST_F(PreservedCatalogTest, FailedAppendKeepsSequence) {
  Append(CatalogEntry::PartitionCreated("cpu", "a"));
  {
    FailurePointGuard guard{"CatalogStore::Append"};
    auto entry = CatalogEntry::ChunkCreated("cpu", "a", ChunkId{0});
    auto sequence = _catalog.Append(entry);
    ASSERT_FALSE(sequence.has_value());
    EXPECT_EQ(ERROR_SERVER_IO_ERROR, sequence.error().errorNumber());
    EXPECT_FALSE(entry.sequence.isSet());
  }
  EXPECT_EQ(CatalogSequence{1}, _catalog.LastSequence());
  EXPECT_EQ(CatalogSequence{2},
            Append(CatalogEntry::ChunkCreated("cpu", "a", ChunkId{0})));
}

TEST_F(PreservedCatalogTest, ReplayReportsStoreFailures) {
  Append(CatalogEntry::PartitionCreated("cpu", "a"));
  FailurePointGuard guard{"CatalogStore::Visit"};
  auto entries = _catalog.ReadAll();
  ASSERT_FALSE(entries.has_value());
  EXPECT_EQ(ERROR_SERVER_IO_ERROR, entries.error().errorNumber());
}

TEST_F(PreservedCatalogTest, ReplayReportsUndecodableEntries) {
  Append(CatalogEntry::PartitionCreated("cpu", "a"));
  ASSERT_TRUE(_store.Append(_uuid, CatalogSequence{2}, "garbage").ok());
  auto entries = _catalog.ReadAll();
  ASSERT_FALSE(entries.has_value());
  EXPECT_EQ(ERROR_SERVER_CORRUPTED_DATAFILE, entries.error().errorNumber());
}

TEST_F(PreservedCatalogTest, WipeAndRebuildFromArtifacts) {
  Append(CatalogEntry::PartitionCreated("stale", "x"));
  PutArtifact("cpu", "a", 2, {{.time = 1, .series = "s", .value = 1.5}});
  PutArtifact("cpu", "a", 0,
              {{.time = 5, .series = "s", .value = 1},
               {.time = 9, .series = "s", .value = 2}});
  PutArtifact("mem", "b", 0, {});
  auto broken = object_paths::Chunk(_uuid.toString(), "mem", "b", 1);
  ASSERT_TRUE(_objects.Put(broken, "x").ok());
  ASSERT_TRUE(_objects
                .Put(object_paths::DataRoot(_uuid.toString()) + "README",
                     "not a chunk")
                .ok());

  ASSERT_TRUE(_catalog.WipeAndRebuild(_objects).ok());

  auto entries = _catalog.ReadAll();
  ASSERT_TRUE(entries.has_value());
  // cpu:a with two chunks, mem:b with one readable chunk
  ASSERT_EQ(1U + 4U * 2U + 1U + 4U, entries->size());
  EXPECT_EQ(CatalogSequence{entries->size()}, _catalog.LastSequence());

  const auto& e = *entries;
  EXPECT_EQ(EntryKind::PartitionCreated, e[0].kind);
  EXPECT_EQ("cpu", e[0].table);
  EXPECT_EQ(EntryKind::ChunkCreated, e[1].kind);
  EXPECT_EQ(ChunkId{0}, e[1].chunk);
  EXPECT_EQ(EntryKind::ChunkPersisted, e[3].kind);
  EXPECT_EQ(2U, e[3].location.row_count);
  EXPECT_EQ(5, e[3].location.min_time);
  EXPECT_EQ(9, e[3].location.max_time);
  EXPECT_EQ(EntryKind::ChunkUnloaded, e[4].kind);
  EXPECT_EQ(ChunkId{2}, e[5].chunk);
  EXPECT_EQ(EntryKind::PartitionCreated, e[9].kind);
  EXPECT_EQ("mem", e[9].table);
  for (const auto& entry : e) {
    EXPECT_NE("stale", entry.table);
  }
}

TEST_F(PreservedCatalogTest, WipeAndRebuildWithoutArtifacts) {
  Append(CatalogEntry::PartitionCreated("cpu", "a"));
  ASSERT_TRUE(_catalog.WipeAndRebuild(_objects).ok());
  EXPECT_EQ(0U, _store.NumEntries(_uuid));
  EXPECT_FALSE(_catalog.LastSequence().isSet());
}

TEST_F(PreservedCatalogTest, WipeAndRebuildKeepsUsedChunkIds) {
  Append(CatalogEntry::PartitionCreated("cpu", "a"));
  for (uint64_t id = 0; id != 4; ++id) {
    Append(CatalogEntry::ChunkCreated("cpu", "a", ChunkId{id}));
    Append(CatalogEntry::ChunkClosed("cpu", "a", ChunkId{id}));
  }
  Append(CatalogEntry::PartitionCreated("mem", "b"));
  Append(CatalogEntry::ChunkCreated("mem", "b", ChunkId{5}));
  PutArtifact("cpu", "a", 1, {{.time = 3, .series = "s", .value = 1}});

  ASSERT_TRUE(_catalog.WipeAndRebuild(_objects).ok());

  auto entries = _catalog.ReadAll();
  ASSERT_TRUE(entries.has_value());
  const auto& e = *entries;
  ASSERT_EQ(1U + 4U + 3U + 1U + 3U + 1U, e.size());

  EXPECT_EQ(ChunkId{1}, e[1].chunk);
  EXPECT_EQ(EntryKind::ChunkCreated, e[5].kind);
  EXPECT_EQ(ChunkId{3}, e[5].chunk);
  EXPECT_EQ(EntryKind::ChunkClosed, e[6].kind);
  EXPECT_EQ(EntryKind::ChunkDropped, e[7].kind);
  EXPECT_EQ(ChunkId{3}, e[7].chunk);

  EXPECT_EQ(EntryKind::PartitionCreated, e[8].kind);
  EXPECT_EQ("mem", e[8].table);
  EXPECT_EQ(ChunkId{5}, e[9].chunk);
  EXPECT_EQ(EntryKind::ChunkDropped, e[11].kind);
  EXPECT_EQ(EntryKind::PartitionDropped, e[12].kind);
}

TEST_F(PreservedCatalogTest, WipeAndRebuildReadsPastUndecodableEntries) {
  Append(CatalogEntry::PartitionCreated("cpu", "a"));
  Append(CatalogEntry::ChunkCreated("cpu", "a", ChunkId{0}));
  ASSERT_TRUE(_store.Append(_uuid, CatalogSequence{3}, "garbage").ok());
  PutArtifact("cpu", "a", 0, {});

  ASSERT_TRUE(_catalog.WipeAndRebuild(_objects).ok());

  auto entries = _catalog.ReadAll();
  ASSERT_TRUE(entries.has_value());
  EXPECT_EQ(5U, entries->size());
}

TEST_F(PreservedCatalogTest, RewriteRenumbersEntries) {
  Append(CatalogEntry::PartitionCreated("cpu", "a"));
  Append(CatalogEntry::ChunkCreated("cpu", "a", ChunkId{0}));
  Append(CatalogEntry::ChunkClosed("cpu", "a", ChunkId{0}));

  auto entries = _catalog.ReadAll();
  ASSERT_TRUE(entries.has_value());
  entries->pop_back();
  ASSERT_TRUE(_catalog.Rewrite(*entries).ok());

  EXPECT_EQ(2U, _store.NumEntries(_uuid));
  EXPECT_EQ(CatalogSequence{2}, _catalog.LastSequence());
  EXPECT_EQ(CatalogSequence{3},
            Append(CatalogEntry::ChunkClosed("cpu", "a", ChunkId{0})));
}

TEST_F(PreservedCatalogTest, FailedRebuildKeepsLog) {
  Append(CatalogEntry::PartitionCreated("cpu", "a"));
  PutArtifact("cpu", "a", 0, {});
  FailurePointGuard guard{"CatalogStore::Rewrite"};
  auto r = _catalog.WipeAndRebuild(_objects);
  EXPECT_EQ(ERROR_SERVER_IO_ERROR, r.errorNumber());
  EXPECT_EQ(1U, _store.NumEntries(_uuid));
  EXPECT_EQ(CatalogSequence{1}, _catalog.LastSequence());
}
