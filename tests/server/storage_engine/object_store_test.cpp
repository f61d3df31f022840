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

#include <stdlib.h>

#include <filesystem>
#include <memory>

#include "basics/debugging.h"
#include "gtest/gtest.h"
#include "storage_engine/local_object_store.h"
#include "storage_engine/memory_object_store.h"

using namespace cdb;

namespace {

class ObjectStoreTest : public ::testing::TestWithParam<std::string_view> {
 protected:
  void SetUp() final {
    if (GetParam() == "memory") {
      _store = std::make_unique<MemoryObjectStore>();
      return;
    }
    _path = testing::TempDir() + "/object_store_XXXXXX";
    ASSERT_NE(mkdtemp(_path.data()), nullptr);
    auto store = std::make_unique<LocalObjectStore>(_path + "/objects");
    ASSERT_TRUE(store->Open().ok());
    _store = std::move(store);
  }

  void TearDown() final {
    _store.reset();
    ClearFailurePoints();
    if (!_path.empty()) {
      std::filesystem::remove_all(_path);
    }
  }

  std::string _path;
  std::unique_ptr<ObjectStore> _store;
};

}  // namespace

TEST_P(ObjectStoreTest, PutGetDelete) {
  EXPECT_EQ(GetParam(), _store->Name());
  EXPECT_FALSE(_store->Exists("dbs/a/rules"));

  ASSERT_TRUE(_store->Put("dbs/a/rules", "first").ok());
  EXPECT_TRUE(_store->Exists("dbs/a/rules"));
  auto bytes = _store->Get("dbs/a/rules");
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ("first", *bytes);

  ASSERT_TRUE(_store->Put("dbs/a/rules", "second").ok());
  bytes = _store->Get("dbs/a/rules");
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ("second", *bytes);

  ASSERT_TRUE(_store->Delete("dbs/a/rules").ok());
  EXPECT_FALSE(_store->Exists("dbs/a/rules"));
  // deleting twice is fine
  EXPECT_TRUE(_store->Delete("dbs/a/rules").ok());
}

TEST_P(ObjectStoreTest, GetMissing) {
  auto bytes = _store->Get("dbs/missing/rules");
  ASSERT_FALSE(bytes.has_value());
  EXPECT_EQ(ERROR_FILE_NOT_FOUND, bytes.error().errorNumber());
}

TEST_P(ObjectStoreTest, BinaryContent) {
  const std::string content{"\0\x01\xff binary\n", 11};
  ASSERT_TRUE(_store->Put("blob", content).ok());
  auto bytes = _store->Get("blob");
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(content, *bytes);
}

TEST_P(ObjectStoreTest, ListByPrefix) {
  for (std::string_view path : {
         "dbs/b/data/cpu/k/1.chunk",
         "dbs/b/data/cpu/k/0.chunk",
         "dbs/b/rules",
         "dbs/c/rules",
         "config/1/databases",
       }) {
    ASSERT_TRUE(_store->Put(path, "x").ok());
  }
  auto paths = _store->List("dbs/b/");
  ASSERT_TRUE(paths.has_value());
  EXPECT_EQ((std::vector<std::string>{"dbs/b/data/cpu/k/0.chunk",
                                      "dbs/b/data/cpu/k/1.chunk",
                                      "dbs/b/rules"}),
            *paths);

  auto none = _store->List("dbs/z/");
  ASSERT_TRUE(none.has_value());
  EXPECT_TRUE(none->empty());
}

TEST_P(ObjectStoreTest, FailurePoints) {
  {
    FailurePointGuard guard{"ObjectStore::Put"};
    EXPECT_TRUE(_store->Put("a", "x").is(ERROR_SERVER_IO_ERROR));
  }
  EXPECT_FALSE(_store->Exists("a"));
  ASSERT_TRUE(_store->Put("a", "x").ok());
  {
    FailurePointGuard guard{"ObjectStore::Get"};
    auto bytes = _store->Get("a");
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(ERROR_SERVER_IO_ERROR, bytes.error().errorNumber());
  }
  {
    FailurePointGuard guard{"ObjectStore::Delete"};
    EXPECT_TRUE(_store->Delete("a").is(ERROR_SERVER_IO_ERROR));
  }
  EXPECT_TRUE(_store->Exists("a"));
}

INSTANTIATE_TEST_SUITE_P(Stores, ObjectStoreTest,
                         ::testing::Values("memory", "local"));

TEST(LocalObjectStoreTest, SurvivesReopen) {
  std::string path = testing::TempDir() + "/local_store_XXXXXX";
  ASSERT_NE(mkdtemp(path.data()), nullptr);
  {
    LocalObjectStore store{path};
    ASSERT_TRUE(store.Open().ok());
    ASSERT_TRUE(store.Put("dbs/x/owner", "owned").ok());
  }
  {
    LocalObjectStore store{path};
    ASSERT_TRUE(store.Open().ok());
    auto bytes = store.Get("dbs/x/owner");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ("owned", *bytes);
    EXPECT_TRUE(std::filesystem::is_regular_file(
      std::filesystem::path{path} / "dbs/x/owner"));
  }
  std::filesystem::remove_all(path);
}

TEST(MemoryObjectStoreTest, Corrupt) {
  MemoryObjectStore store;
  EXPECT_FALSE(store.Corrupt("a"));
  ASSERT_TRUE(store.Put("a", "x").ok());
  EXPECT_TRUE(store.Corrupt("a"));
  auto bytes = store.Get("a");
  ASSERT_TRUE(bytes.has_value());
  EXPECT_NE("x", *bytes);
  EXPECT_EQ(1U, store.Size());
}

TEST(ObjectPathsTest, Layout) {
  EXPECT_EQ("config/1/databases", object_paths::ServerConfig("1"));
  EXPECT_EQ("dbs/u/rules", object_paths::Rules("u"));
  EXPECT_EQ("dbs/u/owner", object_paths::Owner("u"));
  EXPECT_EQ("dbs/u/data/", object_paths::DataRoot("u"));
  EXPECT_EQ("dbs/u/data/cpu/2023-01-01T00/7.chunk",
            object_paths::Chunk("u", "cpu", "2023-01-01T00", 7));
}

TEST(ObjectPathsTest, ParseChunkReversesEscaping) {
  auto path = object_paths::Chunk("u", "my table", "a/b%c", 42);
  EXPECT_EQ(std::string::npos, path.find(' '));
  auto location = object_paths::ParseChunk("u", path);
  ASSERT_TRUE(location.has_value());
  EXPECT_EQ("my table", location->table);
  EXPECT_EQ("a/b%c", location->partition_key);
  EXPECT_EQ(42U, location->chunk_id);
}

TEST(ObjectPathsTest, ParseChunkRejectsOtherPaths) {
  for (std::string_view path : {
         "dbs/u/rules",
         "dbs/v/data/cpu/k/1.chunk",
         "dbs/u/data/cpu/1.chunk",
         "dbs/u/data/cpu/k/one.chunk",
         "dbs/u/data/cpu/k/1.tmp",
       }) {
    auto location = object_paths::ParseChunk("u", path);
    ASSERT_FALSE(location.has_value()) << path;
    EXPECT_EQ(ERROR_BAD_PARAMETER, location.error().errorNumber());
  }
}
