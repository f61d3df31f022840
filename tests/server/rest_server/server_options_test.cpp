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

#include "rest_server/server_options.h"

#include <vpack/builder.h>

#include <filesystem>
#include <fstream>

#include "basics/vpack_helper.h"
#include "gtest/gtest.h"

using namespace cdb;

namespace {

ResultOr<ServerOptions> Parse(std::string_view json, ServerOptions base = {}) {
  auto builder = basics::VPackHelper::FromJson(json);
  EXPECT_TRUE(builder.has_value());
  if (!builder) {
    return std::unexpected{std::move(builder).error()};
  }
  return ServerOptions::FromVPack((*builder)->slice(), std::move(base));
}

}  // namespace

TEST(ServerOptionsTest, Defaults) {
  ServerOptions options;
  EXPECT_TRUE(options.Validate().ok());
  EXPECT_EQ(StorageBackend::Local, options.storage);
  EXPECT_EQ(CatalogBackend::RocksDB, options.catalog);
  EXPECT_EQ("chronodb-data/objects", options.objectsDirectory());
  EXPECT_EQ("chronodb-data/catalog", options.catalogDirectory());
}

TEST(ServerOptionsTest, ParsesAllKeys) {
  auto options = Parse(R"({
    "dataDirectory": "/var/lib/chronodb",
    "serverId": "node-7",
    "schedulerThreads": 8,
    "storage": "memory",
    "catalog": "Memory",
    "defaultRules": {"lifecycle": {"mubRowThreshold": 1000}},
    "shutdownTimeoutSeconds": 5
  })");
  ASSERT_TRUE(options.has_value()) << options.error().errorMessage();
  EXPECT_EQ("/var/lib/chronodb", options->data_directory);
  EXPECT_EQ("node-7", options->server_id);
  EXPECT_EQ(8U, options->scheduler_threads);
  EXPECT_EQ(StorageBackend::Memory, options->storage);
  EXPECT_EQ(CatalogBackend::Memory, options->catalog);
  EXPECT_EQ(1000U,
            options->default_rules.lifecycle.mub_row_threshold.value_or(0));
  EXPECT_EQ(absl::Seconds(5), options->shutdown_timeout);
  EXPECT_EQ("/var/lib/chronodb/objects", options->objectsDirectory());
  EXPECT_TRUE(options->Validate().ok());
}

TEST(ServerOptionsTest, AbsentKeysKeepBase) {
  ServerOptions base;
  base.server_id = "from-flag";
  base.scheduler_threads = 3;
  auto options = Parse(R"({"schedulerThreads": 2})", base);
  ASSERT_TRUE(options.has_value());
  EXPECT_EQ("from-flag", options->server_id);
  EXPECT_EQ(2U, options->scheduler_threads);
}

TEST(ServerOptionsTest, RejectsBadInput) {
  for (auto json : {R"([])", R"({"unknown": 1})", R"({"serverId": 1})",
                    R"({"schedulerThreads": -1})", R"({"storage": "s3"})",
                    R"({"defaultRules": {"lifecycle": 5}})"}) {
    auto options = Parse(json);
    ASSERT_FALSE(options.has_value()) << json;
    EXPECT_NE(ERROR_OK, options.error().errorNumber()) << json;
  }
  EXPECT_TRUE(
    Parse(R"({"unknown": 1})").error().is(ERROR_BAD_PARAMETER));
  EXPECT_NE(std::string_view::npos,
            Parse(R"({"unknown": 1})").error().errorMessage().find("unknown"));
}

TEST(ServerOptionsTest, Validate) {
  ServerOptions options;
  options.server_id = "";
  EXPECT_TRUE(options.Validate().is(ERROR_BAD_PARAMETER));
  options.server_id = "a/b";
  EXPECT_TRUE(options.Validate().is(ERROR_BAD_PARAMETER));
  options.server_id = "1";

  options.scheduler_threads = 0;
  EXPECT_TRUE(options.Validate().is(ERROR_BAD_PARAMETER));
  options.scheduler_threads = 1;

  options.data_directory = "";
  EXPECT_TRUE(options.Validate().is(ERROR_BAD_PARAMETER));
  options.storage = StorageBackend::Memory;
  options.catalog = CatalogBackend::Memory;
  EXPECT_TRUE(options.Validate().ok());

  options.default_rules.name = "db";
  EXPECT_TRUE(options.Validate().is(ERROR_BAD_PARAMETER));
  options.default_rules.name.clear();
  options.default_rules.lifecycle.mub_row_threshold = 0;
  EXPECT_FALSE(options.Validate().ok());
  options.default_rules.lifecycle.mub_row_threshold.reset();

  options.shutdown_timeout = absl::ZeroDuration();
  EXPECT_TRUE(options.Validate().is(ERROR_BAD_PARAMETER));
}

TEST(ServerOptionsTest, FromJsonFile) {
  EXPECT_TRUE(ServerOptions::FromJsonFile("/nonexistent/chronodb.json")
                .error()
                .is(ERROR_FILE_NOT_FOUND));

  const auto path = std::filesystem::path{testing::TempDir()} /
                    "server_options_test.json";
  {
    std::ofstream file{path};
    file << R"({"serverId": "from-file"})";
  }
  auto options = ServerOptions::FromJsonFile(path.string());
  ASSERT_TRUE(options.has_value()) << options.error().errorMessage();
  EXPECT_EQ("from-file", options->server_id);

  {
    std::ofstream file{path};
    file << "{not json";
  }
  EXPECT_FALSE(ServerOptions::FromJsonFile(path.string()).has_value());
  std::filesystem::remove(path);
}
