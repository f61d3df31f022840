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

#include <absl/time/time.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "basics/result_or.h"
#include "database/rules.h"

namespace vpack {
class Slice;
}  // namespace vpack

namespace cdb {

enum class StorageBackend : uint8_t {
  Local,
  Memory,
};

enum class CatalogBackend : uint8_t {
  RocksDB,
  Memory,
};

struct ServerOptions {
  std::string data_directory = "chronodb-data";
  std::string server_id = "1";
  uint64_t scheduler_threads = 4;
  StorageBackend storage = StorageBackend::Local;
  CatalogBackend catalog = CatalogBackend::RocksDB;
  // overrides of the built-in rule defaults, `name` stays empty
  DatabaseRules default_rules;
  absl::Duration shutdown_timeout = absl::Seconds(30);

  // keys as in the config file:
  // {"dataDirectory": "...", "serverId": "...", "schedulerThreads": 4,
  //  "storage": "local", "catalog": "rocksdb", "defaultRules": {...},
  //  "shutdownTimeoutSeconds": 30}
  // absent keys keep the values of `base`
  static ResultOr<ServerOptions> FromVPack(vpack::Slice slice,
                                           ServerOptions base = {});
  static ResultOr<ServerOptions> FromJsonFile(std::string_view path,
                                              ServerOptions base = {});

  Result Validate() const;

  std::string objectsDirectory() const;
  std::string catalogDirectory() const;
};

}  // namespace cdb
