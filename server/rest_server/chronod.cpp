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

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/time/time.h>
#include <signal.h>
#include <vpack/builder.h>

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "basics/logger/logger.h"
#include "catalog/catalog_store.h"
#include "catalog/memory_catalog_store.h"
#include "database/database.h"
#include "general_server/scheduler.h"
#include "operations/operation_tracker.h"
#include "rest_server/management_service.h"
#include "rest_server/registry.h"
#include "rest_server/server_options.h"
#include "rocksdb_engine_catalog/rocksdb_catalog_store.h"
#include "storage_engine/local_object_store.h"
#include "storage_engine/memory_object_store.h"

ABSL_FLAG(std::string, config, "", "JSON server config file");
ABSL_FLAG(std::optional<std::string>, data_directory, std::nullopt,
          "directory of the object store and the catalog");
ABSL_FLAG(std::optional<std::string>, server_id, std::nullopt,
          "id of this server in the object store");
ABSL_FLAG(std::optional<uint64_t>, scheduler_threads, std::nullopt,
          "number of scheduler worker threads");
ABSL_FLAG(std::optional<std::string>, storage, std::nullopt,
          "object store backend: local or memory");
ABSL_FLAG(std::optional<std::string>, catalog, std::nullopt,
          "catalog backend: rocksdb or memory");
ABSL_FLAG(std::vector<std::string>, log_level, {},
          "log levels, e.g. info or catalog=debug, comma separated");

using namespace cdb;

namespace {

ResultOr<ServerOptions> LoadOptions() {
  ServerOptions options;
  if (auto path = absl::GetFlag(FLAGS_config); !path.empty()) {
    auto loaded = ServerOptions::FromJsonFile(path);
    if (!loaded) {
      return loaded;
    }
    options = std::move(*loaded);
  }

  // command line flags win over the config file
  vpack::Builder overrides;
  overrides.openObject();
  if (auto value = absl::GetFlag(FLAGS_data_directory)) {
    overrides.add("dataDirectory", std::string_view{*value});
  }
  if (auto value = absl::GetFlag(FLAGS_server_id)) {
    overrides.add("serverId", std::string_view{*value});
  }
  if (auto value = absl::GetFlag(FLAGS_scheduler_threads)) {
    overrides.add("schedulerThreads", *value);
  }
  if (auto value = absl::GetFlag(FLAGS_storage)) {
    overrides.add("storage", std::string_view{*value});
  }
  if (auto value = absl::GetFlag(FLAGS_catalog)) {
    overrides.add("catalog", std::string_view{*value});
  }
  overrides.close();
  auto merged = ServerOptions::FromVPack(overrides.slice(), std::move(options));
  if (!merged) {
    return merged;
  }
  if (auto r = merged->Validate(); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return merged;
}

ResultOr<std::unique_ptr<ObjectStore>> OpenObjectStore(
  const ServerOptions& options) {
  if (options.storage == StorageBackend::Memory) {
    CDB_WARN("xxxxx", Logger::CONFIG,
             "using the in-memory object store, nothing survives a restart");
    return std::make_unique<MemoryObjectStore>();
  }
  auto store = std::make_unique<LocalObjectStore>(options.objectsDirectory());
  if (auto r = store->Open(); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return store;
}

ResultOr<std::unique_ptr<catalog::CatalogStore>> OpenCatalogStore(
  const ServerOptions& options) {
  if (options.catalog == CatalogBackend::Memory) {
    CDB_WARN("xxxxx", Logger::CONFIG,
             "using the in-memory catalog, nothing survives a restart");
    return std::make_unique<catalog::MemoryCatalogStore>();
  }
  auto store =
    std::make_unique<catalog::RocksDBCatalogStore>(options.catalogDirectory());
  if (auto r = store->Open(); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return store;
}

int WaitForSignal(const sigset_t& signals) {
  int received = 0;
  while (sigwait(&signals, &received) != 0) {
  }
  return received;
}

}  // namespace

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage("ChronoDB control plane daemon");
  absl::ParseCommandLine(argc, argv);

  for (const auto& level : absl::GetFlag(FLAGS_log_level)) {
    if (!log::SetLogLevel(level)) {
      CDB_FATAL("xxxxx", Logger::CONFIG, "invalid log level '", level, "'");
    }
  }

  auto options = LoadOptions();
  if (!options) {
    CDB_FATAL("xxxxx", Logger::CONFIG, "invalid configuration: ",
              options.error().errorMessage());
  }

  // workers inherit the mask, signals are only taken by the main thread
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  auto objects = OpenObjectStore(*options);
  if (!objects) {
    CDB_FATAL("xxxxx", Logger::STARTUP, "cannot open the object store: ",
              objects.error().errorMessage());
  }
  auto catalog_store = OpenCatalogStore(*options);
  if (!catalog_store) {
    CDB_FATAL("xxxxx", Logger::STARTUP, "cannot open the catalog: ",
              catalog_store.error().errorMessage());
  }

  Scheduler scheduler{options->scheduler_threads};
  if (!scheduler.start()) {
    CDB_FATAL("xxxxx", Logger::STARTUP, "cannot start the scheduler");
  }
  operations::OperationTracker tracker{scheduler};
  DatabaseContext context{
    .server_id = options->server_id,
    .objects = **objects,
    .catalog_store = **catalog_store,
    .tracker = tracker,
    .defaults = options->default_rules,
  };
  Registry registry{context};
  ManagementService service{registry, tracker};

  CDB_INFO("xxxxx", Logger::STARTUP, "starting server '", options->server_id,
           "' with ", (*objects)->Name(), " object store and ",
           (*catalog_store)->Name(), " catalog in '", options->data_directory,
           "'");
  if (auto r = registry.Bootstrap(); r.fail()) {
    CDB_ERROR("xxxxx", Logger::STARTUP,
              "bootstrap failed, serving without databases: ",
              r.errorMessage());
  }
  const auto status = service.GetServerStatus();
  CDB_INFO("xxxxx", Logger::STARTUP, "server ready, ",
           status.databases.size(), " database(s) registered");

  const auto received = WaitForSignal(signals);
  CDB_INFO("xxxxx", Logger::STARTUP, "received signal ", received,
           ", shutting down");

  registry.Shutdown(options->shutdown_timeout);
  scheduler.shutdown();
  log::Flush();
  return EXIT_SUCCESS;
}
