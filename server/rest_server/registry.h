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

#include <absl/base/thread_annotations.h>
#include <absl/container/btree_map.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "basics/result_or.h"
#include "catalog/identifiers/database_uuid.h"
#include "database/database.h"

namespace cdb {

struct ServerStatus {
  // bootstrap completed
  bool initialized = false;
  std::optional<std::string> error;
  // sorted by name
  std::vector<DatabaseStatus> databases;
};

struct CreatedDatabase {
  DatabaseUuid uuid;
  OperationPtr operation;
};

// Maps database names to their instances. Released databases stay
// registered, their names remain taken until they are claimed again.
class Registry {
 public:
  explicit Registry(DatabaseContext& context) noexcept : _context{context} {}

  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  // registers the databases the server config lists and spawns their
  // initialization
  Result Bootstrap();

  bool initialized() const;

  ResultOr<CreatedDatabase> CreateDatabase(const DatabaseRules& rules);

  // any state
  ResultOr<std::shared_ptr<Database>> GetDatabase(std::string_view name) const;

  // sorted by name
  std::vector<std::shared_ptr<Database>> Databases() const;

  std::shared_ptr<Database> FindReleased(DatabaseUuid uuid) const;

  ResultOr<DatabaseUuid> ReleaseDatabase(std::string_view name,
                                         std::optional<DatabaseUuid> expected);

  // claims a database released on this server or, failing that, one released
  // by another process on the same storage. returns its name
  ResultOr<std::string> ClaimDatabase(DatabaseUuid uuid);

  ResultOr<OperationPtr> WipePreservedCatalog(std::string_view name);

  ServerStatus Status() const;

  // waits until every registered database left the bootstrapping states
  bool WaitForInit(absl::Duration timeout) const;

  // rejects new databases and waits for running operations
  void Shutdown(absl::Duration timeout);

 private:
  Result CheckAvailable() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(_mutex);

  // rewrites the list of databases owned by this server
  Result WriteServerConfig();

  ResultOr<std::string> ClaimFromStorage(DatabaseUuid uuid);

  DatabaseContext& _context;

  mutable absl::Mutex _mutex;
  absl::btree_map<std::string, std::shared_ptr<Database>, std::less<>>
    _databases ABSL_GUARDED_BY(_mutex);
  bool _initialized ABSL_GUARDED_BY(_mutex) = false;
  bool _shutting_down ABSL_GUARDED_BY(_mutex) = false;
  std::optional<std::string> _init_error ABSL_GUARDED_BY(_mutex);

  absl::Mutex _config_mutex ABSL_ACQUIRED_BEFORE(_mutex);
};

}  // namespace cdb
