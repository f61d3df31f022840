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

#include "rest_server/registry.h"

#include <absl/time/clock.h>
#include <vpack/builder.h>
#include <vpack/iterator.h>
#include <vpack/slice.h>

#include "basics/logger/logger.h"
#include "basics/vpack_helper.h"
#include "database/database_name.h"
#include "operations/operation_tracker.h"
#include "storage_engine/object_store.h"

namespace cdb {
namespace {

struct ConfigEntry {
  std::string name;
  DatabaseUuid uuid;
};

ResultOr<std::vector<ConfigEntry>> ParseServerConfig(std::string_view bytes) {
  auto slice = basics::VPackHelper::FromBytes(bytes);
  if (!slice) {
    return std::unexpected{std::move(slice).error()};
  }
  auto databases = slice->isObject() ? slice->get("databases") : vpack::Slice{};
  if (!databases.isArray()) {
    return std::unexpected<Result>{std::in_place,
                                   ERROR_SERVER_CORRUPTED_DATAFILE,
                                   "attribute 'databases' must be an array"};
  }
  std::vector<ConfigEntry> entries;
  for (auto database : vpack::ArrayIterator(databases)) {
    auto name = basics::VPackHelper::GetString(database, "name");
    if (!name) {
      return std::unexpected{std::move(name).error()};
    }
    auto uuid = basics::VPackHelper::GetString(database, "uuid");
    if (!uuid) {
      return std::unexpected{std::move(uuid).error()};
    }
    auto parsed = DatabaseUuid::Parse(*uuid);
    if (!parsed) {
      return std::unexpected{std::move(parsed).error()};
    }
    if (auto r = ValidateDatabaseName(*name); r.fail()) {
      return std::unexpected{std::move(r)};
    }
    entries.push_back({std::string{*name}, *parsed});
  }
  return entries;
}

}  // namespace

Result Registry::Bootstrap() {
  const auto path = object_paths::ServerConfig(_context.server_id);
  auto entries = [&]() -> ResultOr<std::vector<ConfigEntry>> {
    auto bytes = _context.objects.Get(path);
    if (!bytes) {
      if (bytes.error().is(ERROR_FILE_NOT_FOUND)) {
        CDB_INFO("xxxxx", Logger::STARTUP, "no server config at '", path,
                 "', starting without databases");
        return std::vector<ConfigEntry>{};
      }
      return std::unexpected{std::move(bytes).error()};
    }
    return ParseServerConfig(*bytes);
  }();
  if (!entries) {
    auto r = std::move(entries).error().withContext(
      "cannot read server config '", path, "'");
    CDB_ERROR("xxxxx", Logger::STARTUP, r.errorMessage());
    absl::MutexLock lock{&_mutex};
    _init_error = std::string{r.errorMessage()};
    return r;
  }

  std::vector<std::shared_ptr<Database>> databases;
  {
    absl::MutexLock lock{&_mutex};
    for (auto& entry : *entries) {
      if (_databases.contains(entry.name)) {
        CDB_WARN("xxxxx", Logger::STARTUP, "server config lists database '",
                 entry.name, "' twice, ignoring id ", entry.uuid);
        continue;
      }
      auto database = std::make_shared<Database>(_context, std::move(entry.name),
                                                  entry.uuid);
      _databases.emplace(database->name(), database);
      databases.push_back(std::move(database));
    }
  }
  for (const auto& database : databases) {
    auto operation = database->Initialize();
    CDB_ERROR_IF("xxxxx", Logger::STARTUP, !operation,
                 "cannot initialize database '", database->name(),
                 "': ", operation.error().errorMessage());
  }

  absl::MutexLock lock{&_mutex};
  _initialized = true;
  CDB_INFO("xxxxx", Logger::STARTUP, "bootstrapped ", databases.size(),
           " database(s) of server '", _context.server_id, "'");
  return {};
}

bool Registry::initialized() const {
  absl::MutexLock lock{&_mutex};
  return _initialized;
}

Result Registry::CheckAvailable() const {
  if (_shutting_down) {
    return {ERROR_SHUTTING_DOWN, "server is shutting down"};
  }
  if (!_initialized) {
    return {ERROR_SERVER_NOT_INITIALIZED, "server is not initialized",
            _init_error ? absl::StrCat(": ", *_init_error) : ""};
  }
  return {};
}

Result Registry::WriteServerConfig() {
  absl::MutexLock config_lock{&_config_mutex};
  vpack::Builder builder;
  builder.openObject();
  builder.add("databases", vpack::Value(vpack::ValueType::Array));
  for (const auto& database : Databases()) {
    if (database->state() == DatabaseState::Released) {
      continue;
    }
    const auto uuid = database->uuid().toString();
    builder.openObject();
    builder.add("name", std::string_view{database->name()});
    builder.add("uuid", std::string_view{uuid});
    builder.close();
  }
  builder.close();
  builder.close();
  auto r = _context.objects.Put(object_paths::ServerConfig(_context.server_id),
                                basics::VPackHelper::ToBytes(builder.slice()));
  CDB_ERROR_IF("xxxxx", Logger::LIFECYCLE, r.fail(),
               "cannot write server config: ", r.errorMessage());
  return r;
}

ResultOr<CreatedDatabase> Registry::CreateDatabase(const DatabaseRules& rules) {
  if (auto r = ValidateDatabaseName(rules.name); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  std::shared_ptr<Database> database;
  {
    absl::MutexLock lock{&_mutex};
    if (auto r = CheckAvailable(); r.fail()) {
      return std::unexpected{std::move(r)};
    }
    if (auto it = _databases.find(rules.name); it != _databases.end()) {
      return std::unexpected<Result>{
        std::in_place, ERROR_SERVER_DUPLICATE_NAME, "database '", rules.name,
        "' already exists (", DatabaseStateName(it->second->state()), ")"};
    }
    database =
      std::make_shared<Database>(_context, rules.name, DatabaseUuid::Random());
    _databases.emplace(rules.name, database);
  }

  auto operation = database->Create(rules);
  if (!operation) {
    absl::MutexLock lock{&_mutex};
    _databases.erase(rules.name);
    return std::unexpected{std::move(operation).error()};
  }
  if (auto r = WriteServerConfig(); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return CreatedDatabase{database->uuid(), std::move(*operation)};
}

ResultOr<std::shared_ptr<Database>> Registry::GetDatabase(
  std::string_view name) const {
  absl::MutexLock lock{&_mutex};
  auto it = _databases.find(name);
  if (it == _databases.end()) {
    return std::unexpected<Result>{std::in_place,
                                   ERROR_SERVER_DATABASE_NOT_FOUND, "database '",
                                   name, "' not found"};
  }
  return it->second;
}

std::vector<std::shared_ptr<Database>> Registry::Databases() const {
  absl::MutexLock lock{&_mutex};
  std::vector<std::shared_ptr<Database>> databases;
  databases.reserve(_databases.size());
  for (const auto& [_, database] : _databases) {
    databases.push_back(database);
  }
  return databases;
}

std::shared_ptr<Database> Registry::FindReleased(DatabaseUuid uuid) const {
  for (auto& database : Databases()) {
    if (database->uuid() == uuid &&
        database->state() == DatabaseState::Released) {
      return database;
    }
  }
  return nullptr;
}

ResultOr<DatabaseUuid> Registry::ReleaseDatabase(
  std::string_view name, std::optional<DatabaseUuid> expected) {
  auto database = GetDatabase(name);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  auto uuid = (*database)->Release(expected);
  if (!uuid) {
    return uuid;
  }
  if (auto r = WriteServerConfig(); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return uuid;
}

ResultOr<std::string> Registry::ClaimDatabase(DatabaseUuid uuid) {
  {
    absl::MutexLock lock{&_mutex};
    if (auto r = CheckAvailable(); r.fail()) {
      return std::unexpected{std::move(r)};
    }
  }
  auto database = FindReleased(uuid);
  if (!database) {
    return ClaimFromStorage(uuid);
  }
  if (auto r = database->Claim(uuid); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  if (auto r = WriteServerConfig(); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return database->name();
}

ResultOr<std::string> Registry::ClaimFromStorage(DatabaseUuid uuid) {
  const auto id = uuid.toString();
  auto not_found = [&] {
    return std::unexpected<Result>{std::in_place,
                                   ERROR_SERVER_DATABASE_NOT_FOUND,
                                   "no released database with id ", id};
  };
  for (const auto& database : Databases()) {
    if (database->uuid() == uuid) {
      return not_found();
    }
  }
  if (!_context.objects.Exists(object_paths::Rules(id)) ||
      _context.objects.Exists(object_paths::Owner(id))) {
    return not_found();
  }

  auto name = [&]() -> ResultOr<std::string> {
    auto bytes = _context.objects.Get(object_paths::Rules(id));
    if (!bytes) {
      return std::unexpected{std::move(bytes).error()};
    }
    auto slice = basics::VPackHelper::FromBytes(*bytes);
    if (!slice) {
      return std::unexpected{std::move(slice).error()};
    }
    auto rules = DatabaseRules::FromVPack(*slice);
    if (!rules) {
      return std::unexpected{std::move(rules).error()};
    }
    return std::move(rules->name);
  }();
  if (!name) {
    return std::unexpected{std::move(name).error().withContext(
      "cannot read the rules of database ", id)};
  }

  std::shared_ptr<Database> database;
  {
    absl::MutexLock lock{&_mutex};
    if (auto it = _databases.find(*name); it != _databases.end()) {
      return std::unexpected<Result>{
        std::in_place, ERROR_SERVER_DUPLICATE_NAME, "cannot claim database ",
        id, ", a database named '", *name, "' already exists"};
    }
    database = std::make_shared<Database>(_context, *name, uuid);
    _databases.emplace(*name, database);
  }
  auto operation = database->Initialize(true);
  if (!operation) {
    absl::MutexLock lock{&_mutex};
    _databases.erase(*name);
    return std::unexpected{std::move(operation).error()};
  }
  CDB_INFO("xxxxx", Logger::LIFECYCLE, "claimed database '", *name,
           "' with id ", id, " from storage");
  if (auto r = WriteServerConfig(); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return name;
}

ResultOr<OperationPtr> Registry::WipePreservedCatalog(std::string_view name) {
  auto database = GetDatabase(name);
  if (!database) {
    return std::unexpected{std::move(database).error()};
  }
  return (*database)->WipePreservedCatalog();
}

ServerStatus Registry::Status() const {
  ServerStatus status;
  {
    absl::MutexLock lock{&_mutex};
    status.initialized = _initialized;
    status.error = _init_error;
  }
  for (const auto& database : Databases()) {
    status.databases.push_back(database->status());
  }
  return status;
}

bool Registry::WaitForInit(absl::Duration timeout) const {
  const auto deadline = absl::Now() + timeout;
  for (const auto& database : Databases()) {
    if (!database->WaitForInit(deadline - absl::Now())) {
      return false;
    }
  }
  return true;
}

void Registry::Shutdown(absl::Duration timeout) {
  {
    absl::MutexLock lock{&_mutex};
    if (_shutting_down) {
      return;
    }
    _shutting_down = true;
  }
  CDB_INFO("xxxxx", Logger::LIFECYCLE, "shutting down, waiting for running "
                                       "operations");
  CDB_WARN_IF("xxxxx", Logger::LIFECYCLE, !_context.tracker.WaitAll(timeout),
              "operations still running after ", absl::FormatDuration(timeout));
}

}  // namespace cdb
