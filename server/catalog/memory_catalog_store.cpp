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

#include "catalog/memory_catalog_store.h"

#include "basics/debugging.h"

namespace cdb::catalog {

Result MemoryCatalogStore::Append(const DatabaseUuid& database,
                                  CatalogSequence sequence,
                                  std::string_view bytes) {
  CDB_IF_FAILURE("CatalogStore::Append") {
    return {ERROR_SERVER_IO_ERROR, "failed to append catalog entry ",
            sequence.id(), " of database ", database};
  }
  absl::MutexLock lock{&_mutex};
  auto [_, inserted] =
    _entries[database].try_emplace(sequence, std::string{bytes});
  if (!inserted) {
    return {ERROR_SERVER_CONFLICT, "catalog entry ", sequence.id(),
            " of database ", database, " already exists"};
  }
  return {};
}

Result MemoryCatalogStore::Visit(const DatabaseUuid& database,
                                 CatalogSequence from, size_t limit,
                                 Visitor visitor) const {
  CDB_IF_FAILURE("CatalogStore::Visit") {
    return {ERROR_SERVER_IO_ERROR, "failed to read catalog of database ",
            database};
  }
  absl::MutexLock lock{&_mutex};
  auto db = _entries.find(database);
  if (db == _entries.end()) {
    return {};
  }
  for (auto it = db->second.lower_bound(from);
       it != db->second.end() && limit != 0; ++it, --limit) {
    if (!visitor(it->first, it->second)) {
      break;
    }
  }
  return {};
}

ResultOr<CatalogSequence> MemoryCatalogStore::LastSequence(
  const DatabaseUuid& database) const {
  absl::MutexLock lock{&_mutex};
  auto db = _entries.find(database);
  if (db == _entries.end() || db->second.empty()) {
    return CatalogSequence::none();
  }
  return db->second.rbegin()->first;
}

Result MemoryCatalogStore::Rewrite(const DatabaseUuid& database,
                                   const Batch& entries) {
  CDB_IF_FAILURE("CatalogStore::Rewrite") {
    return {ERROR_SERVER_IO_ERROR, "failed to rewrite catalog of database ",
            database};
  }
  absl::btree_map<CatalogSequence, std::string> fresh;
  for (const auto& [sequence, bytes] : entries) {
    fresh.insert_or_assign(sequence, bytes);
  }
  absl::MutexLock lock{&_mutex};
  if (fresh.empty()) {
    _entries.erase(database);
  } else {
    _entries[database] = std::move(fresh);
  }
  return {};
}

size_t MemoryCatalogStore::NumEntries(const DatabaseUuid& database) const {
  absl::MutexLock lock{&_mutex};
  auto db = _entries.find(database);
  return db == _entries.end() ? 0 : db->second.size();
}

}  // namespace cdb::catalog
