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

#include <absl/synchronization/mutex.h>

#include <deque>
#include <optional>
#include <vector>

#include "basics/result_or.h"
#include "catalog/catalog_entry.h"
#include "catalog/catalog_store.h"
#include "catalog/identifiers/database_uuid.h"

namespace cdb {

class ObjectStore;

namespace catalog {

// Ordered, restartable reader over the entries of one database. Reads the
// store in bounded batches.
class CatalogReader {
 public:
  static constexpr size_t kDefaultBatchSize = 256;

  CatalogReader(const CatalogStore& store, DatabaseUuid database,
                size_t batch_size = kDefaultBatchSize) noexcept
    : _store{store}, _database{database}, _batch_size{batch_size} {}

  // std::nullopt once all entries were read
  ResultOr<std::optional<CatalogEntry>> Next();

  // restarts from the first entry
  void Rewind() noexcept;

 private:
  Result Fill();

  const CatalogStore& _store;
  const DatabaseUuid _database;
  const size_t _batch_size;
  CatalogSequence _next{1};
  std::deque<CatalogEntry> _buffer;
  bool _exhausted = false;
};

// Append-only durable record of the partition and chunk mutations of one
// database.
class PreservedCatalog {
 public:
  PreservedCatalog(DatabaseUuid database, CatalogStore& store) noexcept
    : _database{database}, _store{store} {}

  PreservedCatalog(const PreservedCatalog&) = delete;
  PreservedCatalog& operator=(const PreservedCatalog&) = delete;

  // picks up the sequence of the last stored entry
  Result Open();

  // assigns the next sequence number and stores the entry durably
  ResultOr<CatalogSequence> Append(CatalogEntry& entry);

  CatalogReader Replay() const { return CatalogReader{_store, _database}; }

  // every entry in append order
  ResultOr<std::vector<CatalogEntry>> ReadAll() const;

  // replaces the log with `entries`, numbered from 1 in the given order
  Result Rewrite(std::vector<CatalogEntry>& entries);

  // replaces the log with one derived from the chunk artifacts of the
  // database found in `objects`. chunk ids handed out by the readable part
  // of the old log stay used
  Result WipeAndRebuild(const ObjectStore& objects);

  CatalogSequence LastSequence() const;

  const DatabaseUuid& database() const noexcept { return _database; }

 private:
  const DatabaseUuid _database;
  CatalogStore& _store;

  mutable absl::Mutex _mutex;
  CatalogSequence _last ABSL_GUARDED_BY(_mutex);
};

}  // namespace catalog
}  // namespace cdb
