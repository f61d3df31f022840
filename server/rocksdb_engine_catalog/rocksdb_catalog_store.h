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

#include <memory>
#include <string>

#include "catalog/catalog_store.h"

namespace rocksdb {
class DB;
}  // namespace rocksdb

namespace cdb::catalog {

// Catalog store backed by a RocksDB instance. Keys are the 16 byte database
// uuid followed by the 8 byte big endian sequence number, so a prefix scan
// yields the entries of one database in append order.
class RocksDBCatalogStore final : public CatalogStore {
 public:
  explicit RocksDBCatalogStore(std::string path);
  ~RocksDBCatalogStore() override;

  Result Open();
  void Close();

  std::string_view Name() const noexcept final { return "rocksdb"; }

  Result Append(const DatabaseUuid& database, CatalogSequence sequence,
                std::string_view bytes) final;
  Result Visit(const DatabaseUuid& database, CatalogSequence from,
               size_t limit, Visitor visitor) const final;
  ResultOr<CatalogSequence> LastSequence(
    const DatabaseUuid& database) const final;
  Result Rewrite(const DatabaseUuid& database, const Batch& entries) final;

 private:
  std::string _path;
  std::unique_ptr<rocksdb::DB> _db;
};

}  // namespace cdb::catalog
