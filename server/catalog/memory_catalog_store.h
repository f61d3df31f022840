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

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>

#include "catalog/catalog_store.h"

namespace cdb::catalog {

class MemoryCatalogStore final : public CatalogStore {
 public:
  std::string_view Name() const noexcept final { return "memory"; }

  Result Append(const DatabaseUuid& database, CatalogSequence sequence,
                std::string_view bytes) final;
  Result Visit(const DatabaseUuid& database, CatalogSequence from,
               size_t limit, Visitor visitor) const final;
  ResultOr<CatalogSequence> LastSequence(
    const DatabaseUuid& database) const final;
  Result Rewrite(const DatabaseUuid& database, const Batch& entries) final;

  size_t NumEntries(const DatabaseUuid& database) const;

 private:
  mutable absl::Mutex _mutex;
  absl::flat_hash_map<DatabaseUuid,
                      absl::btree_map<CatalogSequence, std::string>>
    _entries ABSL_GUARDED_BY(_mutex);
};

}  // namespace cdb::catalog
