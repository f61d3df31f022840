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

#include <absl/functional/function_ref.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "basics/result_or.h"
#include "catalog/identifiers/chunk_id.h"
#include "catalog/identifiers/database_uuid.h"

namespace cdb::catalog {

// Durable, ordered storage of serialized catalog entries keyed by
// (database, sequence).
class CatalogStore {
 public:
  // return false to stop the visit
  using Visitor = absl::FunctionRef<bool(CatalogSequence, std::string_view)>;
  using Batch = std::vector<std::pair<CatalogSequence, std::string>>;

  virtual ~CatalogStore() = default;

  virtual std::string_view Name() const noexcept = 0;

  virtual Result Append(const DatabaseUuid& database, CatalogSequence sequence,
                        std::string_view bytes) = 0;

  // visits at most `limit` entries with a sequence >= `from`, in order
  virtual Result Visit(const DatabaseUuid& database, CatalogSequence from,
                       size_t limit, Visitor visitor) const = 0;

  // CatalogSequence::none() if there are no entries
  virtual ResultOr<CatalogSequence> LastSequence(
    const DatabaseUuid& database) const = 0;

  // atomically replaces all entries of `database` with `entries`
  virtual Result Rewrite(const DatabaseUuid& database,
                         const Batch& entries) = 0;

  Result Wipe(const DatabaseUuid& database) { return Rewrite(database, {}); }
};

}  // namespace cdb::catalog
