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
#include <absl/synchronization/mutex.h>

#include "storage_engine/object_store.h"

namespace cdb {

// Keeps objects in memory. Used by tests, which can also remove or damage
// objects to simulate lost artifacts.
class MemoryObjectStore final : public ObjectStore {
 public:
  std::string_view Name() const noexcept final { return "memory"; }

  Result Put(std::string_view path, std::string_view bytes) final;
  ResultOr<std::string> Get(std::string_view path) const final;
  bool Exists(std::string_view path) const final;
  Result Delete(std::string_view path) final;
  ResultOr<std::vector<std::string>> List(
    std::string_view prefix) const final;

  // overwrites the object with bytes that do not decode
  bool Corrupt(std::string_view path);

  size_t Size() const;

 private:
  mutable absl::Mutex _mutex;
  absl::btree_map<std::string, std::string, std::less<>> _objects
    ABSL_GUARDED_BY(_mutex);
};

}  // namespace cdb
