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

#include "storage_engine/memory_object_store.h"

#include <absl/strings/match.h>

#include "basics/debugging.h"

namespace cdb {

Result MemoryObjectStore::Put(std::string_view path, std::string_view bytes) {
  CDB_IF_FAILURE("ObjectStore::Put") {
    return {ERROR_SERVER_IO_ERROR, "failed to write object '", path, "'"};
  }
  absl::MutexLock lock{&_mutex};
  _objects.insert_or_assign(std::string{path}, std::string{bytes});
  return {};
}

ResultOr<std::string> MemoryObjectStore::Get(std::string_view path) const {
  CDB_IF_FAILURE("ObjectStore::Get") {
    return std::unexpected<Result>{std::in_place, ERROR_SERVER_IO_ERROR,
                                   "failed to read object '", path, "'"};
  }
  absl::MutexLock lock{&_mutex};
  auto it = _objects.find(path);
  if (it == _objects.end()) {
    return std::unexpected<Result>{std::in_place, ERROR_FILE_NOT_FOUND,
                                   "object '", path, "' not found"};
  }
  return it->second;
}

bool MemoryObjectStore::Exists(std::string_view path) const {
  absl::MutexLock lock{&_mutex};
  return _objects.contains(path);
}

Result MemoryObjectStore::Delete(std::string_view path) {
  CDB_IF_FAILURE("ObjectStore::Delete") {
    return {ERROR_SERVER_IO_ERROR, "failed to delete object '", path, "'"};
  }
  absl::MutexLock lock{&_mutex};
  if (auto it = _objects.find(path); it != _objects.end()) {
    _objects.erase(it);
  }
  return {};
}

ResultOr<std::vector<std::string>> MemoryObjectStore::List(
  std::string_view prefix) const {
  std::vector<std::string> paths;
  absl::MutexLock lock{&_mutex};
  for (auto it = _objects.lower_bound(prefix);
       it != _objects.end() && absl::StartsWith(it->first, prefix); ++it) {
    paths.push_back(it->first);
  }
  return paths;
}

bool MemoryObjectStore::Corrupt(std::string_view path) {
  absl::MutexLock lock{&_mutex};
  auto it = _objects.find(path);
  if (it == _objects.end()) {
    return false;
  }
  it->second = "\xff\xff corrupted";
  return true;
}

size_t MemoryObjectStore::Size() const {
  absl::MutexLock lock{&_mutex};
  return _objects.size();
}

}  // namespace cdb
