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

#include <filesystem>

#include "storage_engine/object_store.h"

namespace cdb {

// Stores every object as a file below a root directory. Writes go to a
// temporary file that is renamed over the target.
class LocalObjectStore final : public ObjectStore {
 public:
  explicit LocalObjectStore(std::filesystem::path root);

  // creates the root directory
  Result Open();

  std::string_view Name() const noexcept final { return "local"; }

  Result Put(std::string_view path, std::string_view bytes) final;
  ResultOr<std::string> Get(std::string_view path) const final;
  bool Exists(std::string_view path) const final;
  Result Delete(std::string_view path) final;
  ResultOr<std::vector<std::string>> List(
    std::string_view prefix) const final;

  const std::filesystem::path& root() const noexcept { return _root; }

 private:
  std::filesystem::path Resolve(std::string_view path) const;

  std::filesystem::path _root;
};

}  // namespace cdb
