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

#include "storage_engine/local_object_store.h"

#include <absl/random/random.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

#include "basics/debugging.h"
#include "basics/logger/logger.h"

namespace cdb {
namespace {

constexpr std::string_view kTempSuffix = ".tmp";

Result IoError(std::string_view what, const std::filesystem::path& file,
               const std::error_code& ec) {
  return {ec == std::errc::no_space_on_device ? ERROR_SERVER_FILESYSTEM_FULL
                                              : ERROR_SERVER_IO_ERROR,
          what, " '", file.string(), "': ", ec.message()};
}

}  // namespace

LocalObjectStore::LocalObjectStore(std::filesystem::path root)
  : _root{std::move(root)} {}

Result LocalObjectStore::Open() {
  std::error_code ec;
  std::filesystem::create_directories(_root, ec);
  if (ec) {
    return IoError("cannot create object store directory", _root, ec);
  }
  CDB_INFO("xxxxx", Logger::ENGINES, "using local object store at '",
           _root.string(), "'");
  return {};
}

std::filesystem::path LocalObjectStore::Resolve(std::string_view path) const {
  return _root / std::filesystem::path{path}.relative_path();
}

Result LocalObjectStore::Put(std::string_view path, std::string_view bytes) {
  CDB_IF_FAILURE("ObjectStore::Put") {
    return {ERROR_SERVER_IO_ERROR, "failed to write object '", path, "'"};
  }
  const auto file = Resolve(path);
  std::error_code ec;
  std::filesystem::create_directories(file.parent_path(), ec);
  if (ec) {
    return IoError("cannot create directory", file.parent_path(), ec);
  }

  thread_local absl::BitGen gen;
  auto temp = file;
  temp += absl::StrCat(".", absl::Uniform<uint32_t>(gen), kTempSuffix);
  {
    std::ofstream out{temp, std::ios::binary | std::ios::trunc};
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      std::filesystem::remove(temp, ec);
      return {ERROR_CANNOT_WRITE_FILE, "cannot write '", temp.string(), "'"};
    }
  }
  std::filesystem::rename(temp, file, ec);
  if (ec) {
    auto r = IoError("cannot rename temporary file", temp, ec);
    std::filesystem::remove(temp, ec);
    return r;
  }
  return {};
}

ResultOr<std::string> LocalObjectStore::Get(std::string_view path) const {
  CDB_IF_FAILURE("ObjectStore::Get") {
    return std::unexpected<Result>{std::in_place, ERROR_SERVER_IO_ERROR,
                                   "failed to read object '", path, "'"};
  }
  const auto file = Resolve(path);
  std::ifstream in{file, std::ios::binary};
  if (!in) {
    return std::unexpected<Result>{std::in_place, ERROR_FILE_NOT_FOUND,
                                   "object '", path, "' not found"};
  }
  std::string bytes{std::istreambuf_iterator<char>{in},
                    std::istreambuf_iterator<char>{}};
  if (in.bad()) {
    return std::unexpected<Result>{std::in_place, ERROR_SERVER_IO_ERROR,
                                   "cannot read '", file.string(), "'"};
  }
  return bytes;
}

bool LocalObjectStore::Exists(std::string_view path) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(Resolve(path), ec);
}

Result LocalObjectStore::Delete(std::string_view path) {
  CDB_IF_FAILURE("ObjectStore::Delete") {
    return {ERROR_SERVER_IO_ERROR, "failed to delete object '", path, "'"};
  }
  const auto file = Resolve(path);
  std::error_code ec;
  std::filesystem::remove(file, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return IoError("cannot delete", file, ec);
  }
  return {};
}

ResultOr<std::vector<std::string>> LocalObjectStore::List(
  std::string_view prefix) const {
  std::vector<std::string> paths;
  std::error_code ec;
  if (!std::filesystem::exists(_root, ec)) {
    return paths;
  }
  std::filesystem::recursive_directory_iterator it{_root, ec};
  const auto end = std::filesystem::recursive_directory_iterator{};
  for (; !ec && it != end; it.increment(ec)) {
    std::error_code file_ec;
    if (!it->is_regular_file(file_ec)) {
      continue;
    }
    auto relative = it->path().lexically_relative(_root).generic_string();
    if (absl::EndsWith(relative, kTempSuffix) ||
        !absl::StartsWith(relative, prefix)) {
      continue;
    }
    paths.push_back(std::move(relative));
  }
  if (ec) {
    return std::unexpected<Result>{IoError("cannot list", _root, ec)};
  }
  std::ranges::sort(paths);
  return paths;
}

}  // namespace cdb
