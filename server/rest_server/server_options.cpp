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

#include "rest_server/server_options.h"

#include <vpack/builder.h>
#include <vpack/iterator.h>
#include <vpack/slice.h>

#include <filesystem>
#include <fstream>
#include <magic_enum/magic_enum.hpp>
#include <sstream>

#include "basics/string_utils.h"
#include "basics/vpack_helper.h"

namespace cdb {
namespace {

Result InvalidOption(std::string_view option, std::string_view reason) {
  return {ERROR_BAD_PARAMETER, "invalid option '", option, "': ", reason};
}

template<typename E>
Result ReadEnum(vpack::Slice value, std::string_view option, E& out) {
  if (!value.isString()) {
    return InvalidOption(option, "expected a string");
  }
  auto parsed = magic_enum::enum_cast<E>(value.stringView(),
                                         magic_enum::case_insensitive);
  if (!parsed) {
    return InvalidOption(option, absl::StrCat("unknown value '",
                                              value.stringView(), "'"));
  }
  out = *parsed;
  return {};
}

Result ReadUInt(vpack::Slice value, std::string_view option, uint64_t& out) {
  if (!value.isNumber() || value.getNumber<double>() < 0) {
    return InvalidOption(option, "expected an unsigned number");
  }
  out = value.getNumber<uint64_t>();
  return {};
}

Result ReadString(vpack::Slice value, std::string_view option,
                  std::string& out) {
  if (!value.isString()) {
    return InvalidOption(option, "expected a string");
  }
  out = value.stringView();
  return {};
}

}  // namespace

ResultOr<ServerOptions> ServerOptions::FromVPack(vpack::Slice slice,
                                                 ServerOptions base) {
  if (!slice.isObject()) {
    return std::unexpected<Result>{std::in_place, ERROR_BAD_PARAMETER,
                                   "server config must be an object"};
  }
  auto options = std::move(base);
  for (auto [key, value] : vpack::ObjectIterator(slice)) {
    auto name = key.stringView();
    Result r;
    if (name == "dataDirectory") {
      r = ReadString(value, name, options.data_directory);
    } else if (name == "serverId") {
      r = ReadString(value, name, options.server_id);
    } else if (name == "schedulerThreads") {
      r = ReadUInt(value, name, options.scheduler_threads);
    } else if (name == "storage") {
      r = ReadEnum(value, name, options.storage);
    } else if (name == "catalog") {
      r = ReadEnum(value, name, options.catalog);
    } else if (name == "defaultRules") {
      auto rules = DatabaseRules::FromVPack(value);
      if (!rules) {
        r = std::move(rules).error().withContext("invalid option '", name, "'");
      } else {
        options.default_rules = std::move(*rules);
      }
    } else if (name == "shutdownTimeoutSeconds") {
      uint64_t seconds = 0;
      r = ReadUInt(value, name, seconds);
      options.shutdown_timeout = absl::Seconds(seconds);
    } else {
      r = InvalidOption(name, "unknown option");
    }
    if (r.fail()) {
      return std::unexpected{std::move(r)};
    }
  }
  return options;
}

ResultOr<ServerOptions> ServerOptions::FromJsonFile(std::string_view path,
                                                    ServerOptions base) {
  std::ifstream file{std::filesystem::path{path}};
  if (!file) {
    return std::unexpected<Result>{std::in_place, ERROR_FILE_NOT_FOUND,
                                   "cannot open config file '", path, "'"};
  }
  std::stringstream content;
  content << file.rdbuf();
  auto builder = basics::VPackHelper::FromJson(content.str());
  if (!builder) {
    return std::unexpected{std::move(builder).error().withContext(
      "cannot parse config file '", path, "'")};
  }
  return FromVPack((*builder)->slice(), std::move(base));
}

Result ServerOptions::Validate() const {
  if (data_directory.empty() && (storage == StorageBackend::Local ||
                                 catalog == CatalogBackend::RocksDB)) {
    return InvalidOption("dataDirectory", "must not be empty");
  }
  if (server_id.empty() ||
      basics::string_utils::UrlEncode(server_id) != server_id) {
    return InvalidOption("serverId",
                         "must be a non-empty string of letters, digits, "
                         "'-', '_' and '~'");
  }
  if (scheduler_threads == 0) {
    return InvalidOption("schedulerThreads", "must be positive");
  }
  if (!default_rules.name.empty()) {
    return InvalidOption("defaultRules", "must not set 'name'");
  }
  auto defaults = default_rules;
  defaults.name = "defaults";
  if (auto r = ValidateRules(defaults); r.fail()) {
    return std::move(r).withContext("invalid option 'defaultRules'");
  }
  if (shutdown_timeout <= absl::ZeroDuration()) {
    return InvalidOption("shutdownTimeoutSeconds", "must be positive");
  }
  return {};
}

std::string ServerOptions::objectsDirectory() const {
  return (std::filesystem::path{data_directory} / "objects").string();
}

std::string ServerOptions::catalogDirectory() const {
  return (std::filesystem::path{data_directory} / "catalog").string();
}

}  // namespace cdb
