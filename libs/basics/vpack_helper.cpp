////////////////////////////////////////////////////////////////////////////////
/// DISCLAIMER
///
/// Copyright 2014-2023 ArangoDB GmbH, Cologne, Germany
/// Copyright 2004-2014 triAGENS GmbH, Cologne, Germany
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
/// Copyright holder is ArangoDB GmbH, Cologne, Germany
////////////////////////////////////////////////////////////////////////////////

#include "basics/vpack_helper.h"

#include <vpack/exception.h>
#include <vpack/parser.h>
#include <vpack/validator.h>

#include "basics/errors.h"

namespace cdb::basics {

ResultOr<vpack::Slice> VPackHelper::FromBytes(std::string_view bytes) {
  if (bytes.empty()) {
    return std::unexpected<Result>{std::in_place,
                                   ERROR_SERVER_CORRUPTED_DATAFILE,
                                   "empty VelocyPack document"};
  }
  try {
    vpack::Validator validator;
    validator.validate(bytes.data(), bytes.size());  // throws on error
  } catch (const vpack::Exception& e) {
    return std::unexpected<Result>{std::in_place,
                                   ERROR_SERVER_CORRUPTED_DATAFILE,
                                   "invalid VelocyPack document: ", e.what()};
  }
  return vpack::Slice(reinterpret_cast<const uint8_t*>(bytes.data()));
}

ResultOr<std::shared_ptr<vpack::Builder>> VPackHelper::FromJson(
  std::string_view json) {
  try {
    return vpack::Parser::fromJson(json.data(), json.size());
  } catch (const vpack::Exception& e) {
    return std::unexpected<Result>{std::in_place, ERROR_BAD_PARAMETER,
                                   "cannot parse JSON: ", e.what()};
  }
}

ResultOr<uint64_t> VPackHelper::GetUInt(vpack::Slice slice,
                                        std::string_view attribute) {
  auto value = slice.isObject() ? slice.get(attribute) : vpack::Slice{};
  if (!value.isNumber()) {
    return std::unexpected<Result>{std::in_place, ERROR_TYPE_ERROR,
                                   "attribute '", attribute,
                                   "' must be an unsigned number"};
  }
  try {
    return value.getNumber<uint64_t>();
  } catch (const vpack::Exception&) {
    return std::unexpected<Result>{std::in_place, ERROR_TYPE_ERROR,
                                   "attribute '", attribute,
                                   "' must be an unsigned number"};
  }
}

ResultOr<std::string_view> VPackHelper::GetString(vpack::Slice slice,
                                                  std::string_view attribute) {
  auto value = slice.isObject() ? slice.get(attribute) : vpack::Slice{};
  if (!value.isString()) {
    return std::unexpected<Result>{std::in_place, ERROR_TYPE_ERROR,
                                   "attribute '", attribute,
                                   "' must be a string"};
  }
  return value.stringView();
}

}  // namespace cdb::basics
