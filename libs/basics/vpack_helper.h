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

#pragma once

#include <vpack/builder.h>
#include <vpack/slice.h>

#include <memory>
#include <string_view>

#include "basics/result_or.h"

namespace cdb::basics {

struct VPackHelper {
  // the raw bytes of `slice`
  static std::string_view ToBytes(vpack::Slice slice) noexcept {
    return {slice.startAs<char>(), static_cast<size_t>(slice.byteSize())};
  }

  // validates untrusted bytes before handing out a slice pointing into them.
  // the slice is valid as long as `bytes` is
  static ResultOr<vpack::Slice> FromBytes(std::string_view bytes);

  static ResultOr<std::shared_ptr<vpack::Builder>> FromJson(
    std::string_view json);

  // returns the value of `attribute` if it is an unsigned integer
  static ResultOr<uint64_t> GetUInt(vpack::Slice slice,
                                    std::string_view attribute);

  static ResultOr<std::string_view> GetString(vpack::Slice slice,
                                              std::string_view attribute);
};

}  // namespace cdb::basics
