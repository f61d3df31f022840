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

#include <absl/numeric/int128.h>
#include <absl/strings/str_cat.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "basics/result_or.h"

namespace cdb {

// durable 128 bit identifier of a database instance (random, version 4),
// printed as 8-4-4-4-12 lowercase hex
class DatabaseUuid {
 public:
  static constexpr size_t kStringSize = 36;
  static constexpr size_t kBinarySize = 16;

  constexpr DatabaseUuid() noexcept = default;
  constexpr explicit DatabaseUuid(absl::uint128 value) noexcept
    : _value{value} {}

  static DatabaseUuid Random();

  // ERROR_SERVER_INVALID_UUID for anything but the canonical form
  static ResultOr<DatabaseUuid> Parse(std::string_view value);

  // 16 bytes, big endian
  static ResultOr<DatabaseUuid> FromBinary(std::string_view bytes);

  absl::uint128 value() const noexcept { return _value; }
  bool isNil() const noexcept { return _value == 0; }

  std::string toString() const;
  std::array<char, kBinarySize> toBinary() const noexcept;

  bool operator==(const DatabaseUuid&) const noexcept = default;
  bool operator<(const DatabaseUuid& other) const noexcept {
    return _value < other._value;
  }

  template<typename H>
  friend H AbslHashValue(H h, const DatabaseUuid& uuid) {
    return H::combine(std::move(h), uuid._value);
  }

  template<typename Sink>
  friend void AbslStringify(Sink& sink, const DatabaseUuid& uuid) {
    sink.Append(uuid.toString());
  }

 private:
  absl::uint128 _value = 0;
};

}  // namespace cdb
