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

#include "catalog/identifiers/database_uuid.h"

#include <absl/random/random.h>
#include <absl/strings/str_format.h>

#include "basics/string_utils.h"

namespace cdb {
namespace {

constexpr size_t kDashes[] = {8, 13, 18, 23};

bool IsDashPosition(size_t pos) noexcept {
  for (auto dash : kDashes) {
    if (dash == pos) {
      return true;
    }
  }
  return false;
}

}  // namespace

DatabaseUuid DatabaseUuid::Random() {
  thread_local absl::BitGen gen;
  uint64_t hi = absl::Uniform<uint64_t>(gen);
  uint64_t lo = absl::Uniform<uint64_t>(gen);
  // version 4, variant 10xx
  hi = (hi & ~uint64_t{0xF000}) | uint64_t{0x4000};
  lo = (lo & ~(uint64_t{0xC0} << 56)) | (uint64_t{0x80} << 56);
  return DatabaseUuid{absl::MakeUint128(hi, lo)};
}

ResultOr<DatabaseUuid> DatabaseUuid::Parse(std::string_view value) {
  auto invalid = [&] {
    return std::unexpected<Result>{std::in_place, ERROR_SERVER_INVALID_UUID,
                                   "'", value, "' is not a valid database uuid"};
  };
  if (value.size() != kStringSize) {
    return invalid();
  }
  uint64_t hi = 0;
  uint64_t lo = 0;
  size_t nibbles = 0;
  for (size_t pos = 0; pos != value.size(); ++pos) {
    if (IsDashPosition(pos)) {
      if (value[pos] != '-') {
        return invalid();
      }
      continue;
    }
    int nibble = basics::string_utils::Hex2int(value[pos], -1);
    if (nibble < 0) {
      return invalid();
    }
    auto& half = nibbles < 16 ? hi : lo;
    half = (half << 4) | static_cast<uint64_t>(nibble);
    ++nibbles;
  }
  return DatabaseUuid{absl::MakeUint128(hi, lo)};
}

ResultOr<DatabaseUuid> DatabaseUuid::FromBinary(std::string_view bytes) {
  if (bytes.size() != kBinarySize) {
    return std::unexpected<Result>{std::in_place, ERROR_SERVER_INVALID_UUID,
                                   "binary database uuid must have ",
                                   kBinarySize, " bytes"};
  }
  uint64_t hi = 0;
  uint64_t lo = 0;
  for (size_t i = 0; i != 8; ++i) {
    hi = (hi << 8) | static_cast<uint8_t>(bytes[i]);
    lo = (lo << 8) | static_cast<uint8_t>(bytes[8 + i]);
  }
  return DatabaseUuid{absl::MakeUint128(hi, lo)};
}

std::string DatabaseUuid::toString() const {
  auto hex = absl::StrFormat("%016x%016x", absl::Uint128High64(_value),
                             absl::Uint128Low64(_value));
  return absl::StrCat(hex.substr(0, 8), "-", hex.substr(8, 4), "-",
                      hex.substr(12, 4), "-", hex.substr(16, 4), "-",
                      hex.substr(20));
}

std::array<char, DatabaseUuid::kBinarySize> DatabaseUuid::toBinary()
  const noexcept {
  std::array<char, kBinarySize> bytes;
  const uint64_t hi = absl::Uint128High64(_value);
  const uint64_t lo = absl::Uint128Low64(_value);
  for (size_t i = 0; i != 8; ++i) {
    bytes[i] = static_cast<char>(hi >> (56 - 8 * i));
    bytes[8 + i] = static_cast<char>(lo >> (56 - 8 * i));
  }
  return bytes;
}

}  // namespace cdb
