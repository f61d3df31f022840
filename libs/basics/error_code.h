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

#include <absl/strings/str_cat.h>

#include <iosfwd>
#include <string_view>

namespace cdb {

class ErrorCode {
 public:
  using ValueType = int;

  constexpr explicit ErrorCode(ValueType value) noexcept : _value{value} {}

  constexpr ErrorCode(const ErrorCode&) noexcept = default;
  constexpr ErrorCode& operator=(const ErrorCode&) noexcept = default;

  constexpr ValueType value() const noexcept { return _value; }

  constexpr bool operator==(const ErrorCode&) const noexcept = default;
  constexpr auto operator<=>(const ErrorCode&) const noexcept = default;

  template<typename H>
  friend H AbslHashValue(H h, ErrorCode code) {
    return H::combine(std::move(h), code._value);
  }

  template<typename Sink>
  friend void AbslStringify(Sink& sink, ErrorCode code) {
    sink.Append(absl::StrCat(code._value));
  }

 private:
  ValueType _value;
};

std::ostream& operator<<(std::ostream& out, ErrorCode code);

}  // namespace cdb
