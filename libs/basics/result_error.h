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

#include <string>
#include <string_view>

#include "basics/error_code.h"

namespace cdb::result {

class Error final {
 public:
  explicit Error(ErrorCode error_number) noexcept;
  Error(ErrorCode error_number, std::string&& error_message) noexcept;
  Error(ErrorCode error_number, std::string_view error_message);

  ErrorCode errorNumber() const noexcept { return _error_number; }

  // falls back to the default message of the error number
  std::string_view errorMessage() const& noexcept;
  std::string errorMessage() && noexcept;

  bool operator==(const Error& other) const noexcept = default;

 private:
  ErrorCode _error_number;
  std::string _error_message;
};

}  // namespace cdb::result
