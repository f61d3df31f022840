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

#include "basics/result.h"

#include <ostream>

namespace cdb {
namespace result {

Error::Error(ErrorCode error_number) noexcept : _error_number{error_number} {}

Error::Error(ErrorCode error_number, std::string&& error_message) noexcept
  : _error_number{error_number}, _error_message{std::move(error_message)} {}

Error::Error(ErrorCode error_number, std::string_view error_message)
  : _error_number{error_number}, _error_message{error_message} {}

std::string_view Error::errorMessage() const& noexcept {
  if (!_error_message.empty()) {
    return _error_message;
  }
  return GetErrorStr(_error_number);
}

std::string Error::errorMessage() && noexcept {
  if (!_error_message.empty()) {
    return std::move(_error_message);
  }
  return std::string{GetErrorStr(_error_number)};
}

}  // namespace result

Result::Result(ErrorCode error_number) {
  if (error_number != ERROR_OK) {
    _error = std::make_unique<result::Error>(error_number);
  }
}

Result::Result(ErrorCode error_number, std::string&& error_message) {
  if (error_number != ERROR_OK) {
    _error =
      std::make_unique<result::Error>(error_number, std::move(error_message));
  }
}

Result::Result(ErrorCode error_number, std::string_view error_message) {
  if (error_number != ERROR_OK) {
    _error = std::make_unique<result::Error>(error_number, error_message);
  }
}

Result::Result(ErrorCode error_number, const char* error_message)
  : Result{error_number, absl::NullSafeStringView(error_message)} {}

Result Result::clone() const {
  if (_error) {
    return {_error->errorNumber(), _error->errorMessage()};
  }
  return {};
}

ErrorCode Result::errorNumber() const noexcept {
  if (_error) {
    return _error->errorNumber();
  }
  return ERROR_OK;
}

std::string_view Result::errorMessage() const& noexcept {
  if (_error) {
    return _error->errorMessage();
  }
  return {};
}

std::string Result::errorMessage() && noexcept {
  if (_error) {
    return std::move(*_error).errorMessage();
  }
  return {};
}

bool Result::operator==(const Result& other) const {
  if (_error == nullptr || other._error == nullptr) {
    return _error == other._error;
  }
  return *_error == *other._error;
}

std::ostream& operator<<(std::ostream& out, const Result& result) {
  return out << "Result(" << result.errorNumber().value() << ", "
             << result.errorMessage() << ")";
}

}  // namespace cdb
