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

#include <exception>
#include <source_location>
#include <string>
#include <type_traits>

#include "basics/errors.h"
#include "basics/result.h"

#define CDB_THROW(code, ...)                                 \
  throw ::cdb::basics::Exception(std::source_location::current(), \
                                 (code)__VA_OPT__(, ) __VA_ARGS__)

namespace cdb::basics {

class Exception final : public std::exception {
 public:
  Exception(std::source_location location, ErrorCode code);
  Exception(std::source_location location, ErrorCode code,
            std::string_view message);

  template<typename... Args>
    requires(sizeof...(Args) > 1)
  Exception(std::source_location location, ErrorCode code, Args&&... args)
    : Exception{location, code, absl::StrCat(std::forward<Args>(args)...)} {}

  explicit Exception(std::source_location location, Result&& result);

  const char* what() const noexcept final { return _message.c_str(); }

  std::string_view message() const noexcept { return _message; }
  ErrorCode code() const noexcept { return _code; }
  std::source_location location() const noexcept { return _location; }

 private:
  std::string _message;
  std::source_location _location;
  ErrorCode _code;
};

// converts exceptions escaping from `f` into a Result
template<typename F>
Result SafeCall(F&& f) noexcept {
  try {
    if constexpr (std::is_same_v<std::invoke_result_t<F>, Result>) {
      return std::forward<F>(f)();
    } else {
      std::forward<F>(f)();
      return {};
    }
  } catch (const Exception& e) {
    return {e.code(), e.message()};
  } catch (const std::bad_alloc&) {
    return {ERROR_OUT_OF_MEMORY};
  } catch (const std::exception& e) {
    return {ERROR_INTERNAL, e.what()};
  } catch (...) {
    return {ERROR_INTERNAL, "unknown exception"};
  }
}

}  // namespace cdb::basics
