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

#include "basics/assert.h"

#include <cstdlib>

#include "basics/logger/logger.h"

namespace cdb::basics {

void AssertionFailed(std::string_view expr, std::string_view message,
                     std::source_location location) noexcept {
  log::Log("xxxxx", location.function_name(), location.file_name(),
           static_cast<int>(location.line()), LogLevel::FATAL, Logger::FIXME,
           absl::StrCat("assertion failed: ", expr,
                        message.empty() ? "" : ", ", message));
  log::Flush();
  std::abort();
}

}  // namespace cdb::basics
