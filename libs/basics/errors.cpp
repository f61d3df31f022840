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

#include "basics/errors.h"

#include <ostream>

namespace cdb {

std::string_view GetErrorStr(ErrorCode code) noexcept {
  switch (code.value()) {
    case ERROR_OK.value():
      return "no error";
    case ERROR_FAILED.value():
      return "failed";
    case ERROR_SYS_ERROR.value():
      return "system error";
    case ERROR_OUT_OF_MEMORY.value():
      return "out of memory";
    case ERROR_INTERNAL.value():
      return "internal error";
    case ERROR_ILLEGAL_NUMBER.value():
      return "illegal number";
    case ERROR_FILE_NOT_FOUND.value():
      return "file not found";
    case ERROR_CANNOT_WRITE_FILE.value():
      return "cannot write file";
    case ERROR_NOT_IMPLEMENTED.value():
      return "not implemented";
    case ERROR_BAD_PARAMETER.value():
      return "bad parameter";
    case ERROR_FORBIDDEN.value():
      return "forbidden";
    case ERROR_TYPE_ERROR.value():
      return "type error";
    case ERROR_LOCKED.value():
      return "locked";
    case ERROR_REQUEST_CANCELED.value():
      return "canceled request";
    case ERROR_SHUTTING_DOWN.value():
      return "shutdown in progress";
    case ERROR_SERVER_CORRUPTED_DATAFILE.value():
      return "corrupted datafile";
    case ERROR_SERVER_IO_ERROR.value():
      return "IO error";
    case ERROR_SERVER_FILESYSTEM_FULL.value():
      return "filesystem full";
    case ERROR_SERVER_READ_ONLY.value():
      return "read only";
    case ERROR_SERVER_CONFLICT.value():
      return "conflict";
    case ERROR_SERVER_DUPLICATE_NAME.value():
      return "duplicate name";
    case ERROR_SERVER_ILLEGAL_NAME.value():
      return "illegal name";
    case ERROR_SERVER_DATABASE_NOT_FOUND.value():
      return "database not found";
    case ERROR_SERVER_NOT_INITIALIZED.value():
      return "not yet initialized";
    case ERROR_SERVER_INVALID_STATE.value():
      return "operation not allowed in current state";
    case ERROR_SERVER_INVALID_RULES.value():
      return "invalid database rules";
    case ERROR_SERVER_INVALID_UUID.value():
      return "invalid database identifier";
    case ERROR_SERVER_IDENTIFIER_MISMATCH.value():
      return "database identifier mismatch";
    case ERROR_SERVER_DATABASE_CREATING.value():
      return "database is being created";
    case ERROR_SERVER_PARTITION_NOT_FOUND.value():
      return "partition not found";
    case ERROR_SERVER_CHUNK_NOT_FOUND.value():
      return "chunk not found";
    case ERROR_SERVER_OPERATION_NOT_FOUND.value():
      return "operation not found";
    case ERROR_SERVER_RESOURCE_LIMIT.value():
      return "resource limit exceeded";
    default:
      return "unknown error";
  }
}

std::ostream& operator<<(std::ostream& out, ErrorCode code) {
  return out << code.value();
}

}  // namespace cdb
