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

#include "rocksdb_engine_catalog/rocksdb_utils.h"

#include "basics/errors.h"

namespace cdb::rocksutils {

Result ConvertStatus(const rocksdb::Status& status) {
  switch (status.code()) {
    case rocksdb::Status::Code::kOk:
      return {};
    case rocksdb::Status::Code::kNotFound:
      return {ERROR_FILE_NOT_FOUND, status.ToString()};
    case rocksdb::Status::Code::kCorruption:
      return {ERROR_SERVER_CORRUPTED_DATAFILE, status.ToString()};
    case rocksdb::Status::Code::kNotSupported:
      return {ERROR_NOT_IMPLEMENTED, status.ToString()};
    case rocksdb::Status::Code::kInvalidArgument:
      return {ERROR_BAD_PARAMETER, status.ToString()};
    case rocksdb::Status::Code::kIOError:
      if (status.subcode() == rocksdb::Status::SubCode::kNoSpace) {
        return {ERROR_SERVER_FILESYSTEM_FULL, status.ToString()};
      }
      return {ERROR_SERVER_IO_ERROR, status.ToString()};
    case rocksdb::Status::Code::kShutdownInProgress:
      return {ERROR_SHUTTING_DOWN, status.ToString()};
    case rocksdb::Status::Code::kBusy:
    case rocksdb::Status::Code::kTryAgain:
      return {ERROR_LOCKED, status.ToString()};
    case rocksdb::Status::Code::kTimedOut:
    case rocksdb::Status::Code::kAborted:
      return {ERROR_SERVER_CONFLICT, status.ToString()};
    default:
      return {ERROR_INTERNAL,
              "unknown RocksDB status code: ", status.ToString()};
  }
}

}  // namespace cdb::rocksutils
