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

#include <string_view>

#include "basics/error_code.h"

namespace cdb {

// general errors
inline constexpr ErrorCode ERROR_OK{0};
inline constexpr ErrorCode ERROR_FAILED{1};
inline constexpr ErrorCode ERROR_SYS_ERROR{2};
inline constexpr ErrorCode ERROR_OUT_OF_MEMORY{3};
inline constexpr ErrorCode ERROR_INTERNAL{4};
inline constexpr ErrorCode ERROR_ILLEGAL_NUMBER{5};
inline constexpr ErrorCode ERROR_FILE_NOT_FOUND{6};
inline constexpr ErrorCode ERROR_CANNOT_WRITE_FILE{7};
inline constexpr ErrorCode ERROR_NOT_IMPLEMENTED{9};
inline constexpr ErrorCode ERROR_BAD_PARAMETER{10};
inline constexpr ErrorCode ERROR_FORBIDDEN{11};
inline constexpr ErrorCode ERROR_TYPE_ERROR{12};
inline constexpr ErrorCode ERROR_LOCKED{19};
inline constexpr ErrorCode ERROR_SHUTTING_DOWN{30};
inline constexpr ErrorCode ERROR_REQUEST_CANCELED{21};

// storage errors
inline constexpr ErrorCode ERROR_SERVER_CORRUPTED_DATAFILE{1100};
inline constexpr ErrorCode ERROR_SERVER_IO_ERROR{1101};
inline constexpr ErrorCode ERROR_SERVER_FILESYSTEM_FULL{1102};

// server errors
inline constexpr ErrorCode ERROR_SERVER_CONFLICT{1200};
inline constexpr ErrorCode ERROR_SERVER_DUPLICATE_NAME{1207};
inline constexpr ErrorCode ERROR_SERVER_ILLEGAL_NAME{1208};
inline constexpr ErrorCode ERROR_SERVER_DATABASE_NOT_FOUND{1228};
inline constexpr ErrorCode ERROR_SERVER_READ_ONLY{1004};
inline constexpr ErrorCode ERROR_SERVER_NOT_INITIALIZED{1230};
inline constexpr ErrorCode ERROR_SERVER_INVALID_STATE{1231};
inline constexpr ErrorCode ERROR_SERVER_INVALID_RULES{1232};
inline constexpr ErrorCode ERROR_SERVER_INVALID_UUID{1233};
inline constexpr ErrorCode ERROR_SERVER_IDENTIFIER_MISMATCH{1234};
inline constexpr ErrorCode ERROR_SERVER_DATABASE_CREATING{1235};
inline constexpr ErrorCode ERROR_SERVER_PARTITION_NOT_FOUND{1236};
inline constexpr ErrorCode ERROR_SERVER_CHUNK_NOT_FOUND{1237};
inline constexpr ErrorCode ERROR_SERVER_OPERATION_NOT_FOUND{1238};
inline constexpr ErrorCode ERROR_SERVER_RESOURCE_LIMIT{1239};

/// returns the default message for an error number
std::string_view GetErrorStr(ErrorCode code) noexcept;

}  // namespace cdb
