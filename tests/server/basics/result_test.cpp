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

#include <stdexcept>

#include "basics/debugging.h"
#include "basics/exceptions.h"
#include "basics/result_or.h"
#include "gtest/gtest.h"

using namespace cdb;

TEST(ResultTest, DefaultIsOk) {
  Result r;
  EXPECT_TRUE(r.ok());
  EXPECT_FALSE(r.fail());
  EXPECT_EQ(ERROR_OK, r.errorNumber());
  EXPECT_EQ("", r.errorMessage());
}

TEST(ResultTest, MessageConcatenation) {
  Result r{ERROR_SERVER_CHUNK_NOT_FOUND, "chunk ", 3, " of partition '",
           "cpu:2023-01-01T00", "' not found"};
  EXPECT_TRUE(r.fail());
  EXPECT_TRUE(r.is(ERROR_SERVER_CHUNK_NOT_FOUND));
  EXPECT_EQ("chunk 3 of partition 'cpu:2023-01-01T00' not found",
            r.errorMessage());
}

TEST(ResultTest, DefaultMessageFromCode) {
  Result r{ERROR_SERVER_DATABASE_NOT_FOUND};
  EXPECT_FALSE(r.errorMessage().empty());
  EXPECT_EQ(GetErrorStr(ERROR_SERVER_DATABASE_NOT_FOUND), r.errorMessage());
}

TEST(ResultTest, WithContext) {
  Result failed{ERROR_SERVER_IO_ERROR, "disk on fire"};
  auto r = std::move(failed).withContext("database '", "metrics", "'");
  EXPECT_TRUE(r.is(ERROR_SERVER_IO_ERROR));
  EXPECT_EQ("database 'metrics': disk on fire", r.errorMessage());

  Result ok;
  auto still_ok = std::move(ok).withContext("ignored");
  EXPECT_TRUE(still_ok.ok());
}

TEST(ResultTest, Clone) {
  Result r{ERROR_BAD_PARAMETER, "bad"};
  auto copy = r.clone();
  EXPECT_EQ(r, copy);
  EXPECT_EQ("bad", copy.errorMessage());
}

TEST(ResultTest, SafeCallCapturesExceptions) {
  auto thrown = basics::SafeCall(
    [] { CDB_THROW(ERROR_SERVER_CORRUPTED_DATAFILE, "bad entry ", 7); });
  EXPECT_TRUE(thrown.is(ERROR_SERVER_CORRUPTED_DATAFILE));
  EXPECT_EQ("bad entry 7", thrown.errorMessage());

  auto std_error =
    basics::SafeCall([]() -> Result { throw std::runtime_error{"boom"}; });
  EXPECT_TRUE(std_error.is(ERROR_INTERNAL));
  EXPECT_EQ("boom", std_error.errorMessage());

  auto returned = basics::SafeCall(
    []() -> Result { return {ERROR_SERVER_CONFLICT, "conflict"}; });
  EXPECT_TRUE(returned.is(ERROR_SERVER_CONFLICT));

  EXPECT_TRUE(basics::SafeCall([] {}).ok());
}

TEST(ResultTest, ResultOr) {
  ResultOr<int> value = 5;
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(5, *value);

  ResultOr<int> error = std::unexpected<Result>{
    std::in_place, ERROR_SERVER_INVALID_STATE, "nope"};
  ASSERT_FALSE(error.has_value());
  EXPECT_EQ(ERROR_SERVER_INVALID_STATE, error.error().errorNumber());
}

TEST(FailurePointTest, GuardScopesFailure) {
  ClearFailurePoints();
  EXPECT_FALSE(ShouldFail("ObjectStore::Put"));
  {
    FailurePointGuard guard{"ObjectStore::Put"};
    EXPECT_TRUE(ShouldFail("ObjectStore::Put"));
    EXPECT_FALSE(ShouldFail("ObjectStore::Get"));
    auto points = GetFailurePoints();
    ASSERT_EQ(1U, points.size());
    EXPECT_EQ("ObjectStore::Put", points[0]);
  }
  EXPECT_FALSE(ShouldFail("ObjectStore::Put"));
  EXPECT_TRUE(GetFailurePoints().empty());
}
