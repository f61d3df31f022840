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

#include "basics/logger/logger.h"

#include "gtest/gtest.h"

using namespace cdb;

class LoggerTest : public ::testing::Test {
 protected:
  LoggerTest()
    : _level{log::GetLogLevel()}, _catalog{Logger::CATALOG.GetLevel()} {}

  ~LoggerTest() override {
    log::SetLogLevel(_level);
    Logger::CATALOG.SetLevel(_catalog);
  }

 private:
  LogLevel _level;
  LogLevel _catalog;
};

TEST_F(LoggerTest, test_general_level) {
  ASSERT_TRUE(log::SetLogLevel("debug"));
  EXPECT_EQ(LogLevel::DEBUG, log::GetLogLevel());
  ASSERT_TRUE(log::SetLogLevel("warning"));
  EXPECT_EQ(LogLevel::WARN, log::GetLogLevel());
  EXPECT_TRUE(log::IsEnabled(LogLevel::ERR));
  EXPECT_FALSE(log::IsEnabled(LogLevel::INFO));

  EXPECT_FALSE(log::SetLogLevel("verbose"));
  EXPECT_EQ(LogLevel::WARN, log::GetLogLevel());
}

TEST_F(LoggerTest, test_topic_level) {
  ASSERT_TRUE(log::SetLogLevel("info"));
  ASSERT_TRUE(log::SetLogLevel("catalog=trace"));
  EXPECT_EQ(LogLevel::TRACE, Logger::CATALOG.GetLevel());
  EXPECT_TRUE(log::IsEnabled(LogLevel::TRACE, Logger::CATALOG));

  ASSERT_TRUE(log::SetLogLevel("catalog=error"));
  EXPECT_FALSE(log::IsEnabled(LogLevel::WARN, Logger::CATALOG));

  EXPECT_FALSE(log::SetLogLevel("nosuchtopic=info"));
  EXPECT_FALSE(log::SetLogLevel("catalog=loud"));
}

TEST_F(LoggerTest, test_find_topic) {
  EXPECT_EQ(&Logger::OPERATIONS, log::FindTopic("operations"));
  EXPECT_EQ(nullptr, log::FindTopic("nosuchtopic"));
  EXPECT_FALSE(log::GetTopics().empty());
}

TEST_F(LoggerTest, test_disabled_arguments_not_evaluated) {
  Logger::CATALOG.SetLevel(LogLevel::ERR);
  int evaluated = 0;
  auto count = [&] { return ++evaluated; };
  CDB_DEBUG("xxxxx", Logger::CATALOG, "value ", count());
  EXPECT_EQ(0, evaluated);
  CDB_ERROR("xxxxx", Logger::CATALOG, "value ", count());
  EXPECT_EQ(1, evaluated);
}
