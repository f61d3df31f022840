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

#include <atomic>
#include <source_location>
#include <string_view>
#include <vector>

#include "basics/logger/log_level.h"

namespace cdb {

class LogTopic final {
 public:
  // pseudo topic to address all log topics
  static inline constexpr std::string_view kAll = "all";

  explicit LogTopic(std::string_view name,
                    LogLevel level = LogLevel::DEFAULT) noexcept
    : _name{name}, _level{level} {}

  std::string_view GetName() const { return _name; }
  LogLevel GetLevel() const noexcept {
    return _level.load(std::memory_order_relaxed);
  }
  void SetLevel(LogLevel level) noexcept {
    _level.store(level, std::memory_order_relaxed);
  }

 private:
  std::string_view _name;
  std::atomic<LogLevel> _level;
};

struct Logger {
  // NOLINTBEGIN
  static LogTopic CATALOG;
  static LogTopic CONFIG;
  static LogTopic DEVEL;
  static LogTopic ENGINES;
  static LogTopic FIXME;
  static LogTopic LIFECYCLE;
  static LogTopic OPERATIONS;
  static LogTopic STARTUP;
  static LogTopic THREADS;
  // NOLINTEND
};

[[noreturn]] void FatalErrorExit() noexcept;

namespace log {

LogLevel GetLogLevel() noexcept;
void SetLogLevel(LogLevel) noexcept;

// accepts "<level>" or "<topic>=<level>"
bool SetLogLevel(std::string_view);

void Log(const char* logid, const char* function, const char* file, int line,
         LogLevel level, const LogTopic& topic, std::string_view message);

inline bool IsEnabled(LogLevel level) noexcept {
  return level <= GetLogLevel();
}

inline bool IsEnabled(LogLevel level, const LogTopic& topic) noexcept {
  const auto topic_level = topic.GetLevel();
  return level <=
         ((topic_level == LogLevel::DEFAULT) ? GetLogLevel() : topic_level);
}

void Flush() noexcept;

std::vector<LogTopic*> GetTopics();
LogTopic* FindTopic(std::string_view name) noexcept;

constexpr bool TranslateLogLevel(std::string_view l, bool is_general,
                                 LogLevel& level) noexcept {
  if (l == "fatal") {
    level = LogLevel::FATAL;
  } else if (l == "error" || l == "err") {
    level = LogLevel::ERR;
  } else if (l == "warning" || l == "warn") {
    level = LogLevel::WARN;
  } else if (l == "info") {
    level = LogLevel::INFO;
  } else if (l == "debug") {
    level = LogLevel::DEBUG;
  } else if (l == "trace") {
    level = LogLevel::TRACE;
  } else if (!is_general && (l.empty() || l == "default")) {
    level = LogLevel::DEFAULT;
  } else {
    return false;
  }

  return true;
}

constexpr std::string_view TranslateLogLevel(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::ERR:
      return "ERROR";
    case LogLevel::WARN:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::TRACE:
      return "TRACE";
    case LogLevel::FATAL:
      return "FATAL";
    case LogLevel::DEFAULT:
      return "DEFAULT";
  }
  return "UNKNOWN";
}

namespace detail {

template<typename... Args>
void Log(std::source_location location, const char* id, LogLevel level,
         const LogTopic& topic, Args&&... args) {
  log::Log(id, location.function_name(), location.file_name(), location.line(),
           level, topic, absl::StrCat(std::forward<Args>(args)...));
}

}  // namespace detail
}  // namespace log
}  // namespace cdb

#define CDB_LOG_IF(id, level, topic, cond, ...)                           \
  if (::cdb::log::IsEnabled((::cdb::LogLevel::level), (topic)) && (cond)) \
  ::cdb::log::detail::Log(std::source_location::current(), (id),          \
                          (::cdb::LogLevel::level), (topic), __VA_ARGS__)

#define CDB_LOG(id, level, topic, ...) \
  CDB_LOG_IF(id, level, topic, true, __VA_ARGS__)

#define CDB_TRACE(id, topic, ...) CDB_LOG(id, TRACE, topic, __VA_ARGS__)
#define CDB_DEBUG(id, topic, ...) CDB_LOG(id, DEBUG, topic, __VA_ARGS__)
#define CDB_INFO(id, topic, ...) CDB_LOG(id, INFO, topic, __VA_ARGS__)
#define CDB_WARN(id, topic, ...) CDB_LOG(id, WARN, topic, __VA_ARGS__)
#define CDB_ERROR(id, topic, ...) CDB_LOG(id, ERR, topic, __VA_ARGS__)
#define CDB_FATAL(id, topic, ...)         \
  CDB_LOG(id, FATAL, topic, __VA_ARGS__); \
  ::cdb::FatalErrorExit()

#define CDB_WARN_IF(id, topic, cond, ...) \
  CDB_LOG_IF(id, WARN, topic, cond, __VA_ARGS__)
#define CDB_ERROR_IF(id, topic, cond, ...) \
  CDB_LOG_IF(id, ERR, topic, cond, __VA_ARGS__)
