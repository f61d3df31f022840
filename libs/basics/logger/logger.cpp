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

#include <absl/synchronization/mutex.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <functional>
#include <thread>

namespace cdb {

LogTopic Logger::CATALOG{"catalog", LogLevel::INFO};
LogTopic Logger::CONFIG{"config"};
LogTopic Logger::DEVEL{"development", LogLevel::FATAL};
LogTopic Logger::ENGINES{"engines", LogLevel::INFO};
LogTopic Logger::FIXME{"general", LogLevel::INFO};
LogTopic Logger::LIFECYCLE{"lifecycle", LogLevel::INFO};
LogTopic Logger::OPERATIONS{"operations", LogLevel::INFO};
LogTopic Logger::STARTUP{"startup", LogLevel::INFO};
LogTopic Logger::THREADS{"threads", LogLevel::WARN};

void FatalErrorExit() noexcept {
  log::Flush();
  std::_Exit(EXIT_FAILURE);
}

namespace log {
namespace {

std::atomic<LogLevel> gLevel{LogLevel::INFO};

constinit absl::Mutex gOutputMutex{absl::kConstInit};

LogTopic* const kTopics[] = {
  &Logger::CATALOG, &Logger::CONFIG,     &Logger::DEVEL,
  &Logger::ENGINES, &Logger::FIXME,      &Logger::LIFECYCLE,
  &Logger::OPERATIONS, &Logger::STARTUP, &Logger::THREADS,
};

}  // namespace

LogLevel GetLogLevel() noexcept {
  return gLevel.load(std::memory_order_relaxed);
}

void SetLogLevel(LogLevel level) noexcept {
  gLevel.store(level, std::memory_order_relaxed);
}

bool SetLogLevel(std::string_view spec) {
  auto pos = spec.find('=');
  if (pos == std::string_view::npos) {
    LogLevel level;
    if (!TranslateLogLevel(spec, true, level)) {
      return false;
    }
    SetLogLevel(level);
    return true;
  }

  auto name = spec.substr(0, pos);
  LogLevel level;
  if (!TranslateLogLevel(spec.substr(pos + 1), false, level)) {
    return false;
  }
  if (name == LogTopic::kAll) {
    for (auto* topic : kTopics) {
      topic->SetLevel(level);
    }
    return true;
  }
  auto* topic = FindTopic(name);
  if (topic == nullptr) {
    return false;
  }
  topic->SetLevel(level);
  return true;
}

void Log(const char* logid, const char* /*function*/, const char* /*file*/,
         int /*line*/, LogLevel level, const LogTopic& topic,
         std::string_view message) {
  auto line = absl::StrCat(
    absl::FormatTime("%Y-%m-%dT%H:%M:%SZ", absl::Now(), absl::UTCTimeZone()),
    " [", getpid(), "-", std::hash<std::thread::id>{}(std::this_thread::get_id()),
    "] ", TranslateLogLevel(level), " {", topic.GetName(), "} ");
  if (logid != nullptr && std::string_view{logid} != "xxxxx") {
    absl::StrAppend(&line, "[", logid, "] ");
  }
  absl::StrAppend(&line, message, "\n");

  absl::MutexLock lock{&gOutputMutex};
  std::fwrite(line.data(), 1, line.size(), stderr);
}

void Flush() noexcept {
  absl::MutexLock lock{&gOutputMutex};
  std::fflush(stderr);
}

std::vector<LogTopic*> GetTopics() {
  return {std::begin(kTopics), std::end(kTopics)};
}

LogTopic* FindTopic(std::string_view name) noexcept {
  for (auto* topic : kTopics) {
    if (topic->GetName() == name) {
      return topic;
    }
  }
  return nullptr;
}

}  // namespace log
}  // namespace cdb
