////////////////////////////////////////////////////////////////////////////////
/// DISCLAIMER
///
/// Copyright 2025 SereneDB GmbH, Berlin, Germany
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
/// Copyright holder is SereneDB GmbH, Berlin, Germany
////////////////////////////////////////////////////////////////////////////////

#include "database/rules.h"

#include <absl/time/clock.h>
#include <vpack/builder.h>
#include <vpack/iterator.h>
#include <vpack/slice.h>

#include "database/database_name.h"

namespace cdb {
namespace {

constexpr std::string_view kDefaultPartitionTemplate = "%Y-%m-%dT%H";
constexpr uint64_t kDefaultMubRowThreshold = 100'000;
constexpr uint64_t kDefaultLateArriveWindowSeconds = 300;
constexpr uint64_t kDefaultPersistAgeThresholdSeconds = 1800;
constexpr uint64_t kDefaultPersistRowThreshold = 1'000'000;
constexpr uint64_t kDefaultWorkerCleanupAvgSleepSeconds = 500;

template<typename T>
void Overlay(std::optional<T>& base, const std::optional<T>& top) {
  if (top) {
    base = top;
  }
}

template<typename T>
void AddIfSet(vpack::Builder& builder, std::string_view key,
              const std::optional<T>& value) {
  if (value) {
    if constexpr (std::is_same_v<T, std::string>) {
      builder.add(key, std::string_view{*value});
    } else {
      builder.add(key, *value);
    }
  }
}

Result InvalidField(std::string_view field, std::string_view reason) {
  return {ERROR_SERVER_INVALID_RULES, "invalid rules field '", field, "': ",
          reason};
}

Result ReadUInt(vpack::Slice value, std::string_view field,
                std::optional<uint64_t>& out) {
  if (!value.isNumber()) {
    return InvalidField(field, "expected an unsigned number");
  }
  auto number = value.getNumber<double>();
  if (number < 0) {
    return InvalidField(field, "expected an unsigned number");
  }
  out = value.getNumber<uint64_t>();
  return {};
}

Result ReadLifecycle(vpack::Slice slice, LifecycleRules& lifecycle) {
  if (!slice.isObject()) {
    return InvalidField("lifecycle", "expected an object");
  }
  for (auto [key, value] : vpack::ObjectIterator(slice)) {
    auto name = key.stringView();
    Result r;
    if (name == "mubRowThreshold") {
      r = ReadUInt(value, "lifecycle.mubRowThreshold",
                   lifecycle.mub_row_threshold);
    } else if (name == "lateArriveWindowSeconds") {
      r = ReadUInt(value, "lifecycle.lateArriveWindowSeconds",
                   lifecycle.late_arrive_window_seconds);
    } else if (name == "persistAgeThresholdSeconds") {
      r = ReadUInt(value, "lifecycle.persistAgeThresholdSeconds",
                   lifecycle.persist_age_threshold_seconds);
    } else if (name == "persistRowThreshold") {
      r = ReadUInt(value, "lifecycle.persistRowThreshold",
                   lifecycle.persist_row_threshold);
    } else if (name == "bufferSizeSoft") {
      r = ReadUInt(value, "lifecycle.bufferSizeSoft",
                   lifecycle.buffer_size_soft);
    } else if (name == "bufferSizeHard") {
      r = ReadUInt(value, "lifecycle.bufferSizeHard",
                   lifecycle.buffer_size_hard);
    } else if (name == "immutable") {
      if (!value.isBool()) {
        return InvalidField("lifecycle.immutable", "expected a boolean");
      }
      lifecycle.immutable = value.getBool();
    } else {
      return InvalidField(absl::StrCat("lifecycle.", name), "unknown field");
    }
    if (r.fail()) {
      return r;
    }
  }
  return {};
}

}  // namespace

bool LifecycleRules::empty() const noexcept {
  return *this == LifecycleRules{};
}

DatabaseRules DatabaseRules::Defaults() {
  DatabaseRules rules;
  rules.partition_template = std::string{kDefaultPartitionTemplate};
  rules.lifecycle.mub_row_threshold = kDefaultMubRowThreshold;
  rules.lifecycle.late_arrive_window_seconds = kDefaultLateArriveWindowSeconds;
  rules.lifecycle.persist_age_threshold_seconds =
    kDefaultPersistAgeThresholdSeconds;
  rules.lifecycle.persist_row_threshold = kDefaultPersistRowThreshold;
  rules.lifecycle.buffer_size_soft = 0;
  rules.lifecycle.buffer_size_hard = 0;
  rules.lifecycle.immutable = false;
  rules.worker_cleanup_avg_sleep_seconds = kDefaultWorkerCleanupAvgSleepSeconds;
  return rules;
}

DatabaseRules DatabaseRules::overlay(const DatabaseRules& overrides) const {
  DatabaseRules merged = *this;
  if (!overrides.name.empty()) {
    merged.name = overrides.name;
  }
  Overlay(merged.partition_template, overrides.partition_template);
  auto& lifecycle = merged.lifecycle;
  Overlay(lifecycle.mub_row_threshold, overrides.lifecycle.mub_row_threshold);
  Overlay(lifecycle.late_arrive_window_seconds,
          overrides.lifecycle.late_arrive_window_seconds);
  Overlay(lifecycle.persist_age_threshold_seconds,
          overrides.lifecycle.persist_age_threshold_seconds);
  Overlay(lifecycle.persist_row_threshold,
          overrides.lifecycle.persist_row_threshold);
  Overlay(lifecycle.buffer_size_soft, overrides.lifecycle.buffer_size_soft);
  Overlay(lifecycle.buffer_size_hard, overrides.lifecycle.buffer_size_hard);
  Overlay(lifecycle.immutable, overrides.lifecycle.immutable);
  Overlay(merged.worker_cleanup_avg_sleep_seconds,
          overrides.worker_cleanup_avg_sleep_seconds);
  return merged;
}

void DatabaseRules::toVPack(vpack::Builder& builder) const {
  builder.openObject();
  builder.add("name", std::string_view{name});
  AddIfSet(builder, "partitionTemplate", partition_template);
  if (!lifecycle.empty()) {
    builder.add("lifecycle", vpack::Value(vpack::ValueType::Object));
    AddIfSet(builder, "mubRowThreshold", lifecycle.mub_row_threshold);
    AddIfSet(builder, "lateArriveWindowSeconds",
             lifecycle.late_arrive_window_seconds);
    AddIfSet(builder, "persistAgeThresholdSeconds",
             lifecycle.persist_age_threshold_seconds);
    AddIfSet(builder, "persistRowThreshold", lifecycle.persist_row_threshold);
    AddIfSet(builder, "bufferSizeSoft", lifecycle.buffer_size_soft);
    AddIfSet(builder, "bufferSizeHard", lifecycle.buffer_size_hard);
    AddIfSet(builder, "immutable", lifecycle.immutable);
    builder.close();
  }
  AddIfSet(builder, "workerCleanupAvgSleepSeconds",
           worker_cleanup_avg_sleep_seconds);
  builder.close();
}

ResultOr<DatabaseRules> DatabaseRules::FromVPack(vpack::Slice slice) {
  if (!slice.isObject()) {
    return std::unexpected<Result>{std::in_place, ERROR_SERVER_INVALID_RULES,
                                   "rules must be an object"};
  }
  DatabaseRules rules;
  for (auto [key, value] : vpack::ObjectIterator(slice)) {
    auto name = key.stringView();
    Result r;
    if (name == "name") {
      if (!value.isString()) {
        r = InvalidField("name", "expected a string");
      } else {
        rules.name = value.stringView();
      }
    } else if (name == "partitionTemplate") {
      if (!value.isString()) {
        r = InvalidField("partitionTemplate", "expected a string");
      } else {
        rules.partition_template = std::string{value.stringView()};
      }
    } else if (name == "lifecycle") {
      r = ReadLifecycle(value, rules.lifecycle);
    } else if (name == "workerCleanupAvgSleepSeconds") {
      r = ReadUInt(value, "workerCleanupAvgSleepSeconds",
                   rules.worker_cleanup_avg_sleep_seconds);
    } else {
      r = InvalidField(name, "unknown field");
    }
    if (r.fail()) {
      return std::unexpected{std::move(r)};
    }
  }
  return rules;
}

ActiveRules ActiveRules::Merge(const DatabaseRules& provided,
                               const DatabaseRules& defaults) {
  const auto builtin = DatabaseRules::Defaults();
  const auto merged = builtin.overlay(defaults).overlay(provided);
  const auto& lifecycle = merged.lifecycle;
  ActiveRules active;
  active.name = provided.name;
  active.partition_template = *merged.partition_template;
  active.mub_row_threshold = *lifecycle.mub_row_threshold;
  active.late_arrive_window_seconds = *lifecycle.late_arrive_window_seconds;
  active.persist_age_threshold_seconds =
    *lifecycle.persist_age_threshold_seconds;
  active.persist_row_threshold = *lifecycle.persist_row_threshold;
  active.buffer_size_soft = *lifecycle.buffer_size_soft;
  active.buffer_size_hard = *lifecycle.buffer_size_hard;
  active.immutable = *lifecycle.immutable;
  active.worker_cleanup_avg_sleep_seconds =
    *merged.worker_cleanup_avg_sleep_seconds;
  return active;
}

DatabaseRules ActiveRules::toRules() const {
  DatabaseRules rules;
  rules.name = name;
  rules.partition_template = partition_template;
  rules.lifecycle.mub_row_threshold = mub_row_threshold;
  rules.lifecycle.late_arrive_window_seconds = late_arrive_window_seconds;
  rules.lifecycle.persist_age_threshold_seconds = persist_age_threshold_seconds;
  rules.lifecycle.persist_row_threshold = persist_row_threshold;
  rules.lifecycle.buffer_size_soft = buffer_size_soft;
  rules.lifecycle.buffer_size_hard = buffer_size_hard;
  rules.lifecycle.immutable = immutable;
  rules.worker_cleanup_avg_sleep_seconds = worker_cleanup_avg_sleep_seconds;
  return rules;
}

std::string ActiveRules::partitionKey(int64_t time) const {
  return absl::FormatTime(partition_template, absl::FromUnixNanos(time),
                          absl::UTCTimeZone());
}

Result ValidateRules(const DatabaseRules& rules) {
  if (auto r = ValidateDatabaseName(rules.name); r.fail()) {
    return InvalidField("name", r.errorMessage());
  }
  if (rules.partition_template && rules.partition_template->empty()) {
    return InvalidField("partitionTemplate", "must not be empty");
  }
  const auto& lifecycle = rules.lifecycle;
  if (lifecycle.mub_row_threshold && *lifecycle.mub_row_threshold == 0) {
    return InvalidField("lifecycle.mubRowThreshold", "must be positive");
  }
  if (lifecycle.buffer_size_soft && lifecycle.buffer_size_hard &&
      *lifecycle.buffer_size_hard != 0 &&
      *lifecycle.buffer_size_soft > *lifecycle.buffer_size_hard) {
    return InvalidField("lifecycle.bufferSizeSoft",
                        "must not exceed lifecycle.bufferSizeHard");
  }
  return {};
}

}  // namespace cdb
