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

#pragma once

#include <absl/time/time.h>

#include <cstdint>
#include <optional>
#include <string>

#include "basics/result_or.h"

namespace vpack {
class Builder;
class Slice;
}  // namespace vpack

namespace cdb {

struct LifecycleRules {
  // open chunk row count that triggers a rollover on write
  std::optional<uint64_t> mub_row_threshold;
  // age of the last write after which a forced persist takes the open chunk
  std::optional<uint64_t> late_arrive_window_seconds;
  std::optional<uint64_t> persist_age_threshold_seconds;
  std::optional<uint64_t> persist_row_threshold;
  // 0 means unlimited
  std::optional<uint64_t> buffer_size_soft;
  std::optional<uint64_t> buffer_size_hard;
  std::optional<bool> immutable;

  bool empty() const noexcept;
  bool operator==(const LifecycleRules&) const = default;
};

// Configuration of a database. Only `name` is required; the rules a tenant
// submitted are kept as they are ("provided"), the rules the engine works
// with are merged with defaults ("active").
struct DatabaseRules {
  std::string name;
  // strftime style, applied in UTC to the row time
  std::optional<std::string> partition_template;
  LifecycleRules lifecycle;
  std::optional<uint64_t> worker_cleanup_avg_sleep_seconds;

  // built-in defaults with every optional field set
  static DatabaseRules Defaults();

  // fields set in `overrides` win over the ones in `this`
  DatabaseRules overlay(const DatabaseRules& overrides) const;

  void toVPack(vpack::Builder& builder) const;
  static ResultOr<DatabaseRules> FromVPack(vpack::Slice slice);

  bool operator==(const DatabaseRules&) const = default;
};

// provided rules merged with defaults, every value present
struct ActiveRules {
  static ActiveRules Merge(const DatabaseRules& provided,
                           const DatabaseRules& defaults);

  DatabaseRules toRules() const;

  absl::Duration lateArriveWindow() const {
    return absl::Seconds(late_arrive_window_seconds);
  }

  // partition key of a row written at `time` (ns since epoch)
  std::string partitionKey(int64_t time) const;

  std::string name;
  std::string partition_template;
  uint64_t mub_row_threshold = 0;
  uint64_t late_arrive_window_seconds = 0;
  uint64_t persist_age_threshold_seconds = 0;
  uint64_t persist_row_threshold = 0;
  uint64_t buffer_size_soft = 0;
  uint64_t buffer_size_hard = 0;
  bool immutable = false;
  uint64_t worker_cleanup_avg_sleep_seconds = 0;
};

// ERROR_SERVER_INVALID_RULES naming the offending field
Result ValidateRules(const DatabaseRules& rules);

}  // namespace cdb
