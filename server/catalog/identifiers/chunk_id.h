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

#include "basics/identifier.h"

namespace cdb {

// partition scoped, monotonically increasing from 0 and never reused
class ChunkId : public basics::Identifier {
 public:
  using Identifier::Identifier;

  ChunkId next() const noexcept { return ChunkId{id() + 1}; }
};

static_assert(sizeof(ChunkId) == sizeof(ChunkId::BaseType));

// per database sequence number of a preserved catalog entry, starting at 1
class CatalogSequence : public basics::Identifier {
 public:
  using Identifier::Identifier;

  static constexpr CatalogSequence none() { return CatalogSequence{0}; }

  bool isSet() const { return id() != 0; }
  CatalogSequence next() const noexcept { return CatalogSequence{id() + 1}; }
};

}  // namespace cdb
