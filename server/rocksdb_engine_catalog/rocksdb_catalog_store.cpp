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

#include "rocksdb_engine_catalog/rocksdb_catalog_store.h"

#include <absl/base/internal/endian.h>
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

#include "basics/assert.h"
#include "basics/debugging.h"
#include "basics/logger/logger.h"
#include "rocksdb_engine_catalog/rocksdb_utils.h"

namespace cdb::catalog {
namespace {

constexpr size_t kKeySize =
  DatabaseUuid::kBinarySize + sizeof(CatalogSequence::BaseType);

std::string MakeKey(const DatabaseUuid& database, uint64_t sequence) {
  std::string key;
  key.reserve(kKeySize);
  const auto uuid = database.toBinary();
  key.append(uuid.data(), uuid.size());
  char buffer[sizeof(uint64_t)];
  absl::big_endian::Store64(buffer, sequence);
  key.append(buffer, sizeof(buffer));
  return key;
}

std::string MakeKey(const DatabaseUuid& database, CatalogSequence sequence) {
  return MakeKey(database, sequence.id());
}

CatalogSequence SequenceOf(const rocksdb::Slice& key) {
  CDB_ASSERT(key.size() == kKeySize);
  return CatalogSequence{
    absl::big_endian::Load64(key.data() + DatabaseUuid::kBinarySize)};
}

rocksdb::WriteOptions SyncWrite() {
  rocksdb::WriteOptions options;
  options.sync = true;
  return options;
}

}  // namespace

RocksDBCatalogStore::RocksDBCatalogStore(std::string path)
  : _path{std::move(path)} {}

RocksDBCatalogStore::~RocksDBCatalogStore() { Close(); }

Result RocksDBCatalogStore::Open() {
  CDB_ASSERT(!_db);
  rocksdb::Options options;
  options.create_if_missing = true;
  rocksdb::DB* db = nullptr;
  auto r = rocksutils::ConvertStatus(rocksdb::DB::Open(options, _path, &db));
  if (r.fail()) {
    return std::move(r).withContext("cannot open catalog store at '", _path,
                                    "'");
  }
  _db.reset(db);
  CDB_INFO("xxxxx", Logger::CATALOG, "opened catalog store at '", _path, "'");
  return {};
}

void RocksDBCatalogStore::Close() {
  if (_db) {
    auto r = rocksutils::ConvertStatus(_db->Close());
    CDB_WARN_IF("xxxxx", Logger::CATALOG, r.fail(),
                "error closing catalog store: ", r.errorMessage());
    _db.reset();
  }
}

Result RocksDBCatalogStore::Append(const DatabaseUuid& database,
                                   CatalogSequence sequence,
                                   std::string_view bytes) {
  CDB_IF_FAILURE("CatalogStore::Append") {
    return {ERROR_SERVER_IO_ERROR, "failed to append catalog entry ",
            sequence.id(), " of database ", database};
  }
  CDB_ASSERT(_db);
  const auto key = MakeKey(database, sequence);
  return rocksutils::ConvertStatus(
    _db->Put(SyncWrite(), key, rocksdb::Slice{bytes.data(), bytes.size()}));
}

Result RocksDBCatalogStore::Visit(const DatabaseUuid& database,
                                  CatalogSequence from, size_t limit,
                                  Visitor visitor) const {
  CDB_IF_FAILURE("CatalogStore::Visit") {
    return {ERROR_SERVER_IO_ERROR, "failed to read catalog of database ",
            database};
  }
  CDB_ASSERT(_db);
  const auto start = MakeKey(database, from);
  const auto end = MakeKey(database, UINT64_MAX);
  const rocksdb::Slice upper{end};
  rocksdb::ReadOptions ro;
  ro.iterate_upper_bound = &upper;
  std::unique_ptr<rocksdb::Iterator> iter{_db->NewIterator(ro)};
  for (iter->Seek(start); iter->Valid() && limit != 0; iter->Next(), --limit) {
    const auto value = iter->value();
    if (!visitor(SequenceOf(iter->key()),
                 std::string_view{value.data(), value.size()})) {
      break;
    }
  }
  return rocksutils::ConvertStatus(iter->status());
}

ResultOr<CatalogSequence> RocksDBCatalogStore::LastSequence(
  const DatabaseUuid& database) const {
  CDB_ASSERT(_db);
  const auto prefix = MakeKey(database, 0);
  const auto end = MakeKey(database, UINT64_MAX);
  std::unique_ptr<rocksdb::Iterator> iter{
    _db->NewIterator(rocksdb::ReadOptions{})};
  iter->SeekForPrev(end);
  if (iter->Valid() && iter->key().compare(prefix) >= 0) {
    return SequenceOf(iter->key());
  }
  if (auto r = rocksutils::ConvertStatus(iter->status()); r.fail()) {
    return std::unexpected{std::move(r)};
  }
  return CatalogSequence::none();
}

Result RocksDBCatalogStore::Rewrite(const DatabaseUuid& database,
                                    const Batch& entries) {
  CDB_IF_FAILURE("CatalogStore::Rewrite") {
    return {ERROR_SERVER_IO_ERROR, "failed to rewrite catalog of database ",
            database};
  }
  CDB_ASSERT(_db);
  rocksdb::WriteBatch batch;
  const auto start = MakeKey(database, 0);
  const auto end = MakeKey(database, UINT64_MAX);
  auto r = rocksutils::ConvertStatus(batch.DeleteRange(start, end));
  if (r.fail()) {
    return r;
  }
  for (const auto& [sequence, bytes] : entries) {
    r = rocksutils::ConvertStatus(batch.Put(MakeKey(database, sequence), bytes));
    if (r.fail()) {
      return r;
    }
  }
  return rocksutils::ConvertStatus(_db->Write(SyncWrite(), &batch));
}

}  // namespace cdb::catalog
