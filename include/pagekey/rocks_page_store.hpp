#pragma once

#include <pagekey/page_store.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/transaction_db.h>

namespace pagekey {

/**
 * PageStore on a RocksDB TransactionDB.
 *
 * Column families:
 *   pagekey_pages   : storage key -> page bytes
 *   pagekey_deleted : "<unix seconds>/<storage key>[_<n>]" -> page bytes
 *
 * SoftDelete moves a page between the two families in one transaction, so a
 * crash never loses or duplicates it.
 */
class RocksPageStore final : public PageStore {
 public:
  static rocksdb::Status Open(const std::string& db_path, std::unique_ptr<RocksPageStore>* out,
                              const Options& opt = Options{});

  ~RocksPageStore() override;

  RocksPageStore(const RocksPageStore&) = delete;
  RocksPageStore& operator=(const RocksPageStore&) = delete;

  rocksdb::Status ReadRaw(std::string_view key, std::string* out) const override;
  rocksdb::Status WriteRaw(std::string_view key, std::string_view bytes) override;
  rocksdb::Status SoftDelete(std::string_view key) override;
  rocksdb::Status ListKeys(std::vector<std::string>* out) const override;

  /** Keys of the holding area, sorted. */
  rocksdb::Status ListDeletedKeys(std::vector<std::string>* out) const;

  /** Flush and release the database. Idempotent. */
  void Close();

 private:
  explicit RocksPageStore(const Options& opt);

  rocksdb::Status ListFamily(rocksdb::ColumnFamilyHandle* cf, std::vector<std::string>* out) const;

  Options opt_;

  rocksdb::TransactionDB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;
  rocksdb::ColumnFamilyHandle* pages_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* deleted_cf_ = nullptr;
  std::shared_ptr<rocksdb::Cache> block_cache_;
};

}  // namespace pagekey
