#include <pagekey/rocks_page_store.hpp>

#include <pagekey/internal.hpp>

#include <utility>

#include <rocksdb/filter_policy.h>
#include <rocksdb/options.h>
#include <rocksdb/table.h>
#include <rocksdb/utilities/transaction.h>

namespace pagekey {

namespace {

constexpr const char* kPagesCF = "pagekey_pages";
constexpr const char* kDeletedCF = "pagekey_deleted";

inline void EmitCounter(const Options& opt, std::string_view name, uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

inline void EmitHistogram(const Options& opt, std::string_view name, uint64_t value) {
  if (opt.metrics) opt.metrics->Histogram(name, value);
}

rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

rocksdb::Slice ToSlice(std::string_view v) { return rocksdb::Slice(v.data(), v.size()); }

}  // namespace

RocksPageStore::RocksPageStore(const Options& opt) : opt_(opt) {}

RocksPageStore::~RocksPageStore() { Close(); }

rocksdb::Status RocksPageStore::Open(const std::string& db_path,
                                     std::unique_ptr<RocksPageStore>* out, const Options& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (db_path.empty()) return rocksdb::Status::InvalidArgument("db_path is empty");

  auto store = std::unique_ptr<RocksPageStore>(new RocksPageStore(opt));

  rocksdb::Options options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  rocksdb::TransactionDBOptions txn_opts;

  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);
  store->block_cache_ = cache;

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kPagesCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kDeletedCF, MakeCFOptions(cache, opt.bloom_bits_per_key));

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::TransactionDB* db = nullptr;

  rocksdb::Status s = rocksdb::TransactionDB::Open(options, txn_opts, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    return s;
  }

  store->db_ = db;
  store->handles_ = std::move(handles);

  // Descriptor order = handle order
  store->pages_cf_ = store->handles_[1];
  store->deleted_cf_ = store->handles_[2];

  *out = std::move(store);
  return rocksdb::Status::OK();
}

rocksdb::Status RocksPageStore::ReadRaw(std::string_view key, std::string* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (key.empty()) return rocksdb::Status::InvalidArgument("storage key is empty");

  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), pages_cf_, ToSlice(key), out);
  if (s.IsNotFound()) {
    return rocksdb::Status::NotFound("no page stored under key", std::string(key));
  }
  return s;
}

rocksdb::Status RocksPageStore::WriteRaw(std::string_view key, std::string_view bytes) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (key.empty()) return rocksdb::Status::InvalidArgument("storage key is empty");

  rocksdb::Status s = db_->Put(rocksdb::WriteOptions(), pages_cf_, ToSlice(key), ToSlice(bytes));
  if (s.ok()) EmitCounter(opt_, "pagekey.store.write_total");
  return s;
}

rocksdb::Status RocksPageStore::SoftDelete(std::string_view key) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (key.empty()) return rocksdb::Status::InvalidArgument("storage key is empty");

  const uint64_t op_start_us = internal::NowMicros();
  int attempts_used = 0;

  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    EmitHistogram(opt_, "pagekey.store.soft_delete_latency_us", internal::NowMicros() - op_start_us);
    EmitHistogram(opt_, "pagekey.store.soft_delete_attempts", static_cast<uint64_t>(attempts_used));
    if (st.ok()) EmitCounter(opt_, "pagekey.store.soft_delete_total");
    return st;
  };

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;

  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  for (int attempt = 0; attempt < opt_.max_retries; ++attempt) {
    attempts_used = attempt + 1;

    std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
    if (!txn) return finish(rocksdb::Status::IOError("BeginTransaction returned null"));

    std::string bytes;
    rocksdb::Status s = txn->GetForUpdate(ro, pages_cf_, ToSlice(key), &bytes);
    if (s.IsNotFound()) {
      return finish(rocksdb::Status::NotFound("no page stored under key", std::string(key)));
    }
    if (!s.ok()) {
      if (internal::IsRetryableTxnStatus(s)) {
        EmitCounter(opt_, "pagekey.store.soft_delete_retry_total");
        continue;
      }
      return finish(s);
    }

    // First free name in this second's holding area
    const std::string prefix =
        std::to_string(internal::WallClockSeconds()) + "/" + std::string(key);
    std::string target = prefix;
    bool retry = false;
    for (int n = 1;; ++n) {
      std::string ignored;
      s = txn->GetForUpdate(ro, deleted_cf_, target, &ignored);
      if (s.IsNotFound()) break;
      if (!s.ok()) {
        retry = internal::IsRetryableTxnStatus(s);
        break;
      }
      target = prefix + "_" + std::to_string(n);
    }
    if (retry) {
      EmitCounter(opt_, "pagekey.store.soft_delete_retry_total");
      continue;
    }
    if (!s.IsNotFound()) return finish(s);

    s = txn->Put(deleted_cf_, target, bytes);
    if (!s.ok()) return finish(s);
    s = txn->Delete(pages_cf_, ToSlice(key));
    if (!s.ok()) return finish(s);

    rocksdb::Status cs = txn->Commit();
    if (cs.ok()) return finish(cs);

    if (internal::IsRetryableTxnStatus(cs)) {
      EmitCounter(opt_, "pagekey.store.soft_delete_retry_total");
      continue;
    }
    return finish(cs);
  }

  return finish(rocksdb::Status::TimedOut("SoftDelete exceeded max_retries"));
}

rocksdb::Status RocksPageStore::ListKeys(std::vector<std::string>* out) const {
  return ListFamily(pages_cf_, out);
}

rocksdb::Status RocksPageStore::ListDeletedKeys(std::vector<std::string>* out) const {
  return ListFamily(deleted_cf_, out);
}

rocksdb::Status RocksPageStore::ListFamily(rocksdb::ColumnFamilyHandle* cf,
                                           std::vector<std::string>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  out->clear();

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  rocksdb::Status iter_status;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, cf));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      out->emplace_back(it->key().data(), it->key().size());
    }
    iter_status = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  return iter_status;
}

void RocksPageStore::Close() {
  if (!db_) return;

  for (auto* h : handles_) delete h;
  handles_.clear();
  delete db_;
  db_ = nullptr;
  pages_cf_ = deleted_cf_ = nullptr;
}

}  // namespace pagekey
