#include <pagekey/reconcile.hpp>

#include <pagekey/frontmatter.hpp>
#include <pagekey/identifier.hpp>
#include <pagekey/page_key.hpp>

#include <memory>
#include <set>
#include <utility>
#include <vector>

#include <trantor/utils/Logger.h>

namespace pagekey {

namespace {

inline void EmitCounter(const Options& opt, std::string_view name, uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

// The identifier a stored page claims for itself.
rocksdb::Status DeclaredIdentifier(const PageStore& store, const std::string& key,
                                   std::string* out) {
  std::string raw;
  rocksdb::Status s = store.ReadRaw(key, &raw);
  if (!s.ok()) return s;

  s = ExtractEmbeddedIdentifier(raw, out);
  if (s.ok() || !s.IsNotFound()) return s;
  return IdentifierFromStorageKey(key, out);
}

}  // namespace

ReconcileWinner ChooseRicherContent(const ReconciliationCandidate& candidate) {
  if (!candidate.canonical_content) return ReconcileWinner::kLegacy;
  return candidate.legacy_content.size() > candidate.canonical_content->size()
             ? ReconcileWinner::kLegacy
             : ReconcileWinner::kCanonical;
}

// ---------------------------------------------------------------------------
// ReconcileJob
// ---------------------------------------------------------------------------

ReconcileJob::ReconcileJob(PageStore* store, std::string legacy_identifier,
                           std::string canonical_identifier, const Options& opt)
    : store_(store),
      legacy_(std::move(legacy_identifier)),
      canonical_(std::move(canonical_identifier)),
      opt_(opt) {}

std::string ReconcileJob::GetName() const { return "ReconcileJob-" + canonical_; }

void ReconcileJob::Restore(const std::string& key, const std::string& bytes) const {
  rocksdb::Status s = store_->WriteRaw(key, bytes);
  if (!s.ok()) {
    LOG_ERROR << "Could not restore " << key << " after failed reconciliation of " << legacy_
              << "; a copy remains in the soft-delete area: " << s.ToString();
  }
}

rocksdb::Status ReconcileJob::Execute() {
  if (!store_) return rocksdb::Status::InvalidArgument("store is null");

  const std::string legacy_key = StorageKeyFor(legacy_);
  const std::string canonical_key = StorageKeyFor(canonical_);
  if (legacy_key == canonical_key) {
    return rocksdb::Status::InvalidArgument("identifiers share a storage key", legacy_);
  }

  ReconciliationCandidate candidate;
  candidate.legacy_identifier = legacy_;
  candidate.canonical_identifier = canonical_;

  rocksdb::Status s = store_->ReadRaw(legacy_key, &candidate.legacy_content);
  if (!s.ok()) return s;

  std::string existing;
  s = store_->ReadRaw(canonical_key, &existing);
  if (s.ok()) {
    candidate.canonical_content = std::move(existing);
  } else if (!s.IsNotFound()) {
    return s;
  }

  const ReconcileWinner winner = ChooseRicherContent(candidate);
  const std::string& winning = winner == ReconcileWinner::kLegacy
                                   ? candidate.legacy_content
                                   : *candidate.canonical_content;

  // Nothing is touched until the final bytes are known
  std::string rewritten;
  s = RewriteEmbeddedIdentifier(winning, canonical_, &rewritten);
  if (!s.ok()) return s;

  s = store_->SoftDelete(legacy_key);
  if (!s.ok()) return s;

  bool canonical_deleted = false;
  if (candidate.canonical_content && winner == ReconcileWinner::kLegacy) {
    s = store_->SoftDelete(canonical_key);
    if (!s.ok()) {
      Restore(legacy_key, candidate.legacy_content);
      return s;
    }
    canonical_deleted = true;
  }

  s = store_->WriteRaw(canonical_key, rewritten);
  if (!s.ok()) {
    Restore(legacy_key, candidate.legacy_content);
    if (canonical_deleted) Restore(canonical_key, *candidate.canonical_content);
    return s;
  }

  if (candidate.canonical_content) {
    EmitCounter(opt_, "pagekey.reconcile.shadow_total");
    LOG_INFO << "Resolved shadowing of " << canonical_ << " by " << legacy_ << ": kept the "
             << (winner == ReconcileWinner::kLegacy ? "legacy" : "canonical") << " copy ("
             << candidate.legacy_content.size() << " vs " << candidate.canonical_content->size()
             << " bytes)";
  } else {
    EmitCounter(opt_, "pagekey.reconcile.moved_total");
    LOG_INFO << "Moved page " << legacy_ << " to " << canonical_;
  }
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// ReconcileScanJob
// ---------------------------------------------------------------------------

ReconcileScanJob::ReconcileScanJob(PageStore* store, JobQueueCoordinator* coordinator,
                                   const Options& opt)
    : store_(store), coordinator_(coordinator), opt_(opt) {}

rocksdb::Status ReconcileScanJob::Execute() {
  if (!store_) return rocksdb::Status::InvalidArgument("store is null");
  if (!coordinator_) return rocksdb::Status::InvalidArgument("coordinator is null");

  keys_scanned_ = 0;
  jobs_enqueued_ = 0;

  std::vector<std::string> keys;
  rocksdb::Status s = store_->ListKeys(&keys);
  if (!s.ok()) return s;

  std::set<std::string> seen;
  for (const std::string& key : keys) {
    keys_scanned_++;

    std::string declared;
    s = DeclaredIdentifier(*store_, key, &declared);
    if (s.IsNotFound()) continue;  // removed since listing
    if (!s.ok()) {
      LOG_WARN << "Skipping page " << key << ": " << s.ToString();
      continue;
    }
    std::string canonical;
    s = NormalizeIdentifier(declared, &canonical);
    if (!s.ok()) {
      LOG_WARN << "Skipping page " << key << " with unusable identifier: " << s.ToString();
      continue;
    }
    if (canonical == declared) continue;

    // Already in its canonical slot; only the embedded field is stale
    const std::string canonical_key = StorageKeyFor(canonical);
    if (key == canonical_key || StorageKeyFor(declared) == canonical_key) continue;
    if (!seen.insert(declared).second) continue;

    auto job = std::make_shared<ReconcileJob>(store_, declared, canonical, opt_);
    s = coordinator_->EnqueueJob(job);
    if (!s.ok()) {
      LOG_WARN << "Could not schedule " << job->GetName() << ": " << s.ToString();
      continue;
    }
    jobs_enqueued_++;
  }

  LOG_INFO << "Reconciliation sweep scanned " << keys_scanned_.load() << " pages, scheduled "
           << jobs_enqueued_.load() << " moves";
  return rocksdb::Status::OK();
}

}  // namespace pagekey
