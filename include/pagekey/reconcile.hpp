#pragma once

#include <pagekey/job_queue.hpp>
#include <pagekey/options.hpp>
#include <pagekey/page_store.hpp>

#include <atomic>
#include <optional>
#include <string>

#include <rocksdb/status.h>

namespace pagekey {

/** A page stored under a non-canonical identifier, and what it would shadow. */
struct ReconciliationCandidate {
  std::string legacy_identifier;
  std::string canonical_identifier;
  std::string legacy_content;
  std::optional<std::string> canonical_content;  // nullopt: no page under the canonical key
};

enum class ReconcileWinner { kLegacy, kCanonical };

/**
 * The copy that survives reconciliation: the legacy copy when nothing is
 * stored canonically, otherwise the longer of the two (ties keep canonical).
 */
ReconcileWinner ChooseRicherContent(const ReconciliationCandidate& candidate);

/**
 * Moves one legacy page to its canonical key.
 *
 * Losing copies are soft-deleted, never dropped. If the final write fails,
 * the soft-deleted bytes are written back to their keys before the error is
 * returned.
 */
class ReconcileJob final : public Job {
 public:
  ReconcileJob(PageStore* store, std::string legacy_identifier, std::string canonical_identifier,
               const Options& opt = Options());

  rocksdb::Status Execute() override;

  /** "ReconcileJob-<canonical identifier>": one queue per target page. */
  std::string GetName() const override;

  const std::string& legacy_identifier() const { return legacy_; }
  const std::string& canonical_identifier() const { return canonical_; }

 private:
  void Restore(const std::string& key, const std::string& bytes) const;

  PageStore* store_;
  const std::string legacy_;
  const std::string canonical_;
  Options opt_;
};

/**
 * Full-store sweep: finds every page whose declared identifier is not
 * canonical and enqueues a ReconcileJob for it.
 *
 * A page declares its identifier through an embedded `identifier` field, or
 * else through its storage key.
 */
class ReconcileScanJob final : public Job {
 public:
  ReconcileScanJob(PageStore* store, JobQueueCoordinator* coordinator,
                   const Options& opt = Options());

  rocksdb::Status Execute() override;
  std::string GetName() const override { return "ReconcileScanJob"; }

  /** Keys inspected and resolver jobs enqueued by the last Execute(). */
  int keys_scanned() const { return keys_scanned_.load(); }
  int jobs_enqueued() const { return jobs_enqueued_.load(); }

 private:
  PageStore* store_;
  JobQueueCoordinator* coordinator_;
  Options opt_;

  std::atomic<int> keys_scanned_{0};
  std::atomic<int> jobs_enqueued_{0};
};

}  // namespace pagekey
