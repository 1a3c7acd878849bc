#pragma once

#include <pagekey/job_queue.hpp>
#include <pagekey/options.hpp>
#include <pagekey/page_store.hpp>

#include <atomic>
#include <string>

#include <rocksdb/status.h>

namespace pagekey {

/** Extension of the per-page sidecar files older wiki versions wrote. */
inline constexpr char kLegacySidecarExtension[] = ".json";

/**
 * Moves one artifact file into the store's holding area.
 *
 * An artifact that is already gone counts as archived.
 */
class ArchiveJob final : public Job {
 public:
  ArchiveJob(FilePageStore* store, std::string file_name, const Options& opt = Options());

  rocksdb::Status Execute() override;

  /** "ArchiveJob-<file name>" */
  std::string GetName() const override { return "ArchiveJob-" + file_name_; }

  const std::string& file_name() const { return file_name_; }

 private:
  FilePageStore* store_;
  const std::string file_name_;
  Options opt_;
};

/**
 * Lists the artifacts with one extension and enqueues an ArchiveJob for each.
 * Stops at the first job that cannot be scheduled; the next sweep picks up
 * the rest.
 */
class ArchiveScanJob final : public Job {
 public:
  ArchiveScanJob(FilePageStore* store, JobQueueCoordinator* coordinator,
                 std::string extension = kLegacySidecarExtension, const Options& opt = Options());

  rocksdb::Status Execute() override;
  std::string GetName() const override { return "ArchiveScanJob"; }

  int files_found() const { return files_found_.load(); }
  int jobs_enqueued() const { return jobs_enqueued_.load(); }

 private:
  FilePageStore* store_;
  JobQueueCoordinator* coordinator_;
  const std::string extension_;
  Options opt_;

  std::atomic<int> files_found_{0};
  std::atomic<int> jobs_enqueued_{0};
};

}  // namespace pagekey
