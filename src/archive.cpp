#include <pagekey/archive.hpp>

#include <memory>
#include <utility>
#include <vector>

#include <trantor/utils/Logger.h>

namespace pagekey {

// ---------------------------------------------------------------------------
// ArchiveJob
// ---------------------------------------------------------------------------

ArchiveJob::ArchiveJob(FilePageStore* store, std::string file_name, const Options& opt)
    : store_(store), file_name_(std::move(file_name)), opt_(opt) {}

rocksdb::Status ArchiveJob::Execute() {
  if (!store_) return rocksdb::Status::InvalidArgument("store is null");

  rocksdb::Status s = store_->ArchiveArtifact(file_name_);
  if (s.IsNotFound()) {
    LOG_DEBUG << "Artifact " << file_name_ << " already gone";
    return rocksdb::Status::OK();
  }
  if (!s.ok()) return s;

  if (opt_.metrics) opt_.metrics->Counter("pagekey.archive.archived_total", 1);
  LOG_INFO << "Archived " << file_name_;
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// ArchiveScanJob
// ---------------------------------------------------------------------------

ArchiveScanJob::ArchiveScanJob(FilePageStore* store, JobQueueCoordinator* coordinator,
                               std::string extension, const Options& opt)
    : store_(store), coordinator_(coordinator), extension_(std::move(extension)), opt_(opt) {}

rocksdb::Status ArchiveScanJob::Execute() {
  if (!store_) return rocksdb::Status::InvalidArgument("store is null");
  if (!coordinator_) return rocksdb::Status::InvalidArgument("coordinator is null");

  files_found_ = 0;
  jobs_enqueued_ = 0;

  std::vector<std::string> names;
  rocksdb::Status s = store_->ListArtifacts(extension_, &names);
  if (!s.ok()) return s;
  files_found_ = static_cast<int>(names.size());

  for (const std::string& name : names) {
    s = coordinator_->EnqueueJob(std::make_shared<ArchiveJob>(store_, name, opt_));
    if (!s.ok()) {
      return rocksdb::Status::Incomplete("could not schedule archive of " + name, s.ToString());
    }
    jobs_enqueued_++;
  }

  LOG_INFO << "Archive scan found " << names.size() << " " << extension_ << " files";
  return rocksdb::Status::OK();
}

}  // namespace pagekey
