#pragma once

#include <pagekey/options.hpp>

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace pagekey {

/**
 * Raw page storage addressed by storage key (see StorageKeyFor).
 *
 * Implementations must be safe for concurrent use.
 */
class PageStore {
 public:
  virtual ~PageStore() = default;

  /** NotFound if no page is stored under `key`. */
  virtual rocksdb::Status ReadRaw(std::string_view key, std::string* out) const = 0;

  /** Create or replace the page stored under `key`. */
  virtual rocksdb::Status WriteRaw(std::string_view key, std::string_view bytes) = 0;

  /**
   * Move the page under `key` into a timestamped, recoverable holding area.
   * An earlier soft delete of the same key in the same second is never
   * overwritten. NotFound if no page is stored under `key`.
   */
  virtual rocksdb::Status SoftDelete(std::string_view key) = 0;

  /** All live storage keys, sorted. */
  virtual rocksdb::Status ListKeys(std::vector<std::string>* out) const = 0;
};

/**
 * Pages as `<data_dir>/<key>.md` files.
 *
 * Writes go to a temporary file that is renamed into place. Soft-deleted
 * pages move to `<data_dir>/<deleted_area_name>/<unix seconds>/<key>.md`,
 * or `<key>_<n>.md` if that name is taken.
 *
 * Other files in the directory (sidecars written by older wiki versions)
 * are artifacts: never listed as pages, but can be listed and archived into
 * the same holding area.
 */
class FilePageStore final : public PageStore {
 public:
  /** Open (creating if missing) the page directory. */
  static rocksdb::Status Open(const std::string& data_dir, std::unique_ptr<FilePageStore>* out,
                              const Options& opt = Options{});

  rocksdb::Status ReadRaw(std::string_view key, std::string* out) const override;
  rocksdb::Status WriteRaw(std::string_view key, std::string_view bytes) override;
  rocksdb::Status SoftDelete(std::string_view key) override;
  rocksdb::Status ListKeys(std::vector<std::string>* out) const override;

  /**
   * File names in the data directory ending in `extension` (e.g. ".json"),
   * sorted. Hidden files, directories and pages are skipped.
   */
  rocksdb::Status ListArtifacts(std::string_view extension, std::vector<std::string>* out) const;

  /**
   * Move the artifact `file_name` into the holding area under the same
   * collision rules as SoftDelete. NotFound if it does not exist.
   */
  rocksdb::Status ArchiveArtifact(std::string_view file_name);

  const std::filesystem::path& data_dir() const { return data_dir_; }

 private:
  FilePageStore(std::filesystem::path data_dir, const Options& opt);

  rocksdb::Status ValidateKey(std::string_view key) const;
  rocksdb::Status ValidateArtifact(std::string_view file_name) const;
  std::filesystem::path PathFor(std::string_view key) const;

  // Caller holds mu_ exclusively
  rocksdb::Status MoveToHoldingArea(const std::filesystem::path& path, const std::string& stem,
                                    const std::string& extension);

  const std::filesystem::path data_dir_;
  const Options opt_;

  // Shared for reads and listing, exclusive for writes and moves
  mutable std::shared_mutex mu_;
};

}  // namespace pagekey
