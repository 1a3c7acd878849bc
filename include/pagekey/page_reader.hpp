#pragma once

#include <pagekey/options.hpp>
#include <pagekey/page_store.hpp>
#include <pagekey/pipeline.hpp>

#include <string>
#include <string_view>

#include <rocksdb/status.h>

namespace pagekey {

/** A page as served to readers. */
struct Page {
  std::string identifier;   // canonical form of the requested identifier
  std::string storage_key;  // key the content was read from
  std::string content;      // migrated content (original if migration failed)
  bool migrated = false;    // content differs from the stored bytes
  bool written_back = false;
};

/**
 * Read path with rolling migrations.
 *
 * Every read runs the stored bytes through the pipeline and persists the
 * migrated form, so pages converge on the current format as they are used.
 * Neither the store nor the pipeline is owned.
 */
class PageReader {
 public:
  PageReader(PageStore* store, const MigrationPipeline* pipeline, const Options& opt = Options());

  /**
   * Read the page for `identifier`, preferring its canonical key and falling
   * back to the key of the identifier as given.
   *
   * A failed migration serves the stored content; a failed write-back is
   * logged and the migrated content is still served.
   * NotFound if neither key holds a page.
   */
  rocksdb::Status ReadPage(std::string_view identifier, Page* out) const;

  /**
   * Migrate `content`, point its embedded identifier field (if it has one) at
   * the canonical identifier, and store it under the canonical key.
   */
  rocksdb::Status WritePage(std::string_view identifier, std::string_view content) const;

 private:
  PageStore* store_;
  const MigrationPipeline* pipeline_;
  Options opt_;
};

}  // namespace pagekey
