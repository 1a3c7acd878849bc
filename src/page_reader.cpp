#include <pagekey/page_reader.hpp>

#include <pagekey/frontmatter.hpp>
#include <pagekey/identifier.hpp>
#include <pagekey/page_key.hpp>

#include <utility>

#include <trantor/utils/Logger.h>

namespace pagekey {

PageReader::PageReader(PageStore* store, const MigrationPipeline* pipeline, const Options& opt)
    : store_(store), pipeline_(pipeline), opt_(opt) {}

rocksdb::Status PageReader::ReadPage(std::string_view identifier, Page* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (!store_ || !pipeline_) return rocksdb::Status::InvalidArgument("reader is not wired");

  std::string canonical;
  rocksdb::Status s = NormalizeIdentifier(identifier, &canonical);
  if (!s.ok()) return s;

  // Canonical key first, then the identifier exactly as requested
  std::string key = StorageKeyFor(canonical);
  std::string raw;
  s = store_->ReadRaw(key, &raw);
  if (s.IsNotFound()) {
    const std::string fallback = StorageKeyFor(identifier);
    if (fallback != key) {
      key = fallback;
      s = store_->ReadRaw(key, &raw);
    }
  }
  if (s.IsNotFound()) {
    return rocksdb::Status::NotFound("no page for identifier", std::string(identifier));
  }
  if (!s.ok()) return s;

  Page page;
  page.identifier = std::move(canonical);
  page.storage_key = key;

  std::string migrated;
  s = pipeline_->ApplyMigrations(raw, &migrated);
  if (!s.ok()) {
    LOG_WARN << "Serving unmigrated page " << page.identifier << ": " << s.ToString();
    page.content = std::move(raw);
    *out = std::move(page);
    return rocksdb::Status::OK();
  }

  if (migrated != raw) {
    page.migrated = true;
    s = store_->WriteRaw(key, migrated);
    if (s.ok()) {
      page.written_back = true;
      LOG_DEBUG << "Migrated page " << page.identifier << " in place";
    } else {
      LOG_WARN << "Could not write back migrated page " << page.identifier << ": "
               << s.ToString();
    }
  }

  page.content = std::move(migrated);
  *out = std::move(page);
  return rocksdb::Status::OK();
}

rocksdb::Status PageReader::WritePage(std::string_view identifier,
                                      std::string_view content) const {
  if (!store_ || !pipeline_) return rocksdb::Status::InvalidArgument("reader is not wired");

  std::string canonical;
  rocksdb::Status s = NormalizeIdentifier(identifier, &canonical);
  if (!s.ok()) return s;

  std::string migrated;
  s = pipeline_->ApplyMigrations(content, &migrated);
  if (!s.ok()) return s;

  // The page must declare the identifier it is stored under
  std::string stored;
  s = RewriteEmbeddedIdentifier(migrated, canonical, &stored);
  if (!s.ok()) return s;

  return store_->WriteRaw(StorageKeyFor(canonical), stored);
}

}  // namespace pagekey
