#pragma once

#include <pagekey/migration.hpp>
#include <pagekey/options.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace pagekey {

/**
 * An ordered collection of content migrations applied to one document.
 *
 * The collection is fixed at construction. ApplyMigrations runs each
 * migration whose supported formats include the document's current format
 * and whose AppliesTo accepts the document, in construction order.
 *
 * Thread-safe: ApplyMigrations is const and migrations are stateless.
 */
class MigrationPipeline {
 public:
  explicit MigrationPipeline(std::vector<std::unique_ptr<Migration>> migrations,
                             std::shared_ptr<MetricsSink> metrics = nullptr);

  MigrationPipeline(MigrationPipeline&&) = default;
  MigrationPipeline& operator=(MigrationPipeline&&) = default;
  MigrationPipeline(const MigrationPipeline&) = delete;
  MigrationPipeline& operator=(const MigrationPipeline&) = delete;

  /** Dotted-key merge followed by table spacing. */
  static MigrationPipeline Default();

  /**
   * The default pipeline plus the optional migrations enabled in `opt`:
   * YAML conversion first, identifier and inventory.container munging after
   * the dotted-key merge, table spacing always last.
   */
  static MigrationPipeline FromOptions(const Options& opt);

  /**
   * Migrate `content`.
   *
   * Documents without recognized frontmatter are returned unchanged. If any
   * migration fails, `out` receives the original content and the status is
   * Aborted("migration <name> failed: <cause>").
   */
  rocksdb::Status ApplyMigrations(std::string_view content, std::string* out) const;

  std::vector<std::string> MigrationNames() const;

 private:
  std::vector<std::unique_ptr<Migration>> migrations_;
  std::shared_ptr<MetricsSink> metrics_;
};

}  // namespace pagekey
