#pragma once

#include <pagekey/frontmatter.hpp>

#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace pagekey {

/**
 * A content-level migration of one stored document.
 *
 * Migrations are stateless. The pipeline only calls AppliesTo and Apply for
 * documents whose detected format is listed by SupportedFormats, and only
 * calls Apply when AppliesTo returned true.
 */
class Migration {
 public:
  virtual ~Migration() = default;

  /** Short stable name used in errors and logs. */
  virtual std::string Name() const = 0;

  virtual std::vector<FrontmatterFormat> SupportedFormats() const = 0;

  /** True if Apply would change the document. */
  virtual bool AppliesTo(std::string_view content) const = 0;

  /**
   * Transform the document. On failure `out` is left untouched and the
   * returned status describes the cause.
   */
  virtual rocksdb::Status Apply(std::string_view content, std::string* out) const = 0;
};

// ---------------------------------------------------------------------------
// Format conversion
// ---------------------------------------------------------------------------

/** Converts "---" YAML frontmatter into "+++" TOML frontmatter. */
class YamlToTomlMigration final : public Migration {
 public:
  std::string Name() const override { return "yaml_to_toml"; }
  std::vector<FrontmatterFormat> SupportedFormats() const override;
  bool AppliesTo(std::string_view content) const override;
  rocksdb::Status Apply(std::string_view content, std::string* out) const override;
};

// ---------------------------------------------------------------------------
// Structural normalization
// ---------------------------------------------------------------------------

/**
 * Moves dotted-key assignments (`a.b.c = v`) into `[a.b]` tables.
 *
 * Ungrouped root lines keep their order at the top; tables follow in sorted
 * order, each with its moved assignments first and its existing lines after.
 * An existing line wins over a moved assignment of the same key. Frontmatter
 * with arrays of tables is left alone.
 */
class TomlDottedKeyMigration final : public Migration {
 public:
  std::string Name() const override { return "toml_dotted_keys"; }
  std::vector<FrontmatterFormat> SupportedFormats() const override;
  bool AppliesTo(std::string_view content) const override;
  rocksdb::Status Apply(std::string_view content, std::string* out) const override;
};

/** Inserts one blank line before every table header that directly follows content. */
class TomlTableSpacingMigration final : public Migration {
 public:
  std::string Name() const override { return "toml_table_spacing"; }
  std::vector<FrontmatterFormat> SupportedFormats() const override;
  bool AppliesTo(std::string_view content) const override;
  rocksdb::Status Apply(std::string_view content, std::string* out) const override;
};

// ---------------------------------------------------------------------------
// Field-level identifier munging
// ---------------------------------------------------------------------------

/** Normalizes the root `identifier` string of TOML frontmatter in place. */
class IdentifierFieldMigration final : public Migration {
 public:
  std::string Name() const override { return "identifier_field"; }
  std::vector<FrontmatterFormat> SupportedFormats() const override;
  bool AppliesTo(std::string_view content) const override;
  rocksdb::Status Apply(std::string_view content, std::string* out) const override;
};

/** Normalizes `inventory.container` of TOML frontmatter in place. */
class InventoryContainerMigration final : public Migration {
 public:
  std::string Name() const override { return "inventory_container"; }
  std::vector<FrontmatterFormat> SupportedFormats() const override;
  bool AppliesTo(std::string_view content) const override;
  rocksdb::Status Apply(std::string_view content, std::string* out) const override;
};

}  // namespace pagekey
