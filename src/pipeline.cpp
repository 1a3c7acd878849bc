#include <pagekey/pipeline.hpp>

#include <pagekey/internal.hpp>

#include <algorithm>
#include <utility>

namespace pagekey {

MigrationPipeline::MigrationPipeline(std::vector<std::unique_ptr<Migration>> migrations,
                                     std::shared_ptr<MetricsSink> metrics)
    : migrations_(std::move(migrations)), metrics_(std::move(metrics)) {}

MigrationPipeline MigrationPipeline::Default() {
  return FromOptions(Options{});
}

MigrationPipeline MigrationPipeline::FromOptions(const Options& opt) {
  std::vector<std::unique_ptr<Migration>> migrations;
  if (opt.convert_yaml_frontmatter) {
    migrations.push_back(std::make_unique<YamlToTomlMigration>());
  }
  migrations.push_back(std::make_unique<TomlDottedKeyMigration>());
  if (opt.munge_identifier_field) {
    migrations.push_back(std::make_unique<IdentifierFieldMigration>());
  }
  if (opt.munge_inventory_container) {
    migrations.push_back(std::make_unique<InventoryContainerMigration>());
  }
  // Must run last so earlier rewrites cannot leave headers unspaced
  migrations.push_back(std::make_unique<TomlTableSpacingMigration>());
  return MigrationPipeline(std::move(migrations), opt.metrics);
}

rocksdb::Status MigrationPipeline::ApplyMigrations(std::string_view content,
                                                   std::string* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  if (DetectFrontmatterFormat(content) == FrontmatterFormat::kUnknown) {
    *out = std::string(content);
    return rocksdb::Status::OK();
  }

  const uint64_t start_us = internal::NowMicros();
  std::string current(content);

  for (const auto& migration : migrations_) {
    // A conversion earlier in the pipeline may have changed the format
    const FrontmatterFormat format = DetectFrontmatterFormat(current);
    const auto supported = migration->SupportedFormats();
    if (std::find(supported.begin(), supported.end(), format) == supported.end()) {
      continue;
    }
    if (!migration->AppliesTo(current)) continue;

    std::string next;
    rocksdb::Status s = migration->Apply(current, &next);
    if (!s.ok()) {
      if (metrics_) metrics_->Counter("pagekey.pipeline.failed_total", 1);
      *out = std::string(content);
      return rocksdb::Status::Aborted("migration " + migration->Name() + " failed",
                                      s.ToString());
    }
    current = std::move(next);
  }

  if (metrics_) {
    if (current != content) metrics_->Counter("pagekey.pipeline.migrated_total", 1);
    metrics_->Histogram("pagekey.pipeline.latency_us", internal::NowMicros() - start_us);
  }

  *out = std::move(current);
  return rocksdb::Status::OK();
}

std::vector<std::string> MigrationPipeline::MigrationNames() const {
  std::vector<std::string> names;
  names.reserve(migrations_.size());
  for (const auto& m : migrations_) names.push_back(m->Name());
  return names;
}

}  // namespace pagekey
