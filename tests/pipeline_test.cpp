// Unit tests for pagekey/pipeline.hpp
// Tests: migration ordering, format re-detection, idempotence, failure handling, metrics

#include <gtest/gtest.h>

#include <pagekey/pipeline.hpp>
#include <pagekey/test_utils.hpp>

#include <memory>
#include <string>
#include <vector>

namespace pagekey {
namespace {

using pagekey::testing::RecordingMetrics;

/** Fails on every document it sees. */
class FailingMigration : public Migration {
 public:
  std::string Name() const override { return "always_fails"; }
  std::vector<FrontmatterFormat> SupportedFormats() const override {
    return {FrontmatterFormat::kTOML};
  }
  bool AppliesTo(std::string_view) const override { return true; }
  rocksdb::Status Apply(std::string_view, std::string*) const override {
    return rocksdb::Status::Corruption("bad page");
  }
};

/** Appends a marker line to the body; counts its calls. */
class AppendMigration : public Migration {
 public:
  explicit AppendMigration(int* calls) : calls_(calls) {}
  std::string Name() const override { return "append"; }
  std::vector<FrontmatterFormat> SupportedFormats() const override {
    return {FrontmatterFormat::kTOML};
  }
  bool AppliesTo(std::string_view content) const override {
    return content.find("[appended]") == std::string_view::npos;
  }
  rocksdb::Status Apply(std::string_view content, std::string* out) const override {
    ++*calls_;
    *out = std::string(content) + "[appended]";
    return rocksdb::Status::OK();
  }

 private:
  int* calls_;
};

std::string Migrate(const MigrationPipeline& pipeline, const std::string& in) {
  std::string out;
  rocksdb::Status s = pipeline.ApplyMigrations(in, &out);
  EXPECT_TRUE(s.ok()) << s.ToString();
  return out;
}

// =============================================================================
// Construction
// =============================================================================

class PipelineTest : public ::testing::Test {};

TEST_F(PipelineTest, DefaultRunsDottedKeysThenSpacing) {
  EXPECT_EQ(MigrationPipeline::Default().MigrationNames(),
            (std::vector<std::string>{"toml_dotted_keys", "toml_table_spacing"}));
}

TEST_F(PipelineTest, OptionalMigrationsKeepTheirOrder) {
  Options opt;
  opt.convert_yaml_frontmatter = true;
  opt.munge_identifier_field = true;
  opt.munge_inventory_container = true;
  EXPECT_EQ(MigrationPipeline::FromOptions(opt).MigrationNames(),
            (std::vector<std::string>{"yaml_to_toml", "toml_dotted_keys", "identifier_field",
                                      "inventory_container", "toml_table_spacing"}));
}

// =============================================================================
// Behavior
// =============================================================================

TEST_F(PipelineTest, MergesAndSpacesDottedKeys) {
  EXPECT_EQ(Migrate(MigrationPipeline::Default(), "+++\ntitle = \"T\"\na.b = 1\n+++\nbody\n"),
            "+++\ntitle = \"T\"\n\n[a]\nb = 1\n+++\nbody\n");
}

TEST_F(PipelineTest, DocumentsWithoutFrontmatterPassThrough) {
  const auto pipeline = MigrationPipeline::Default();
  EXPECT_EQ(Migrate(pipeline, "# Just markdown\n"), "# Just markdown\n");
  EXPECT_EQ(Migrate(pipeline, ""), "");
}

TEST_F(PipelineTest, YamlIsLeftAloneUnlessConversionIsEnabled) {
  const std::string in = "---\ntitle: Hello\n---\nBody\n";
  EXPECT_EQ(Migrate(MigrationPipeline::Default(), in), in);

  Options opt;
  opt.convert_yaml_frontmatter = true;
  EXPECT_EQ(Migrate(MigrationPipeline::FromOptions(opt), in), "+++\ntitle = \"Hello\"\n+++\nBody\n");
}

TEST_F(PipelineTest, TomlMigrationsSeeConvertedYaml) {
  Options opt;
  opt.convert_yaml_frontmatter = true;
  opt.munge_identifier_field = true;
  const std::string in = "---\nidentifier: MyPage\nmeta:\n  author: Ann\n---\nBody\n";
  EXPECT_EQ(Migrate(MigrationPipeline::FromOptions(opt), in),
            "+++\nidentifier = \"my_page\"\n\n[meta]\nauthor = \"Ann\"\n+++\nBody\n");
}

TEST_F(PipelineTest, InventoryContainerIsMungedAfterTheMerge) {
  Options opt;
  opt.munge_inventory_container = true;
  const std::string in =
      "+++\ntitle = \"T\"\ninventory.container = \"Box A\"\n[inventory]\nitems = []\n+++\n";
  EXPECT_EQ(Migrate(MigrationPipeline::FromOptions(opt), in),
            "+++\ntitle = \"T\"\n\n[inventory]\ncontainer = \"box_a\"\nitems = []\n+++\n");
}

TEST_F(PipelineTest, MigratingTwiceChangesNothing) {
  Options opt;
  opt.convert_yaml_frontmatter = true;
  opt.munge_identifier_field = true;
  opt.munge_inventory_container = true;
  const auto pipeline = MigrationPipeline::FromOptions(opt);

  const std::vector<std::string> docs = {
      "+++\ninventory.container = \"X\"\n\n[inventory]\nitems = []\n+++\nbody\n",
      "---\ntitle: Hello\ntags:\n  - a\n  - b\nmeta:\n  author: Ann\n---\nBody\n",
      "+++\nidentifier = \"SomePage\"\na.b.c = 1\n[x]\ny = 2\n+++\n",
      "{\"identifier\": \"x\"}",
  };
  for (const auto& doc : docs) {
    const std::string once = Migrate(pipeline, doc);
    EXPECT_EQ(Migrate(pipeline, once), once) << doc;
  }
}

TEST_F(PipelineTest, MigrationsThatDoNotApplyAreSkipped) {
  int calls = 0;
  std::vector<std::unique_ptr<Migration>> migrations;
  migrations.push_back(std::make_unique<AppendMigration>(&calls));
  migrations.push_back(std::make_unique<AppendMigration>(&calls));
  MigrationPipeline pipeline(std::move(migrations));

  EXPECT_EQ(Migrate(pipeline, "+++\na = 1\n+++\n"), "+++\na = 1\n+++\n[appended]");
  EXPECT_EQ(calls, 1);

  // Unsupported format
  EXPECT_EQ(Migrate(pipeline, "---\na: 1\n---\n"), "---\na: 1\n---\n");
  EXPECT_EQ(calls, 1);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(PipelineTest, FailureAbortsAndReturnsTheOriginal) {
  int calls = 0;
  std::vector<std::unique_ptr<Migration>> migrations;
  migrations.push_back(std::make_unique<AppendMigration>(&calls));
  migrations.push_back(std::make_unique<FailingMigration>());
  MigrationPipeline pipeline(std::move(migrations));

  const std::string in = "+++\na = 1\n+++\nbody";
  std::string out;
  rocksdb::Status s = pipeline.ApplyMigrations(in, &out);
  ASSERT_TRUE(s.IsAborted()) << s.ToString();
  EXPECT_NE(s.ToString().find("migration always_fails failed"), std::string::npos);
  EXPECT_NE(s.ToString().find("bad page"), std::string::npos);
  EXPECT_EQ(out, in);
  EXPECT_EQ(calls, 1);
}

TEST_F(PipelineTest, BrokenYamlAbortsConversion) {
  Options opt;
  opt.convert_yaml_frontmatter = true;
  const std::string in = "---\na: *alias\n---\nbody";
  std::string out;
  rocksdb::Status s = MigrationPipeline::FromOptions(opt).ApplyMigrations(in, &out);
  ASSERT_TRUE(s.IsAborted());
  EXPECT_NE(s.ToString().find("yaml_to_toml"), std::string::npos);
  EXPECT_EQ(out, in);
}

TEST_F(PipelineTest, NullOutIsRejected) {
  EXPECT_TRUE(MigrationPipeline::Default().ApplyMigrations("x", nullptr).IsInvalidArgument());
}

// =============================================================================
// Metrics
// =============================================================================

TEST_F(PipelineTest, ReportsMigratedFailedAndLatency) {
  auto metrics = std::make_shared<RecordingMetrics>();
  Options opt;
  opt.metrics = metrics;
  const auto pipeline = MigrationPipeline::FromOptions(opt);

  Migrate(pipeline, "+++\na.b = 1\n+++\n");
  Migrate(pipeline, "+++\nc = 1\n+++\n");
  EXPECT_EQ(metrics->counter("pagekey.pipeline.migrated_total"), 1u);
  EXPECT_EQ(metrics->samples("pagekey.pipeline.latency_us"), 2u);

  std::vector<std::unique_ptr<Migration>> failing;
  failing.push_back(std::make_unique<FailingMigration>());
  MigrationPipeline broken(std::move(failing), metrics);
  std::string out;
  EXPECT_TRUE(broken.ApplyMigrations("+++\na = 1\n+++\n", &out).IsAborted());
  EXPECT_EQ(metrics->counter("pagekey.pipeline.failed_total"), 1u);
}

}  // namespace
}  // namespace pagekey
