// Unit tests for pagekey/yaml.hpp
// Tests: frontmatter splitting, block and flow collections, scalars, rejections

#include <gtest/gtest.h>

#include <pagekey/yaml.hpp>

#include <string>

#include <json/value.h>

namespace pagekey {
namespace {

Json::Value Parse(const std::string& text) {
  Json::Value out;
  rocksdb::Status s = ParseYaml(text, &out);
  EXPECT_TRUE(s.ok()) << s.ToString();
  return out;
}

// =============================================================================
// Frontmatter splitting
// =============================================================================

class SplitYamlTest : public ::testing::Test {};

TEST_F(SplitYamlTest, ExcludesDelimiterLines) {
  YamlParts parts;
  ASSERT_TRUE(SplitYamlFrontmatter("---\ntitle: x\n---\nbody\n", &parts).ok());
  EXPECT_EQ(parts.frontmatter, "title: x\n");
  EXPECT_EQ(parts.body, "body\n");
}

TEST_F(SplitYamlTest, EmptyFrontmatter) {
  YamlParts parts;
  ASSERT_TRUE(SplitYamlFrontmatter("---\n---\nbody", &parts).ok());
  EXPECT_TRUE(parts.frontmatter.empty());
  EXPECT_EQ(parts.body, "body");
}

TEST_F(SplitYamlTest, AcceptsCrLf) {
  YamlParts parts;
  ASSERT_TRUE(SplitYamlFrontmatter("---\r\na: 1\r\n---\r\nbody", &parts).ok());
  EXPECT_EQ(parts.frontmatter, "a: 1\r\n");
  EXPECT_EQ(parts.body, "body");
}

TEST_F(SplitYamlTest, DashesInsideALineDoNotClose) {
  YamlParts parts;
  ASSERT_TRUE(SplitYamlFrontmatter("---\nrule: ---x\n---\n", &parts).ok());
  EXPECT_EQ(parts.frontmatter, "rule: ---x\n");
  EXPECT_TRUE(parts.body.empty());
}

TEST_F(SplitYamlTest, RejectsMalformedDelimiters) {
  YamlParts parts;
  EXPECT_TRUE(SplitYamlFrontmatter("---\na: 1\n", &parts).IsInvalidArgument());
  EXPECT_TRUE(SplitYamlFrontmatter("--- \na: 1\n---\n", &parts).IsInvalidArgument());
  EXPECT_TRUE(SplitYamlFrontmatter("a: 1\n---\n", &parts).IsInvalidArgument());
  EXPECT_TRUE(SplitYamlFrontmatter("---\n---\n", nullptr).IsInvalidArgument());
}

// =============================================================================
// Block collections
// =============================================================================

class YamlBlockTest : public ::testing::Test {};

TEST_F(YamlBlockTest, NestedMappingsAndSequences) {
  const Json::Value v = Parse("title: Hello\ntags:\n  - a\n  - b\nmeta:\n  author: Ann\n");
  ASSERT_TRUE(v.isObject());
  EXPECT_EQ(v["title"].asString(), "Hello");
  ASSERT_TRUE(v["tags"].isArray());
  ASSERT_EQ(v["tags"].size(), 2u);
  EXPECT_EQ(v["tags"][0].asString(), "a");
  EXPECT_EQ(v["tags"][1].asString(), "b");
  EXPECT_EQ(v["meta"]["author"].asString(), "Ann");
}

TEST_F(YamlBlockTest, SequenceAtTheKeysIndentation) {
  const Json::Value v = Parse("tags:\n- a\n- b\nnext: 1\n");
  ASSERT_EQ(v["tags"].size(), 2u);
  EXPECT_EQ(v["next"].asInt(), 1);
}

TEST_F(YamlBlockTest, SequenceOfMappings) {
  const Json::Value v = Parse("items:\n  - name: x\n    qty: 2\n  - name: y\n");
  ASSERT_EQ(v["items"].size(), 2u);
  EXPECT_EQ(v["items"][0]["name"].asString(), "x");
  EXPECT_EQ(v["items"][0]["qty"].asInt(), 2);
  EXPECT_EQ(v["items"][1]["name"].asString(), "y");
}

TEST_F(YamlBlockTest, EmptyValuesAreNull) {
  const Json::Value v = Parse("a:\nb: ~\n");
  EXPECT_TRUE(v["a"].isNull());
  EXPECT_TRUE(v["b"].isNull());
  EXPECT_TRUE(Parse("").isNull());
}

TEST_F(YamlBlockTest, CommentsAndDocumentMarkersAreSkipped) {
  const Json::Value v = Parse("---\n# header\na: b # note\nc: 'x # y'\nd: b#c\n");
  EXPECT_EQ(v["a"].asString(), "b");
  EXPECT_EQ(v["c"].asString(), "x # y");
  EXPECT_EQ(v["d"].asString(), "b#c");
}

TEST_F(YamlBlockTest, QuotedKeys) {
  const Json::Value v = Parse("\"my key\": v\n'other': w\n");
  EXPECT_EQ(v["my key"].asString(), "v");
  EXPECT_EQ(v["other"].asString(), "w");
}

// =============================================================================
// Scalars
// =============================================================================

class YamlScalarTest : public ::testing::Test {};

TEST_F(YamlScalarTest, PlainScalarsResolveToTypes) {
  const Json::Value v = Parse("a: yes\nb: off\nc: 0x1F\nd: -7\ne: 1_000\nf: 1.5\ng: '12'\nh: text\n");
  EXPECT_TRUE(v["a"].isBool());
  EXPECT_TRUE(v["a"].asBool());
  EXPECT_FALSE(v["b"].asBool());
  EXPECT_EQ(v["c"].asInt64(), 31);
  EXPECT_EQ(v["d"].asInt64(), -7);
  EXPECT_EQ(v["e"].asInt64(), 1000);
  EXPECT_DOUBLE_EQ(v["f"].asDouble(), 1.5);
  EXPECT_TRUE(v["g"].isString());
  EXPECT_EQ(v["g"].asString(), "12");
  EXPECT_EQ(v["h"].asString(), "text");
}

TEST_F(YamlScalarTest, DoubleQuotedEscapes) {
  const Json::Value v = Parse("a: \"tab\\there\\u00e9\"\nb: 'it''s'\n");
  EXPECT_EQ(v["a"].asString(), "tab\there\xC3\xA9");
  EXPECT_EQ(v["b"].asString(), "it's");
}

TEST_F(YamlScalarTest, PlainScalarsContinueOnIndentedLines) {
  const Json::Value v = Parse("a: one\n  two\nb: 1\n");
  EXPECT_EQ(v["a"].asString(), "one two");
}

TEST_F(YamlScalarTest, LiteralBlockScalars) {
  EXPECT_EQ(Parse("t: |\n  line1\n  line2\nn: 1\n")["t"].asString(), "line1\nline2\n");
  EXPECT_EQ(Parse("t: |-\n  line1\n  line2\n")["t"].asString(), "line1\nline2");
  EXPECT_EQ(Parse("t: |+\n  line1\n\n")["t"].asString(), "line1\n\n");
}

TEST_F(YamlScalarTest, FoldedBlockScalars) {
  EXPECT_EQ(Parse("t: >\n  a\n  b\n\n  c\n")["t"].asString(), "a b\nc\n");
}

// =============================================================================
// Flow collections
// =============================================================================

class YamlFlowTest : public ::testing::Test {};

TEST_F(YamlFlowTest, SequencesAndMappings) {
  const Json::Value v = Parse("tags: [a, 'b c', 3]\nmeta: {x: 1, y: [true]}\n");
  ASSERT_EQ(v["tags"].size(), 3u);
  EXPECT_EQ(v["tags"][0].asString(), "a");
  EXPECT_EQ(v["tags"][1].asString(), "b c");
  EXPECT_EQ(v["tags"][2].asInt(), 3);
  EXPECT_EQ(v["meta"]["x"].asInt(), 1);
  EXPECT_TRUE(v["meta"]["y"][0].asBool());
}

TEST_F(YamlFlowTest, FlowCollectionsMaySpanLines) {
  const Json::Value v = Parse("tags: [a,\n  b]\nnext: 1\n");
  ASSERT_EQ(v["tags"].size(), 2u);
  EXPECT_EQ(v["tags"][1].asString(), "b");
  EXPECT_EQ(v["next"].asInt(), 1);
}

TEST_F(YamlFlowTest, EmptyCollections) {
  const Json::Value v = Parse("a: []\nb: {}\n");
  EXPECT_TRUE(v["a"].isArray());
  EXPECT_EQ(v["a"].size(), 0u);
  EXPECT_TRUE(v["b"].isObject());
}

// =============================================================================
// Rejections
// =============================================================================

class YamlRejectTest : public ::testing::Test {};

TEST_F(YamlRejectTest, AnchorsAliasesAndTags) {
  Json::Value v;
  EXPECT_TRUE(ParseYaml("a: &x 1\n", &v).IsInvalidArgument());
  EXPECT_TRUE(ParseYaml("b: *x\n", &v).IsInvalidArgument());
  EXPECT_TRUE(ParseYaml("c: !!str 1\n", &v).IsInvalidArgument());
  EXPECT_TRUE(ParseYaml("<<: {a: 1}\n", &v).IsInvalidArgument());
}

TEST_F(YamlRejectTest, TabIndentation) {
  Json::Value v;
  EXPECT_TRUE(ParseYaml("a:\n\tb: 1\n", &v).IsInvalidArgument());
}

TEST_F(YamlRejectTest, DuplicateKeysReportTheLine) {
  Json::Value v;
  rocksdb::Status s = ParseYaml("a: 1\na: 2\n", &v);
  ASSERT_TRUE(s.IsInvalidArgument());
  EXPECT_NE(s.ToString().find("yaml: line 2"), std::string::npos) << s.ToString();
}

TEST_F(YamlRejectTest, InconsistentIndentation) {
  Json::Value v;
  EXPECT_TRUE(ParseYaml("a:\n    b: 1\n  c: 2\n", &v).IsInvalidArgument());
}

TEST_F(YamlRejectTest, UnterminatedQuotesAndFlows) {
  Json::Value v;
  EXPECT_TRUE(ParseYaml("a: \"open\n", &v).IsInvalidArgument());
  EXPECT_TRUE(ParseYaml("a: [1, 2\n", &v).IsInvalidArgument());
}

TEST_F(YamlRejectTest, NullOut) {
  EXPECT_TRUE(ParseYaml("a: 1", nullptr).IsInvalidArgument());
}

}  // namespace
}  // namespace pagekey
