// Unit tests for pagekey/page_store.hpp
// Tests: FilePageStore reads, atomic writes, soft delete into the holding area, listing,
// artifact archiving

#include <gtest/gtest.h>

#include <pagekey/page_store.hpp>
#include <pagekey/test_utils.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace pagekey {
namespace {

namespace fs = std::filesystem;

// =============================================================================
// Test Fixture
// =============================================================================

class FilePageStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() / ("pagekey_test_" + RandomSuffix());
    data_dir_ = test_dir_ / "pages";
  }

  void TearDown() override {
    store_.reset();
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  rocksdb::Status OpenStore(const Options& opt = Options{}) {
    return FilePageStore::Open(data_dir_.string(), &store_, opt);
  }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  static std::string ReadFile(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  }

  static void WriteFile(const fs::path& p, const std::string& bytes) {
    std::ofstream f(p, std::ios::binary);
    f << bytes;
  }

  // Every file under the holding area, relative to it
  std::vector<std::string> HeldFiles(const std::string& area = "__deleted__") {
    std::vector<std::string> out;
    const fs::path root = data_dir_ / area;
    if (!fs::exists(root)) return out;
    for (const auto& e : fs::recursive_directory_iterator(root)) {
      if (e.is_regular_file()) out.push_back(fs::relative(e.path(), root).generic_string());
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  fs::path test_dir_;
  fs::path data_dir_;
  std::unique_ptr<FilePageStore> store_;
};

// =============================================================================
// Open
// =============================================================================

TEST_F(FilePageStoreTest, OpenCreatesTheDirectory) {
  ASSERT_TRUE(OpenStore().ok());
  EXPECT_TRUE(fs::is_directory(data_dir_));
  EXPECT_EQ(store_->data_dir(), data_dir_);
}

TEST_F(FilePageStoreTest, OpenRejectsBadArguments) {
  EXPECT_TRUE(FilePageStore::Open(data_dir_.string(), nullptr).IsInvalidArgument());
  EXPECT_TRUE(FilePageStore::Open("", &store_).IsInvalidArgument());

  fs::create_directories(test_dir_);
  WriteFile(test_dir_ / "file", "x");
  EXPECT_FALSE(FilePageStore::Open((test_dir_ / "file").string(), &store_).ok());
}

// =============================================================================
// Read / Write
// =============================================================================

TEST_F(FilePageStoreTest, WriteThenRead) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->WriteRaw("MZXW6===", "+++\na = 1\n+++\nbody").ok());

  std::string out;
  ASSERT_TRUE(store_->ReadRaw("MZXW6===", &out).ok());
  EXPECT_EQ(out, "+++\na = 1\n+++\nbody");
  EXPECT_EQ(ReadFile(data_dir_ / "MZXW6===.md"), out);
}

TEST_F(FilePageStoreTest, WriteReplacesAndLeavesNoTempFiles) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->WriteRaw("K", "old").ok());
  ASSERT_TRUE(store_->WriteRaw("K", "new").ok());

  std::string out;
  ASSERT_TRUE(store_->ReadRaw("K", &out).ok());
  EXPECT_EQ(out, "new");

  size_t files = 0;
  for (const auto& e : fs::directory_iterator(data_dir_)) {
    (void)e;
    ++files;
  }
  EXPECT_EQ(files, 1u);
}

TEST_F(FilePageStoreTest, BinaryAndEmptyContent) {
  ASSERT_TRUE(OpenStore().ok());
  const std::string binary("a\0b\xff", 4);
  ASSERT_TRUE(store_->WriteRaw("B", binary).ok());
  ASSERT_TRUE(store_->WriteRaw("E", "").ok());

  std::string out;
  ASSERT_TRUE(store_->ReadRaw("B", &out).ok());
  EXPECT_EQ(out, binary);
  ASSERT_TRUE(store_->ReadRaw("E", &out).ok());
  EXPECT_TRUE(out.empty());
}

TEST_F(FilePageStoreTest, ReadMissingIsNotFound) {
  ASSERT_TRUE(OpenStore().ok());
  std::string out;
  EXPECT_TRUE(store_->ReadRaw("MISSING", &out).IsNotFound());
  EXPECT_TRUE(store_->ReadRaw("MISSING", nullptr).IsInvalidArgument());
}

TEST_F(FilePageStoreTest, KeysMustBePlainFileNames) {
  ASSERT_TRUE(OpenStore().ok());
  std::string out;
  for (const std::string key : {"", ".", "..", ".hidden", "a/b", "a\\b", "__deleted__"}) {
    EXPECT_TRUE(store_->WriteRaw(key, "x").IsInvalidArgument()) << key;
    EXPECT_TRUE(store_->ReadRaw(key, &out).IsInvalidArgument()) << key;
    EXPECT_TRUE(store_->SoftDelete(key).IsInvalidArgument()) << key;
  }
  EXPECT_TRUE(store_->WriteRaw(std::string("a\0b", 3), "x").IsInvalidArgument());
}

// =============================================================================
// Soft delete
// =============================================================================

TEST_F(FilePageStoreTest, SoftDeleteMovesIntoTheHoldingArea) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->WriteRaw("K", "content").ok());
  ASSERT_TRUE(store_->SoftDelete("K").ok());

  std::string out;
  EXPECT_TRUE(store_->ReadRaw("K", &out).IsNotFound());

  const auto held = HeldFiles();
  ASSERT_EQ(held.size(), 1u);
  // <seconds>/K.md
  const size_t slash = held[0].find('/');
  ASSERT_NE(slash, std::string::npos);
  EXPECT_EQ(held[0].substr(slash + 1), "K.md");
  EXPECT_EQ(held[0].substr(0, slash).find_first_not_of("0123456789"), std::string::npos);
  EXPECT_EQ(ReadFile(data_dir_ / "__deleted__" / held[0]), "content");
}

TEST_F(FilePageStoreTest, RepeatedSoftDeletesNeverOverwrite) {
  ASSERT_TRUE(OpenStore().ok());
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(store_->WriteRaw("K", "v" + std::to_string(i)).ok());
    ASSERT_TRUE(store_->SoftDelete("K").ok());
  }

  const auto held = HeldFiles();
  ASSERT_EQ(held.size(), 3u);
  std::vector<std::string> contents;
  for (const auto& h : held) contents.push_back(ReadFile(data_dir_ / "__deleted__" / h));
  std::sort(contents.begin(), contents.end());
  EXPECT_EQ(contents, (std::vector<std::string>{"v0", "v1", "v2"}));
}

TEST_F(FilePageStoreTest, SoftDeleteMissingIsNotFound) {
  ASSERT_TRUE(OpenStore().ok());
  EXPECT_TRUE(store_->SoftDelete("K").IsNotFound());
  EXPECT_TRUE(HeldFiles().empty());
}

TEST_F(FilePageStoreTest, HoldingAreaNameIsConfigurable) {
  Options opt;
  opt.deleted_area_name = "trash";
  ASSERT_TRUE(OpenStore(opt).ok());
  ASSERT_TRUE(store_->WriteRaw("K", "x").ok());
  ASSERT_TRUE(store_->SoftDelete("K").ok());
  EXPECT_EQ(HeldFiles("trash").size(), 1u);
  EXPECT_TRUE(store_->WriteRaw("trash", "x").IsInvalidArgument());
}

// =============================================================================
// Listing
// =============================================================================

TEST_F(FilePageStoreTest, ListKeysReturnsSortedPagesOnly) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->WriteRaw("ZZ", "1").ok());
  ASSERT_TRUE(store_->WriteRaw("AA", "2").ok());
  ASSERT_TRUE(store_->WriteRaw("MM", "3").ok());
  ASSERT_TRUE(store_->SoftDelete("MM").ok());
  WriteFile(data_dir_ / "notes.txt", "x");
  WriteFile(data_dir_ / ".AA.md.tmp-1", "x");
  fs::create_directories(data_dir_ / "dir.md");

  std::vector<std::string> keys;
  ASSERT_TRUE(store_->ListKeys(&keys).ok());
  EXPECT_EQ(keys, (std::vector<std::string>{"AA", "ZZ"}));
  EXPECT_TRUE(store_->ListKeys(nullptr).IsInvalidArgument());
}

// =============================================================================
// Artifacts
// =============================================================================

TEST_F(FilePageStoreTest, ListArtifactsMatchesOneExtension) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->WriteRaw("AA", "page").ok());
  WriteFile(data_dir_ / "b.json", "{}");
  WriteFile(data_dir_ / "a.json", "{}");
  WriteFile(data_dir_ / ".hidden.json", "{}");
  WriteFile(data_dir_ / "notes.txt", "x");
  fs::create_directories(data_dir_ / "dir.json");

  std::vector<std::string> names;
  ASSERT_TRUE(store_->ListArtifacts(".json", &names).ok());
  EXPECT_EQ(names, (std::vector<std::string>{"a.json", "b.json"}));

  ASSERT_TRUE(store_->ListArtifacts(".txt", &names).ok());
  EXPECT_EQ(names, (std::vector<std::string>{"notes.txt"}));
}

TEST_F(FilePageStoreTest, ListArtifactsRejectsBadExtensions) {
  ASSERT_TRUE(OpenStore().ok());
  std::vector<std::string> names;
  for (const std::string ext : {"", ".", "json", ".md"}) {
    EXPECT_TRUE(store_->ListArtifacts(ext, &names).IsInvalidArgument()) << ext;
  }
  EXPECT_TRUE(store_->ListArtifacts(".json", nullptr).IsInvalidArgument());
}

TEST_F(FilePageStoreTest, ArchiveArtifactMovesIntoTheHoldingArea) {
  ASSERT_TRUE(OpenStore().ok());
  WriteFile(data_dir_ / "page.json", "{\"a\":1}");

  ASSERT_TRUE(store_->ArchiveArtifact("page.json").ok());
  EXPECT_FALSE(fs::exists(data_dir_ / "page.json"));

  auto held = HeldFiles();
  ASSERT_EQ(held.size(), 1u);
  EXPECT_EQ(fs::path(held[0]).filename().string(), "page.json");
  EXPECT_EQ(ReadFile(data_dir_ / "__deleted__" / held[0]), "{\"a\":1}");

  WriteFile(data_dir_ / "page.json", "{\"a\":2}");
  ASSERT_TRUE(store_->ArchiveArtifact("page.json").ok());
  held = HeldFiles();
  ASSERT_EQ(held.size(), 2u);
}

TEST_F(FilePageStoreTest, ArchiveArtifactRejectsPagesAndMissingFiles) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->WriteRaw("AA", "page").ok());

  EXPECT_TRUE(store_->ArchiveArtifact("AA.md").IsInvalidArgument());
  EXPECT_TRUE(store_->ArchiveArtifact("../x.json").IsInvalidArgument());
  EXPECT_TRUE(store_->ArchiveArtifact("gone.json").IsNotFound());
  EXPECT_TRUE(fs::exists(data_dir_ / "AA.md"));
  EXPECT_TRUE(HeldFiles().empty());
}

TEST_F(FilePageStoreTest, ConcurrentWritersAndReaders) {
  ASSERT_TRUE(OpenStore().ok());

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, t] {
      for (int i = 0; i < 25; ++i) {
        const std::string key = "K" + std::to_string(t) + "X" + std::to_string(i);
        EXPECT_TRUE(store_->WriteRaw(key, key).ok());
        std::string out;
        EXPECT_TRUE(store_->ReadRaw(key, &out).ok());
        EXPECT_EQ(out, key);
      }
    });
  }
  for (auto& t : threads) t.join();

  std::vector<std::string> keys;
  ASSERT_TRUE(store_->ListKeys(&keys).ok());
  EXPECT_EQ(keys.size(), 100u);
}

TEST_F(FilePageStoreTest, EmitsMetrics) {
  auto metrics = std::make_shared<pagekey::testing::RecordingMetrics>();
  Options opt;
  opt.metrics = metrics;
  ASSERT_TRUE(OpenStore(opt).ok());

  ASSERT_TRUE(store_->WriteRaw("K", "x").ok());
  ASSERT_TRUE(store_->SoftDelete("K").ok());
  EXPECT_EQ(metrics->counter("pagekey.store.write_total"), 1u);
  EXPECT_EQ(metrics->counter("pagekey.store.soft_delete_total"), 1u);

  WriteFile(data_dir_ / "K.json", "{}");
  ASSERT_TRUE(store_->ArchiveArtifact("K.json").ok());
  EXPECT_EQ(metrics->counter("pagekey.store.archive_total"), 1u);
}

}  // namespace
}  // namespace pagekey
