// Unit tests for pagekey/rocks_page_store.hpp
// Tests: RocksPageStore open/close, reads and writes, transactional soft delete, listing

#include <gtest/gtest.h>

#include <pagekey/rocks_page_store.hpp>
#include <pagekey/test_utils.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace pagekey {
namespace {

// =============================================================================
// Test Fixture
// =============================================================================

class RocksPageStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() / ("pagekey_test_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_);
    db_path_ = (test_dir_ / "pages_db").string();
  }

  void TearDown() override {
    // Close store before cleanup
    store_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  rocksdb::Status OpenStore(const Options& opt = Options{}) {
    return RocksPageStore::Open(db_path_, &store_, opt);
  }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  std::filesystem::path test_dir_;
  std::string db_path_;
  std::unique_ptr<RocksPageStore> store_;
};

// =============================================================================
// Open/Close Tests
// =============================================================================

TEST_F(RocksPageStoreTest, OpenCreatesNewDatabase) {
  ASSERT_TRUE(OpenStore().ok());
  EXPECT_TRUE(std::filesystem::exists(db_path_));
}

TEST_F(RocksPageStoreTest, PagesSurviveReopen) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->WriteRaw("K", "v").ok());
  ASSERT_TRUE(store_->WriteRaw("D", "gone").ok());
  ASSERT_TRUE(store_->SoftDelete("D").ok());
  store_->Close();

  ASSERT_TRUE(OpenStore().ok());
  std::string out;
  ASSERT_TRUE(store_->ReadRaw("K", &out).ok());
  EXPECT_EQ(out, "v");
  std::vector<std::string> deleted;
  ASSERT_TRUE(store_->ListDeletedKeys(&deleted).ok());
  EXPECT_EQ(deleted.size(), 1u);
}

TEST_F(RocksPageStoreTest, OpenWithNullOutput) {
  EXPECT_TRUE(RocksPageStore::Open(db_path_, nullptr).IsInvalidArgument());
  EXPECT_TRUE(RocksPageStore::Open("", &store_).IsInvalidArgument());
}

TEST_F(RocksPageStoreTest, CloseIsIdempotent) {
  ASSERT_TRUE(OpenStore().ok());
  store_->Close();
  store_->Close();
}

TEST_F(RocksPageStoreTest, OperationsAfterClose) {
  ASSERT_TRUE(OpenStore().ok());
  store_->Close();

  std::string out;
  std::vector<std::string> keys;
  EXPECT_FALSE(store_->ReadRaw("K", &out).ok());
  EXPECT_FALSE(store_->WriteRaw("K", "v").ok());
  EXPECT_FALSE(store_->SoftDelete("K").ok());
  EXPECT_FALSE(store_->ListKeys(&keys).ok());
}

// =============================================================================
// Read / Write Tests
// =============================================================================

TEST_F(RocksPageStoreTest, WriteReadOverwrite) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->WriteRaw("K", "one").ok());
  ASSERT_TRUE(store_->WriteRaw("K", "two").ok());

  std::string out;
  ASSERT_TRUE(store_->ReadRaw("K", &out).ok());
  EXPECT_EQ(out, "two");
}

TEST_F(RocksPageStoreTest, ReadMissingIsNotFound) {
  ASSERT_TRUE(OpenStore().ok());
  std::string out;
  EXPECT_TRUE(store_->ReadRaw("K", &out).IsNotFound());
  EXPECT_TRUE(store_->ReadRaw("K", nullptr).IsInvalidArgument());
  EXPECT_TRUE(store_->ReadRaw("", &out).IsInvalidArgument());
}

TEST_F(RocksPageStoreTest, BinaryValue) {
  ASSERT_TRUE(OpenStore().ok());
  const std::string binary("\0\x01\xff", 3);
  ASSERT_TRUE(store_->WriteRaw("K", binary).ok());
  std::string out;
  ASSERT_TRUE(store_->ReadRaw("K", &out).ok());
  EXPECT_EQ(out, binary);
}

// =============================================================================
// Soft delete Tests
// =============================================================================

TEST_F(RocksPageStoreTest, SoftDeleteMovesThePage) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->WriteRaw("K", "content").ok());
  ASSERT_TRUE(store_->SoftDelete("K").ok());

  std::string out;
  EXPECT_TRUE(store_->ReadRaw("K", &out).IsNotFound());

  std::vector<std::string> keys;
  ASSERT_TRUE(store_->ListKeys(&keys).ok());
  EXPECT_TRUE(keys.empty());

  std::vector<std::string> deleted;
  ASSERT_TRUE(store_->ListDeletedKeys(&deleted).ok());
  ASSERT_EQ(deleted.size(), 1u);
  const size_t slash = deleted[0].find('/');
  ASSERT_NE(slash, std::string::npos);
  EXPECT_EQ(deleted[0].substr(slash + 1), "K");
}

TEST_F(RocksPageStoreTest, SoftDeletesInOneSecondGetSuffixes) {
  ASSERT_TRUE(OpenStore().ok());
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(store_->WriteRaw("K", "v" + std::to_string(i)).ok());
    ASSERT_TRUE(store_->SoftDelete("K").ok());
  }

  std::vector<std::string> deleted;
  ASSERT_TRUE(store_->ListDeletedKeys(&deleted).ok());
  EXPECT_EQ(deleted.size(), 3u);
}

TEST_F(RocksPageStoreTest, SoftDeleteMissingIsNotFound) {
  ASSERT_TRUE(OpenStore().ok());
  EXPECT_TRUE(store_->SoftDelete("K").IsNotFound());
}

TEST_F(RocksPageStoreTest, ConcurrentSoftDeletesMoveEachPageOnce) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->WriteRaw("K", "content").ok());

  std::atomic<int> moved{0};
  std::atomic<int> missing{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      rocksdb::Status s = store_->SoftDelete("K");
      if (s.ok()) moved++;
      if (s.IsNotFound()) missing++;
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(moved.load(), 1);
  EXPECT_EQ(missing.load(), 3);
  std::vector<std::string> deleted;
  ASSERT_TRUE(store_->ListDeletedKeys(&deleted).ok());
  EXPECT_EQ(deleted.size(), 1u);
}

TEST_F(RocksPageStoreTest, SoftDeleteEmitsMetrics) {
  auto metrics = std::make_shared<pagekey::testing::RecordingMetrics>();
  Options opt;
  opt.metrics = metrics;
  ASSERT_TRUE(OpenStore(opt).ok());

  ASSERT_TRUE(store_->WriteRaw("K", "x").ok());
  ASSERT_TRUE(store_->SoftDelete("K").ok());
  EXPECT_EQ(metrics->counter("pagekey.store.write_total"), 1u);
  EXPECT_EQ(metrics->counter("pagekey.store.soft_delete_total"), 1u);
  EXPECT_EQ(metrics->samples("pagekey.store.soft_delete_latency_us"), 1u);
  EXPECT_EQ(metrics->samples("pagekey.store.soft_delete_attempts"), 1u);
}

// =============================================================================
// Listing Tests
// =============================================================================

TEST_F(RocksPageStoreTest, ListKeysIsSorted) {
  ASSERT_TRUE(OpenStore().ok());
  for (const char* key : {"ZZ", "AA", "MM"}) ASSERT_TRUE(store_->WriteRaw(key, "x").ok());

  std::vector<std::string> keys;
  ASSERT_TRUE(store_->ListKeys(&keys).ok());
  EXPECT_EQ(keys, (std::vector<std::string>{"AA", "MM", "ZZ"}));
  EXPECT_TRUE(store_->ListKeys(nullptr).IsInvalidArgument());
}

}  // namespace
}  // namespace pagekey
