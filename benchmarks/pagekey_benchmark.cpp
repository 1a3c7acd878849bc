// Performance benchmarks for pagekey
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: CPU-bound operations (normalization, key encoding, migrations)
//    - No I/O
// 2. MACROBENCHMARKS: store operations and the reconciliation sweep
//    - Full file store operations with I/O
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use state.PauseTiming()/ResumeTiming() for necessary setup

#include <benchmark/benchmark.h>

#include <pagekey/identifier.hpp>
#include <pagekey/job_queue.hpp>
#include <pagekey/page_key.hpp>
#include <pagekey/page_store.hpp>
#include <pagekey/pipeline.hpp>
#include <pagekey/reconcile.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace {

// =============================================================================
// Helpers
// =============================================================================

std::string RandomSuffix() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

std::vector<std::string> MakeIdentifiers(size_t n) {
  static const char* kWords[] = {"Lab", "wallbins", "L3", "Été", "Straße", "MyPage", "x-ray",
                                 "UNIT", "ÅngströM", "bin"};
  std::mt19937 gen(42);
  std::uniform_int_distribution<size_t> pick(0, 9);
  std::vector<std::string> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    out.push_back(std::string(kWords[pick(gen)]) + " " + kWords[pick(gen)] + " " +
                  std::to_string(i));
  }
  return out;
}

std::string MakeTomlPage(int tables) {
  std::string page = "+++\ntitle = \"Bench\"\n";
  for (int i = 0; i < tables; ++i) {
    page += "t" + std::to_string(i) + ".a = 1\n";
    page += "t" + std::to_string(i) + ".b = \"two\"\n";
  }
  page += "+++\n# Body\n\nSome text.\n";
  return page;
}

std::string MakeYamlPage(int keys) {
  std::string page = "---\ntitle: Bench\ntags:\n  - a\n  - b\nmeta:\n";
  for (int i = 0; i < keys; ++i) page += "  k" + std::to_string(i) + ": " + std::to_string(i) + "\n";
  page += "---\nBody\n";
  return page;
}

// =============================================================================
// MICROBENCHMARKS
// =============================================================================

void BM_NormalizeIdentifier(benchmark::State& state) {
  const auto ids = MakeIdentifiers(1024);
  size_t i = 0;
  std::string out;
  for (auto _ : state) {
    rocksdb::Status s = pagekey::NormalizeIdentifier(ids[i++ % ids.size()], &out);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(out);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_NormalizeIdentifier);

void BM_StorageKeyRoundTrip(benchmark::State& state) {
  const auto ids = MakeIdentifiers(1024);
  size_t i = 0;
  std::string back;
  for (auto _ : state) {
    const std::string key = pagekey::StorageKeyFor(ids[i++ % ids.size()]);
    rocksdb::Status s = pagekey::IdentifierFromStorageKey(key, &back);
    benchmark::DoNotOptimize(s);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_StorageKeyRoundTrip);

void BM_DefaultPipeline(benchmark::State& state) {
  const auto pipeline = pagekey::MigrationPipeline::Default();
  const std::string page = MakeTomlPage(static_cast<int>(state.range(0)));
  std::string out;
  for (auto _ : state) {
    rocksdb::Status s = pipeline.ApplyMigrations(page, &out);
    benchmark::DoNotOptimize(s);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(page.size()));
}
BENCHMARK(BM_DefaultPipeline)->Arg(1)->Arg(16)->Arg(128);

void BM_YamlConversion(benchmark::State& state) {
  pagekey::Options opt;
  opt.convert_yaml_frontmatter = true;
  const auto pipeline = pagekey::MigrationPipeline::FromOptions(opt);
  const std::string page = MakeYamlPage(static_cast<int>(state.range(0)));
  std::string out;
  for (auto _ : state) {
    rocksdb::Status s = pipeline.ApplyMigrations(page, &out);
    benchmark::DoNotOptimize(s);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(page.size()));
}
BENCHMARK(BM_YamlConversion)->Arg(4)->Arg(64);

// =============================================================================
// MACROBENCHMARKS
// =============================================================================

class FileStoreBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State&) override {
    test_dir_ = std::filesystem::temp_directory_path() / ("pagekey_bench_" + RandomSuffix());
    rocksdb::Status s = pagekey::FilePageStore::Open(test_dir_.string(), &store_);
    if (!s.ok()) store_.reset();
  }

  void TearDown(const benchmark::State&) override {
    store_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  std::filesystem::path test_dir_;
  std::unique_ptr<pagekey::FilePageStore> store_;
};

BENCHMARK_DEFINE_F(FileStoreBenchmark, WriteRead)(benchmark::State& state) {
  if (!store_) {
    state.SkipWithError("store open failed");
    return;
  }
  const std::string page = MakeTomlPage(4);
  int i = 0;
  std::string out;
  for (auto _ : state) {
    const std::string key = pagekey::StorageKeyFor("page_" + std::to_string(i++ % 256));
    rocksdb::Status s = store_->WriteRaw(key, page);
    if (s.ok()) s = store_->ReadRaw(key, &out);
    if (!s.ok()) {
      state.SkipWithError(s.ToString().c_str());
      return;
    }
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(FileStoreBenchmark, WriteRead);

BENCHMARK_DEFINE_F(FileStoreBenchmark, ReconcileSweep)(benchmark::State& state) {
  if (!store_) {
    state.SkipWithError("store open failed");
    return;
  }
  const int pages = static_cast<int>(state.range(0));
  for (auto _ : state) {
    state.PauseTiming();
    for (int i = 0; i < pages; ++i) {
      const std::string id = "Legacy Page " + std::to_string(i);
      rocksdb::Status s = store_->WriteRaw(pagekey::StorageKeyFor(id), "+++\ntitle = \"x\"\n+++\n");
      if (!s.ok()) {
        state.SkipWithError(s.ToString().c_str());
        return;
      }
    }
    state.ResumeTiming();

    pagekey::JobQueueCoordinator coordinator;
    pagekey::ReconcileScanJob scan(store_.get(), &coordinator);
    rocksdb::Status s = scan.Execute();
    if (s.ok()) s = coordinator.WaitForIdle(std::chrono::seconds(60));
    coordinator.Shutdown();
    if (!s.ok()) {
      state.SkipWithError(s.ToString().c_str());
      return;
    }
  }
  state.SetItemsProcessed(state.iterations() * pages);
}
BENCHMARK_REGISTER_F(FileStoreBenchmark, ReconcileSweep)->Arg(64)->Unit(benchmark::kMillisecond);

}  // namespace

BENCHMARK_MAIN();
