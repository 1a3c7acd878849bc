#include <pagekey/archive.hpp>
#include <pagekey/config.hpp>
#include <pagekey/identifier.hpp>
#include <pagekey/job_queue.hpp>
#include <pagekey/page_key.hpp>
#include <pagekey/page_reader.hpp>
#include <pagekey/pipeline.hpp>
#include <pagekey/reconcile.hpp>
#include <pagekey/rocks_page_store.hpp>
#include <pagekey/shutdown.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <trantor/utils/Logger.h>

namespace {

struct OpenedStore {
  std::unique_ptr<pagekey::PageStore> owner;
  pagekey::RocksPageStore* rocks = nullptr;  // set for the rocksdb backend
  pagekey::FilePageStore* files = nullptr;   // set for the file backend
};

rocksdb::Status OpenStore(const pagekey::Config& config, OpenedStore* out) {
  if (config.store_backend == "rocksdb") {
    std::unique_ptr<pagekey::RocksPageStore> db;
    rocksdb::Status s = pagekey::RocksPageStore::Open(config.data_dir, &db, config.options);
    if (!s.ok()) return s;
    out->rocks = db.get();
    out->owner = std::move(db);
    return s;
  }
  std::unique_ptr<pagekey::FilePageStore> files;
  rocksdb::Status s = pagekey::FilePageStore::Open(config.data_dir, &files, config.options);
  if (!s.ok()) return s;
  out->files = files.get();
  out->owner = std::move(files);
  return s;
}

int RunNormalize(const std::vector<std::string>& args) {
  if (args.size() < 2) return 2;
  int rc = 0;
  for (size_t i = 1; i < args.size(); ++i) {
    std::string canonical;
    rocksdb::Status s = pagekey::NormalizeIdentifier(args[i], &canonical);
    if (!s.ok()) {
      std::cerr << args[i] << ": " << s.ToString() << "\n";
      rc = 1;
      continue;
    }
    std::cout << canonical << "\n";
  }
  return rc;
}

int RunMigrate(const pagekey::Config& config) {
  if (config.positional.size() != 2) return 2;

  std::ifstream file(config.positional[1], std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "Cannot open " << config.positional[1] << "\n";
    return 1;
  }
  const std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

  auto pipeline = pagekey::MigrationPipeline::FromOptions(config.options);
  std::string migrated;
  rocksdb::Status s = pipeline.ApplyMigrations(content, &migrated);
  if (!s.ok()) {
    std::cerr << "Migration failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << migrated;
  return 0;
}

int RunKeys(pagekey::PageStore* store) {
  std::vector<std::string> keys;
  rocksdb::Status s = store->ListKeys(&keys);
  if (!s.ok()) {
    std::cerr << "ListKeys failed: " << s.ToString() << "\n";
    return 1;
  }
  for (const auto& key : keys) {
    std::string identifier;
    s = pagekey::IdentifierFromStorageKey(key, &identifier);
    std::cout << key << "\t" << (s.ok() ? identifier : "<" + s.ToString() + ">") << "\n";
  }
  return 0;
}

int RunRead(const pagekey::Config& config, pagekey::PageStore* store) {
  if (config.positional.size() != 2) return 2;

  auto pipeline = pagekey::MigrationPipeline::FromOptions(config.options);
  pagekey::PageReader reader(store, &pipeline, config.options);

  pagekey::Page page;
  rocksdb::Status s = reader.ReadPage(config.positional[1], &page);
  if (!s.ok()) {
    std::cerr << "Read failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << page.content;
  return 0;
}

int RunSweep(const pagekey::Config& config, const OpenedStore& store) {
  pagekey::JobQueueCoordinator coordinator(config.options);

  pagekey::ShutdownHandler shutdown;
  shutdown.RegisterCoordinator(&coordinator);
  if (store.rocks) shutdown.RegisterStore(store.rocks);
  if (!shutdown.InstallSignalHandlers()) {
    LOG_WARN << "Could not install signal handlers";
  }

  auto scan = std::make_shared<pagekey::ReconcileScanJob>(store.owner.get(), &coordinator,
                                                          config.options);
  rocksdb::Status s = coordinator.EnqueueJob(scan);
  if (!s.ok()) {
    std::cerr << "Could not start sweep: " << s.ToString() << "\n";
    return 1;
  }

  // Sidecar files only exist next to file-backed pages
  std::shared_ptr<pagekey::ArchiveScanJob> archive;
  if (store.files) {
    archive = std::make_shared<pagekey::ArchiveScanJob>(
        store.files, &coordinator, pagekey::kLegacySidecarExtension, config.options);
    s = coordinator.EnqueueJob(archive);
    if (!s.ok()) {
      std::cerr << "Could not start archive scan: " << s.ToString() << "\n";
      return 1;
    }
  }

  while (coordinator.WaitForIdle(std::chrono::milliseconds(250)).IsTimedOut()) {
    if (shutdown.IsShutdownRequested()) {
      std::cerr << "Interrupted, finishing queued jobs\n";
      break;
    }
    const pagekey::JobProgress progress = coordinator.GetJobProgress();
    LOG_INFO << "Sweep running: " << progress.total_active << " of " << progress.total_queues
             << " queues active";
  }
  shutdown.Shutdown();

  const pagekey::JobProgress progress = coordinator.GetJobProgress();
  std::cout << "scanned=" << scan->keys_scanned() << " scheduled=" << scan->jobs_enqueued();
  if (archive) std::cout << " archived=" << archive->jobs_enqueued();
  std::cout << " queues=" << progress.total_queues << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  pagekey::Config config;
  try {
    config = pagekey::Config::LoadFromArgs(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n" << pagekey::UsageText(argv[0]);
    return 2;
  }

  if (config.show_help || config.positional.empty()) {
    std::cerr << pagekey::UsageText(argv[0]);
    return config.show_help ? 0 : 2;
  }

  pagekey::ApplyLogLevel(config);

  const std::string cmd = config.positional[0];
  int rc = 2;
  if (cmd == "normalize") {
    rc = RunNormalize(config.positional);
  } else if (cmd == "migrate") {
    rc = RunMigrate(config);
  } else if (cmd == "keys" || cmd == "read" || cmd == "sweep") {
    try {
      config.Validate();
    } catch (const std::exception& e) {
      std::cerr << "Invalid configuration: " << e.what() << "\n";
      return 2;
    }

    OpenedStore store;
    rocksdb::Status s = OpenStore(config, &store);
    if (!s.ok()) {
      std::cerr << "Open failed: " << s.ToString() << "\n";
      return 1;
    }
    if (cmd == "keys") {
      rc = RunKeys(store.owner.get());
    } else if (cmd == "read") {
      rc = RunRead(config, store.owner.get());
    } else {
      rc = RunSweep(config, store);
    }
  }

  if (rc == 2) std::cerr << pagekey::UsageText(argv[0]);
  return rc;
}
