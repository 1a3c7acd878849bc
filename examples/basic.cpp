#include <pagekey/identifier.hpp>
#include <pagekey/job_queue.hpp>
#include <pagekey/page_key.hpp>
#include <pagekey/page_reader.hpp>
#include <pagekey/page_store.hpp>
#include <pagekey/pipeline.hpp>
#include <pagekey/reconcile.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

int main() {
  pagekey::Options opt;
  std::unique_ptr<pagekey::FilePageStore> store;

  auto s = pagekey::FilePageStore::Open("./pagekey_pages", &store, opt);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  std::string id;
  s = pagekey::NormalizeIdentifier("Lab Wallbins L3", &id);
  if (!s.ok()) {
    std::cerr << "Normalize failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "canonical=" << id << "\n";

  // A page saved before identifiers were canonical, with old-style frontmatter.
  s = store->WriteRaw(pagekey::StorageKeyFor("Lab Wallbins L3"),
                      "+++\ntitle = \"Wallbins\"\nlocation.room = \"L3\"\n+++\nShelf map.\n");
  if (!s.ok()) std::cerr << "Write failed: " << s.ToString() << "\n";

  // Reads find the legacy copy and migrate its frontmatter.
  const auto pipeline = pagekey::MigrationPipeline::Default();
  pagekey::PageReader reader(store.get(), &pipeline, opt);
  pagekey::Page page;
  s = reader.ReadPage("Lab Wallbins L3", &page);
  if (!s.ok()) {
    std::cerr << "Read failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << page.content;

  // The sweep moves it to its canonical key.
  pagekey::JobQueueCoordinator coordinator(opt);
  pagekey::ReconcileScanJob scan(store.get(), &coordinator, opt);
  s = scan.Execute();
  if (s.ok()) s = coordinator.WaitForIdle(std::chrono::seconds(10));
  if (!s.ok()) std::cerr << "Sweep failed: " << s.ToString() << "\n";
  coordinator.Shutdown();

  std::string content;
  s = store->ReadRaw(pagekey::StorageKeyFor(id), &content);
  if (!s.ok()) {
    std::cerr << "Canonical read failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "moved to " << id << "\n";
  return 0;
}
