#include <pagekey/shutdown.hpp>

#include <pagekey/job_queue.hpp>
#include <pagekey/rocks_page_store.hpp>

#include <algorithm>
#include <thread>
#include <utility>

namespace pagekey {

namespace {
// Set from signal context
std::atomic<int> g_pending_signal{0};
static_assert(std::atomic<int>::is_always_lock_free, "signal flag must be lock-free");

template <typename T>
void AddUnique(std::vector<T*>* items, T* item) {
  if (std::find(items->begin(), items->end(), item) == items->end()) items->push_back(item);
}

template <typename T>
void Remove(std::vector<T*>* items, T* item) {
  items->erase(std::remove(items->begin(), items->end(), item), items->end());
}
}  // namespace

ShutdownHandler::ShutdownHandler() { g_pending_signal.store(0); }

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
  Shutdown();
}

void ShutdownHandler::RegisterCoordinator(JobQueueCoordinator* coordinator) {
  if (!coordinator) return;
  std::lock_guard<std::mutex> lock(mutex_);
  AddUnique(&coordinators_, coordinator);
}

void ShutdownHandler::UnregisterCoordinator(JobQueueCoordinator* coordinator) {
  if (!coordinator) return;
  std::lock_guard<std::mutex> lock(mutex_);
  Remove(&coordinators_, coordinator);
}

void ShutdownHandler::RegisterStore(RocksPageStore* store) {
  if (!store) return;
  std::lock_guard<std::mutex> lock(mutex_);
  AddUnique(&stores_, store);
}

void ShutdownHandler::UnregisterStore(RocksPageStore* store) {
  if (!store) return;
  std::lock_guard<std::mutex> lock(mutex_);
  Remove(&stores_, store);
}

void ShutdownHandler::SignalHandler(int signum) { g_pending_signal.store(signum); }

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_installed_) return true;

  struct sigaction sa;
  sa.sa_handler = SignalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;

  const int signals[] = {SIGTERM, SIGINT, SIGHUP};
  struct sigaction* previous[] = {&prev_term_, &prev_int_, &prev_hup_};
  for (int i = 0; i < 3; ++i) {
    if (sigaction(signals[i], &sa, previous[i]) != 0) {
      // Undo the ones already installed
      for (int j = i - 1; j >= 0; --j) sigaction(signals[j], previous[j], nullptr);
      return false;
    }
  }

  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!handlers_installed_) return;

  sigaction(SIGTERM, &prev_term_, nullptr);
  sigaction(SIGINT, &prev_int_, nullptr);
  sigaction(SIGHUP, &prev_hup_, nullptr);
  handlers_installed_ = false;
}

bool ShutdownHandler::Shutdown() {
  bool expected = false;
  if (!shutdown_requested_.compare_exchange_strong(expected, true)) {
    // Already shutting down, wait for completion
    while (!shutdown_complete_.load()) {
      std::this_thread::yield();
    }
    return false;
  }

  // Copy under lock to avoid holding it while workers drain
  std::vector<JobQueueCoordinator*> coordinators;
  std::vector<RocksPageStore*> stores;
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    coordinators.swap(coordinators_);
    stores.swap(stores_);
    callbacks = callbacks_;
  }

  for (JobQueueCoordinator* coordinator : coordinators) coordinator->Shutdown();
  for (RocksPageStore* store : stores) store->Close();

  for (const auto& callback : callbacks) {
    if (callback) {
      callback();
    }
  }

  shutdown_complete_.store(true);
  return true;
}

bool ShutdownHandler::IsShutdownRequested() const {
  return shutdown_requested_.load() || g_pending_signal.load() != 0;
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

}  // namespace pagekey
