#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <vector>

namespace pagekey {

class JobQueueCoordinator;
class RocksPageStore;

/**
 * Stops a pagekey process in a safe order.
 *
 * A sweep registers its coordinator and store, installs the signal handlers
 * and polls IsShutdownRequested() while waiting for the queues. SIGTERM,
 * SIGINT and SIGHUP only record the signal; the polling thread then calls
 * Shutdown(), which drains the coordinators before any store is closed and
 * runs the callbacks last.
 *
 * Thread-safe.
 */
class ShutdownHandler {
 public:
  ShutdownHandler();
  ~ShutdownHandler();

  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /** Registered objects must outlive Shutdown() or be unregistered first. */
  void RegisterCoordinator(JobQueueCoordinator* coordinator);
  void UnregisterCoordinator(JobQueueCoordinator* coordinator);
  void RegisterStore(RocksPageStore* store);
  void UnregisterStore(RocksPageStore* store);

  /** Runs after coordinators and stores, in registration order. */
  void OnShutdown(std::function<void()> callback);

  /**
   * Route SIGTERM, SIGINT and SIGHUP to this handler. Process-wide; the
   * previous dispositions are kept for RestoreSignalHandlers().
   * @return false if sigaction failed (nothing is left installed)
   */
  bool InstallSignalHandlers();
  void RestoreSignalHandlers();

  /** First call does the work and returns true; later calls return false. */
  bool Shutdown();

  bool IsShutdownRequested() const;

 private:
  static void SignalHandler(int signum);

  std::mutex mutex_;
  std::vector<JobQueueCoordinator*> coordinators_;
  std::vector<RocksPageStore*> stores_;
  std::vector<std::function<void()>> callbacks_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> shutdown_complete_{false};
  bool handlers_installed_ = false;

  struct sigaction prev_term_;
  struct sigaction prev_int_;
  struct sigaction prev_hup_;
};

}  // namespace pagekey
