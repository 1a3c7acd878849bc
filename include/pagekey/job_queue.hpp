#pragma once

#include <pagekey/options.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <rocksdb/status.h>

namespace pagekey {

/** A unit of background work. Its name selects (and lazily creates) its queue. */
class Job {
 public:
  virtual ~Job() = default;
  virtual rocksdb::Status Execute() = 0;
  virtual std::string GetName() const = 0;
};

/** Counters of one named queue. */
struct QueueStats {
  std::string queue_name;
  int jobs_remaining = 0;
  // Deepest backlog of the current burst; 0 whenever the queue drains.
  int high_water_mark = 0;
  bool is_active = false;
};

/** Snapshot across all queues. */
struct JobProgress {
  bool is_running = false;
  std::vector<QueueStats> queue_stats;  // active queues only
  int total_active = 0;
  int total_queues = 0;
};

/** Delivered on the job's worker after Execute() returns. */
struct JobCompletion {
  std::string job_name;
  rocksdb::Status status;
};

using CompletionHandler = std::function<void(const JobCompletion&)>;

/**
 * Executes tasks for one queue strictly one at a time, in submission order.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  /**
   * Submit a task. Returns Busy if the dispatcher cannot take more work, or
   * Aborted after Stop(). The task is not run when an error is returned.
   */
  virtual rocksdb::Status Dispatch(std::function<void()> task) = 0;

  /** Finish queued tasks, then release the worker. Idempotent. */
  virtual void Stop() = 0;
};

using DispatcherFactory =
    std::function<std::unique_ptr<Dispatcher>(const std::string& queue_name, const Options& opt)>;

/**
 * The default dispatcher: one std::thread draining a bounded FIFO of
 * `Options::queue_capacity` pending tasks.
 */
std::unique_ptr<Dispatcher> NewWorkerDispatcher(const std::string& queue_name,
                                                const Options& opt);

/**
 * Runs jobs on named single-worker queues and keeps per-queue counters.
 *
 * Queues with different names run concurrently; jobs in one queue run in
 * enqueue order. One mutex guards all bookkeeping and is never held while a
 * job executes. A failing job is logged and reported to its completion
 * handler; it is not retried and does not affect other jobs.
 *
 * Thread-safe.
 */
class JobQueueCoordinator {
 public:
  explicit JobQueueCoordinator(const Options& opt = Options(),
                               DispatcherFactory factory = NewWorkerDispatcher);
  ~JobQueueCoordinator();

  JobQueueCoordinator(const JobQueueCoordinator&) = delete;
  JobQueueCoordinator& operator=(const JobQueueCoordinator&) = delete;

  /**
   * Submit a job to the queue named after it.
   * @return OK once queued; Busy if the queue is saturated (counters are
   *         rolled back); Aborted after Shutdown(); InvalidArgument for null.
   */
  rocksdb::Status EnqueueJob(std::shared_ptr<Job> job);

  /**
   * Like EnqueueJob, and runs `on_complete` on the same worker once the job
   * has finished, before the queue's counters are released. The handler may
   * enqueue follow-up jobs.
   */
  rocksdb::Status EnqueueJobWithCompletion(std::shared_ptr<Job> job,
                                           CompletionHandler on_complete);

  /** NotFound if no job with that name was ever enqueued. */
  rocksdb::Status GetQueueStats(const std::string& queue_name, QueueStats* out) const;

  /** Stats of every queue with pending or running jobs. */
  std::vector<QueueStats> GetActiveQueues() const;

  JobProgress GetJobProgress() const;

  /**
   * Block until no queue is active or `timeout` elapses.
   * Returns TimedOut on timeout.
   */
  rocksdb::Status WaitForIdle(std::chrono::milliseconds timeout);

  /** Stop accepting jobs, drain every queue and join the workers. Idempotent. */
  void Shutdown();

  bool IsShutdown() const;

 private:
  struct Queue {
    std::unique_ptr<Dispatcher> dispatcher;
    QueueStats stats;
  };

  void RunJob(const std::shared_ptr<Job>& job, const CompletionHandler& on_complete);
  void MarkFinished(const std::string& queue_name);

  Options opt_;
  DispatcherFactory factory_;

  mutable std::mutex mu_;
  std::condition_variable idle_cv_;
  std::map<std::string, Queue> queues_;
  int active_queues_ = 0;
  bool shutdown_ = false;
};

}  // namespace pagekey
