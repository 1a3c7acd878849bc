#include <pagekey/job_queue.hpp>

#include <pagekey/internal.hpp>

#include <deque>
#include <exception>
#include <thread>
#include <utility>

#include <trantor/utils/Logger.h>

namespace pagekey {

namespace {

inline void EmitCounter(const Options& opt, std::string_view name, uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

inline void EmitHistogram(const Options& opt, std::string_view name, uint64_t value) {
  if (opt.metrics) opt.metrics->Histogram(name, value);
}

inline void EmitGauge(const Options& opt, std::string_view name, double value) {
  if (opt.metrics) opt.metrics->Gauge(name, value);
}

// ---------------------------------------------------------------------------
// WorkerDispatcher
// ---------------------------------------------------------------------------

class WorkerDispatcher final : public Dispatcher {
 public:
  WorkerDispatcher(std::string queue_name, size_t capacity)
      : queue_name_(std::move(queue_name)), capacity_(capacity) {
    worker_ = std::thread([this] { Run(); });
  }

  ~WorkerDispatcher() override { Stop(); }

  rocksdb::Status Dispatch(std::function<void()> task) override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopping_) return rocksdb::Status::Aborted("dispatcher stopped", queue_name_);
      if (capacity_ > 0 && pending_.size() >= capacity_) {
        return rocksdb::Status::Busy("queue saturated", queue_name_);
      }
      pending_.push_back(std::move(task));
    }
    cv_.notify_one();
    return rocksdb::Status::OK();
  }

  void Stop() override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stopping_ = true;
    }
    cv_.notify_all();

    std::lock_guard<std::mutex> join_lock(join_mu_);
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    }
  }

 private:
  void Run() {
    while (true) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
        // Drain what was accepted before stopping
        if (pending_.empty()) return;
        task = std::move(pending_.front());
        pending_.pop_front();
      }
      task();
    }
  }

  const std::string queue_name_;
  const size_t capacity_;

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> pending_;
  bool stopping_ = false;

  std::mutex join_mu_;
  std::thread worker_;
};

}  // namespace

std::unique_ptr<Dispatcher> NewWorkerDispatcher(const std::string& queue_name,
                                                const Options& opt) {
  return std::make_unique<WorkerDispatcher>(queue_name, opt.queue_capacity);
}

// ---------------------------------------------------------------------------
// JobQueueCoordinator
// ---------------------------------------------------------------------------

JobQueueCoordinator::JobQueueCoordinator(const Options& opt, DispatcherFactory factory)
    : opt_(opt), factory_(std::move(factory)) {
  if (!factory_) factory_ = NewWorkerDispatcher;
}

JobQueueCoordinator::~JobQueueCoordinator() { Shutdown(); }

rocksdb::Status JobQueueCoordinator::EnqueueJob(std::shared_ptr<Job> job) {
  return EnqueueJobWithCompletion(std::move(job), nullptr);
}

rocksdb::Status JobQueueCoordinator::EnqueueJobWithCompletion(std::shared_ptr<Job> job,
                                                              CompletionHandler on_complete) {
  if (!job) return rocksdb::Status::InvalidArgument("job is null");

  const std::string name = job->GetName();
  Dispatcher* dispatcher = nullptr;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_) return rocksdb::Status::Aborted("coordinator is shut down", name);

    auto it = queues_.find(name);
    if (it == queues_.end()) {
      Queue queue;
      queue.dispatcher = factory_(name, opt_);
      if (!queue.dispatcher) {
        return rocksdb::Status::Aborted("dispatcher factory returned null", name);
      }
      queue.stats.queue_name = name;
      it = queues_.emplace(name, std::move(queue)).first;
    }

    QueueStats& stats = it->second.stats;
    stats.jobs_remaining++;
    if (stats.jobs_remaining > stats.high_water_mark) {
      stats.high_water_mark = stats.jobs_remaining;
    }
    if (!stats.is_active) {
      stats.is_active = true;
      active_queues_++;
    }
    dispatcher = it->second.dispatcher.get();
  }

  // Dispatch outside the lock: a dispatcher may run the task inline
  rocksdb::Status s = dispatcher->Dispatch(
      [this, job, handler = std::move(on_complete)] { RunJob(job, handler); });

  if (!s.ok()) {
    MarkFinished(name);
    EmitCounter(opt_, "pagekey.jobs.rejected_total");
    LOG_WARN << "Job " << name << " was not enqueued: " << s.ToString();
    return s;
  }

  EmitCounter(opt_, "pagekey.jobs.enqueued_total");
  return rocksdb::Status::OK();
}

void JobQueueCoordinator::RunJob(const std::shared_ptr<Job>& job,
                                 const CompletionHandler& on_complete) {
  const std::string name = job->GetName();
  const uint64_t start_us = internal::NowMicros();

  rocksdb::Status s;
  try {
    s = job->Execute();
  } catch (const std::exception& e) {
    s = rocksdb::Status::Aborted("job threw an exception", e.what());
  }

  EmitHistogram(opt_, "pagekey.jobs.latency_us", internal::NowMicros() - start_us);
  if (!s.ok()) {
    EmitCounter(opt_, "pagekey.jobs.failed_total");
    LOG_ERROR << "Job " << name << " failed: " << s.ToString();
  } else {
    LOG_DEBUG << "Job " << name << " completed";
  }

  if (on_complete) {
    try {
      on_complete(JobCompletion{name, s});
    } catch (const std::exception& e) {
      LOG_ERROR << "Completion handler of job " << name << " threw: " << e.what();
    }
  }

  MarkFinished(name);
}

void JobQueueCoordinator::MarkFinished(const std::string& queue_name) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = queues_.find(queue_name);
  if (it == queues_.end()) return;

  QueueStats& stats = it->second.stats;
  if (stats.jobs_remaining > 0) stats.jobs_remaining--;
  if (stats.jobs_remaining == 0 && stats.is_active) {
    stats.is_active = false;
    stats.high_water_mark = 0;
    active_queues_--;
    EmitGauge(opt_, "pagekey.jobs.active_queues", static_cast<double>(active_queues_));
    if (active_queues_ == 0) idle_cv_.notify_all();
  }
}

rocksdb::Status JobQueueCoordinator::GetQueueStats(const std::string& queue_name,
                                                   QueueStats* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::lock_guard<std::mutex> lock(mu_);
  auto it = queues_.find(queue_name);
  if (it == queues_.end()) return rocksdb::Status::NotFound("no such queue", queue_name);
  *out = it->second.stats;
  return rocksdb::Status::OK();
}

std::vector<QueueStats> JobQueueCoordinator::GetActiveQueues() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<QueueStats> active;
  for (const auto& [name, queue] : queues_) {
    if (queue.stats.is_active) active.push_back(queue.stats);
  }
  return active;
}

JobProgress JobQueueCoordinator::GetJobProgress() const {
  std::lock_guard<std::mutex> lock(mu_);
  JobProgress progress;
  for (const auto& [name, queue] : queues_) {
    if (queue.stats.is_active) progress.queue_stats.push_back(queue.stats);
  }
  progress.total_active = active_queues_;
  progress.total_queues = static_cast<int>(queues_.size());
  progress.is_running = active_queues_ > 0;
  return progress;
}

rocksdb::Status JobQueueCoordinator::WaitForIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  if (!idle_cv_.wait_for(lock, timeout, [this] { return active_queues_ == 0; })) {
    return rocksdb::Status::TimedOut("job queues still active",
                                     std::to_string(active_queues_));
  }
  return rocksdb::Status::OK();
}

void JobQueueCoordinator::Shutdown() {
  std::vector<Dispatcher*> dispatchers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutdown_) return;
    shutdown_ = true;
    for (auto& [name, queue] : queues_) dispatchers.push_back(queue.dispatcher.get());
  }

  // Drains accepted jobs; their completion handlers may still call in
  for (Dispatcher* d : dispatchers) d->Stop();
}

bool JobQueueCoordinator::IsShutdown() const {
  std::lock_guard<std::mutex> lock(mu_);
  return shutdown_;
}

}  // namespace pagekey
