#pragma once

#include "common/thread_pool.hpp"
#include "domain/job_queue.hpp"

#include <condition_variable>
#include <mutex>

namespace hls_media {

// In-process queue: jobs run on a common::ThreadPool in the same process.
// A failed job is retried on the same thread until max_attempts is reached.
class ThreadPoolJobQueue : public JobQueue {
public:
  ThreadPoolJobQueue(unsigned int worker_threads, unsigned int max_attempts);
  ~ThreadPoolJobQueue() override;

  // Must be called before the first enqueue.
  void start(JobHandler handler);
  // Finishes queued jobs, then refuses new ones.
  void stop();

  std::expected<void, std::string> enqueue(std::string_view job_name, std::int64_t asset_id) override;

  // Blocks until every accepted job has finished (or given up).
  void waitIdle();
  size_t failedCount() const;

private:
  void runWithRetries(Job job);

  common::ThreadPool pool_;
  unsigned int max_attempts_;
  JobHandler handler_;

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  size_t in_flight_{0};
  size_t failed_{0};
  bool stopped_{false};
};

} // namespace hls_media
