#pragma once

#include "domain/job_queue.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace hls_media {

// Producer: LPUSH <queue_key> <job json>
class RedisJobQueue : public JobQueue {
public:
  explicit RedisJobQueue(std::string queue_key);

  std::expected<void, std::string> enqueue(std::string_view job_name, std::int64_t asset_id) override;

  // Re-queues a job as-is (used by the worker for retries).
  std::expected<void, std::string> push(const Job& job);

private:
  std::string queue_key_;
};

// Consumer. Each job is moved to <queue_key>:processing while it runs and
// removed from there afterwards, so a crashed worker leaves it recoverable.
// Jobs that fail max_attempts times end up on <queue_key>:failed.
class RedisJobWorker {
public:
  struct Options {
    std::string queue_key;
    unsigned int threads{1};
    unsigned int max_attempts{3};
    std::chrono::seconds poll_timeout{5};
  };

  RedisJobWorker(Options options, JobHandler handler);
  ~RedisJobWorker();

  RedisJobWorker(const RedisJobWorker&) = delete;
  RedisJobWorker& operator=(const RedisJobWorker&) = delete;

  // Moves leftovers from :processing back onto the queue, then spawns threads.
  void start();
  // Threads exit after their current poll or job.
  void stop();

private:
  void loop();
  size_t recoverProcessing();
  void finish(const std::string& payload, const Job& job, bool succeeded);
  void pushFailed(const std::string& payload);
  void removeProcessing(const std::string& payload);

  Options options_;
  JobHandler handler_;
  RedisJobQueue requeue_;
  std::string processing_key_;
  std::string failed_key_;
  std::atomic<bool> running_{false};
  std::vector<std::jthread> threads_;
};

} // namespace hls_media
