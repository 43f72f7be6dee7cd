#include "thread_pool_job_queue.hpp"
#include <iostream>

namespace hls_media {

ThreadPoolJobQueue::ThreadPoolJobQueue(unsigned int worker_threads, unsigned int max_attempts)
  : pool_(worker_threads), max_attempts_(max_attempts == 0 ? 1 : max_attempts) {}

ThreadPoolJobQueue::~ThreadPoolJobQueue() {
  stop();
}

void ThreadPoolJobQueue::start(JobHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
  std::cout << "[queue] in-process queue started with " << pool_.size() << " threads" << std::endl;
}

void ThreadPoolJobQueue::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return;
    stopped_ = true;
  }
  pool_.stop();
}

std::expected<void, std::string> ThreadPoolJobQueue::enqueue(std::string_view job_name, std::int64_t asset_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return std::unexpected("job queue is stopped");
    }
    if (!handler_) {
      return std::unexpected("job queue has no handler");
    }
    ++in_flight_;
  }

  Job job{std::string(job_name), asset_id, 0};
  try {
    pool_.commit([this, job]() { runWithRetries(job); });
  } catch (const std::runtime_error& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
    idle_cv_.notify_all();
    return std::unexpected(e.what());
  }
  return {};
}

void ThreadPoolJobQueue::runWithRetries(Job job) {
  for (; job.attempt < max_attempts_; ++job.attempt) {
    MediaResult<void> result;
    try {
      result = handler_(job);
    } catch (const std::exception& e) {
      result = makeError(ErrorCode::StorageFailure, e.what());
    }
    if (result) {
      break;
    }
    std::cerr << "[queue] " << job.name << " for asset " << job.asset_id << " failed (attempt "
              << job.attempt + 1 << "/" << max_attempts_ << "): " << result.error().message << std::endl;
    if (job.attempt + 1 == max_attempts_) {
      std::lock_guard<std::mutex> lock(mutex_);
      ++failed_;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  --in_flight_;
  idle_cv_.notify_all();
}

void ThreadPoolJobQueue::waitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

size_t ThreadPoolJobQueue::failedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_;
}

} // namespace hls_media
