#include "infrastructure/thread_pool_job_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>

namespace hls_media {
namespace {

TEST(ThreadPoolJobQueueTest, RefusesJobsBeforeStart) {
  ThreadPoolJobQueue queue(1, 1);
  EXPECT_FALSE(queue.enqueue(kTranscodeJob, 1).has_value());
}

TEST(ThreadPoolJobQueueTest, RunsEveryAcceptedJob) {
  ThreadPoolJobQueue queue(3, 1);
  std::mutex mutex;
  std::multiset<std::int64_t> seen;
  queue.start([&](const Job& job) -> MediaResult<void> {
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(job.name, kTranscodeJob);
    seen.insert(job.asset_id);
    return {};
  });

  for (std::int64_t id = 1; id <= 10; ++id) {
    ASSERT_TRUE(queue.enqueue(kTranscodeJob, id).has_value());
  }
  queue.waitIdle();

  EXPECT_EQ(seen.size(), 10u);
  EXPECT_EQ(queue.failedCount(), 0u);
}

TEST(ThreadPoolJobQueueTest, RetriesUntilMaxAttempts) {
  ThreadPoolJobQueue queue(1, 3);
  std::atomic<int> calls{0};
  std::atomic<unsigned int> last_attempt{0};
  queue.start([&](const Job& job) -> MediaResult<void> {
    ++calls;
    last_attempt = job.attempt;
    return makeError(ErrorCode::EncodingFailure, "boom");
  });

  ASSERT_TRUE(queue.enqueue(kTranscodeJob, 5).has_value());
  queue.waitIdle();

  EXPECT_EQ(calls.load(), 3);
  EXPECT_EQ(last_attempt.load(), 2u);
  EXPECT_EQ(queue.failedCount(), 1u);
}

TEST(ThreadPoolJobQueueTest, StopsRetryingAfterSuccess) {
  ThreadPoolJobQueue queue(1, 5);
  std::atomic<int> calls{0};
  queue.start([&](const Job&) -> MediaResult<void> {
    if (++calls < 2) {
      return makeError(ErrorCode::EncodingFailure, "transient");
    }
    return {};
  });

  ASSERT_TRUE(queue.enqueue(kTranscodeJob, 5).has_value());
  queue.waitIdle();
  EXPECT_EQ(calls.load(), 2);
  EXPECT_EQ(queue.failedCount(), 0u);
}

TEST(ThreadPoolJobQueueTest, RefusesJobsAfterStop) {
  ThreadPoolJobQueue queue(1, 1);
  queue.start([](const Job&) -> MediaResult<void> { return {}; });
  queue.stop();
  EXPECT_FALSE(queue.enqueue(kTranscodeJob, 1).has_value());
}

} // namespace
} // namespace hls_media
