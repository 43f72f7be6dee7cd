#include "redis_job_queue.hpp"
#include "common/connection_pool/redis_connection_pool.hpp"
#include "infrastructure/job_codec.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace hls_media {

namespace {
std::string replyError(redisContext* ctx, const redisReply* reply) {
  if (!reply) {
    return ctx && ctx->err ? ctx->errstr : "no reply from redis";
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    return std::string(reply->str, reply->len);
  }
  return {};
}
} // namespace

RedisJobQueue::RedisJobQueue(std::string queue_key) : queue_key_(std::move(queue_key)) {}

std::expected<void, std::string> RedisJobQueue::enqueue(std::string_view job_name, std::int64_t asset_id) {
  return push(Job{std::string(job_name), asset_id, 0});
}

std::expected<void, std::string> RedisJobQueue::push(const Job& job) {
  try {
    common::RedisConnectionGuard conn(common::RedisConnectionPool::getInstance());
    if (!conn.valid()) {
      return std::unexpected("no redis connection available");
    }

    auto payload = encodeJob(job);
    auto reply = common::makeReply(redisCommand(conn.get(), "LPUSH %s %b",
                                                queue_key_.c_str(), payload.data(), payload.size()));
    if (auto err = replyError(conn.get(), reply.get()); !err.empty()) {
      if (!reply) conn.discard();
      return std::unexpected(err);
    }
    return {};
  } catch (const std::exception& e) {
    // The pool throws when no connection can be opened in time.
    return std::unexpected(std::string(e.what()));
  }
}

RedisJobWorker::RedisJobWorker(Options options, JobHandler handler)
  : options_(std::move(options)),
    handler_(std::move(handler)),
    requeue_(options_.queue_key),
    processing_key_(options_.queue_key + ":processing"),
    failed_key_(options_.queue_key + ":failed") {
  if (options_.max_attempts == 0) options_.max_attempts = 1;
  if (options_.threads == 0) options_.threads = 1;
}

RedisJobWorker::~RedisJobWorker() {
  stop();
}

void RedisJobWorker::start() {
  if (running_.exchange(true)) return;

  auto recovered = recoverProcessing();
  if (recovered > 0) {
    std::cout << "[worker] re-queued " << recovered << " interrupted job(s)" << std::endl;
  }

  for (unsigned int i = 0; i < options_.threads; ++i) {
    threads_.emplace_back([this] { loop(); });
  }
  std::cout << "[worker] listening on " << options_.queue_key << " with "
            << options_.threads << " thread(s)" << std::endl;
}

void RedisJobWorker::stop() {
  if (!running_.exchange(false)) return;
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
  std::cout << "[worker] stopped" << std::endl;
}

size_t RedisJobWorker::recoverProcessing() {
  try {
    common::RedisConnectionGuard conn(common::RedisConnectionPool::getInstance());
    if (!conn.valid()) {
      std::cerr << "[worker] cannot recover " << processing_key_ << ": no redis connection" << std::endl;
      return 0;
    }

    size_t moved = 0;
    while (true) {
      auto reply = common::makeReply(redisCommand(conn.get(), "RPOPLPUSH %s %s",
                                                  processing_key_.c_str(), options_.queue_key.c_str()));
      if (!reply || reply->type != REDIS_REPLY_STRING) {
        if (auto err = replyError(conn.get(), reply.get()); !err.empty()) {
          std::cerr << "[worker] recovery stopped: " << err << std::endl;
        }
        break;
      }
      ++moved;
    }
    return moved;
  } catch (const std::exception& e) {
    std::cerr << "[worker] cannot recover " << processing_key_ << ": " << e.what() << std::endl;
    return 0;
  }
}

void RedisJobWorker::loop() {
  const auto timeout = static_cast<int>(options_.poll_timeout.count());

  while (running_.load()) {
    std::string payload;
    try {
      common::RedisConnectionGuard conn(common::RedisConnectionPool::getInstance());
      if (!conn.valid()) {
        std::cerr << "[worker] no redis connection, retrying" << std::endl;
        std::this_thread::sleep_for(std::chrono::seconds(1));
        continue;
      }

      auto reply = common::makeReply(redisCommand(conn.get(), "BRPOPLPUSH %s %s %d",
                                                  options_.queue_key.c_str(), processing_key_.c_str(), timeout));
      if (!reply) {
        std::cerr << "[worker] " << replyError(conn.get(), nullptr) << std::endl;
        conn.discard();
        std::this_thread::sleep_for(std::chrono::seconds(1));
        continue;
      }
      if (reply->type == REDIS_REPLY_NIL) {
        continue;
      }
      if (reply->type != REDIS_REPLY_STRING) {
        std::cerr << "[worker] unexpected reply: " << replyError(conn.get(), reply.get()) << std::endl;
        continue;
      }
      payload.assign(reply->str, reply->len);
    } catch (const std::exception& e) {
      std::cerr << "[worker] redis unavailable: " << e.what() << std::endl;
      std::this_thread::sleep_for(std::chrono::seconds(1));
      continue;
    }

    auto job = decodeJob(payload);
    if (!job) {
      std::cerr << "[worker] " << job.error() << std::endl;
      pushFailed(payload);
      removeProcessing(payload);
      continue;
    }

    MediaResult<void> result;
    try {
      result = handler_(*job);
    } catch (const std::exception& e) {
      result = makeError(ErrorCode::StorageFailure, e.what());
    }
    if (!result) {
      std::cerr << "[worker] " << job->name << " for asset " << job->asset_id << " failed (attempt "
                << job->attempt + 1 << "/" << options_.max_attempts << "): "
                << result.error().message << std::endl;
    }
    finish(payload, *job, result.has_value());
  }
}

void RedisJobWorker::finish(const std::string& payload, const Job& job, bool succeeded) {
  if (!succeeded) {
    if (job.attempt + 1 < options_.max_attempts) {
      Job retry = job;
      ++retry.attempt;
      if (auto pushed = requeue_.push(retry); !pushed) {
        std::cerr << "[worker] cannot re-queue asset " << job.asset_id << ": " << pushed.error() << std::endl;
        // Left on :processing; the next worker start picks it up again.
        return;
      }
    } else {
      std::cerr << "[worker] giving up on asset " << job.asset_id << std::endl;
      pushFailed(payload);
    }
  }
  removeProcessing(payload);
}

void RedisJobWorker::pushFailed(const std::string& payload) {
  try {
    common::RedisConnectionGuard conn(common::RedisConnectionPool::getInstance());
    if (!conn.valid()) {
      std::cerr << "[worker] cannot record failed job: no redis connection" << std::endl;
      return;
    }
    auto reply = common::makeReply(redisCommand(conn.get(), "LPUSH %s %b",
                                                failed_key_.c_str(), payload.data(), payload.size()));
    if (auto err = replyError(conn.get(), reply.get()); !err.empty()) {
      std::cerr << "[worker] LPUSH " << failed_key_ << ": " << err << std::endl;
      if (!reply) conn.discard();
    }
  } catch (const std::exception& e) {
    std::cerr << "[worker] cannot record failed job: " << e.what() << std::endl;
  }
}

void RedisJobWorker::removeProcessing(const std::string& payload) {
  try {
    common::RedisConnectionGuard conn(common::RedisConnectionPool::getInstance());
    if (!conn.valid()) {
      std::cerr << "[worker] cannot ack job: no redis connection" << std::endl;
      return;
    }
    auto reply = common::makeReply(redisCommand(conn.get(), "LREM %s 1 %b",
                                                processing_key_.c_str(), payload.data(), payload.size()));
    if (auto err = replyError(conn.get(), reply.get()); !err.empty()) {
      std::cerr << "[worker] LREM " << processing_key_ << ": " << err << std::endl;
      if (!reply) conn.discard();
    }
  } catch (const std::exception& e) {
    std::cerr << "[worker] cannot ack job: " << e.what() << std::endl;
  }
}

} // namespace hls_media
