#include "redis_connection_pool.hpp"
#include "common/config/config.hpp"
#include "common/connection_pool/connection_pool.hpp"
#include <cstring>
#include <iostream>
#include <hiredis/hiredis.h>

namespace common {

RedisConnection& RedisConnection::operator=(RedisConnection&& other) noexcept {
  if (this != &other) {
    if (conn_) {
      redisFree(conn_);
    }
    conn_ = other.conn_;
    other.conn_ = nullptr;
  }
  return *this;
}

bool RedisConnection::isValid() const {
  if (!conn_ || conn_->err) return false;
  auto reply = makeReply(redisCommand(conn_, "PING"));
  if (!reply) return false;
  return reply->type == REDIS_REPLY_STATUS && std::strcmp(reply->str, "PONG") == 0;
}

RedisConnectionPool::RedisConnectionPool() : ConnectionPool(config::Config::getInstance().getRedisCntPool()), redis_config_(config::Config::getInstance().getRedis()) {
  warmUp();
}

std::unique_ptr<Connection> RedisConnectionPool::createConnection() {
  redisContext* conn = redisConnect(redis_config_.host.c_str(), static_cast<int>(redis_config_.port));
  if (conn == NULL || conn->err) {
    if (conn) {
      std::cerr << "[redis] connect failed: " << conn->errstr << std::endl;
      redisFree(conn);
    }
    return nullptr;
  }

  if (redis_config_.db != 0) {
    auto reply = makeReply(redisCommand(conn, "SELECT %d", redis_config_.db));
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
      std::cerr << "[redis] SELECT " << redis_config_.db << " failed" << std::endl;
      redisFree(conn);
      return nullptr;
    }
  }

  return std::make_unique<RedisConnection>(conn);
}

} // namespace common
