#include "connection_pool.hpp"
#include <stdexcept>

namespace common {

ConnectionPool::~ConnectionPool() {
  shutdown_.store(true);
  condition_.notify_all();

  std::lock_guard<std::mutex> lock(mutex_);
  while (!pool_.empty()) {
    pool_.pop();
  }
}

void ConnectionPool::warmUp() {
  for (size_t i = 0; i < cp_config_.min_connections; ++i) {
    auto conn = createConnection();
    if (conn) {
      std::lock_guard<std::mutex> lock(mutex_);
      pool_.push(std::move(conn));
    }
  }
}

bool ConnectionPool::validateConnection(Connection* conn) {
  return conn && conn->isValid();
}

std::unique_ptr<Connection> ConnectionPool::getConnectionFromPool() {
  std::unique_lock<std::mutex> lock(mutex_);

  // wait for a free slot or time out
  auto deadline = std::chrono::steady_clock::now() + cp_config_.timeout;

  while (pool_.empty() && active_connections_.load() >= cp_config_.max_connections && !shutdown_.load()) {
    if (condition_.wait_until(lock, deadline) == std::cv_status::timeout) {
      throw std::runtime_error("Connection pool timeout");
    }
  }

  if (shutdown_.load()) {
    throw std::runtime_error("Connection pool is shutting down");
  }

  std::unique_ptr<Connection> conn;

  while (!pool_.empty()) {
    conn = std::move(pool_.front());
    pool_.pop();
    if (validateConnection(conn.get())) {
      break;
    }
    conn.reset();
  }

  // nothing reusable: open a new one while under max_connections
  if (!conn && active_connections_.load() < cp_config_.max_connections) {
    lock.unlock();
    conn = createConnection();
    lock.lock();

    if (!conn) {
      throw std::runtime_error("Failed to create connection");
    }
  }

  if (conn) {
    active_connections_.fetch_add(1);
  }

  return conn;
}

void ConnectionPool::returnConnection(std::unique_ptr<Connection> conn) {
  std::lock_guard<std::mutex> lock(mutex_);

  active_connections_.fetch_sub(1);

  if (!conn || shutdown_.load() || !validateConnection(conn.get()) || pool_.size() >= cp_config_.min_connections) {
    conn.reset();
  } else {
    pool_.push(std::move(conn));
  }
  condition_.notify_one();
}

}
