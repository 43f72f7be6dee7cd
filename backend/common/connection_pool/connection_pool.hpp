#pragma once

#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <queue>

#include "common/config/config.hpp"

namespace common {

// RAII: one live connection; closed by the derived destructor
class Connection {
public:
  virtual ~Connection() = default;
  virtual bool isValid() const = 0;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  Connection() = default;
  Connection(Connection&&) = default;
  Connection& operator=(Connection&&) = default;
};


/*
  idle = connections waiting in pool_ (trimmed back to min_connections on return)
  active = connections handed out through a guard
  idle + active <= max_connections
*/
class ConnectionPool {
public:
  virtual ~ConnectionPool();

  // Throws std::runtime_error on timeout, shutdown or a failed connect.
  std::unique_ptr<Connection> getConnectionFromPool();

  void returnConnection(std::unique_ptr<Connection> conn);

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

protected:
  ConnectionPool(const config::ConnectionPoolConfig& cfg): cp_config_(cfg){};
  virtual std::unique_ptr<Connection> createConnection() = 0;

  void warmUp();
  bool validateConnection(Connection* conn);

  config::ConnectionPoolConfig cp_config_;
  std::queue<std::unique_ptr<Connection>> pool_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::atomic<size_t> active_connections_{0};
  std::atomic<bool> shutdown_{false};
};

// RAII: borrows a connection on construction, hands it back on destruction
class ConnectionGuard {
public:
  ConnectionGuard(ConnectionPool& pool) : pool_(pool) { conn_ = pool_.getConnectionFromPool(); }
  ~ConnectionGuard() { if (conn_) pool_.returnConnection(std::move(conn_)); }

  Connection* operator->() const { return conn_.get(); }
  Connection& operator*() const { return *conn_; }

  bool valid() const { return conn_ != nullptr; }

  // The connection is known broken; drop it instead of returning it.
  void discard() {
    if (conn_) {
      conn_.reset();
      pool_.returnConnection(nullptr);
    }
  }

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;

protected:
  ConnectionPool& pool_;
  std::unique_ptr<Connection> conn_;
};

} // namespace common
