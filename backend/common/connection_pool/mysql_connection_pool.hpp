#pragma once

#include "common/config/config.hpp"
#include "common/connection_pool/connection_pool.hpp"
#include <mysql/mysql.h>
#include <memory>
#include <string>

namespace common {

// RAII: owns one MYSQL handle, closed on destruction
class MySQLConnection : public Connection {
public:
  MySQLConnection(MYSQL* conn): conn_(conn) {}
  ~MySQLConnection() override { if (conn_) mysql_close(conn_); }

  MYSQL* get() const { return conn_; }
  bool isValid() const override;

  MySQLConnection(MySQLConnection&& other): conn_(other.conn_) {other.conn_ = nullptr; }
  MySQLConnection& operator=(MySQLConnection&& other) noexcept;

private:
  MYSQL* conn_ = nullptr;
};


class MySQLConnectionPool final : public ConnectionPool{
public:
  static MySQLConnectionPool& getInstance() {
    static MySQLConnectionPool instance;
    return instance;
  }
  std::unique_ptr<Connection> createConnection() override;

private:
  MySQLConnectionPool();
  config::DatabaseConfig db_config_;
};

class MySQLConnectionGuard final : public ConnectionGuard{
  using ConnectionGuard::ConnectionGuard;
public:
  MYSQL* get() const {
    return static_cast<MySQLConnection*>(conn_.get())->get();
  }

  // Quotes a value for direct inclusion in a statement on this connection.
  std::string escape(const std::string& value) const;
};
} // namespace common
