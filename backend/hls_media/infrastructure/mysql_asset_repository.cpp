#include "mysql_asset_repository.hpp"
#include "common/connection_pool/mysql_connection_pool.hpp"
#include <format>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace hls_media {

namespace {
using ResultPtr = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;

constexpr const char* kSelectColumns =
  "SELECT id, title, description, category, video_file, thumbnail, hls_dir, processed, "
  "DATE_FORMAT(created_at, '%Y-%m-%dT%H:%i:%sZ') FROM videos";

std::string column(MYSQL_ROW row, int index) {
  return row[index] ? row[index] : "";
}

MediaResult<void> noConnection() {
  return makeError(ErrorCode::StorageFailure, "no database connection available");
}

// The pool throws when it cannot hand out a connection in time.
template <typename Fn>
auto guarded(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& e) {
    return makeError(ErrorCode::StorageFailure, e.what());
  }
}
} // namespace

MysqlAssetRepository::MysqlAssetRepository() {
  // Touch the pool so a bad DSN shows up at startup instead of on first request.
  common::MySQLConnectionGuard conn(common::MySQLConnectionPool::getInstance());
  if (!conn.valid()) {
    throw std::runtime_error("cannot connect to MySQL");
  }
}

MediaResult<void> MysqlAssetRepository::exec(common::MySQLConnectionGuard& conn, const std::string& query) {
  if (mysql_query(conn.get(), query.c_str())) {
    return makeError(ErrorCode::StorageFailure, mysql_error(conn.get()));
  }
  return {};
}

Asset MysqlAssetRepository::rowToAsset(MYSQL_ROW row) {
  Asset asset;
  asset.id = std::stoll(row[0]);
  asset.title = column(row, 1);
  asset.description = column(row, 2);
  asset.category = column(row, 3);
  asset.source_file_path = column(row, 4);
  asset.thumbnail_path = column(row, 5);
  asset.hls_base_dir = column(row, 6);
  asset.processed = column(row, 7) == "1";
  asset.created_at = column(row, 8);
  return asset;
}

MediaResult<void> MysqlAssetRepository::ensureSchema() {
  return guarded([&]() -> MediaResult<void> {
    common::MySQLConnectionGuard conn(common::MySQLConnectionPool::getInstance());
    if (!conn.valid()) return noConnection();

    return exec(conn,
      "CREATE TABLE IF NOT EXISTS videos ("
      "  id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
      "  created_at DATETIME NOT NULL DEFAULT CURRENT_TIMESTAMP,"
      "  title VARCHAR(255) NOT NULL,"
      "  description TEXT NOT NULL,"
      "  category VARCHAR(255) NOT NULL DEFAULT '',"
      "  video_file VARCHAR(512) NOT NULL DEFAULT '',"
      "  thumbnail VARCHAR(512) NOT NULL DEFAULT '',"
      "  hls_dir VARCHAR(512) NOT NULL DEFAULT '',"
      "  processed TINYINT(1) NOT NULL DEFAULT 0,"
      "  KEY idx_videos_created_at (created_at)"
      ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4");
  });
}

MediaResult<Asset> MysqlAssetRepository::create(const Asset& draft) {
  return guarded([&]() -> MediaResult<Asset> {
    common::MySQLConnectionGuard conn(common::MySQLConnectionPool::getInstance());
    if (!conn.valid()) return std::unexpected(noConnection().error());

    auto query = std::format(
      "INSERT INTO videos (created_at, title, description, category, video_file, thumbnail, hls_dir, processed) "
      "VALUES (UTC_TIMESTAMP(), '{}', '{}', '{}', '{}', '{}', '{}', {})",
      conn.escape(draft.title),
      conn.escape(draft.description),
      conn.escape(draft.category),
      conn.escape(draft.source_file_path),
      conn.escape(draft.thumbnail_path),
      conn.escape(draft.hls_base_dir),
      draft.processed ? 1 : 0);

    if (auto ok = exec(conn, query); !ok) {
      return std::unexpected(ok.error());
    }
    auto id = static_cast<std::int64_t>(mysql_insert_id(conn.get()));
    return fetchById(conn, id);
  });
}

MediaResult<Asset> MysqlAssetRepository::fetchById(common::MySQLConnectionGuard& conn, std::int64_t id) {
  auto query = std::format("{} WHERE id = {}", kSelectColumns, id);
  if (auto ok = exec(conn, query); !ok) {
    return std::unexpected(ok.error());
  }

  ResultPtr result(mysql_store_result(conn.get()), &mysql_free_result);
  if (!result) {
    return makeError(ErrorCode::StorageFailure, mysql_error(conn.get()));
  }

  MYSQL_ROW row = mysql_fetch_row(result.get());
  if (!row) {
    return makeError(ErrorCode::NotFound, std::format("asset {} not found", id));
  }
  return rowToAsset(row);
}

MediaResult<Asset> MysqlAssetRepository::findById(std::int64_t id) {
  return guarded([&]() -> MediaResult<Asset> {
    common::MySQLConnectionGuard conn(common::MySQLConnectionPool::getInstance());
    if (!conn.valid()) return std::unexpected(noConnection().error());
    return fetchById(conn, id);
  });
}

MediaResult<std::vector<Asset>> MysqlAssetRepository::findAll() {
  return guarded([&]() -> MediaResult<std::vector<Asset>> {
    common::MySQLConnectionGuard conn(common::MySQLConnectionPool::getInstance());
    if (!conn.valid()) return std::unexpected(noConnection().error());

    auto query = std::format("{} ORDER BY created_at DESC, id DESC", kSelectColumns);
    if (auto ok = exec(conn, query); !ok) {
      return std::unexpected(ok.error());
    }

    ResultPtr result(mysql_store_result(conn.get()), &mysql_free_result);
    if (!result) {
      return makeError(ErrorCode::StorageFailure, mysql_error(conn.get()));
    }

    std::vector<Asset> assets;
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(result.get()))) {
      assets.push_back(rowToAsset(row));
    }
    return assets;
  });
}

MediaResult<void> MysqlAssetRepository::markProcessed(std::int64_t id, const ProcessingUpdate& update) {
  return guarded([&]() -> MediaResult<void> {
    common::MySQLConnectionGuard conn(common::MySQLConnectionPool::getInstance());
    if (!conn.valid()) return noConnection();

    auto rollback = [&conn](MediaError error) -> MediaResult<void> {
      if (mysql_query(conn.get(), "ROLLBACK")) {
        std::cerr << "[mysql] rollback failed: " << mysql_error(conn.get()) << std::endl;
        conn.discard();
      }
      return std::unexpected(std::move(error));
    };

    if (auto ok = exec(conn, "START TRANSACTION"); !ok) {
      return ok;
    }

    if (auto ok = exec(conn, std::format("SELECT id FROM videos WHERE id = {} FOR UPDATE", id)); !ok) {
      return rollback(ok.error());
    }
    {
      ResultPtr locked(mysql_store_result(conn.get()), &mysql_free_result);
      if (!locked) {
        return rollback(MediaError{ErrorCode::StorageFailure, mysql_error(conn.get())});
      }
      if (mysql_num_rows(locked.get()) == 0) {
        return rollback(MediaError{ErrorCode::NotFound, std::format("asset {} not found", id)});
      }
    }

    std::string thumbnail_clause;
    if (update.thumbnail_path) {
      thumbnail_clause = std::format(", thumbnail = '{}'", conn.escape(*update.thumbnail_path));
    }
    auto query = std::format("UPDATE videos SET hls_dir = '{}', processed = 1{} WHERE id = {}",
                             conn.escape(update.hls_base_dir), thumbnail_clause, id);
    if (auto ok = exec(conn, query); !ok) {
      return rollback(ok.error());
    }

    if (auto ok = exec(conn, "COMMIT"); !ok) {
      return rollback(ok.error());
    }
    return {};
  });
}

} // namespace hls_media
