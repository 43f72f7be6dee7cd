#pragma once

#include "domain/asset_repository.hpp"
#include <mysql/mysql.h>
#include <string>

namespace common { class MySQLConnectionGuard; }

namespace hls_media {

// Table `videos` (sql/schema.sql) through the shared MySQL connection pool.
class MysqlAssetRepository : public AssetRepository {
public:
  MysqlAssetRepository();

  MediaResult<Asset> create(const Asset& draft) override;
  MediaResult<Asset> findById(std::int64_t id) override;
  MediaResult<std::vector<Asset>> findAll() override;
  // START TRANSACTION; SELECT .. FOR UPDATE; UPDATE; COMMIT
  MediaResult<void> markProcessed(std::int64_t id, const ProcessingUpdate& update) override;

  // CREATE TABLE IF NOT EXISTS, for first boot.
  MediaResult<void> ensureSchema();

private:
  static Asset rowToAsset(MYSQL_ROW row);
  static MediaResult<void> exec(common::MySQLConnectionGuard& conn, const std::string& query);
  static MediaResult<Asset> fetchById(common::MySQLConnectionGuard& conn, std::int64_t id);
};

} // namespace hls_media
