#pragma once
#include "domain/asset_repository.hpp"
#include <map>
#include <mutex>

namespace hls_media {

// Process-local store. Every operation runs under one mutex, which also makes
// markProcessed atomic.
class MemoryAssetRepository : public AssetRepository {
public:
  MediaResult<Asset> create(const Asset& draft) override;
  MediaResult<Asset> findById(std::int64_t id) override;
  MediaResult<std::vector<Asset>> findAll() override;
  MediaResult<void> markProcessed(std::int64_t id, const ProcessingUpdate& update) override;

  // Inserts a record with an explicit id (fixtures, imports).
  void put(const Asset& asset);
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::int64_t, Asset> assets_;
  std::int64_t next_id_{1};
};

} // namespace hls_media
