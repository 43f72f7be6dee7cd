#pragma once

// project
#include "asset.hpp"
#include "media_error.hpp"

// std
#include <cstdint>
#include <vector>

namespace hls_media {

class AssetRepository {
public:
  virtual ~AssetRepository() = default;
  // Inserts a new record; the returned asset carries the assigned id and created_at.
  virtual MediaResult<Asset> create(const Asset& draft) = 0;
  virtual MediaResult<Asset> findById(std::int64_t id) = 0;
  // Newest first.
  virtual MediaResult<std::vector<Asset>> findAll() = 0;
  // Applies hls_base_dir, thumbnail_path (if set) and processed=true in one
  // atomic step. A missing record is NotFound.
  virtual MediaResult<void> markProcessed(std::int64_t id, const ProcessingUpdate& update) = 0;
};

} // namespace hls_media
