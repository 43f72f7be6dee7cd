#include "memory_asset_repository.hpp"
#include <algorithm>
#include <chrono>
#include <format>

namespace hls_media {

namespace {
std::string utcNow() {
  auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}", now);
}
} // namespace

MediaResult<Asset> MemoryAssetRepository::create(const Asset& draft) {
  std::lock_guard<std::mutex> lock(mutex_);
  Asset asset = draft;
  asset.id = next_id_++;
  if (asset.created_at.empty()) {
    asset.created_at = utcNow();
  }
  assets_[asset.id] = asset;
  return asset;
}

MediaResult<Asset> MemoryAssetRepository::findById(std::int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = assets_.find(id);
  if (it == assets_.end()) {
    return makeError(ErrorCode::NotFound, "asset " + std::to_string(id) + " not found");
  }
  return it->second;
}

MediaResult<std::vector<Asset>> MemoryAssetRepository::findAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Asset> result;
  result.reserve(assets_.size());
  for (const auto& [id, asset] : assets_) {
    result.push_back(asset);
  }
  std::sort(result.begin(), result.end(), [](const Asset& a, const Asset& b) {
    if (a.created_at != b.created_at) {
      return a.created_at > b.created_at;
    }
    return a.id > b.id;
  });
  return result;
}

MediaResult<void> MemoryAssetRepository::markProcessed(std::int64_t id, const ProcessingUpdate& update) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = assets_.find(id);
  if (it == assets_.end()) {
    return makeError(ErrorCode::NotFound, "asset " + std::to_string(id) + " not found");
  }
  it->second.hls_base_dir = update.hls_base_dir;
  if (update.thumbnail_path) {
    it->second.thumbnail_path = *update.thumbnail_path;
  }
  it->second.processed = true;
  return {};
}

void MemoryAssetRepository::put(const Asset& asset) {
  std::lock_guard<std::mutex> lock(mutex_);
  Asset stored = asset;
  if (stored.created_at.empty()) {
    stored.created_at = utcNow();
  }
  assets_[stored.id] = stored;
  next_id_ = std::max(next_id_, stored.id + 1);
}

size_t MemoryAssetRepository::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return assets_.size();
}

} // namespace hls_media
