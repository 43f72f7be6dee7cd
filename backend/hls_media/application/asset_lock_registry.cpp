#include "asset_lock_registry.hpp"

namespace hls_media {

AssetLock::AssetLock(AssetLockRegistry* registry, std::int64_t asset_id)
  : registry_(registry), asset_id_(asset_id) {}

AssetLock::AssetLock(AssetLock&& other) noexcept
  : registry_(other.registry_), asset_id_(other.asset_id_) {
  other.registry_ = nullptr;
}

AssetLock::~AssetLock() {
  if (registry_) {
    registry_->release(asset_id_);
  }
}

AssetLock AssetLockRegistry::acquire(std::int64_t asset_id) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = entries_[asset_id];
    if (!slot) {
      slot = std::make_shared<Entry>();
    }
    slot->users++;
    entry = slot;
  }
  // waiting happens outside the registry mutex
  entry->mutex.lock();
  return AssetLock(this, asset_id);
}

void AssetLockRegistry::release(std::int64_t asset_id) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = entries_.find(asset_id);
  if (it == entries_.end()) {
    return;
  }
  it->second->mutex.unlock();
  if (--it->second->users == 0) {
    entries_.erase(it);
  }
}

bool AssetLockRegistry::isHeld(std::int64_t asset_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return entries_.contains(asset_id);
}

size_t AssetLockRegistry::trackedCount() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return entries_.size();
}

} // namespace hls_media
