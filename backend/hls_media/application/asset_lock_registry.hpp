#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace hls_media {

class AssetLockRegistry;

// Exclusive hold on one asset id; released on destruction.
class AssetLock {
public:
  AssetLock(AssetLock&& other) noexcept;
  AssetLock& operator=(AssetLock&&) = delete;
  AssetLock(const AssetLock&) = delete;
  AssetLock& operator=(const AssetLock&) = delete;
  ~AssetLock();

  std::int64_t assetId() const { return asset_id_; }

private:
  friend class AssetLockRegistry;
  AssetLock(AssetLockRegistry* registry, std::int64_t asset_id);

  AssetLockRegistry* registry_;
  std::int64_t asset_id_;
};

// In-process mutex per asset id. Entries exist only while someone holds or
// waits for them.
class AssetLockRegistry {
public:
  AssetLockRegistry() = default;
  AssetLockRegistry(const AssetLockRegistry&) = delete;
  AssetLockRegistry& operator=(const AssetLockRegistry&) = delete;

  // Blocks until the asset is free.
  AssetLock acquire(std::int64_t asset_id);
  bool isHeld(std::int64_t asset_id) const;
  size_t trackedCount() const;

private:
  friend class AssetLock;

  struct Entry {
    std::mutex mutex;
    size_t users{0};
  };

  void release(std::int64_t asset_id);

  mutable std::mutex registry_mutex_;
  std::unordered_map<std::int64_t, std::shared_ptr<Entry>> entries_;
};

} // namespace hls_media
