#include "application/asset_lock_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace hls_media {
namespace {

TEST(AssetLockRegistryTest, EntryExistsOnlyWhileHeld) {
  AssetLockRegistry registry;
  {
    auto lock = registry.acquire(1);
    EXPECT_TRUE(registry.isHeld(1));
    EXPECT_EQ(lock.assetId(), 1);
    EXPECT_EQ(registry.trackedCount(), 1u);
  }
  EXPECT_FALSE(registry.isHeld(1));
  EXPECT_EQ(registry.trackedCount(), 0u);
}

TEST(AssetLockRegistryTest, MovedLockReleasesOnce) {
  AssetLockRegistry registry;
  {
    auto first = registry.acquire(2);
    AssetLock second(std::move(first));
    EXPECT_TRUE(registry.isHeld(2));
  }
  EXPECT_FALSE(registry.isHeld(2));
  auto again = registry.acquire(2);
  EXPECT_TRUE(registry.isHeld(2));
}

TEST(AssetLockRegistryTest, DifferentAssetsDoNotBlock) {
  AssetLockRegistry registry;
  auto a = registry.acquire(1);
  auto b = registry.acquire(2);
  EXPECT_EQ(registry.trackedCount(), 2u);
}

TEST(AssetLockRegistryTest, SameAssetIsSerialized) {
  AssetLockRegistry registry;
  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      for (int round = 0; round < 20; ++round) {
        auto lock = registry.acquire(42);
        int now = ++inside;
        int seen = max_inside.load();
        while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::microseconds(50));
        --inside;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(max_inside.load(), 1);
  EXPECT_EQ(registry.trackedCount(), 0u);
}

} // namespace
} // namespace hls_media
