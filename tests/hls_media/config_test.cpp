#include "common/config/config.hpp"
#include "hls_media/test_support.hpp"

#include <gtest/gtest.h>

namespace {

TEST(ConfigTest, OverlaysOnlyGivenKeys) {
  auto& cfg = config::Config::getInstance();
  auto redis_host = cfg.getRedis().host;

  cfg.loadFromString(R"({
    "http": {"port": 9090, "read_timeout_s": 12},
    "media": {"media_root": "/srv/media", "thumbnail_offset_s": 5},
    "job_queue": {"backend": "inprocess", "worker_threads": 2},
    "database": {"pool": {"timeout_ms": 1500}}
  })");

  EXPECT_EQ(cfg.getHttp().port, 9090);
  EXPECT_EQ(cfg.getHttp().read_timeout, std::chrono::seconds(12));
  EXPECT_EQ(cfg.getMedia().media_root, "/srv/media");
  EXPECT_EQ(cfg.getMedia().thumbnail_offset, std::chrono::seconds(5));
  EXPECT_EQ(cfg.getJobQueue().backend, "inprocess");
  EXPECT_EQ(cfg.getJobQueue().worker_threads, 2u);
  EXPECT_EQ(cfg.getDBCntPool().timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(cfg.getRedis().host, redis_host);
}

TEST(ConfigTest, RejectedInputLeavesValuesUntouched) {
  auto& cfg = config::Config::getInstance();
  cfg.loadFromString(R"({"job_queue": {"backend": "redis", "queue_key": "q:before"}})");

  EXPECT_THROW(cfg.loadFromString(R"({"job_queue": {"backend": "carrier-pigeon", "queue_key": "q:after"}})"),
               std::runtime_error);
  EXPECT_THROW(cfg.loadFromString(R"({"repository": {"backend": "csv"}})"), std::runtime_error);
  EXPECT_THROW(cfg.loadFromString(R"({"job_queue": {"max_attempts": 0}})"), std::runtime_error);
  EXPECT_THROW(cfg.loadFromString(R"({"http": {"port": "eighty"}})"), std::runtime_error);
  EXPECT_THROW(cfg.loadFromString("{ not json"), std::runtime_error);
  EXPECT_THROW(cfg.loadFromString("[1, 2]"), std::runtime_error);

  EXPECT_EQ(cfg.getJobQueue().backend, "redis");
  EXPECT_EQ(cfg.getJobQueue().queue_key, "q:before");
}

TEST(ConfigTest, MemoryAndUploadBodyLimitsAreSeparate) {
  auto& cfg = config::Config::getInstance();
  cfg.loadFromString(R"({
    "http": {"max_body_bytes": 4096, "max_upload_bytes": 1073741824},
    "redis": {"pool": {"min_connections": 1, "max_connections": 3, "timeout_ms": 250}}
  })");

  EXPECT_EQ(cfg.getHttp().max_body_bytes, 4096u);
  EXPECT_EQ(cfg.getHttp().max_upload_bytes, 1073741824u);
  EXPECT_LT(cfg.getHttp().max_body_bytes, cfg.getHttp().max_upload_bytes);
  EXPECT_EQ(cfg.getRedisCntPool().min_connections, 1u);
  EXPECT_EQ(cfg.getRedisCntPool().max_connections, 3u);
  EXPECT_EQ(cfg.getRedisCntPool().timeout, std::chrono::milliseconds(250));
}

TEST(ConfigTest, LoadsFromFile) {
  hls_media::testing::TempMediaRoot dir;
  auto file = dir.writeFile("hls_media.json", R"({"repository": {"backend": "memory"}, "redis": {"db": 3}})");

  auto& cfg = config::Config::getInstance();
  cfg.loadFromFile(file.string());
  EXPECT_EQ(cfg.getRepository().backend, "memory");
  EXPECT_EQ(cfg.getRedis().db, 3);

  EXPECT_THROW(cfg.loadFromFile((dir.path() / "missing.json").string()), std::runtime_error);
}

} // namespace
