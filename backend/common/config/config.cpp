#include "config.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace config {

namespace {

using json = nlohmann::json;

template <typename T>
void overlay(const json& section, const char* key, T& target) {
  if (!section.contains(key)) {
    return;
  }
  try {
    target = section.at(key).get<T>();
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("config key '") + key + "': " + e.what());
  }
}

template <typename Rep, typename Period>
void overlay(const json& section, const char* key, std::chrono::duration<Rep, Period>& target) {
  Rep count = target.count();
  overlay(section, key, count);
  target = std::chrono::duration<Rep, Period>(count);
}

void overlayPool(const json& section, ConnectionPoolConfig& cp) {
  overlay(section, "min_connections", cp.min_connections);
  overlay(section, "max_connections", cp.max_connections);
  overlay(section, "timeout_ms", cp.timeout);
}

const json& sectionOf(const json& root, const char* name) {
  static const json empty = json::object();
  if (!root.contains(name)) {
    return empty;
  }
  const auto& section = root.at(name);
  if (!section.is_object()) {
    throw std::runtime_error(std::string("config section '") + name + "' must be an object");
  }
  return section;
}

} // namespace

Config::Config() {
  db_cp_ = {
    .min_connections = 4,
    .max_connections = 16,
    .timeout = std::chrono::milliseconds(5000)
  };

  redis_cp_ = {
    .min_connections = 2,
    .max_connections = 16,
    .timeout = std::chrono::milliseconds(5000)
  };

  redis_ = {
    .host = "127.0.0.1",
    .port = 6379,
    .db = 0
  };

  database_ = {
    .host = "localhost",
    .port = 3306,
    .user = "hls_media",
    .password = "",
    .db_name = "hls_media",
    .charset = "utf8mb4",
  };

  http_ = {
    .host = "0.0.0.0",
    .port = 8080,
    .max_body_bytes = 1024 * 1024,
    .max_upload_bytes = 2ull * 1024 * 1024 * 1024,
    .read_timeout = std::chrono::seconds(30)
  };

  media_ = {
    .media_root = "./media",
    .ffmpeg_binary = "ffmpeg",
    .video_codec = "libx264",
    .preset = "veryfast",
    .thumbnail_offset = std::chrono::seconds(3)
  };

  job_queue_ = {
    .backend = "redis",
    .queue_key = "hls_media:queue:default",
    .worker_threads = 1,
    .max_attempts = 3,
    .poll_timeout = std::chrono::seconds(5)
  };

  repository_ = {
    .backend = "mysql"
  };
}

void Config::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw std::runtime_error("Cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  loadFromString(buffer.str());
}

void Config::loadFromString(const std::string& json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
  }
  if (!root.is_object()) {
    throw std::runtime_error("Config root must be a JSON object");
  }

  // Overlay onto copies so a rejected file leaves the current values alone.
  auto database = database_;
  auto db_cp = db_cp_;
  auto redis_cfg = redis_;
  auto redis_cp = redis_cp_;
  auto http_cfg = http_;
  auto media_cfg = media_;
  auto job_queue = job_queue_;
  auto repository_cfg = repository_;

  const auto& db = sectionOf(root, "database");
  overlay(db, "host", database.host);
  overlay(db, "port", database.port);
  overlay(db, "user", database.user);
  overlay(db, "password", database.password);
  overlay(db, "db_name", database.db_name);
  overlay(db, "charset", database.charset);
  overlayPool(sectionOf(db, "pool"), db_cp);

  const auto& redis = sectionOf(root, "redis");
  overlay(redis, "host", redis_cfg.host);
  overlay(redis, "port", redis_cfg.port);
  overlay(redis, "db", redis_cfg.db);
  overlayPool(sectionOf(redis, "pool"), redis_cp);

  const auto& http = sectionOf(root, "http");
  overlay(http, "host", http_cfg.host);
  overlay(http, "port", http_cfg.port);
  overlay(http, "max_body_bytes", http_cfg.max_body_bytes);
  overlay(http, "max_upload_bytes", http_cfg.max_upload_bytes);
  overlay(http, "read_timeout_s", http_cfg.read_timeout);

  const auto& media = sectionOf(root, "media");
  overlay(media, "media_root", media_cfg.media_root);
  overlay(media, "ffmpeg_binary", media_cfg.ffmpeg_binary);
  overlay(media, "video_codec", media_cfg.video_codec);
  overlay(media, "preset", media_cfg.preset);
  overlay(media, "thumbnail_offset_s", media_cfg.thumbnail_offset);

  const auto& queue = sectionOf(root, "job_queue");
  overlay(queue, "backend", job_queue.backend);
  overlay(queue, "queue_key", job_queue.queue_key);
  overlay(queue, "worker_threads", job_queue.worker_threads);
  overlay(queue, "max_attempts", job_queue.max_attempts);
  overlay(queue, "poll_timeout_s", job_queue.poll_timeout);

  const auto& repository = sectionOf(root, "repository");
  overlay(repository, "backend", repository_cfg.backend);

  if (job_queue.backend != "redis" && job_queue.backend != "inprocess") {
    throw std::runtime_error("job_queue.backend must be \"redis\" or \"inprocess\"");
  }
  if (repository_cfg.backend != "mysql" && repository_cfg.backend != "memory") {
    throw std::runtime_error("repository.backend must be \"mysql\" or \"memory\"");
  }
  if (job_queue.max_attempts == 0) {
    throw std::runtime_error("job_queue.max_attempts must be at least 1");
  }

  database_ = database;
  db_cp_ = db_cp;
  redis_ = redis_cfg;
  redis_cp_ = redis_cp;
  http_ = http_cfg;
  media_ = media_cfg;
  job_queue_ = job_queue;
  repository_ = repository_cfg;
}

} // namespace config
