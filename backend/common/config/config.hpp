#pragma once

#include <cstddef>
#include <string>
#include <chrono>

namespace config {

struct ConnectionPoolConfig{
  size_t min_connections;
  size_t max_connections;
  std::chrono::milliseconds timeout;
};

struct DatabaseConfig {
  std::string host;
  unsigned int port;
  std::string user;
  std::string password;
  std::string db_name;
  std::string charset;
};

struct RedisConfig {
  std::string host;
  unsigned int port;
  int db;
};

struct HttpConfig {
  std::string host;
  unsigned short port;
  size_t max_body_bytes;    // in-memory request bodies
  size_t max_upload_bytes;  // upload bodies, written to disk while read
  std::chrono::seconds read_timeout;
};

// media_root is the sandboxed root; every served or generated file lives below it
struct MediaConfig {
  std::string media_root;
  std::string ffmpeg_binary;
  std::string video_codec;
  std::string preset;
  std::chrono::seconds thumbnail_offset;
};

struct JobQueueConfig {
  std::string backend;   // "redis" | "inprocess"
  std::string queue_key;
  unsigned int worker_threads;
  unsigned int max_attempts;
  std::chrono::seconds poll_timeout;
};

struct RepositoryBackendConfig {
  std::string backend;   // "mysql" | "memory"
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Overlays the values found in a JSON file on top of the defaults.
// Throws std::runtime_error on unreadable files, bad JSON or mistyped keys.
void loadFromFile(const std::string& path);
void loadFromString(const std::string& json_text);

// Getters
const DatabaseConfig& getDatabase() const { return database_; }
const RedisConfig& getRedis() const { return redis_ ;}
const HttpConfig& getHttp() const { return http_; }
const MediaConfig& getMedia() const { return media_; }
const JobQueueConfig& getJobQueue() const { return job_queue_; }
const RepositoryBackendConfig& getRepository() const { return repository_; }
const ConnectionPoolConfig& getDBCntPool() const { return db_cp_; }
const ConnectionPoolConfig& getRedisCntPool() const { return redis_cp_; }
std::string getHttpIpPort() const { return http_.host+":"+std::to_string(http_.port);}

private:
  Config();

  RedisConfig redis_;
  DatabaseConfig database_;
  HttpConfig http_;
  MediaConfig media_;
  JobQueueConfig job_queue_;
  RepositoryBackendConfig repository_;
  ConnectionPoolConfig db_cp_;
  ConnectionPoolConfig redis_cp_;
};

} // namespace config
