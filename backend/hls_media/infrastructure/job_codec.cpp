#include "job_codec.hpp"
#include <nlohmann/json.hpp>

namespace hls_media {
using json = nlohmann::json;

std::string encodeJob(const Job& job) {
  json j = {
    {"job", job.name},
    {"asset_id", job.asset_id},
    {"attempt", job.attempt},
  };
  return j.dump();
}

std::expected<Job, std::string> decodeJob(const std::string& payload) {
  try {
    auto j = json::parse(payload);
    Job job;
    job.name = j.at("job").get<std::string>();
    job.asset_id = j.at("asset_id").get<std::int64_t>();
    job.attempt = j.value("attempt", 0u);
    return job;
  } catch (const json::exception& e) {
    return std::unexpected(std::string("malformed job payload: ") + e.what());
  }
}

} // namespace hls_media
