#pragma once

#include "domain/job_queue.hpp"
#include <expected>
#include <string>

namespace hls_media {

// Wire form of a queued job: {"job":"transcode_video","asset_id":1,"attempt":0}
std::string encodeJob(const Job& job);
std::expected<Job, std::string> decodeJob(const std::string& payload);

} // namespace hls_media
