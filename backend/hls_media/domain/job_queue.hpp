#pragma once
#include "media_error.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace hls_media {

inline constexpr std::string_view kTranscodeJob = "transcode_video";

struct Job {
  std::string name;
  std::int64_t asset_id{0};
  unsigned int attempt{0};
};

using JobHandler = std::function<MediaResult<void>(const Job&)>;

// Producer side of an at-least-once job queue. enqueue returns once the job
// is accepted; execution happens elsewhere.
class JobQueue {
public:
  virtual ~JobQueue() = default;
  virtual std::expected<void, std::string> enqueue(std::string_view job_name, std::int64_t asset_id) = 0;
};

} // namespace hls_media
