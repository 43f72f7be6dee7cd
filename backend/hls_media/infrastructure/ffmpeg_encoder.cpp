#include "ffmpeg_encoder.hpp"

#include <boost/process.hpp>
#include <deque>
#include <filesystem>
#include <iostream>

namespace hls_media {
namespace bp = boost::process;

namespace {
// ffmpeg's last lines of stderr are the useful part of a failure.
constexpr size_t kStderrTailLines = 8;

std::vector<std::string> commonArgs() {
  return {"-hide_banner", "-loglevel", "error", "-nostdin", "-y"};
}
} // namespace

FfmpegEncoder::FfmpegEncoder(std::string binary) : binary_(std::move(binary)) {
  if (std::filesystem::path(binary_).is_absolute()) {
    if (std::filesystem::exists(binary_)) {
      executable_ = binary_;
    }
  } else {
    executable_ = bp::search_path(binary_).string();
  }

  if (executable_.empty()) {
    std::cerr << "[ffmpeg] " << binary_ << " not found; encodes will fail" << std::endl;
  }
}

std::vector<std::string> FfmpegEncoder::buildVariantArgs(const VariantEncodeRequest& request) {
  const auto& out = request.output_dir;
  auto args = commonArgs();
  args.insert(args.end(), {
    "-i", request.input.string(),
    "-vf", "scale=-2:" + std::to_string(request.variant.height),
    "-c:v", request.video_codec,
    "-preset", request.preset,
    "-c:a", request.audio.codec,
    "-ar", std::to_string(request.audio.sample_rate),
    "-b:a", std::to_string(request.audio.bitrate_kbps) + "k",
    "-b:v", std::to_string(request.variant.video_bitrate_kbps) + "k",
    "-hls_time", std::to_string(request.packaging.segment_seconds),
    "-hls_playlist_type", request.packaging.playlist_type,
    "-hls_segment_filename", (out / request.packaging.segment_pattern).string(),
    (out / request.packaging.manifest_name).string(),
  });
  return args;
}

std::vector<std::string> FfmpegEncoder::buildThumbnailArgs(const ThumbnailRequest& request) {
  auto args = commonArgs();
  args.insert(args.end(), {
    "-ss", std::to_string(request.offset.count()),
    "-i", request.input.string(),
    "-frames:v", "1",
    request.output.string(),
  });
  return args;
}

std::expected<void, std::string> FfmpegEncoder::encodeVariant(const VariantEncodeRequest& request) {
  return execute(buildVariantArgs(request));
}

std::expected<void, std::string> FfmpegEncoder::extractThumbnail(const ThumbnailRequest& request) {
  return execute(buildThumbnailArgs(request));
}

std::expected<void, std::string> FfmpegEncoder::execute(const std::vector<std::string>& args) {
  if (executable_.empty()) {
    return std::unexpected(binary_ + " is not installed or not found in PATH");
  }

  std::deque<std::string> tail;
  int exit_code = -1;
  try {
    bp::ipstream err_stream;
    bp::child child(executable_, bp::args(args),
                    bp::std_in < bp::null,
                    bp::std_out > bp::null,
                    bp::std_err > err_stream);

    std::string line;
    while (std::getline(err_stream, line)) {
      if (line.empty()) continue;
      tail.push_back(line);
      if (tail.size() > kStderrTailLines) {
        tail.pop_front();
      }
    }
    child.wait();
    exit_code = child.exit_code();
  } catch (const bp::process_error& e) {
    return std::unexpected(std::string("failed to launch ffmpeg: ") + e.what());
  }

  if (exit_code != 0) {
    std::string message = "ffmpeg exited with code " + std::to_string(exit_code);
    for (const auto& l : tail) {
      message += "\n" + l;
    }
    return std::unexpected(message);
  }
  return {};
}

} // namespace hls_media
