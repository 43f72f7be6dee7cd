#pragma once

#include "domain/encoder.hpp"

#include <expected>
#include <string>
#include <vector>

namespace hls_media {

// Runs the ffmpeg binary as a child process, one blocking call per request.
// Arguments are passed as a vector; nothing goes through a shell.
class FfmpegEncoder : public Encoder {
public:
  // binary is either an absolute path or a name looked up on PATH.
  explicit FfmpegEncoder(std::string binary = "ffmpeg");

  std::expected<void, std::string> encodeVariant(const VariantEncodeRequest& request) override;
  std::expected<void, std::string> extractThumbnail(const ThumbnailRequest& request) override;

  bool available() const { return !executable_.empty(); }

  static std::vector<std::string> buildVariantArgs(const VariantEncodeRequest& request);
  static std::vector<std::string> buildThumbnailArgs(const ThumbnailRequest& request);

private:
  std::expected<void, std::string> execute(const std::vector<std::string>& args);

  std::string binary_;
  std::string executable_;
};

} // namespace hls_media
