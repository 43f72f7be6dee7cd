#pragma once
#include "quality.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <string>

namespace hls_media {

struct VariantEncodeRequest {
  std::filesystem::path input;
  std::filesystem::path output_dir;  // receives the manifest and segments
  QualityVariant variant;
  AudioProfile audio;
  HlsPackaging packaging;
  std::string video_codec;
  std::string preset;
};

struct ThumbnailRequest {
  std::filesystem::path input;
  std::filesystem::path output;
  std::chrono::seconds offset{3};
};

// Blocking media encoder. The error string is the encoder's own diagnostic.
class Encoder {
public:
  virtual ~Encoder() = default;
  virtual std::expected<void, std::string> encodeVariant(const VariantEncodeRequest& request) = 0;
  virtual std::expected<void, std::string> extractThumbnail(const ThumbnailRequest& request) = 0;
};

} // namespace hls_media
