#pragma once

#include "application/asset_lock_registry.hpp"
#include "domain/asset_repository.hpp"
#include "domain/encoder.hpp"
#include "domain/media_error.hpp"
#include "domain/media_layout.hpp"
#include "domain/quality.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace hls_media {

struct PipelineOptions {
  std::chrono::seconds thumbnail_offset{3};
};

/*
  Turns an asset's source file into <root>/hls/<id>/{360p,720p,1080p}/ plus
  thumb.jpg, then records the result with one atomic markProcessed.

  - no source file: success, nothing touched
  - any variant fails: EncodingFailure with the encoder's message, record untouched
  - thumbnail fails: logged, record written without a thumbnail
  Runs for the same asset are serialized through the lock registry.
*/
class TranscodePipeline {
public:
  TranscodePipeline(std::shared_ptr<AssetRepository> repository,
                    std::shared_ptr<Encoder> encoder,
                    std::shared_ptr<AssetLockRegistry> locks,
                    MediaLayout layout,
                    QualityLadder ladder,
                    PipelineOptions options = {});

  MediaResult<void> run(std::int64_t asset_id);

  const QualityLadder& ladder() const { return ladder_; }

private:
  MediaResult<void> encodeVariant(std::int64_t asset_id,
                                  const std::filesystem::path& input,
                                  const QualityVariant& variant);
  std::optional<std::string> extractThumbnail(std::int64_t asset_id,
                                              const std::filesystem::path& input);

  std::shared_ptr<AssetRepository> repository_;
  std::shared_ptr<Encoder> encoder_;
  std::shared_ptr<AssetLockRegistry> locks_;
  MediaLayout layout_;
  QualityLadder ladder_;
  PipelineOptions options_;
};

} // namespace hls_media
