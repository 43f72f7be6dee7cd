#include "transcode_pipeline.hpp"
#include <chrono>
#include <format>
#include <iostream>
#include <system_error>

namespace hls_media {
namespace fs = std::filesystem;

TranscodePipeline::TranscodePipeline(std::shared_ptr<AssetRepository> repository,
                                     std::shared_ptr<Encoder> encoder,
                                     std::shared_ptr<AssetLockRegistry> locks,
                                     MediaLayout layout,
                                     QualityLadder ladder,
                                     PipelineOptions options)
  : repository_(std::move(repository)),
    encoder_(std::move(encoder)),
    locks_(std::move(locks)),
    layout_(std::move(layout)),
    ladder_(std::move(ladder)),
    options_(options) {}

MediaResult<void> TranscodePipeline::run(std::int64_t asset_id) {
  auto asset = repository_->findById(asset_id);
  if (!asset) {
    return std::unexpected(asset.error());
  }
  if (!asset->hasSource()) {
    std::cout << "[pipeline] asset " << asset_id << " has no source file, nothing to do" << std::endl;
    return {};
  }

  auto hold = locks_->acquire(asset_id);
  auto start_time = std::chrono::steady_clock::now();

  const fs::path input = layout_.absolute(asset->source_file_path);
  const fs::path out_base = layout_.assetDir(asset_id);

  std::error_code ec;
  fs::create_directories(out_base, ec);
  if (ec) {
    return makeError(ErrorCode::StorageFailure,
                     std::format("cannot create {}: {}", out_base.string(), ec.message()));
  }

  for (const auto& variant : ladder_.variants) {
    std::cout << "[pipeline] asset " << asset_id << ": encoding " << variant.name << std::endl;
    if (auto result = encodeVariant(asset_id, input, variant); !result) {
      std::cerr << "[pipeline] asset " << asset_id << ": " << variant.name
                << " failed, aborting run: " << result.error().message << std::endl;
      return result;
    }
  }

  ProcessingUpdate update{
    .hls_base_dir = MediaLayout::hlsRelativeDir(asset_id),
    .thumbnail_path = extractThumbnail(asset_id, input),
  };

  if (auto saved = repository_->markProcessed(asset_id, update); !saved) {
    std::cerr << "[pipeline] asset " << asset_id << ": saving result failed: "
              << saved.error().message << std::endl;
    return saved;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start_time);
  std::cout << "[pipeline] asset " << asset_id << " processed in " << elapsed.count() << " ms" << std::endl;
  return {};
}

MediaResult<void> TranscodePipeline::encodeVariant(std::int64_t asset_id,
                                                   const fs::path& input,
                                                   const QualityVariant& variant) {
  const fs::path staging = layout_.stagingDir(asset_id, variant.name);
  const fs::path target = layout_.variantDir(asset_id, variant.name);

  std::error_code ec;
  fs::remove_all(staging, ec);  // left over from an interrupted run
  fs::create_directories(staging, ec);
  if (ec) {
    return makeError(ErrorCode::StorageFailure,
                     std::format("cannot create {}: {}", staging.string(), ec.message()));
  }

  VariantEncodeRequest request{
    .input = input,
    .output_dir = staging,
    .variant = variant,
    .audio = ladder_.audio,
    .packaging = ladder_.packaging,
    .video_codec = ladder_.video_codec,
    .preset = ladder_.preset,
  };

  auto encoded = encoder_->encodeVariant(request);
  if (!encoded) {
    fs::remove_all(staging, ec);
    return makeError(ErrorCode::EncodingFailure, encoded.error());
  }
  if (!fs::is_regular_file(staging / ladder_.packaging.manifest_name, ec)) {
    fs::remove_all(staging, ec);
    return makeError(ErrorCode::EncodingFailure,
                     std::format("encoder reported success but wrote no {}", ladder_.packaging.manifest_name));
  }

  // swap the finished package in; readers never see a half-written manifest
  fs::remove_all(target, ec);
  if (ec) {
    return makeError(ErrorCode::StorageFailure,
                     std::format("cannot replace {}: {}", target.string(), ec.message()));
  }
  fs::rename(staging, target, ec);
  if (ec) {
    return makeError(ErrorCode::StorageFailure,
                     std::format("cannot move {} into place: {}", staging.string(), ec.message()));
  }
  return {};
}

std::optional<std::string> TranscodePipeline::extractThumbnail(std::int64_t asset_id,
                                                               const fs::path& input) {
  const fs::path thumb = layout_.thumbnailPath(asset_id);

  auto extracted = encoder_->extractThumbnail(ThumbnailRequest{
    .input = input,
    .output = thumb,
    .offset = options_.thumbnail_offset,
  });
  if (!extracted) {
    std::cerr << "[pipeline] asset " << asset_id << ": thumbnail extraction failed, continuing without: "
              << extracted.error() << std::endl;
    return std::nullopt;
  }

  std::error_code ec;
  if (!fs::is_regular_file(thumb, ec)) {
    std::cerr << "[pipeline] asset " << asset_id << ": encoder wrote no thumbnail, continuing without" << std::endl;
    return std::nullopt;
  }
  return MediaLayout::thumbnailRelativePath(asset_id);
}

} // namespace hls_media
