#include "media_layout.hpp"
#include <format>

namespace hls_media {
namespace fs = std::filesystem;

MediaLayout::MediaLayout(const fs::path& root)
  : root_(fs::absolute(root).lexically_normal()) {
  // a trailing separator leaves an empty filename element; strip it
  if (!root_.has_filename() && root_.has_parent_path() && root_ != root_.root_path()) {
    root_ = root_.parent_path();
  }
}

fs::path MediaLayout::hlsRoot() const {
  return root_ / "hls";
}

fs::path MediaLayout::assetDir(std::int64_t asset_id) const {
  return hlsRoot() / std::to_string(asset_id);
}

fs::path MediaLayout::variantDir(std::int64_t asset_id, std::string_view variant) const {
  return assetDir(asset_id) / fs::path(variant);
}

fs::path MediaLayout::stagingDir(std::int64_t asset_id, std::string_view variant) const {
  return assetDir(asset_id) / std::format(".{}.partial", variant);
}

fs::path MediaLayout::thumbnailPath(std::int64_t asset_id) const {
  return assetDir(asset_id) / fs::path(kThumbnailName);
}

fs::path MediaLayout::sourceDir() const {
  return root_ / "videos" / "original";
}

std::string MediaLayout::hlsRelativeDir(std::int64_t asset_id) {
  return std::format("hls/{}", asset_id);
}

std::string MediaLayout::thumbnailRelativePath(std::int64_t asset_id) {
  return std::format("hls/{}/{}", asset_id, kThumbnailName);
}

fs::path MediaLayout::absolute(const std::string& relative) const {
  return (root_ / relative).lexically_normal();
}

} // namespace hls_media
