#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace hls_media {

/*
  On-disk layout under the media root:

    <root>/hls/<id>/<variant>/index.m3u8
    <root>/hls/<id>/<variant>/NNN.ts
    <root>/hls/<id>/thumb.jpg
    <root>/videos/original/<uuid><ext>

  Pure path arithmetic; nothing here touches the filesystem.
*/
class MediaLayout {
public:
  // root is made absolute and lexically normalized once here
  explicit MediaLayout(const std::filesystem::path& root);

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path hlsRoot() const;
  std::filesystem::path assetDir(std::int64_t asset_id) const;
  std::filesystem::path variantDir(std::int64_t asset_id, std::string_view variant) const;
  std::filesystem::path stagingDir(std::int64_t asset_id, std::string_view variant) const;
  std::filesystem::path thumbnailPath(std::int64_t asset_id) const;
  std::filesystem::path sourceDir() const;

  // Media-root-relative forms stored on the asset record.
  static std::string hlsRelativeDir(std::int64_t asset_id);
  static std::string thumbnailRelativePath(std::int64_t asset_id);

  // Absolute path of a media-root-relative reference.
  std::filesystem::path absolute(const std::string& relative) const;

  static constexpr std::string_view kThumbnailName = "thumb.jpg";

private:
  std::filesystem::path root_;
};

} // namespace hls_media
