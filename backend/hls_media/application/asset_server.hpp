#pragma once

#include "application/path_resolver.hpp"
#include "domain/media_error.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace hls_media {

inline constexpr std::string_view kManifestContentType = "application/vnd.apple.mpegurl";
inline constexpr std::string_view kSegmentContentType = "video/MP2T";
inline constexpr std::string_view kThumbnailContentType = "image/jpeg";

// Body is not read here; the transport streams it from path.
struct ServedFile {
  std::filesystem::path path;
  std::string content_type;
  std::uintmax_t size{0};
};

// Read side of the HLS package. Only ever fails with NotFound; the caller is
// assumed to be authorized already.
class AssetServer {
public:
  explicit AssetServer(std::shared_ptr<const PathResolver> resolver);

  MediaResult<ServedFile> serveManifest(std::int64_t asset_id, std::string_view quality) const;
  MediaResult<ServedFile> serveSegment(std::int64_t asset_id, std::string_view quality,
                                       std::string_view filename) const;
  MediaResult<ServedFile> serveThumbnail(std::int64_t asset_id) const;

private:
  MediaResult<ServedFile> serveExisting(const MediaResult<std::filesystem::path>& resolved,
                                        std::string_view content_type) const;

  std::shared_ptr<const PathResolver> resolver_;
};

} // namespace hls_media
