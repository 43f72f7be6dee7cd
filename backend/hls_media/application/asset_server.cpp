#include "asset_server.hpp"
#include <iostream>
#include <system_error>

namespace hls_media {
namespace fs = std::filesystem;

AssetServer::AssetServer(std::shared_ptr<const PathResolver> resolver)
  : resolver_(std::move(resolver)) {}

MediaResult<ServedFile> AssetServer::serveManifest(std::int64_t asset_id, std::string_view quality) const {
  return serveExisting(resolver_->resolve(asset_id, quality, kManifestName), kManifestContentType);
}

MediaResult<ServedFile> AssetServer::serveSegment(std::int64_t asset_id, std::string_view quality,
                                                  std::string_view filename) const {
  return serveExisting(resolver_->resolve(asset_id, quality, filename), kSegmentContentType);
}

MediaResult<ServedFile> AssetServer::serveThumbnail(std::int64_t asset_id) const {
  return serveExisting(resolver_->resolveThumbnail(asset_id), kThumbnailContentType);
}

MediaResult<ServedFile> AssetServer::serveExisting(const MediaResult<fs::path>& resolved,
                                                   std::string_view content_type) const {
  if (!resolved) {
    return std::unexpected(resolved.error());
  }

  std::error_code ec;
  if (!fs::is_regular_file(*resolved, ec) || ec) {
    return notFound();
  }

  // The file must sit directly in the canonical form of the directory it was
  // resolved in (hls/<id>/<variant>/ or hls/<id>/). A planted symlink that
  // leads anywhere else, another asset or variant included, is refused.
  auto real = fs::canonical(*resolved, ec);
  if (ec) {
    return notFound();
  }
  const auto& hls_root = resolver_->layout().hlsRoot();
  auto relative_dir = resolved->parent_path().lexically_relative(hls_root);
  if (relative_dir.empty() || *relative_dir.begin() == "..") {
    return notFound();
  }
  auto canonical_root = fs::weakly_canonical(hls_root, ec);
  if (ec) {
    return notFound();
  }
  if (real.parent_path() != (canonical_root / relative_dir).lexically_normal()) {
    std::cerr << "[asset_server] refusing " << resolved->string()
              << ": resolves outside its own directory" << std::endl;
    return notFound();
  }

  auto size = fs::file_size(real, ec);
  if (ec) {
    return notFound();
  }

  return ServedFile{
    .path = real,
    .content_type = std::string(content_type),
    .size = size,
  };
}

} // namespace hls_media
