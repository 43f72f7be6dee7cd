#include "path_resolver.hpp"
#include <algorithm>

namespace hls_media {
namespace fs = std::filesystem;

PathResolver::PathResolver(MediaLayout layout, ResolutionAliasTable aliases)
  : layout_(std::move(layout)), aliases_(std::move(aliases)) {}

bool PathResolver::isLeafName(std::string_view filename) {
  if (filename.empty()) {
    return false;
  }
  return filename.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

bool PathResolver::strictlyInside(const fs::path& candidate, const fs::path& base) {
  const fs::path dir = base.has_filename() ? base : base.parent_path();
  auto c = candidate.begin();
  for (const auto& part : dir) {
    if (c == candidate.end() || *c != part) {
      return false;
    }
    ++c;
  }
  // at least one non-empty component past the base
  return std::any_of(c, candidate.end(), [](const fs::path& part) { return !part.empty(); });
}

MediaResult<fs::path> PathResolver::resolve(std::int64_t asset_id,
                                            std::string_view requested_quality,
                                            std::string_view filename) const {
  auto variant = aliases_.lookup(requested_quality);
  if (!variant) {
    return notFound();
  }
  if (asset_id < 0 || !isLeafName(filename)) {
    return notFound();
  }

  const fs::path base = layout_.variantDir(asset_id, *variant).lexically_normal();
  const fs::path candidate = (base / fs::path(filename)).lexically_normal();

  if (!strictlyInside(candidate, base)) {
    return notFound();
  }
  return candidate;
}

MediaResult<fs::path> PathResolver::resolveThumbnail(std::int64_t asset_id) const {
  if (asset_id < 0) {
    return notFound();
  }
  const fs::path base = layout_.assetDir(asset_id).lexically_normal();
  const fs::path candidate = layout_.thumbnailPath(asset_id).lexically_normal();
  if (!strictlyInside(candidate, base)) {
    return notFound();
  }
  return candidate;
}

} // namespace hls_media
