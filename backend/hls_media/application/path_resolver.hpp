#pragma once

#include "domain/media_error.hpp"
#include "domain/media_layout.hpp"
#include "domain/quality.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace hls_media {

// Maps (asset id, quality label, leaf filename) to one file below
// <root>/hls/<id>/<variant>/. Pure: no filesystem access, no side effects.
// Every rejection is NotFound.
class PathResolver {
public:
  PathResolver(MediaLayout layout, ResolutionAliasTable aliases);

  MediaResult<std::filesystem::path> resolve(std::int64_t asset_id,
                                             std::string_view requested_quality,
                                             std::string_view filename) const;

  MediaResult<std::filesystem::path> resolveThumbnail(std::int64_t asset_id) const;

  const MediaLayout& layout() const { return layout_; }

  // A leaf must be non-empty and free of '/', '\\' and NUL.
  static bool isLeafName(std::string_view filename);

private:
  static bool strictlyInside(const std::filesystem::path& candidate,
                             const std::filesystem::path& base);

  MediaLayout layout_;
  ResolutionAliasTable aliases_;
};

} // namespace hls_media
