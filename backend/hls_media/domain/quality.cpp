#include "quality.hpp"
#include <algorithm>
#include <stdexcept>

namespace hls_media {

const QualityVariant* QualityLadder::find(std::string_view name) const {
  auto it = std::find_if(variants.begin(), variants.end(),
                         [name](const QualityVariant& v) { return v.name == name; });
  return it == variants.end() ? nullptr : &*it;
}

QualityLadder QualityLadder::standard() {
  QualityLadder ladder;
  ladder.variants = {
    {.name = "360p", .height = 360, .video_bitrate_kbps = 800},
    {.name = "720p", .height = 720, .video_bitrate_kbps = 2500},
    {.name = "1080p", .height = 1080, .video_bitrate_kbps = 4500},
  };
  return ladder;
}

ResolutionAliasTable::ResolutionAliasTable(std::map<std::string, std::string, std::less<>> aliases,
                                           const QualityLadder& ladder)
  : aliases_(std::move(aliases)) {
  for (const auto& [label, target] : aliases_) {
    if (!ladder.find(target)) {
      throw std::invalid_argument("quality alias '" + label + "' targets unknown variant '" + target + "'");
    }
  }
}

std::optional<std::string> ResolutionAliasTable::lookup(std::string_view label) const {
  auto it = aliases_.find(label);
  if (it == aliases_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ResolutionAliasTable ResolutionAliasTable::standard(const QualityLadder& ladder) {
  return ResolutionAliasTable({
    {"480p", "360p"},
    {"360p", "360p"},
    {"720p", "720p"},
    {"1080p", "1080p"},
  }, ladder);
}

} // namespace hls_media
