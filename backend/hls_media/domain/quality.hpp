#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hls_media {

inline constexpr std::string_view kManifestName = "index.m3u8";

struct QualityVariant {
  std::string name;            // stored directory name, e.g. "720p"
  int height{0};               // width follows the source aspect ratio
  int video_bitrate_kbps{0};
};

struct AudioProfile {
  std::string codec{"aac"};
  int sample_rate{48000};
  int bitrate_kbps{128};
};

struct HlsPackaging {
  int segment_seconds{4};
  std::string playlist_type{"vod"};
  std::string manifest_name{kManifestName};
  std::string segment_pattern{"%03d.ts"};
};

// Fixed encoding ladder. Variants are produced in the order listed.
struct QualityLadder {
  std::vector<QualityVariant> variants;
  AudioProfile audio;
  HlsPackaging packaging;
  std::string video_codec{"libx264"};
  std::string preset{"veryfast"};

  const QualityVariant* find(std::string_view name) const;

  // 360p@800k, 720p@2500k, 1080p@4500k
  static QualityLadder standard();
};

// Client-facing quality label -> stored variant directory. Immutable.
class ResolutionAliasTable {
public:
  // Throws std::invalid_argument if an alias points at a variant the ladder
  // never produces.
  ResolutionAliasTable(std::map<std::string, std::string, std::less<>> aliases,
                       const QualityLadder& ladder);

  std::optional<std::string> lookup(std::string_view label) const;
  const std::map<std::string, std::string, std::less<>>& entries() const { return aliases_; }

  // 480p->360p, 360p->360p, 720p->720p, 1080p->1080p
  static ResolutionAliasTable standard(const QualityLadder& ladder);

private:
  std::map<std::string, std::string, std::less<>> aliases_;
};

} // namespace hls_media
