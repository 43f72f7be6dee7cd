#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace hls_media {

struct Asset {
  std::int64_t id{0};          // assigned by the repository, immutable
  std::string title;
  std::string description;
  std::string category;        // free text
  std::string source_file_path;// relative to media root, empty = no source
  std::string thumbnail_path;  // relative to media root, empty until set
  std::string hls_base_dir;    // "hls/<id>" once processed
  bool processed{false};
  std::string created_at;      // UTC, "YYYY-MM-DDTHH:MM:SSZ"

  bool hasSource() const { return !source_file_path.empty(); }
  bool hasThumbnail() const { return !thumbnail_path.empty(); }
};

// The single write a successful transcode performs. processed=true is implied.
// A missing thumbnail_path leaves the stored thumbnail untouched.
struct ProcessingUpdate {
  std::string hls_base_dir;
  std::optional<std::string> thumbnail_path;
};

} // namespace hls_media
