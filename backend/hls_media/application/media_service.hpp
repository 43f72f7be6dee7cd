#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "application/job_orchestrator.hpp"
#include "domain/asset.hpp"
#include "domain/asset_repository.hpp"
#include "domain/media_error.hpp"
#include "domain/media_layout.hpp"

namespace hls_media {

struct UploadRequest {
  std::string title;
  std::string description;
  std::string category;
  std::string filename;  // client-side name; only its extension is kept
};

class MediaService {
public:
  MediaService(std::shared_ptr<AssetRepository> repository,
               std::shared_ptr<JobOrchestrator> orchestrator,
               MediaLayout layout);

  // Column limits of the videos table. Titles and categories are counted in
  // characters, descriptions in bytes.
  static constexpr std::size_t kMaxTitleChars = 255;
  static constexpr std::size_t kMaxCategoryChars = 255;
  static constexpr std::size_t kMaxDescriptionBytes = 65535;

  // A fresh hidden file under videos/original/ to stream an upload body into.
  MediaResult<std::filesystem::path> reserveUploadFile();

  // Moves the spooled body to videos/original/<uuid><ext>, creates the record
  // and hands it to the orchestrator. The spooled file is consumed on every
  // path. A queue failure is logged; the upload still succeeds.
  MediaResult<Asset> uploadAsset(const UploadRequest& request, const std::filesystem::path& spooled);

  // InvalidArgument unless every text field is UTF-8 and fits its column.
  static MediaResult<void> validate(const UploadRequest& request);

  MediaResult<std::vector<Asset>> listAssets();

  // ".mp4" unless the client name carries a short alphanumeric extension.
  static std::string storedExtension(const std::string& filename);

private:
  MediaResult<std::string> storeSource(const std::string& extension, const std::filesystem::path& spooled);

  std::shared_ptr<AssetRepository> repository_;
  std::shared_ptr<JobOrchestrator> orchestrator_;
  MediaLayout layout_;
};

} // namespace hls_media
