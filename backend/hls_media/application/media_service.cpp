#include "media_service.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string_view>
#include <uuid/uuid.h>

namespace hls_media {
namespace fs = std::filesystem;

namespace {
std::string newUuid() {
  uuid_t uuid;
  uuid_generate(uuid);
  char text[37];
  uuid_unparse_lower(uuid, text);
  return text;
}

// Code points in a well-formed UTF-8 string; nullopt on bad, overlong or
// surrogate sequences.
std::optional<std::size_t> utf8Length(std::string_view text) {
  std::size_t count = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    auto lead = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
      cp = lead;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
      extra = 1;
      cp = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      extra = 2;
      cp = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      extra = 3;
      cp = lead & 0x07;
    } else {
      return std::nullopt;
    }
    if (i + extra >= text.size()) {
      return std::nullopt;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      auto next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0) != 0x80) {
        return std::nullopt;
      }
      cp = (cp << 6) | (next & 0x3F);
    }
    if ((extra == 2 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) ||
        (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF))) {
      return std::nullopt;
    }
    i += extra + 1;
    ++count;
  }
  return count;
}
} // namespace

MediaService::MediaService(std::shared_ptr<AssetRepository> repository,
                           std::shared_ptr<JobOrchestrator> orchestrator,
                           MediaLayout layout)
  : repository_(std::move(repository)),
    orchestrator_(std::move(orchestrator)),
    layout_(std::move(layout)) {}

std::string MediaService::storedExtension(const std::string& filename) {
  auto ext = fs::path(filename).extension().string();
  if (ext.size() < 2 || ext.size() > 6) {
    return ".mp4";
  }
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  bool clean = std::all_of(ext.begin() + 1, ext.end(),
                           [](unsigned char c) { return std::isalnum(c) != 0; });
  return clean ? ext : ".mp4";
}

MediaResult<void> MediaService::validate(const UploadRequest& request) {
  if (request.title.empty()) {
    return makeError(ErrorCode::InvalidArgument, "title is required");
  }

  auto title = utf8Length(request.title);
  auto description = utf8Length(request.description);
  auto category = utf8Length(request.category);
  if (!title || !description || !category) {
    return makeError(ErrorCode::InvalidArgument, "title, description and category must be UTF-8");
  }
  if (*title > kMaxTitleChars) {
    return makeError(ErrorCode::InvalidArgument,
                     std::format("title is longer than {} characters", kMaxTitleChars));
  }
  if (*category > kMaxCategoryChars) {
    return makeError(ErrorCode::InvalidArgument,
                     std::format("category is longer than {} characters", kMaxCategoryChars));
  }
  if (request.description.size() > kMaxDescriptionBytes) {
    return makeError(ErrorCode::InvalidArgument,
                     std::format("description is longer than {} bytes", kMaxDescriptionBytes));
  }
  return {};
}

MediaResult<fs::path> MediaService::reserveUploadFile() {
  std::error_code ec;
  fs::create_directories(layout_.sourceDir(), ec);
  if (ec) {
    return makeError(ErrorCode::StorageFailure, "cannot create upload directory: " + ec.message());
  }
  return layout_.sourceDir() / ("." + newUuid() + ".part");
}

MediaResult<std::string> MediaService::storeSource(const std::string& extension, const fs::path& spooled) {
  auto relative = "videos/original/" + newUuid() + extension;
  auto target = layout_.absolute(relative);

  std::error_code ec;
  fs::rename(spooled, target, ec);
  if (ec) {
    return makeError(ErrorCode::StorageFailure, "cannot store " + target.string() + ": " + ec.message());
  }
  return relative;
}

MediaResult<Asset> MediaService::uploadAsset(const UploadRequest& request, const fs::path& spooled) {
  std::error_code ec;
  auto discard = [&spooled, &ec](MediaError error) -> MediaResult<Asset> {
    fs::remove(spooled, ec);
    return std::unexpected(std::move(error));
  };

  if (auto valid = validate(request); !valid) {
    return discard(valid.error());
  }
  auto size = spooled.empty() ? 0 : fs::file_size(spooled, ec);
  if (ec || size == 0) {
    return discard(MediaError{ErrorCode::InvalidArgument, "video file is required"});
  }

  auto stored = storeSource(storedExtension(request.filename), spooled);
  if (!stored) {
    return discard(stored.error());
  }

  Asset draft;
  draft.title = request.title;
  draft.description = request.description;
  draft.category = request.category;
  draft.source_file_path = *stored;

  auto created = repository_->create(draft);
  if (!created) {
    fs::remove(layout_.absolute(*stored), ec);
    return std::unexpected(created.error());
  }

  if (auto queued = orchestrator_->onAssetCreated(created->id); !queued) {
    std::cerr << "[media] asset " << created->id << " stored but not queued: "
              << queued.error().message << std::endl;
  }
  return created;
}

MediaResult<std::vector<Asset>> MediaService::listAssets() {
  return repository_->findAll();
}

} // namespace hls_media
