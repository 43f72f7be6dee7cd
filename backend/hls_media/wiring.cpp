#include "wiring.hpp"
#include "infrastructure/ffmpeg_encoder.hpp"
#include "infrastructure/memory_asset_repository.hpp"
#include "infrastructure/mysql_asset_repository.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace hls_media {

void loadConfig(int argc, char** argv) {
  std::string path;
  if (argc > 1) {
    path = argv[1];
  } else if (const char* env = std::getenv("HLS_MEDIA_CONFIG")) {
    path = env;
  }

  if (path.empty()) {
    std::cout << "[config] no config file given, using defaults" << std::endl;
    return;
  }
  config::Config::getInstance().loadFromFile(path);
  std::cout << "[config] loaded " << path << std::endl;
}

QualityLadder ladderFromConfig(const config::MediaConfig& media) {
  auto ladder = QualityLadder::standard();
  ladder.video_codec = media.video_codec;
  ladder.preset = media.preset;
  return ladder;
}

std::shared_ptr<AssetRepository> makeRepository(const config::Config& cfg) {
  const auto& backend = cfg.getRepository().backend;
  if (backend == "memory") {
    std::cout << "[store] using in-memory repository" << std::endl;
    return std::make_shared<MemoryAssetRepository>();
  }

  auto repository = std::make_shared<MysqlAssetRepository>();
  if (auto schema = repository->ensureSchema(); !schema) {
    throw std::runtime_error("cannot prepare videos table: " + schema.error().message);
  }
  std::cout << "[store] using MySQL " << cfg.getDatabase().host << "/" << cfg.getDatabase().db_name << std::endl;
  return repository;
}

std::shared_ptr<TranscodePipeline> makePipeline(const config::Config& cfg,
                                                std::shared_ptr<AssetRepository> repository,
                                                std::shared_ptr<AssetLockRegistry> locks) {
  const auto& media = cfg.getMedia();
  auto encoder = std::make_shared<FfmpegEncoder>(media.ffmpeg_binary);
  return std::make_shared<TranscodePipeline>(std::move(repository), std::move(encoder), std::move(locks),
                                             MediaLayout(media.media_root), ladderFromConfig(media),
                                             PipelineOptions{.thumbnail_offset = media.thumbnail_offset});
}

} // namespace hls_media
