#pragma once

#include "application/asset_lock_registry.hpp"
#include "application/transcode_pipeline.hpp"
#include "common/config/config.hpp"
#include "domain/asset_repository.hpp"
#include "domain/media_layout.hpp"
#include "domain/quality.hpp"

#include <memory>
#include <string>

namespace hls_media {

// Config path from argv[1], else $HLS_MEDIA_CONFIG, else none (defaults only).
void loadConfig(int argc, char** argv);

QualityLadder ladderFromConfig(const config::MediaConfig& media);
std::shared_ptr<AssetRepository> makeRepository(const config::Config& cfg);
std::shared_ptr<TranscodePipeline> makePipeline(const config::Config& cfg,
                                                std::shared_ptr<AssetRepository> repository,
                                                std::shared_ptr<AssetLockRegistry> locks);

} // namespace hls_media
