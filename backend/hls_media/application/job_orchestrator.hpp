#pragma once

#include "application/transcode_pipeline.hpp"
#include "domain/asset.hpp"
#include "domain/asset_repository.hpp"
#include "domain/job_queue.hpp"
#include "domain/media_error.hpp"

#include <cstdint>
#include <memory>

namespace hls_media {

class JobOrchestrator {
public:
  JobOrchestrator(std::shared_ptr<AssetRepository> repository,
                  std::shared_ptr<JobQueue> queue,
                  std::shared_ptr<TranscodePipeline> pipeline);

  // Enqueues one transcode job iff the asset was just created, has a source
  // file and is not processed yet. Returns whether a job was enqueued.
  MediaResult<bool> onAssetSaved(const Asset& asset, bool created);

  // Called once by the upload path for a freshly inserted asset.
  MediaResult<bool> onAssetCreated(std::int64_t asset_id);

  // Consumer side: runs the job a queue delivered.
  MediaResult<void> dispatch(const Job& job);

private:
  std::shared_ptr<AssetRepository> repository_;
  std::shared_ptr<JobQueue> queue_;
  std::shared_ptr<TranscodePipeline> pipeline_;
};

} // namespace hls_media
