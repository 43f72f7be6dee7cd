#include "job_orchestrator.hpp"
#include <iostream>

namespace hls_media {

JobOrchestrator::JobOrchestrator(std::shared_ptr<AssetRepository> repository,
                                 std::shared_ptr<JobQueue> queue,
                                 std::shared_ptr<TranscodePipeline> pipeline)
  : repository_(std::move(repository)),
    queue_(std::move(queue)),
    pipeline_(std::move(pipeline)) {}

MediaResult<bool> JobOrchestrator::onAssetSaved(const Asset& asset, bool created) {
  if (!created || !asset.hasSource() || asset.processed) {
    return false;
  }

  if (auto queued = queue_->enqueue(kTranscodeJob, asset.id); !queued) {
    return makeError(ErrorCode::QueueFailure, queued.error());
  }
  std::cout << "[orchestrator] enqueued " << kTranscodeJob << " for asset " << asset.id << std::endl;
  return true;
}

MediaResult<bool> JobOrchestrator::onAssetCreated(std::int64_t asset_id) {
  auto asset = repository_->findById(asset_id);
  if (!asset) {
    return std::unexpected(asset.error());
  }
  return onAssetSaved(*asset, true);
}

MediaResult<void> JobOrchestrator::dispatch(const Job& job) {
  if (job.name != kTranscodeJob) {
    return makeError(ErrorCode::InvalidArgument, "unknown job: " + job.name);
  }
  std::cout << "[orchestrator] running " << job.name << " for asset " << job.asset_id
            << " (attempt " << job.attempt + 1 << ")" << std::endl;
  return pipeline_->run(job.asset_id);
}

} // namespace hls_media
