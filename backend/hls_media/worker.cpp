#include "application/job_orchestrator.hpp"
#include "common/config/config.hpp"
#include "infrastructure/redis_job_queue.hpp"
#include "wiring.hpp"

#include <iostream>
#include <utility>
#include <boost/asio.hpp>

// Consumes transcode jobs from Redis. Run as many of these as the encoding
// hosts allow; each job still holds its asset lock inside the process.
int main(int argc, char** argv) {
  try {
    hls_media::loadConfig(argc, argv);
    const auto& cfg = config::Config::getInstance();
    const auto& queue_cfg = cfg.getJobQueue();

    auto repository = hls_media::makeRepository(cfg);
    auto locks = std::make_shared<hls_media::AssetLockRegistry>();
    auto pipeline = hls_media::makePipeline(cfg, repository, locks);
    auto queue = std::make_shared<hls_media::RedisJobQueue>(queue_cfg.queue_key);
    auto orchestrator = std::make_shared<hls_media::JobOrchestrator>(repository, queue, pipeline);

    hls_media::RedisJobWorker worker(
      hls_media::RedisJobWorker::Options{
        .queue_key = queue_cfg.queue_key,
        .threads = queue_cfg.worker_threads,
        .max_attempts = queue_cfg.max_attempts,
        .poll_timeout = queue_cfg.poll_timeout},
      [orchestrator](const hls_media::Job& job) { return orchestrator->dispatch(job); });

    boost::asio::io_context ioc{1};
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code&, int signal) {
      std::cout << "[worker] signal " << signal << ", draining" << std::endl;
      ioc.stop();
    });

    worker.start();
    ioc.run();
    worker.stop();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
