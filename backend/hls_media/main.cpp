#include "application/asset_server.hpp"
#include "application/job_orchestrator.hpp"
#include "application/media_service.hpp"
#include "application/path_resolver.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include "infrastructure/redis_job_queue.hpp"
#include "infrastructure/thread_pool_job_queue.hpp"
#include "interface/rest_api_handler.hpp"
#include "wiring.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

int main(int argc, char** argv) {
  try {
    hls_media::loadConfig(argc, argv);
    const auto& cfg = config::Config::getInstance();
    const auto& media = cfg.getMedia();

    hls_media::MediaLayout layout(media.media_root);
    std::filesystem::create_directories(layout.hlsRoot());
    std::filesystem::create_directories(layout.sourceDir());

    auto repository = hls_media::makeRepository(cfg);
    auto locks = std::make_shared<hls_media::AssetLockRegistry>();
    auto pipeline = hls_media::makePipeline(cfg, repository, locks);

    const auto& queue_cfg = cfg.getJobQueue();
    std::shared_ptr<hls_media::JobQueue> queue;
    std::shared_ptr<hls_media::ThreadPoolJobQueue> local_queue;
    if (queue_cfg.backend == "inprocess") {
      local_queue = std::make_shared<hls_media::ThreadPoolJobQueue>(queue_cfg.worker_threads, queue_cfg.max_attempts);
      queue = local_queue;
    } else {
      queue = std::make_shared<hls_media::RedisJobQueue>(queue_cfg.queue_key);
    }

    auto orchestrator = std::make_shared<hls_media::JobOrchestrator>(repository, queue, pipeline);
    if (local_queue) {
      local_queue->start([orchestrator](const hls_media::Job& job) { return orchestrator->dispatch(job); });
    }

    auto resolver = std::make_shared<const hls_media::PathResolver>(
      layout, hls_media::ResolutionAliasTable::standard(pipeline->ladder()));
    auto asset_server = std::make_shared<const hls_media::AssetServer>(resolver);
    auto media_service = std::make_shared<hls_media::MediaService>(repository, orchestrator, layout);
    auto api_handler = std::make_shared<hls_media::RestApiHandler>(asset_server, media_service);

    const auto& http_cfg = cfg.getHttp();
    unsigned int threads = std::max(2u, std::thread::hardware_concurrency());
    boost::asio::io_context ioc{static_cast<int>(threads)};
    auto endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(http_cfg.host), http_cfg.port};

    common::HttpServer http_server{ioc, endpoint, api_handler,
                                   common::HttpSessionOptions{
                                     .body_limit = http_cfg.max_body_bytes,
                                     .upload_limit = http_cfg.max_upload_bytes,
                                     .read_timeout = http_cfg.read_timeout}};

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code&, int signal) {
      std::cout << "[server] signal " << signal << ", shutting down" << std::endl;
      ioc.stop();
    });

    http_server.run();
    std::cout << "[server] HTTP listening on " << cfg.getHttpIpPort()
              << ", media root " << layout.root() << std::endl;

    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (unsigned int i = 1; i < threads; ++i) {
      workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : workers) {
      t.join();
    }

    if (local_queue) {
      local_queue->stop();
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
