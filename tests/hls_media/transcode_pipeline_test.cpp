#include "application/asset_server.hpp"
#include "application/transcode_pipeline.hpp"
#include "hls_media/test_support.hpp"
#include "infrastructure/memory_asset_repository.hpp"

#include <gtest/gtest.h>

#include <thread>

namespace hls_media {
namespace {
namespace fs = std::filesystem;

class TranscodePipelineTest : public ::testing::Test {
protected:
  TranscodePipelineTest()
    : repository_(std::make_shared<MemoryAssetRepository>()),
      encoder_(std::make_shared<testing::FakeEncoder>()),
      locks_(std::make_shared<AssetLockRegistry>()),
      layout_(root_.path()),
      pipeline_(repository_, encoder_, locks_, layout_, QualityLadder::standard()) {}

  std::int64_t addAsset(bool with_source) {
    Asset draft;
    draft.title = "clip";
    if (with_source) {
      root_.writeFile("videos/original/clip.mp4", "not really a video");
      draft.source_file_path = "videos/original/clip.mp4";
    }
    return repository_->create(draft).value().id;
  }

  Asset load(std::int64_t id) { return repository_->findById(id).value(); }

  testing::TempMediaRoot root_;
  std::shared_ptr<MemoryAssetRepository> repository_;
  std::shared_ptr<testing::FakeEncoder> encoder_;
  std::shared_ptr<AssetLockRegistry> locks_;
  MediaLayout layout_;
  TranscodePipeline pipeline_;
};

TEST_F(TranscodePipelineTest, NoSourceIsNoOp) {
  auto id = addAsset(false);
  auto before = load(id);

  ASSERT_TRUE(pipeline_.run(id).has_value());

  auto after = load(id);
  EXPECT_FALSE(after.processed);
  EXPECT_EQ(after.hls_base_dir, before.hls_base_dir);
  EXPECT_EQ(encoder_->variantCalls(), 0u);
  EXPECT_EQ(encoder_->thumbnailCalls(), 0u);
  EXPECT_FALSE(fs::exists(layout_.assetDir(id)));
}

TEST_F(TranscodePipelineTest, MissingRecordIsNotFound) {
  auto result = pipeline_.run(404);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::NotFound);
  EXPECT_EQ(encoder_->variantCalls(), 0u);
}

TEST_F(TranscodePipelineTest, SuccessfulRunMarksProcessedAndWritesEveryVariant) {
  auto id = addAsset(true);

  ASSERT_TRUE(pipeline_.run(id).has_value());

  auto asset = load(id);
  EXPECT_TRUE(asset.processed);
  EXPECT_EQ(asset.hls_base_dir, "hls/" + std::to_string(id));
  EXPECT_EQ(asset.thumbnail_path, "hls/" + std::to_string(id) + "/thumb.jpg");
  for (const char* variant : {"360p", "720p", "1080p"}) {
    auto manifest = layout_.variantDir(id, variant) / "index.m3u8";
    ASSERT_TRUE(fs::is_regular_file(manifest)) << manifest;
    EXPECT_NE(testing::readFile(manifest).find("#EXTM3U"), std::string::npos);
    EXPECT_FALSE(fs::exists(layout_.stagingDir(id, variant)));
  }
  EXPECT_TRUE(fs::is_regular_file(layout_.thumbnailPath(id)));
}

TEST_F(TranscodePipelineTest, EncoderReceivesLadderParameters) {
  auto id = addAsset(true);
  ASSERT_TRUE(pipeline_.run(id).has_value());

  auto requests = encoder_->variantRequests();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[0].variant.name, "360p");
  EXPECT_EQ(requests[0].variant.video_bitrate_kbps, 800);
  EXPECT_EQ(requests[2].variant.height, 1080);
  EXPECT_EQ(requests[1].input, layout_.absolute("videos/original/clip.mp4"));
  EXPECT_EQ(requests[1].output_dir, layout_.stagingDir(id, "720p"));
  EXPECT_EQ(requests[1].packaging.segment_seconds, 4);
  EXPECT_EQ(requests[1].audio.sample_rate, 48000);
}

TEST_F(TranscodePipelineTest, EncoderFailureLeavesRecordUnprocessed) {
  auto id = addAsset(true);
  encoder_->failVariant("720p", "Conversion failed!");

  auto result = pipeline_.run(id);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::EncodingFailure);
  EXPECT_EQ(result.error().message, "Conversion failed!");

  auto asset = load(id);
  EXPECT_FALSE(asset.processed);
  EXPECT_TRUE(asset.hls_base_dir.empty());
  // later variants are not attempted
  EXPECT_EQ(encoder_->variantCalls(), 2u);
  EXPECT_FALSE(fs::exists(layout_.stagingDir(id, "720p")));
  EXPECT_EQ(encoder_->thumbnailCalls(), 0u);
}

TEST_F(TranscodePipelineTest, MissingManifestIsEncodingFailure) {
  auto id = addAsset(true);
  encoder_->skipManifestFor("360p");

  auto result = pipeline_.run(id);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::EncodingFailure);
  EXPECT_FALSE(load(id).processed);
  EXPECT_FALSE(fs::exists(layout_.variantDir(id, "360p")));
}

TEST_F(TranscodePipelineTest, ThumbnailFailureStillMarksProcessed) {
  auto id = addAsset(true);
  encoder_->failThumbnail("no frame at 3s");

  ASSERT_TRUE(pipeline_.run(id).has_value());

  auto asset = load(id);
  EXPECT_TRUE(asset.processed);
  EXPECT_FALSE(asset.hls_base_dir.empty());
  EXPECT_TRUE(asset.thumbnail_path.empty());
}

TEST_F(TranscodePipelineTest, RerunKeepsPreviousThumbnailWhenExtractionFails) {
  auto id = addAsset(true);
  ASSERT_TRUE(pipeline_.run(id).has_value());
  auto first = load(id);

  encoder_->failThumbnail("broken");
  ASSERT_TRUE(pipeline_.run(id).has_value());
  EXPECT_EQ(load(id).thumbnail_path, first.thumbnail_path);
}

TEST_F(TranscodePipelineTest, FailedRerunKeepsPreviouslyPublishedVariant) {
  auto id = addAsset(true);
  ASSERT_TRUE(pipeline_.run(id).has_value());

  encoder_->failVariant("360p", "disk full");
  ASSERT_FALSE(pipeline_.run(id).has_value());

  EXPECT_TRUE(load(id).processed);
  EXPECT_TRUE(fs::is_regular_file(layout_.variantDir(id, "360p") / "index.m3u8"));
}

TEST_F(TranscodePipelineTest, DuplicateConcurrentRunsEndConsistent) {
  auto id = addAsset(true);

  std::thread first([&] { EXPECT_TRUE(pipeline_.run(id).has_value()); });
  std::thread second([&] { EXPECT_TRUE(pipeline_.run(id).has_value()); });
  first.join();
  second.join();

  EXPECT_EQ(encoder_->variantCalls(), 6u);
  auto asset = load(id);
  EXPECT_TRUE(asset.processed);
  for (const char* variant : {"360p", "720p", "1080p"}) {
    auto manifest = layout_.variantDir(id, variant) / "index.m3u8";
    ASSERT_TRUE(fs::is_regular_file(manifest));
    auto text = testing::readFile(manifest);
    EXPECT_EQ(text.rfind("#EXTM3U", 0), 0u);
    EXPECT_NE(text.find("#EXT-X-ENDLIST"), std::string::npos);
  }
  EXPECT_EQ(locks_->trackedCount(), 0u);
}

TEST_F(TranscodePipelineTest, ServedManifestAfterRun) {
  auto id = addAsset(true);
  ASSERT_TRUE(pipeline_.run(id).has_value());

  AssetServer server(std::make_shared<const PathResolver>(
    layout_, ResolutionAliasTable::standard(pipeline_.ladder())));

  auto low = server.serveManifest(id, "480p");
  ASSERT_TRUE(low.has_value());
  EXPECT_EQ(low->content_type, kManifestContentType);

  auto missing = server.serveManifest(id, "240p");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

} // namespace
} // namespace hls_media
