#include "application/media_service.hpp"
#include "hls_media/test_support.hpp"
#include "infrastructure/memory_asset_repository.hpp"

#include <gtest/gtest.h>

#include <fstream>

namespace hls_media {
namespace {
namespace fs = std::filesystem;

class MediaServiceTest : public ::testing::Test {
protected:
  MediaServiceTest()
    : repository_(std::make_shared<MemoryAssetRepository>()),
      queue_(std::make_shared<testing::FakeJobQueue>()),
      layout_(root_.path()),
      orchestrator_(std::make_shared<JobOrchestrator>(
        repository_, queue_,
        std::make_shared<TranscodePipeline>(repository_, std::make_shared<testing::FakeEncoder>(),
                                            std::make_shared<AssetLockRegistry>(), layout_,
                                            QualityLadder::standard()))),
      service_(repository_, orchestrator_, layout_) {}

  // Writes content where the HTTP session would spool an upload body.
  fs::path spool(const std::string& content) {
    auto file = service_.reserveUploadFile();
    EXPECT_TRUE(file.has_value());
    std::ofstream(*file, std::ios::binary) << content;
    return *file;
  }

  static size_t filesIn(const fs::path& dir) {
    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
      if (entry.is_regular_file()) ++count;
    }
    return count;
  }

  testing::TempMediaRoot root_;
  std::shared_ptr<MemoryAssetRepository> repository_;
  std::shared_ptr<testing::FakeJobQueue> queue_;
  MediaLayout layout_;
  std::shared_ptr<JobOrchestrator> orchestrator_;
  MediaService service_;
};

TEST_F(MediaServiceTest, UploadStoresFileCreatesRecordAndEnqueues) {
  auto spooled = spool("video-bytes");
  auto created = service_.uploadAsset({.title = "Intro", .description = "d", .category = "tutorial",
                                       .filename = "My Clip.MOV"},
                                      spooled);
  ASSERT_TRUE(created.has_value());
  EXPECT_FALSE(created->processed);
  EXPECT_TRUE(created->hls_base_dir.empty());
  EXPECT_EQ(created->category, "tutorial");

  EXPECT_EQ(created->source_file_path.rfind("videos/original/", 0), 0u);
  EXPECT_EQ(fs::path(created->source_file_path).extension(), ".mov");
  EXPECT_EQ(testing::readFile(layout_.absolute(created->source_file_path)), "video-bytes");
  EXPECT_FALSE(fs::exists(spooled));

  auto jobs = queue_->jobs();
  ASSERT_EQ(jobs.size(), 1u);
  EXPECT_EQ(jobs[0].second, created->id);
}

TEST_F(MediaServiceTest, ReservedUploadFilesAreHiddenAndDistinct) {
  auto first = service_.reserveUploadFile();
  auto second = service_.reserveUploadFile();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_NE(*first, *second);
  EXPECT_EQ(first->parent_path(), layout_.sourceDir());
  EXPECT_EQ(first->filename().string().front(), '.');
  EXPECT_FALSE(fs::exists(*first));
}

TEST_F(MediaServiceTest, UploadRequiresTitleAndPayload) {
  auto untitled_file = spool("bytes");
  auto untitled = service_.uploadAsset({.title = ""}, untitled_file);
  ASSERT_FALSE(untitled.has_value());
  EXPECT_EQ(untitled.error().code, ErrorCode::InvalidArgument);
  EXPECT_FALSE(fs::exists(untitled_file));

  auto empty = service_.uploadAsset({.title = "x"}, spool(""));
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgument);

  auto missing = service_.uploadAsset({.title = "x"}, fs::path());
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, ErrorCode::InvalidArgument);

  EXPECT_EQ(repository_->size(), 0u);
  EXPECT_TRUE(queue_->jobs().empty());
  EXPECT_EQ(filesIn(layout_.sourceDir()), 0u);
}

TEST_F(MediaServiceTest, RejectsTextThatIsNotUtf8) {
  for (const UploadRequest& request : {UploadRequest{.title = "\xFF"},
                                       UploadRequest{.title = "ok", .description = "caf\xC3"},
                                       UploadRequest{.title = "ok", .category = "\xC0\xAF"},
                                       UploadRequest{.title = "\xED\xA0\x80"}}) {
    auto created = service_.uploadAsset(request, spool("bytes"));
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, ErrorCode::InvalidArgument);
  }
  EXPECT_EQ(repository_->size(), 0u);
  EXPECT_EQ(filesIn(layout_.sourceDir()), 0u);
}

TEST_F(MediaServiceTest, RejectsTextLongerThanItsColumn) {
  auto long_title = service_.uploadAsset({.title = std::string(256, 'a')}, spool("bytes"));
  ASSERT_FALSE(long_title.has_value());
  EXPECT_EQ(long_title.error().code, ErrorCode::InvalidArgument);

  auto long_category = service_.uploadAsset({.title = "ok", .category = std::string(256, 'c')}, spool("bytes"));
  ASSERT_FALSE(long_category.has_value());
  EXPECT_EQ(long_category.error().code, ErrorCode::InvalidArgument);

  auto long_description = service_.uploadAsset({.title = "ok", .description = std::string(65536, 'd')},
                                               spool("bytes"));
  ASSERT_FALSE(long_description.has_value());
  EXPECT_EQ(long_description.error().code, ErrorCode::InvalidArgument);
  EXPECT_EQ(repository_->size(), 0u);
}

TEST_F(MediaServiceTest, TitleLimitCountsCharactersNotBytes) {
  // 255 two-byte characters: 510 bytes, still within the column.
  std::string title;
  for (int i = 0; i < 255; ++i) title += "\xC3\xA9";
  auto created = service_.uploadAsset({.title = title, .category = "\xE6\x97\xA5\xE6\x9C\xAC"},
                                      spool("bytes"));
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ(created->title, title);

  EXPECT_FALSE(service_.uploadAsset({.title = title + "\xC3\xA9"}, spool("bytes")).has_value());
}

TEST_F(MediaServiceTest, QueueFailureDoesNotFailUpload) {
  queue_->refuseWith("redis down");
  auto created = service_.uploadAsset({.title = "x"}, spool("bytes"));
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ(repository_->size(), 1u);
}

TEST_F(MediaServiceTest, ListIsNewestFirst) {
  Asset older;
  older.id = 1;
  older.title = "old";
  older.created_at = "2024-01-01T00:00:00Z";
  repository_->put(older);
  Asset newer;
  newer.id = 2;
  newer.title = "new";
  newer.created_at = "2024-06-01T00:00:00Z";
  repository_->put(newer);

  auto list = service_.listAssets();
  ASSERT_TRUE(list.has_value());
  ASSERT_EQ(list->size(), 2u);
  EXPECT_EQ((*list)[0].title, "new");
  EXPECT_EQ((*list)[1].title, "old");
}

TEST(MediaServiceExtensionTest, KeepsOnlyShortAlphanumericExtensions) {
  EXPECT_EQ(MediaService::storedExtension("clip.MP4"), ".mp4");
  EXPECT_EQ(MediaService::storedExtension("clip.webm"), ".webm");
  EXPECT_EQ(MediaService::storedExtension("noext"), ".mp4");
  EXPECT_EQ(MediaService::storedExtension("evil.m$v"), ".mp4");
  EXPECT_EQ(MediaService::storedExtension("long.extension"), ".mp4");
  EXPECT_EQ(MediaService::storedExtension(""), ".mp4");
}

} // namespace
} // namespace hls_media
