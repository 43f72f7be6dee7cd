#include "application/path_resolver.hpp"
#include "hls_media/test_support.hpp"

#include <gtest/gtest.h>

namespace hls_media {
namespace {
namespace fs = std::filesystem;

bool isStrictlyInside(const fs::path& candidate, const fs::path& dir) {
  auto rel = candidate.lexically_relative(dir);
  if (rel.empty() || rel == ".") return false;
  return *rel.begin() != "..";
}

class PathResolverTest : public ::testing::Test {
protected:
  PathResolverTest()
    : ladder_(QualityLadder::standard()),
      resolver_(MediaLayout(root_.path()), ResolutionAliasTable::standard(ladder_)) {}

  fs::path variantDir(std::int64_t id, const std::string& variant) const {
    return MediaLayout(root_.path()).variantDir(id, variant);
  }

  testing::TempMediaRoot root_;
  QualityLadder ladder_;
  PathResolver resolver_;
};

TEST_F(PathResolverTest, ResolvesManifestInsideVariantDirectory) {
  auto path = resolver_.resolve(7, "720p", "index.m3u8");
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(*path, variantDir(7, "720p") / "index.m3u8");
}

TEST_F(PathResolverTest, AliasesShareTheSameTarget) {
  for (const char* file : {"index.m3u8", "000.ts", "017.ts", "..", "a..b"}) {
    auto low = resolver_.resolve(3, "480p", file);
    auto base = resolver_.resolve(3, "360p", file);
    ASSERT_EQ(low.has_value(), base.has_value()) << file;
    if (low) {
      EXPECT_EQ(*low, *base) << file;
    }
  }
}

TEST_F(PathResolverTest, UnknownQualityIsNotFound) {
  for (const char* quality : {"240p", "unknown", "", "../360p", "360P"}) {
    auto path = resolver_.resolve(1, quality, "index.m3u8");
    ASSERT_FALSE(path.has_value()) << quality;
    EXPECT_EQ(path.error().code, ErrorCode::NotFound);
  }
}

TEST_F(PathResolverTest, RejectsSeparatorsAndEmptyNames) {
  for (std::string_view file : {std::string_view("../../../etc/passwd"),
                                std::string_view("sub/000.ts"),
                                std::string_view("..\\..\\boot.ini"),
                                std::string_view("/etc/passwd"),
                                std::string_view(""),
                                std::string_view("a\0b", 3)}) {
    auto path = resolver_.resolve(1, "720p", file);
    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().code, ErrorCode::NotFound);
  }
}

TEST_F(PathResolverTest, DotOnlyNamesNeverLeaveTheVariantDirectory) {
  for (const char* file : {"..", ".", "...", "....", "..ts", "..%2f..", ".. ..", "index.m3u8.."}) {
    auto path = resolver_.resolve(5, "1080p", file);
    if (path) {
      EXPECT_TRUE(isStrictlyInside(*path, variantDir(5, "1080p"))) << file << " -> " << *path;
    } else {
      EXPECT_EQ(path.error().code, ErrorCode::NotFound);
    }
  }
  EXPECT_FALSE(resolver_.resolve(5, "1080p", "..").has_value());
  EXPECT_FALSE(resolver_.resolve(5, "1080p", ".").has_value());
}

TEST_F(PathResolverTest, NegativeAssetIdIsNotFound) {
  EXPECT_FALSE(resolver_.resolve(-1, "720p", "index.m3u8").has_value());
  EXPECT_FALSE(resolver_.resolveThumbnail(-4).has_value());
}

TEST_F(PathResolverTest, ResolveHasNoSideEffects) {
  ASSERT_TRUE(resolver_.resolve(11, "720p", "index.m3u8").has_value());
  EXPECT_FALSE(fs::exists(MediaLayout(root_.path()).assetDir(11)));
}

TEST_F(PathResolverTest, ThumbnailLivesInAssetDirectory) {
  auto path = resolver_.resolveThumbnail(9);
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(*path, MediaLayout(root_.path()).assetDir(9) / "thumb.jpg");
}

TEST(ResolutionAliasTableTest, RejectsAliasToUnknownVariant) {
  auto ladder = QualityLadder::standard();
  EXPECT_THROW(ResolutionAliasTable({{"4k", "2160p"}}, ladder), std::invalid_argument);
}

TEST(ResolutionAliasTableTest, StandardTableMaps480To360) {
  auto table = ResolutionAliasTable::standard(QualityLadder::standard());
  EXPECT_EQ(table.lookup("480p"), "360p");
  EXPECT_EQ(table.lookup("1080p"), "1080p");
  EXPECT_FALSE(table.lookup("240p").has_value());
  EXPECT_EQ(table.entries().size(), 4u);
}

TEST(MediaLayoutTest, TrailingSeparatorIsIgnored) {
  MediaLayout with("/srv/media/");
  MediaLayout without("/srv/media");
  EXPECT_EQ(with.root(), without.root());
  EXPECT_EQ(with.variantDir(1, "720p"), fs::path("/srv/media/hls/1/720p"));
  EXPECT_EQ(MediaLayout::hlsRelativeDir(42), "hls/42");
  EXPECT_EQ(MediaLayout::thumbnailRelativePath(42), "hls/42/thumb.jpg");
}

} // namespace
} // namespace hls_media
