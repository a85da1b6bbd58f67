// Asset index tests

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "soundscan/asset_index.hpp"

namespace soundscan {
namespace {

using fakes::TempDir;
using fakes::write_file;

TEST(AssetIndexTest, FindsFileContainingIdentifier) {
  TempDir dir("assets_find");
  write_file(dir.file("Song Title [abc123].m4a"), "x");
  write_file(dir.file("Other [zzz999].mp3"), "x");

  auto index = AssetIndex::scan(dir.str(), {"abc123", "zzz999", "nope"});
  EXPECT_EQ(index.size(), 2u);
  ASSERT_TRUE(index.lookup("abc123"));
  EXPECT_EQ(index.lookup("abc123")->local_path,
            dir.file("Song Title [abc123].m4a"));
  EXPECT_FALSE(index.lookup("nope"));
}

// -----------------------------------------------------------------------------
// Extension priority is the outer loop: .opus wins over an earlier-named .m4a
// -----------------------------------------------------------------------------
TEST(AssetIndexTest, ExtensionPriorityBeatsNameOrder) {
  TempDir dir("assets_priority");
  write_file(dir.file("a [vid1].m4a"), "x");
  write_file(dir.file("b [vid1].opus"), "x");
  write_file(dir.file("c [vid1].mp4"), "x");

  auto index = AssetIndex::scan(dir.str(), {"vid1"});
  ASSERT_TRUE(index.contains("vid1"));
  EXPECT_EQ(index.lookup("vid1")->local_path, dir.file("b [vid1].opus"));
}

TEST(AssetIndexTest, IgnoresUnrecognizedExtensions) {
  TempDir dir("assets_ext");
  write_file(dir.file("x [vid2].m4a.part"), "x");
  write_file(dir.file("x [vid2].txt"), "x");

  auto index = AssetIndex::scan(dir.str(), {"vid2"});
  EXPECT_FALSE(index.contains("vid2"));
}

TEST(AssetIndexTest, MissingDirectoryIsEmpty) {
  auto index = AssetIndex::scan("/nonexistent_soundscan_assets", {"a"});
  EXPECT_EQ(index.size(), 0u);
}

TEST(AssetIndexTest, InvalidateAndRecord) {
  TempDir dir("assets_mutate");
  write_file(dir.file("t [id9].webm"), "x");

  auto index = AssetIndex::scan(dir.str(), {"id9"});
  ASSERT_TRUE(index.contains("id9"));
  index.invalidate("id9");
  EXPECT_FALSE(index.contains("id9"));
  index.record("id9", dir.file("new [id9].m4a"));
  EXPECT_EQ(index.lookup("id9")->local_path, dir.file("new [id9].m4a"));
}

TEST(AssetIndexTest, TitleFromAssetName) {
  EXPECT_EQ(title_from_asset_name("/a/My Song [abc].m4a", "abc"), "My Song");
  EXPECT_EQ(title_from_asset_name("/a/plain.mp3", "abc"), "plain");
}

} // namespace
} // namespace soundscan
