// Unit tests for mise/platform.hpp

#include <gtest/gtest.h>

#include <mise/platform.hpp>

#include <string>

namespace mise {
namespace {

TEST(PlatformTest, TikTok) {
  EXPECT_EQ(ClassifyPlatform("https://www.tiktok.com/@chef/video/7212345678"),
            Platform::kTikTok);
  EXPECT_EQ(ClassifyPlatform("https://vm.tiktok.com/ZMabc123/"), Platform::kTikTok);
}

TEST(PlatformTest, YouTube) {
  EXPECT_EQ(ClassifyPlatform("https://www.youtube.com/watch?v=abc"), Platform::kYouTube);
  EXPECT_EQ(ClassifyPlatform("https://youtube.com/shorts/abc"), Platform::kYouTube);
  EXPECT_EQ(ClassifyPlatform("https://youtu.be/abc"), Platform::kYouTube);
}

TEST(PlatformTest, CaseInsensitive) {
  EXPECT_EQ(ClassifyPlatform("HTTPS://WWW.TIKTOK.COM/@X"), Platform::kTikTok);
  EXPECT_EQ(ClassifyPlatform("https://YouTu.Be/abc"), Platform::kYouTube);
}

TEST(PlatformTest, EverythingElseIsWebsite) {
  EXPECT_EQ(ClassifyPlatform("https://www.allrecipes.com/recipe/1"), Platform::kWebsite);
  EXPECT_EQ(ClassifyPlatform("https://vimeo.com/123"), Platform::kWebsite);
  EXPECT_EQ(ClassifyPlatform(""), Platform::kWebsite);
  EXPECT_EQ(ClassifyPlatform("not a url"), Platform::kWebsite);
}

TEST(PlatformTest, SubstringMatchWithoutParsing) {
  // No URL parsing: a domain anywhere in the string counts.
  EXPECT_EQ(ClassifyPlatform("see tiktok.com for more"), Platform::kTikTok);
  EXPECT_EQ(ClassifyPlatform("https://example.com/?ref=youtube.com"),
            Platform::kYouTube);
}

TEST(PlatformTest, TikTokCheckedFirst) {
  EXPECT_EQ(ClassifyPlatform("https://youtube.com/redirect?q=tiktok.com"),
            Platform::kTikTok);
}

TEST(PlatformTest, Names) {
  EXPECT_STREQ(PlatformName(Platform::kTikTok), "tiktok");
  EXPECT_STREQ(PlatformName(Platform::kYouTube), "youtube");
  EXPECT_STREQ(PlatformName(Platform::kWebsite), "website");
}

}  // namespace
}  // namespace mise
