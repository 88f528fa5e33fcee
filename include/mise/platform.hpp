#pragma once

#include <string_view>

namespace mise {

/** Where a recipe URL points. */
enum class Platform {
  kTikTok,
  kYouTube,
  kWebsite,  // anything that is not a known short-video platform
};

/**
 * Classify a URL by case-insensitive substring match against the known
 * short-video domains. The URL is not parsed or validated.
 */
Platform ClassifyPlatform(std::string_view url);

/** Wire tag for a platform: "tiktok", "youtube" or "website". */
const char* PlatformName(Platform platform);

}  // namespace mise
