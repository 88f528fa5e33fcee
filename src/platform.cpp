#include <mise/platform.hpp>

#include <string>

namespace mise {

namespace {

constexpr std::string_view kTikTokDomains[] = {"tiktok.com"};
constexpr std::string_view kYouTubeDomains[] = {"youtube.com", "youtu.be"};

template <size_t N>
bool ContainsAny(const std::string& haystack, const std::string_view (&needles)[N]) {
  for (std::string_view needle : needles) {
    if (haystack.find(needle) != std::string::npos) return true;
  }
  return false;
}

}  // namespace

Platform ClassifyPlatform(std::string_view url) {
  std::string lower(url);
  for (char& c : lower) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + ('a' - 'A'));
  }

  if (ContainsAny(lower, kTikTokDomains)) return Platform::kTikTok;
  if (ContainsAny(lower, kYouTubeDomains)) return Platform::kYouTube;
  return Platform::kWebsite;
}

const char* PlatformName(Platform platform) {
  switch (platform) {
    case Platform::kTikTok:
      return "tiktok";
    case Platform::kYouTube:
      return "youtube";
    case Platform::kWebsite:
      return "website";
  }
  return "website";
}

}  // namespace mise
