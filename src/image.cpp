#include <mise/image.hpp>
#include <mise/internal.hpp>

#include <exception>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>

namespace mise {

namespace {

constexpr std::string_view kAllowedExtensions[] = {"jpg", "jpeg", "png",
                                                   "webp", "gif", "svg"};

struct ContentTypeExtension {
  std::string_view content_type;
  std::string_view extension;
};

constexpr ContentTypeExtension kContentTypeExtensions[] = {
    {"image/jpeg", "jpg"},
    {"image/jpg", "jpg"},
    {"image/pjpeg", "jpg"},
    {"image/png", "png"},
    {"image/webp", "webp"},
    {"image/gif", "gif"},
    {"image/svg+xml", "svg"},
};

std::string Lower(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + ('a' - 'A'));
  }
  return out;
}

bool IsAllowedExtension(std::string_view ext) {
  for (std::string_view allowed : kAllowedExtensions) {
    if (ext == allowed) return true;
  }
  return false;
}

// Path component of a URL: after the authority, before '?' or '#'.
std::string_view UrlPath(std::string_view url) {
  size_t end = url.find_first_of("?#");
  if (end != std::string_view::npos) url = url.substr(0, end);

  size_t scheme = url.find("://");
  if (scheme != std::string_view::npos) {
    size_t slash = url.find('/', scheme + 3);
    return slash == std::string_view::npos ? std::string_view() : url.substr(slash);
  }
  return url;
}

uint32_t RandomTwentyBits() {
  thread_local std::mt19937 rng([] {
    std::random_device rd;
    uint32_t seed = rd();
    seed ^= static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    return seed;
  }());
  return static_cast<uint32_t>(rng()) & 0xFFFFFu;
}

}  // namespace

std::string ImageExtension(std::string_view url, std::string_view content_type) {
  std::string_view path = UrlPath(url);
  size_t dot = path.rfind('.');
  if (dot != std::string_view::npos) {
    std::string ext = Lower(path.substr(dot + 1));
    if (IsAllowedExtension(ext)) return ext;
  }

  if (!content_type.empty()) {
    size_t semi = content_type.find(';');
    std::string type = Lower(internal::TrimView(content_type.substr(0, semi)));
    for (const auto& entry : kContentTypeExtensions) {
      if (type == entry.content_type) return std::string(entry.extension);
    }
  }

  return "jpg";
}

std::string MakeObjectName(std::string_view extension, uint64_t now_ms,
                           uint32_t random20) {
  std::ostringstream out;
  out << std::hex << now_ms << '-' << std::setw(5) << std::setfill('0')
      << (random20 & 0xFFFFFu);
  if (!extension.empty()) {
    out << '.' << extension;
  }
  return out.str();
}

std::string PublicObjectUrl(const ImageOptions& options, std::string_view key) {
  std::string url = "https://" + options.bucket + ".s3." + options.region +
                    ".amazonaws.com/";
  url.append(key);
  return url;
}

ImageResolver::ImageResolver(ImageOptions options, ImageFetcher* fetcher,
                             BlobStore* store)
    : options_(std::move(options)), fetcher_(fetcher), store_(store) {}

ImageInfo ImageResolver::Resolve(const std::string& image_url,
                                 std::string* error_out) const {
  if (image_url.empty()) {
    return {};
  }
  if (!enabled()) {
    return {image_url, ""};
  }

  auto fail = [&](const std::string& reason) {
    if (error_out) *error_out = reason;
    return ImageInfo{image_url, ""};
  };

  try {
    FetchedImage image;
    std::string error;
    if (!fetcher_->Fetch(image_url, &image, &error)) {
      return fail("Failed to download image: " + error);
    }
    if (image.content_type.empty()) {
      image.content_type = "image/jpeg";
    }

    uint64_t now_ms = now_ms_ ? now_ms_() : internal::WallClockMillis();
    uint32_t random20 = random20_ ? random20_() : RandomTwentyBits();
    std::string key = MakeObjectName(
        ImageExtension(image_url, image.content_type), now_ms, random20);
    if (!options_.key_prefix.empty()) {
      key = options_.key_prefix + "/" + key;
    }

    if (!store_->Put(key, image.bytes, image.content_type, &error)) {
      return fail("Failed to upload image: " + error);
    }
    return {PublicObjectUrl(options_, key), key};
  } catch (const std::exception& e) {
    return fail(std::string("Image re-hosting threw: ") + e.what());
  }
}

}  // namespace mise
