#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace mise {

/** Image reference returned with a recipe. */
struct ImageInfo {
  std::string url;  // re-hosted URL if uploaded, otherwise the original
  std::string key;  // object key if uploaded, otherwise empty
};

/** Raw image bytes as downloaded from the recipe page. */
struct FetchedImage {
  std::string bytes;
  std::string content_type;  // may be empty
};

/**
 * Downloads image bytes. Implemented by the embedding application
 * (HTTP client of its choice). Must be safe to call from multiple threads.
 */
class ImageFetcher {
 public:
  virtual ~ImageFetcher() = default;

  /**
   * Fetch url into *out.
   * @return false on any failure, with a reason in *error_out if non-null.
   */
  virtual bool Fetch(const std::string& url, FetchedImage* out,
                     std::string* error_out) = 0;
};

/**
 * Public object storage. Implemented by the embedding application.
 * Must be safe to call from multiple threads.
 */
class BlobStore {
 public:
  virtual ~BlobStore() = default;

  /** Store bytes under key as a publicly readable object. */
  virtual bool Put(const std::string& key, std::string_view bytes,
                   const std::string& content_type, std::string* error_out) = 0;
};

/** Where re-hosted images go. */
struct ImageOptions {
  std::string bucket;  // empty disables re-hosting
  std::string region = "us-east-1";
  std::string key_prefix = "uploads/scraper";
};

/**
 * Pick a file extension for an image.
 * Tries the URL path first, then the content type, and falls back to "jpg".
 * Only jpg, jpeg, png, webp, gif and svg are ever returned.
 */
std::string ImageExtension(std::string_view url, std::string_view content_type);

/** "<hex milliseconds>-<5 hex digits>.<extension>" (lowercase hex). */
std::string MakeObjectName(std::string_view extension, uint64_t now_ms,
                           uint32_t random20);

/** https://<bucket>.s3.<region>.amazonaws.com/<key> */
std::string PublicObjectUrl(const ImageOptions& options, std::string_view key);

/**
 * Re-hosts recipe images through a BlobStore.
 *
 * Resolve() never fails outright: if re-hosting is not configured or any
 * step fails, the original URL comes back with an empty key.
 *
 * Thread-safe: Resolve() is const and the collaborators are required to be
 * thread-safe.
 */
class ImageResolver {
 public:
  /** Re-hosting disabled; Resolve() passes URLs through. */
  ImageResolver() = default;

  /** fetcher and store must outlive the resolver. Either may be null. */
  ImageResolver(ImageOptions options, ImageFetcher* fetcher, BlobStore* store);

  bool enabled() const {
    return fetcher_ != nullptr && store_ != nullptr && !options_.bucket.empty();
  }

  const ImageOptions& options() const { return options_; }

  /**
   * Resolve an image URL.
   * @param error_out Set to the failure reason when re-hosting was attempted
   *                  and failed; untouched otherwise.
   */
  ImageInfo Resolve(const std::string& image_url,
                    std::string* error_out = nullptr) const;

  // Deterministic object names for tests.
  void SetClockForTesting(std::function<uint64_t()> now_ms) {
    now_ms_ = std::move(now_ms);
  }
  void SetRandomForTesting(std::function<uint32_t()> random20) {
    random20_ = std::move(random20);
  }

 private:
  ImageOptions options_;
  ImageFetcher* fetcher_ = nullptr;
  BlobStore* store_ = nullptr;
  std::function<uint64_t()> now_ms_;
  std::function<uint32_t()> random20_;
};

}  // namespace mise
