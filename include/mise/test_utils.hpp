#pragma once

#include <mise/image.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mise::testing {

// =============================================================================
// In-memory image collaborators
// =============================================================================

/**
 * Fake fetcher serving images from a map.
 * Unknown URLs fail with "404". Set throw_on_fetch to simulate a client
 * library that throws.
 */
class FakeImageFetcher : public ImageFetcher {
 public:
  void Add(const std::string& url, std::string bytes, std::string content_type = "") {
    std::lock_guard<std::mutex> lock(mu_);
    images_[url] = FetchedImage{std::move(bytes), std::move(content_type)};
  }

  bool Fetch(const std::string& url, FetchedImage* out,
             std::string* error_out) override {
    ++fetch_count_;
    if (throw_on_fetch) {
      throw std::runtime_error("connection reset");
    }
    std::lock_guard<std::mutex> lock(mu_);
    auto it = images_.find(url);
    if (it == images_.end()) {
      if (error_out) *error_out = "404";
      return false;
    }
    *out = it->second;
    return true;
  }

  int fetch_count() const { return fetch_count_.load(); }

  bool throw_on_fetch = false;

 private:
  std::mutex mu_;
  std::map<std::string, FetchedImage> images_;
  std::atomic<int> fetch_count_{0};
};

/**
 * Fake object store that records every Put.
 * Set fail_with to a non-empty reason to make Put fail.
 */
class FakeBlobStore : public BlobStore {
 public:
  struct Object {
    std::string key;
    std::string bytes;
    std::string content_type;
  };

  bool Put(const std::string& key, std::string_view bytes,
           const std::string& content_type, std::string* error_out) override {
    if (!fail_with.empty()) {
      if (error_out) *error_out = fail_with;
      return false;
    }
    std::lock_guard<std::mutex> lock(mu_);
    objects_.push_back(Object{key, std::string(bytes), content_type});
    return true;
  }

  std::vector<Object> objects() const {
    std::lock_guard<std::mutex> lock(mu_);
    return objects_;
  }

  std::string fail_with;

 private:
  mutable std::mutex mu_;
  std::vector<Object> objects_;
};

}  // namespace mise::testing
