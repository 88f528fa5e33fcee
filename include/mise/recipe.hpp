#pragma once

#include <mise/field_value.hpp>
#include <mise/image.hpp>
#include <mise/platform.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mise {

/**
 * Candidate recipe fields as produced by an extraction source (structured
 * data, a scraper library, or a model-based fallback). Times and yields are
 * kept in whatever shape the source used.
 */
struct RawRecipe {
  std::string title;
  std::string description;
  FieldValue prep_time;
  FieldValue cook_time;
  FieldValue total_time;
  FieldValue yields;
  std::vector<std::string> ingredients;
  std::vector<std::string> instructions;
  std::string image_url;
  std::string url;
  std::string host;    // empty: derived from url
  std::string source;  // extraction method, e.g. "json-ld"
};

/** Canonical recipe. Times are minutes; yields is a head count (0 = unknown). */
struct Recipe {
  std::string title;
  std::string description;
  int64_t prep_time = 0;
  int64_t cook_time = 0;
  int64_t total_time = 0;
  int64_t yields = 0;
  std::vector<std::string> ingredients;
  std::vector<std::string> instructions;
  ImageInfo image;
  std::string url;
  std::string host;
  Platform platform = Platform::kWebsite;
};

/**
 * Host part of a URL, lowercased, without userinfo or port.
 * Returns "" when the URL has no "scheme://" or "//" authority.
 */
std::string ExtractHost(std::string_view url);

/**
 * Turns RawRecipe records into Recipe records.
 * Stateless apart from the optional image resolver; safe to share.
 */
class RecipeNormalizer {
 public:
  RecipeNormalizer() = default;

  /** images must outlive the normalizer; null disables re-hosting. */
  explicit RecipeNormalizer(const ImageResolver* images) : images_(images) {}

  /**
   * Normalize one recipe. Never throws on content.
   * @param image_error Set when image re-hosting failed (the original image
   *                    URL is used in that case).
   */
  Recipe Normalize(const RawRecipe& raw, std::string* image_error = nullptr) const;

 private:
  const ImageResolver* images_ = nullptr;
};

}  // namespace mise
