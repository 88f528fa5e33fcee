#include <mise/recipe.hpp>
#include <mise/duration.hpp>
#include <mise/internal.hpp>
#include <mise/servings.hpp>

namespace mise {

namespace {

std::vector<std::string> CleanLines(const std::vector<std::string>& lines) {
  std::vector<std::string> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    std::string_view trimmed = internal::TrimView(line);
    if (!trimmed.empty()) {
      out.emplace_back(trimmed);
    }
  }
  return out;
}

}  // namespace

std::string ExtractHost(std::string_view url) {
  url = internal::TrimView(url);

  size_t start;
  size_t scheme = url.find("://");
  if (scheme != std::string_view::npos) {
    start = scheme + 3;
  } else if (url.substr(0, 2) == "//") {
    start = 2;
  } else {
    return "";
  }

  std::string_view authority = url.substr(start);
  authority = authority.substr(0, authority.find_first_of("/?#"));

  size_t at = authority.rfind('@');
  if (at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }

  // Bracketed IPv6 literals keep their colons.
  if (!authority.empty() && authority.front() == '[') {
    size_t close = authority.find(']');
    authority = close == std::string_view::npos ? authority.substr(1)
                                                : authority.substr(1, close - 1);
  } else {
    authority = authority.substr(0, authority.find(':'));
  }

  std::string host(authority);
  for (char& c : host) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + ('a' - 'A'));
  }
  return host;
}

Recipe RecipeNormalizer::Normalize(const RawRecipe& raw,
                                   std::string* image_error) const {
  Recipe recipe;
  recipe.title = internal::Trim(raw.title);
  recipe.description = internal::Trim(raw.description);

  recipe.prep_time = NormalizeDuration(raw.prep_time);
  recipe.cook_time = NormalizeDuration(raw.cook_time);
  recipe.total_time = NormalizeDuration(raw.total_time);
  recipe.yields = NormalizeServings(raw.yields);

  recipe.ingredients = CleanLines(raw.ingredients);
  recipe.instructions = CleanLines(raw.instructions);

  recipe.url = internal::Trim(raw.url);
  recipe.host = raw.host.empty() ? ExtractHost(recipe.url) : internal::Trim(raw.host);
  recipe.platform = ClassifyPlatform(recipe.url);

  std::string image_url = internal::Trim(raw.image_url);
  if (images_) {
    recipe.image = images_->Resolve(image_url, image_error);
  } else {
    recipe.image = ImageInfo{image_url, ""};
  }

  return recipe;
}

}  // namespace mise
