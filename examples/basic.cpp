#include <mise/duration.hpp>
#include <mise/platform.hpp>
#include <mise/recipe.hpp>
#include <mise/servings.hpp>

#include <iostream>

int main() {
  // Durations from structured data, clocks and free text all land on minutes.
  for (const char* text : {"PT1H30M", "1:30", "1 hr 30 mins", "90", "about 45"}) {
    std::cout << text << " -> " << mise::NormalizeDuration(text) << " min\n";
  }

  // Ranges keep the lower bound.
  for (const char* text : {"4-6 servings", "serves 4", "Makes 12 cookies"}) {
    std::cout << text << " -> " << mise::NormalizeServings(text) << "\n";
  }

  std::cout << mise::PlatformName(
                   mise::ClassifyPlatform("https://www.TikTok.com/@chef/video/1"))
            << "\n";

  mise::RawRecipe raw;
  raw.title = "  Weeknight Dal ";
  raw.prep_time = "10 min";
  raw.cook_time = 25;
  raw.total_time = "PT35M";
  raw.yields = "4 to 6";
  raw.ingredients = {"1 cup red lentils", "  ", "2 cups water"};
  raw.url = "https://Example.com/recipes/dal?ref=home";

  mise::RecipeNormalizer normalizer;
  mise::Recipe recipe = normalizer.Normalize(raw);
  std::cout << recipe.title << ": " << recipe.total_time << " min, serves "
            << recipe.yields << ", " << recipe.ingredients.size()
            << " ingredients, host " << recipe.host << "\n";
  return 0;
}
