#include <mise/duration.hpp>
#include <mise/json.hpp>
#include <mise/platform.hpp>
#include <mise/recipe.hpp>
#include <mise/servings.hpp>
#include <mise/version.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " duration <text>      minutes, e.g. \"1 hr 30 min\"\n"
      << "  " << argv0 << " servings <text>      head count, e.g. \"4-6 servings\"\n"
      << "  " << argv0 << " platform <url>       tiktok | youtube | website\n"
      << "  " << argv0 << " recipe <file.json>   normalize a raw recipe record\n"
      << "  " << argv0 << " version\n";
}

int main(int argc, char** argv) {
  if (argc < 2) { usage(argv[0]); return 2; }

  std::string cmd = argv[1];

  if (cmd == "duration") {
    if (argc != 3) { usage(argv[0]); return 2; }
    std::cout << mise::NormalizeDuration(argv[2]) << "\n";
    return 0;
  } else if (cmd == "servings") {
    if (argc != 3) { usage(argv[0]); return 2; }
    std::cout << mise::NormalizeServings(argv[2]) << "\n";
    return 0;
  } else if (cmd == "platform") {
    if (argc != 3) { usage(argv[0]); return 2; }
    std::cout << mise::PlatformName(mise::ClassifyPlatform(argv[2])) << "\n";
    return 0;
  } else if (cmd == "recipe") {
    if (argc != 3) { usage(argv[0]); return 2; }
    std::ifstream in(argv[2]);
    if (!in.is_open()) {
      std::cerr << "Cannot open " << argv[2] << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    Json::Value json;
    std::string error;
    if (!mise::ParseJson(buffer.str(), &json, &error)) {
      std::cerr << "Invalid JSON in " << argv[2] << ": " << error << "\n";
      return 1;
    }
    mise::RawRecipe raw;
    if (!mise::RawRecipeFromJson(json, &raw, &error)) {
      std::cerr << "Invalid recipe: " << error << "\n";
      return 1;
    }

    mise::RecipeNormalizer normalizer;
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    std::cout << Json::writeString(writer, mise::RecipeToJson(normalizer.Normalize(raw)))
              << "\n";
    return 0;
  } else if (cmd == "version") {
    std::cout << mise::Version() << "\n";
    return 0;
  }

  usage(argv[0]);
  return 2;
}
