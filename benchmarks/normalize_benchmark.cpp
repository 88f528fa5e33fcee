// Performance benchmarks for the mise normalizers
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Each stage of the duration grammar gets its own input so a regression in
// one stage shows up on its own line.

#include <benchmark/benchmark.h>

#include <mise/duration.hpp>
#include <mise/normalize.hpp>
#include <mise/platform.hpp>
#include <mise/recipe.hpp>
#include <mise/servings.hpp>

#include <string>
#include <vector>

namespace {

// =============================================================================
// Text folding
// =============================================================================

static void BM_FoldText_Ascii(benchmark::State& state) {
  std::string input = "  Prep Time:   1 Hour   30 Minutes  ";
  for (auto _ : state) {
    benchmark::DoNotOptimize(mise::internal::FoldText(input));
  }
  state.SetBytesProcessed(state.iterations() * input.size());
}
BENCHMARK(BM_FoldText_Ascii);

static void BM_FoldText_Unicode(benchmark::State& state) {
  std::string input = "4\xE2\x80\x93" "6\xC2\xA0servings \xEF\xBC\x94\xEF\xBC\x95";
  for (auto _ : state) {
    benchmark::DoNotOptimize(mise::internal::FoldText(input));
  }
  state.SetBytesProcessed(state.iterations() * input.size());
}
BENCHMARK(BM_FoldText_Unicode);

// =============================================================================
// Duration, one input per grammar stage
// =============================================================================

const std::vector<std::string> kDurationInputs = {
    "90",                    // digits
    "1:30:00",               // clock
    "PT1H30M",               // ISO-8601
    "1 hour 30 minutes",     // unit words
    "about 45",              // first number
    "a while",               // nothing matches
};

static void BM_NormalizeDuration(benchmark::State& state) {
  const std::string& input = kDurationInputs[state.range(0)];
  state.SetLabel(input);
  for (auto _ : state) {
    benchmark::DoNotOptimize(mise::NormalizeDuration(input));
  }
}
BENCHMARK(BM_NormalizeDuration)->DenseRange(0, 5);

static void BM_NormalizeDuration_Number(benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(mise::NormalizeDuration(89.5));
  }
}
BENCHMARK(BM_NormalizeDuration_Number);

// Unit words after a long prose prefix; should scale linearly.
static void BM_NormalizeDuration_LongProse(benchmark::State& state) {
  std::string input(static_cast<size_t>(state.range(0)), 'x');
  input += " 1 hr 30 min";
  for (auto _ : state) {
    benchmark::DoNotOptimize(mise::NormalizeDuration(input));
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_NormalizeDuration_LongProse)->Range(1 << 10, 1 << 18);

// =============================================================================
// Servings and platform
// =============================================================================

static void BM_NormalizeServings_Range(benchmark::State& state) {
  std::string input = "4 to 6 servings";
  for (auto _ : state) {
    benchmark::DoNotOptimize(mise::NormalizeServings(input));
  }
}
BENCHMARK(BM_NormalizeServings_Range);

static void BM_ClassifyPlatform(benchmark::State& state) {
  std::string url = "https://www.allrecipes.com/recipe/158968/spinach-and-feta-turkey-burgers/";
  for (auto _ : state) {
    benchmark::DoNotOptimize(mise::ClassifyPlatform(url));
  }
}
BENCHMARK(BM_ClassifyPlatform);

// =============================================================================
// Whole recipe
// =============================================================================

static void BM_NormalizeRecipe(benchmark::State& state) {
  mise::RawRecipe raw;
  raw.title = "Spinach and Feta Turkey Burgers";
  raw.prep_time = "15 mins";
  raw.cook_time = "PT15M";
  raw.total_time = "30 minutes";
  raw.yields = "8 patties";
  for (int i = 0; i < 10; ++i) {
    raw.ingredients.push_back("  ingredient line " + std::to_string(i) + " ");
  }
  raw.url = "https://www.allrecipes.com/recipe/158968/";

  mise::RecipeNormalizer normalizer;
  for (auto _ : state) {
    benchmark::DoNotOptimize(normalizer.Normalize(raw));
  }
}
BENCHMARK(BM_NormalizeRecipe);

}  // namespace

BENCHMARK_MAIN();
