// Unit tests for mise/json.hpp
// Tests: raw field decoding, recipe encoding, error shape

#include <gtest/gtest.h>

#include <mise/json.hpp>

#include <string>

namespace mise {
namespace {

Json::Value Parse(const std::string& text) {
  Json::Value json;
  std::string error;
  EXPECT_TRUE(ParseJson(text, &json, &error)) << error;
  return json;
}

// =============================================================================
// FieldValueFromJson
// =============================================================================

TEST(FieldValueFromJsonTest, Scalars) {
  Json::Value json = Parse(R"({"n": 45, "f": 12.5, "s": "1 hr", "z": null, "b": true})");

  EXPECT_TRUE(FieldValueFromJson(json["n"]).is_number());
  EXPECT_DOUBLE_EQ(FieldValueFromJson(json["n"]).number(), 45.0);
  EXPECT_DOUBLE_EQ(FieldValueFromJson(json["f"]).number(), 12.5);
  EXPECT_TRUE(FieldValueFromJson(json["s"]).is_text());
  EXPECT_EQ(FieldValueFromJson(json["s"]).text(), "1 hr");
  EXPECT_TRUE(FieldValueFromJson(json["z"]).is_absent());
  EXPECT_DOUBLE_EQ(FieldValueFromJson(json["b"]).number(), 1.0);
}

TEST(FieldValueFromJsonTest, MissingMemberIsAbsent) {
  Json::Value json = Parse("{}");
  EXPECT_TRUE(FieldValueFromJson(json["prep_time"]).is_absent());
}

TEST(FieldValueFromJsonTest, ContainersAreAbsent) {
  Json::Value json = Parse(R"({"a": [1, 2], "o": {"minutes": 5}})");
  EXPECT_TRUE(FieldValueFromJson(json["a"]).is_absent());
  EXPECT_TRUE(FieldValueFromJson(json["o"]).is_absent());
}

// =============================================================================
// StringListFromJson
// =============================================================================

TEST(StringListFromJsonTest, ArrayOfStrings) {
  auto lines = StringListFromJson(Parse(R"(["a", "b", 3, ["nested"], null])"));
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0], "a");
  EXPECT_EQ(lines[1], "b");
  EXPECT_EQ(lines[2], "3");
}

TEST(StringListFromJsonTest, SingleString) {
  Json::Value json = Parse(R"({"steps": "Mix everything."})");
  auto lines = StringListFromJson(json["steps"]);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "Mix everything.");
}

TEST(StringListFromJsonTest, OtherShapesAreEmpty) {
  Json::Value json = Parse(R"({"o": {"a": "b"}, "n": 4})");
  EXPECT_TRUE(StringListFromJson(json["o"]).empty());
  EXPECT_TRUE(StringListFromJson(json["n"]).empty());
  EXPECT_TRUE(StringListFromJson(json["missing"]).empty());
}

// =============================================================================
// RawRecipeFromJson
// =============================================================================

TEST(RawRecipeFromJsonTest, FullRecord) {
  Json::Value json = Parse(R"({
    "url": "https://example.com/r",
    "title": "Dal",
    "description": "Lentils",
    "prep_time": "10 min",
    "cook_time": 25,
    "total_time": null,
    "yields": "4-6",
    "ingredients": ["lentils", "water"],
    "instructions": ["Simmer."],
    "image": "https://example.com/dal.jpg",
    "host": "example.com",
    "source": "json-ld"
  })");

  RawRecipe raw;
  std::string error;
  ASSERT_TRUE(RawRecipeFromJson(json, &raw, &error)) << error;
  EXPECT_EQ(raw.url, "https://example.com/r");
  EXPECT_EQ(raw.title, "Dal");
  EXPECT_EQ(raw.prep_time.text(), "10 min");
  EXPECT_DOUBLE_EQ(raw.cook_time.number(), 25.0);
  EXPECT_TRUE(raw.total_time.is_absent());
  EXPECT_EQ(raw.yields.text(), "4-6");
  EXPECT_EQ(raw.ingredients.size(), 2u);
  EXPECT_EQ(raw.instructions.size(), 1u);
  EXPECT_EQ(raw.image_url, "https://example.com/dal.jpg");
  EXPECT_EQ(raw.host, "example.com");
  EXPECT_EQ(raw.source, "json-ld");
}

TEST(RawRecipeFromJsonTest, ImageObject) {
  Json::Value json =
      Parse(R"({"url": "https://e.com", "image": {"url": "https://e.com/i.png"}})");
  RawRecipe raw;
  ASSERT_TRUE(RawRecipeFromJson(json, &raw, nullptr));
  EXPECT_EQ(raw.image_url, "https://e.com/i.png");
}

TEST(RawRecipeFromJsonTest, RequiresObject) {
  RawRecipe raw;
  std::string error;
  EXPECT_FALSE(RawRecipeFromJson(Parse("[1, 2]"), &raw, &error));
  EXPECT_EQ(error, "Request body must be a JSON object");
}

TEST(RawRecipeFromJsonTest, RequiresUrl) {
  RawRecipe raw;
  std::string error;
  EXPECT_FALSE(RawRecipeFromJson(Parse(R"({"title": "x"})"), &raw, &error));
  EXPECT_EQ(error, "Field 'url' is required");
  EXPECT_FALSE(RawRecipeFromJson(Parse(R"({"url": ""})"), &raw, &error));
  EXPECT_FALSE(RawRecipeFromJson(Parse(R"({"url": 5})"), &raw, &error));
}

// =============================================================================
// Encoding
// =============================================================================

TEST(RecipeToJsonTest, AllMembers) {
  Recipe recipe;
  recipe.title = "Dal";
  recipe.prep_time = 10;
  recipe.total_time = 35;
  recipe.yields = 4;
  recipe.ingredients = {"lentils"};
  recipe.image = ImageInfo{"https://b.s3.us-east-1.amazonaws.com/k.jpg", "k.jpg"};
  recipe.url = "https://youtu.be/x";
  recipe.host = "youtu.be";
  recipe.platform = Platform::kYouTube;

  Json::Value json = RecipeToJson(recipe);
  EXPECT_EQ(json["title"].asString(), "Dal");
  EXPECT_EQ(json["prep_time"].asInt64(), 10);
  EXPECT_EQ(json["cook_time"].asInt64(), 0);
  EXPECT_EQ(json["total_time"].asInt64(), 35);
  EXPECT_EQ(json["yields"].asInt64(), 4);
  ASSERT_TRUE(json["ingredients"].isArray());
  EXPECT_EQ(json["ingredients"].size(), 1u);
  ASSERT_TRUE(json["instructions"].isArray());
  EXPECT_EQ(json["instructions"].size(), 0u);
  EXPECT_EQ(json["image"]["url"].asString(),
            "https://b.s3.us-east-1.amazonaws.com/k.jpg");
  EXPECT_EQ(json["image"]["key"].asString(), "k.jpg");
  EXPECT_EQ(json["host"].asString(), "youtu.be");
  EXPECT_EQ(json["platform"].asString(), "youtube");
}

TEST(ErrorJsonTest, Shape) {
  Json::Value json = ErrorJson("Field 'url' is required", "invalid_argument");
  EXPECT_FALSE(json["success"].asBool());
  EXPECT_EQ(json["message"].asString(), "Field 'url' is required");
  EXPECT_EQ(json["error_type"].asString(), "invalid_argument");
}

TEST(ParseJsonTest, SyntaxError) {
  Json::Value json;
  std::string error;
  EXPECT_FALSE(ParseJson("{\"url\": ", &json, &error));
  EXPECT_FALSE(error.empty());
}

}  // namespace
}  // namespace mise
