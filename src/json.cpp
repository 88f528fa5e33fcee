#include <mise/json.hpp>

#include <memory>
#include <utility>

namespace mise {

namespace {

std::string StringMember(const Json::Value& json, const char* key) {
  const Json::Value& v = json[key];
  return v.isString() ? v.asString() : std::string();
}

}  // namespace

FieldValue FieldValueFromJson(const Json::Value& value) {
  if (value.isNull()) {
    return FieldValue::Absent();
  }
  if (value.isBool()) {
    return FieldValue::Number(value.asBool() ? 1.0 : 0.0);
  }
  if (value.isNumeric()) {
    return FieldValue::Number(value.asDouble());
  }
  if (value.isString()) {
    return FieldValue::Text(value.asString());
  }
  return FieldValue::Absent();
}

std::vector<std::string> StringListFromJson(const Json::Value& value) {
  std::vector<std::string> out;
  if (value.isString()) {
    out.push_back(value.asString());
    return out;
  }
  if (!value.isArray()) {
    return out;
  }
  for (const auto& item : value) {
    if (item.isString()) {
      out.push_back(item.asString());
    } else if (item.isNumeric() || item.isBool()) {
      out.push_back(item.asString());
    }
  }
  return out;
}

bool RawRecipeFromJson(const Json::Value& json, RawRecipe* out,
                       std::string* error_out) {
  if (!json.isObject()) {
    if (error_out) *error_out = "Request body must be a JSON object";
    return false;
  }

  const Json::Value& url = json["url"];
  if (!url.isString() || url.asString().empty()) {
    if (error_out) *error_out = "Field 'url' is required";
    return false;
  }

  RawRecipe raw;
  raw.url = url.asString();
  raw.title = StringMember(json, "title");
  raw.description = StringMember(json, "description");
  raw.prep_time = FieldValueFromJson(json["prep_time"]);
  raw.cook_time = FieldValueFromJson(json["cook_time"]);
  raw.total_time = FieldValueFromJson(json["total_time"]);
  raw.yields = FieldValueFromJson(json["yields"]);
  raw.ingredients = StringListFromJson(json["ingredients"]);
  raw.instructions = StringListFromJson(json["instructions"]);
  raw.host = StringMember(json, "host");
  raw.source = StringMember(json, "source");

  // "image" may be a bare URL or an {"url": ...} object
  const Json::Value& image = json["image"];
  if (image.isString()) {
    raw.image_url = image.asString();
  } else if (image.isObject()) {
    raw.image_url = StringMember(image, "url");
  }

  *out = std::move(raw);
  return true;
}

Json::Value RecipeToJson(const Recipe& recipe) {
  Json::Value json;
  json["title"] = recipe.title;
  json["description"] = recipe.description;
  json["prep_time"] = static_cast<Json::Int64>(recipe.prep_time);
  json["cook_time"] = static_cast<Json::Int64>(recipe.cook_time);
  json["total_time"] = static_cast<Json::Int64>(recipe.total_time);
  json["yields"] = static_cast<Json::Int64>(recipe.yields);

  json["ingredients"] = Json::Value(Json::arrayValue);
  for (const auto& line : recipe.ingredients) {
    json["ingredients"].append(line);
  }
  json["instructions"] = Json::Value(Json::arrayValue);
  for (const auto& line : recipe.instructions) {
    json["instructions"].append(line);
  }

  json["image"]["url"] = recipe.image.url;
  json["image"]["key"] = recipe.image.key;
  json["url"] = recipe.url;
  json["host"] = recipe.host;
  json["platform"] = PlatformName(recipe.platform);
  return json;
}

Json::Value ErrorJson(const std::string& message, const std::string& error_type) {
  Json::Value json;
  json["success"] = false;
  json["message"] = message;
  json["error_type"] = error_type;
  return json;
}

bool ParseJson(const std::string& text, Json::Value* out, std::string* error_out) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), out, &errors)) {
    if (error_out) *error_out = errors;
    return false;
  }
  return true;
}

}  // namespace mise
