#pragma once

#include <mise/field_value.hpp>
#include <mise/recipe.hpp>

#include <json/json.h>

#include <string>
#include <vector>

namespace mise {

/**
 * Map a JSON value onto a FieldValue.
 * null/missing -> absent, numbers and booleans -> number, strings -> text.
 * Arrays and objects carry no duration or yield and map to absent.
 */
FieldValue FieldValueFromJson(const Json::Value& value);

/**
 * A JSON array of strings (non-string scalars are stringified, nested
 * containers skipped), or a single string as a one-element list.
 */
std::vector<std::string> StringListFromJson(const Json::Value& value);

/**
 * Decode a raw recipe object.
 * @return false if json is not an object or has no non-empty "url" string;
 *         the reason goes to *error_out if non-null.
 */
bool RawRecipeFromJson(const Json::Value& json, RawRecipe* out,
                       std::string* error_out);

/** Encode a normalized recipe (the "data" member of a success response). */
Json::Value RecipeToJson(const Recipe& recipe);

/** {"success": false, "message": ..., "error_type": ...} */
Json::Value ErrorJson(const std::string& message, const std::string& error_type);

/**
 * Parse text as JSON.
 * @return false on a syntax error, with the parser message in *error_out.
 */
bool ParseJson(const std::string& text, Json::Value* out, std::string* error_out);

}  // namespace mise
