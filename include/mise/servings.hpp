#pragma once

#include <mise/field_value.hpp>

#include <cstdint>

namespace mise {

/**
 * Convert a yield/servings field to a head count.
 *
 * Text grammars, first match wins:
 *   1. "4"                  pure digits
 *   2. "4-6", "4 to 6"      range; the lower bound is returned
 *   3. "serves 4"           first number anywhere, rounded
 *
 * Never fails; see NormalizeDuration() for the numeric policy.
 */
int64_t NormalizeServings(const FieldValue& value);

}  // namespace mise
