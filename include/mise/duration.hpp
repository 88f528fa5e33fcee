#pragma once

#include <mise/field_value.hpp>

#include <cstdint>

namespace mise {

/**
 * Convert a duration field to whole minutes.
 *
 * Numbers are taken as minutes. Text is folded (trim, lowercase, dash
 * folding) and tried against these grammars in order; the first one that
 * applies decides the result:
 *
 *   1. "90"                     pure digits, minutes
 *   2. "1:30", "1:30:00"        H:MM[:SS] clock
 *   3. "pt1h30m", "pt45m"       ISO-8601 duration, whole string
 *   4. "1 hr 30 min", "1h30m"   every <number><unit word> summed
 *   5. "1h30m" compact forms    only when stage 4 found nothing
 *   6. "about 45"               first number anywhere, as minutes
 *
 * Never fails: absent, empty and unparseable input give 0, negative and NaN
 * totals clamp to 0, and half minutes round to even.
 */
int64_t NormalizeDuration(const FieldValue& value);

}  // namespace mise
