#pragma once

#include <string>
#include <string_view>

namespace mise::internal {

/**
 * Fold free-form field text into the canonical form the grammars expect.
 *
 * - Trims edges and collapses whitespace runs (ASCII whitespace, no-break
 *   space, thin space and narrow no-break space) to a single space
 * - ASCII case folding (A-Z -> a-z)
 * - Fullwidth ASCII forms (U+FF01-FF5E) -> ASCII, letters lowercased
 * - Hyphen, figure dash, en dash, em dash and minus sign -> '-'
 *
 * Any other UTF-8 sequence (and any invalid byte) passes through unchanged.
 *
 * @param input Raw field text
 * @return Folded copy of input
 */
std::string FoldText(std::string_view input);

/** Replace every ',' with ' ' (in place) and return the result. */
std::string ReplaceCommas(std::string text);

}  // namespace mise::internal
