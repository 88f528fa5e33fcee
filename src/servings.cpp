#include <mise/servings.hpp>
#include <mise/internal.hpp>
#include <mise/normalize.hpp>

#include <string>
#include <string_view>

namespace mise {

namespace {

// "<digits>[spaces](-|to)[spaces]<digits>" anywhere in the text. Dashes are
// already folded to '-' by FoldText(). Returns the lower bound, or -1.
int64_t FindRangeLowerBound(std::string_view s) {
  size_t pos = 0;
  while (pos < s.size()) {
    if (!internal::IsDigit(s[pos])) {
      ++pos;
      continue;
    }
    size_t run_end = internal::DigitRunEnd(s, pos);
    size_t sep = internal::SkipSpaces(s, run_end);
    size_t next = std::string_view::npos;
    if (sep < s.size() && s[sep] == '-') {
      next = sep + 1;
    } else if (s.compare(sep, 2, "to") == 0) {
      next = sep + 2;
    }
    if (next != std::string_view::npos) {
      next = internal::SkipSpaces(s, next);
      if (next < s.size() && internal::IsDigit(s[next])) {
        return internal::ParseDigits(s.substr(pos, run_end - pos));
      }
    }
    pos = run_end;
  }
  return -1;
}

int64_t TextToServings(const std::string& raw) {
  std::string s = internal::FoldText(raw);
  if (s.empty()) return 0;

  if (internal::IsAllDigits(s)) {
    return internal::ParseDigits(s);
  }

  std::string_view text(s);
  int64_t lower = FindRangeLowerBound(text);
  if (lower >= 0) {
    // Lower bound of the range, not the midpoint.
    return lower;
  }

  for (size_t pos = 0; pos < text.size(); ++pos) {
    if (internal::IsDigit(text[pos])) {
      size_t len = internal::DecimalTokenLength(text, pos);
      return internal::RoundToCount(internal::ParseDecimal(text.substr(pos, len)));
    }
  }

  return 0;
}

}  // namespace

int64_t NormalizeServings(const FieldValue& value) {
  switch (value.kind()) {
    case FieldValue::Kind::kAbsent:
      return 0;
    case FieldValue::Kind::kNumber:
      return internal::RoundToCount(value.number());
    case FieldValue::Kind::kText:
      return TextToServings(value.text());
  }
  return 0;
}

}  // namespace mise
