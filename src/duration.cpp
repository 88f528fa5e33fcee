#include <mise/duration.hpp>
#include <mise/internal.hpp>
#include <mise/normalize.hpp>

#include <regex>
#include <string>
#include <string_view>
#include <utility>

namespace mise {

namespace {

// All grammars run on folded text (lowercase, single spaces, ASCII dashes).
// The whole-string grammars stay regular expressions; the free-text stages
// are scanned by hand so they see every byte of arbitrarily long input.
struct DurationGrammars {
  static constexpr auto kFlags = std::regex::ECMAScript | std::regex::optimize;

  std::regex clock{R"((\d+):(\d{1,2})(?::(\d{1,2}))?)", kFlags};
  std::regex iso{
      R"(pt(?:(\d+(?:\.\d+)?)h)?(?:(\d+(?:\.\d+)?)m)?(?:(\d+(?:\.\d+)?)s)?)",
      kFlags};
};

const DurationGrammars& Grammars() {
  static const DurationGrammars grammars;
  return grammars;
}

// Longest spelling first, so "hours" is not read as "h" followed by "ours".
constexpr std::string_view kHourWords[] = {"hours", "hour", "hrs", "hr", "h"};
constexpr std::string_view kMinuteWords[] = {"minutes", "minute", "mins", "min", "m"};
constexpr std::string_view kSecondWords[] = {"seconds", "second", "secs", "sec", "s"};
constexpr std::string_view kCompactHour[] = {"h"};
constexpr std::string_view kCompactMinute[] = {"m"};

constexpr size_t kNoMatch = std::string_view::npos;

double Group(const std::smatch& m, size_t index) {
  return m[index].matched ? internal::ParseDecimal(m[index].str()) : 0.0;
}

// A unit word ends where the word ends, so "1hr30min" splits into "1hr" and
// "30min" while "3 heaping" and "5 hé" are not hour markers. Returns the
// position after the unit, or kNoMatch.
template <size_t N>
size_t MatchUnit(std::string_view s, size_t pos, const std::string_view (&words)[N]) {
  for (std::string_view word : words) {
    if (s.compare(pos, word.size(), word) != 0) continue;
    size_t end = pos + word.size();
    if (!internal::ContinuesWord(s, end)) return end;
  }
  return kNoMatch;
}

// Sum "<num>[spaces]<unit>" * scale over every non-overlapping occurrence.
// A number that fails to match is skipped to the end of its digit run: any
// later start inside the same run meets the same unit text and fails too.
template <size_t N>
double SumUnits(std::string_view s, const std::string_view (&words)[N], double scale,
                bool allow_space) {
  double total = 0.0;
  size_t pos = 0;
  while (pos < s.size()) {
    if (!internal::IsDigit(s[pos])) {
      ++pos;
      continue;
    }
    size_t len = internal::DecimalTokenLength(s, pos);
    size_t unit = allow_space ? internal::SkipSpaces(s, pos + len) : pos + len;
    size_t end = MatchUnit(s, unit, words);
    if (end != kNoMatch) {
      total += internal::ParseDecimal(s.substr(pos, len)) * scale;
      pos = end;
    } else {
      pos = internal::DigitRunEnd(s, pos);
    }
  }
  return total;
}

// "<num>h[spaces]<num>m" pairs. Sets *found when at least one pair matched.
double SumCompactPairs(std::string_view s, bool* found) {
  double total = 0.0;
  size_t pos = 0;
  while (pos < s.size()) {
    if (!internal::IsDigit(s[pos])) {
      ++pos;
      continue;
    }
    size_t len = internal::DecimalTokenLength(s, pos);
    size_t h = pos + len;
    if (h < s.size() && s[h] == 'h') {
      size_t m_pos = internal::SkipSpaces(s, h + 1);
      size_t m_len = internal::DecimalTokenLength(s, m_pos);
      size_t end = m_len > 0 ? MatchUnit(s, m_pos + m_len, kCompactMinute) : kNoMatch;
      if (end != kNoMatch) {
        total += internal::ParseDecimal(s.substr(pos, len)) * 60.0 +
                 internal::ParseDecimal(s.substr(m_pos, m_len));
        *found = true;
        pos = end;
        continue;
      }
    }
    pos = internal::DigitRunEnd(s, pos);
  }
  return total;
}

// Fallback that cannot be reached: every compact form also matches the unit
// words of stage 4 ("h" and "m" are spellings there), so stage 4 has already
// summed anything this finds and only a zero total gets here.
double SumCompact(std::string_view s) {
  bool found = false;
  double total = SumCompactPairs(s, &found);
  if (found) return total;

  total = SumUnits(s, kCompactHour, 60.0, false);
  if (total != 0.0) return total;
  return SumUnits(s, kCompactMinute, 1.0, false);
}

double FirstNumber(std::string_view s) {
  for (size_t pos = 0; pos < s.size(); ++pos) {
    if (internal::IsDigit(s[pos])) {
      return internal::ParseDecimal(s.substr(pos, internal::DecimalTokenLength(s, pos)));
    }
  }
  return 0.0;
}

double TextToMinutes(const std::string& raw) {
  std::string s = internal::FoldText(raw);
  if (s.empty()) return 0.0;

  if (internal::IsAllDigits(s)) {
    return static_cast<double>(internal::ParseDigits(s));
  }

  if (s.size() <= internal::kMaxAnchoredInput) {
    const DurationGrammars& g = Grammars();
    std::smatch m;
    if (std::regex_match(s, m, g.clock)) {
      return Group(m, 1) * 60.0 + Group(m, 2) + Group(m, 3) / 60.0;
    }
    if (std::regex_match(s, m, g.iso)) {
      return Group(m, 1) * 60.0 + Group(m, 2) + Group(m, 3) / 60.0;
    }
  }

  s = internal::ReplaceCommas(std::move(s));
  std::string_view text(s);

  double total = SumUnits(text, kHourWords, 60.0, true);
  total += SumUnits(text, kMinuteWords, 1.0, true);
  total += SumUnits(text, kSecondWords, 1.0, true) / 60.0;

  if (total == 0.0) {
    total = SumCompact(text);
  }

  if (total == 0.0) {
    total = FirstNumber(text);
  }

  return total;
}

}  // namespace

int64_t NormalizeDuration(const FieldValue& value) {
  switch (value.kind()) {
    case FieldValue::Kind::kAbsent:
      return 0;
    case FieldValue::Kind::kNumber:
      return internal::RoundToCount(value.number());
    case FieldValue::Kind::kText:
      if (internal::IsAllDigits(internal::TrimView(value.text()))) {
        // Fast path, and keeps long digit strings exact.
        return internal::ParseDigits(internal::TrimView(value.text()));
      }
      return internal::RoundToCount(TextToMinutes(value.text()));
  }
  return 0;
}

}  // namespace mise
