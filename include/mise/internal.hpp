#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace mise::internal {

// Monotonic timestamp helper for metrics/tracing (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// Wall-clock milliseconds since epoch (object names, response timestamps).
inline uint64_t WallClockMillis() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// Whole-string std::regex grammars (clock, ISO-8601) only run on folded text
// up to this size. std::regex recurses per repeated character, and no valid
// clock or ISO duration is this long. Free-text scans use the scanners below
// and cover the whole string.
constexpr size_t kMaxAnchoredInput = 2048;

inline bool IsDigit(char c) { return c >= '0' && c <= '9'; }

// Same set as the ECMAScript \s class for ASCII.
inline bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// True when the text at pos continues a word: a lowercase letter, or a
// multi-byte UTF-8 sequence outside the Latin-1 symbol block (U+0080..U+00BF),
// General Punctuation (U+2000..U+207F) and CJK punctuation (U+3000..U+303F).
inline bool ContinuesWord(std::string_view s, size_t pos) {
  if (pos >= s.size()) return false;
  unsigned char lead = static_cast<unsigned char>(s[pos]);
  if (lead < 0x80) return lead >= 'a' && lead <= 'z';
  unsigned char next = pos + 1 < s.size() ? static_cast<unsigned char>(s[pos + 1]) : 0;
  if (lead == 0xC2) return false;
  if (lead == 0xE2 && (next == 0x80 || next == 0x81)) return false;
  if (lead == 0xE3 && next == 0x80) return false;
  return true;
}

inline size_t SkipSpaces(std::string_view s, size_t pos) {
  while (pos < s.size() && IsSpace(s[pos])) ++pos;
  return pos;
}

// Length of the "<digits>[.<digits>]" token starting at pos, 0 if s[pos] is
// not a digit. A '.' without a digit after it is not part of the token.
inline size_t DecimalTokenLength(std::string_view s, size_t pos) {
  size_t i = pos;
  while (i < s.size() && IsDigit(s[i])) ++i;
  if (i == pos) return 0;
  if (i + 1 < s.size() && s[i] == '.' && IsDigit(s[i + 1])) {
    i += 2;
    while (i < s.size() && IsDigit(s[i])) ++i;
  }
  return i - pos;
}

// End of the digit run containing pos.
inline size_t DigitRunEnd(std::string_view s, size_t pos) {
  while (pos < s.size() && IsDigit(s[pos])) ++pos;
  return pos;
}

inline bool IsAllDigits(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!IsDigit(c)) return false;
  }
  return true;
}

inline std::string_view TrimView(std::string_view s) {
  const char* ws = " \t\r\n\v\f";
  size_t start = s.find_first_not_of(ws);
  if (start == std::string_view::npos) return {};
  size_t end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

inline std::string Trim(std::string_view s) { return std::string(TrimView(s)); }

// Round half to even and clamp into [0, INT64_MAX]. NaN maps to 0.
inline int64_t RoundToCount(double v) {
  if (!(v > 0.0)) return 0;
  constexpr double kTwoPow63 = 9223372036854775808.0;
  if (v >= kTwoPow63) return std::numeric_limits<int64_t>::max();

  double r = std::round(v);
  if (std::fabs(v - std::trunc(v)) == 0.5) {
    r = 2.0 * std::round(v / 2.0);
  }
  return static_cast<int64_t>(r);
}

// Parse an all-digit string, saturating at INT64_MAX. Stops at the first
// non-digit.
inline int64_t ParseDigits(std::string_view s) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  int64_t v = 0;
  for (char c : s) {
    if (!IsDigit(c)) break;
    int d = c - '0';
    if (v > (kMax - d) / 10) return kMax;
    v = v * 10 + d;
  }
  return v;
}

// Parse "<digits>[.<digits>]" without going through the C locale.
// Fraction digits past the 18th are ignored.
inline double ParseDecimal(std::string_view s) {
  double whole = 0.0;
  size_t i = 0;
  for (; i < s.size() && IsDigit(s[i]); ++i) {
    whole = whole * 10.0 + (s[i] - '0');
  }
  if (i >= s.size() || s[i] != '.') return whole;

  uint64_t frac = 0;
  double scale = 1.0;
  int digits = 0;
  for (++i; i < s.size() && IsDigit(s[i]); ++i) {
    if (digits == 18) continue;
    frac = frac * 10 + static_cast<uint64_t>(s[i] - '0');
    scale *= 10.0;
    ++digits;
  }
  return whole + static_cast<double>(frac) / scale;
}

}  // namespace mise::internal
