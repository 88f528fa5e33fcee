#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace mise {

/**
 * A raw recipe field as handed over by an extraction source.
 *
 * Structured data and scraped HTML disagree on types: a prep time may arrive
 * as a JSON number, as free text, or not at all. FieldValue carries exactly
 * one of those three shapes so that the normalizers dispatch on the type once,
 * at entry.
 *
 * Implicit construction is intentional:
 *   NormalizeDuration(90);         // number
 *   NormalizeDuration("1 hr");     // text
 *   NormalizeDuration(nullptr);    // absent
 */
class FieldValue {
 public:
  enum class Kind { kAbsent, kNumber, kText };

  FieldValue() = default;
  FieldValue(std::nullptr_t) {}

  template <typename T,
            typename = std::enable_if_t<std::is_arithmetic_v<T>>>
  FieldValue(T number)
      : kind_(Kind::kNumber), number_(static_cast<double>(number)) {}

  FieldValue(const char* text)
      : kind_(text ? Kind::kText : Kind::kAbsent), text_(text ? text : "") {}
  FieldValue(std::string text) : kind_(Kind::kText), text_(std::move(text)) {}
  FieldValue(std::string_view text) : kind_(Kind::kText), text_(text) {}

  static FieldValue Absent() { return FieldValue(); }
  static FieldValue Number(double number) { return FieldValue(number); }
  static FieldValue Text(std::string text) { return FieldValue(std::move(text)); }

  Kind kind() const { return kind_; }
  bool is_absent() const { return kind_ == Kind::kAbsent; }
  bool is_number() const { return kind_ == Kind::kNumber; }
  bool is_text() const { return kind_ == Kind::kText; }

  // Only meaningful for the matching kind; 0.0 / "" otherwise.
  double number() const { return number_; }
  const std::string& text() const { return text_; }

 private:
  Kind kind_ = Kind::kAbsent;
  double number_ = 0.0;
  std::string text_;
};

}  // namespace mise
