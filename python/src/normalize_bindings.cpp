/**
 * Normalizer bindings for mise Python bindings.
 */

#include "normalize_bindings.hpp"

#include <mise/duration.hpp>
#include <mise/platform.hpp>
#include <mise/servings.hpp>

#include <limits>
#include <string>

namespace py = pybind11;

namespace mise::python {

FieldValue ToFieldValue(const py::handle& value) {
  if (value.is_none()) {
    return FieldValue::Absent();
  }
  if (py::isinstance<py::bool_>(value)) {
    return FieldValue::Number(value.cast<bool>() ? 1.0 : 0.0);
  }
  if (py::isinstance<py::int_>(value) || py::isinstance<py::float_>(value)) {
    try {
      return FieldValue::Number(value.cast<double>());
    } catch (const py::cast_error&) {
      // int too large for a double; only the sign matters after clamping
      bool positive = value.attr("__gt__")(0).cast<bool>();
      constexpr double kInf = std::numeric_limits<double>::infinity();
      return FieldValue::Number(positive ? kInf : -kInf);
    }
  }
  return FieldValue::Text(py::str(value).cast<std::string>());
}

void BindNormalizers(py::module_& m) {
  m.def(
      "normalize_duration",
      [](const py::object& value) { return NormalizeDuration(ToFieldValue(value)); },
      py::arg("value"),
      R"doc(
Convert a duration to whole minutes.

Accepts None, numbers (already minutes) or text such as "90",
"1:30", "PT1H30M", "1 hr 30 min" or "about 45". Never raises;
unparseable input gives 0.

Args:
    value: Duration field as extracted from a recipe page

Returns:
    Non-negative number of minutes
)doc");

  m.def(
      "normalize_servings",
      [](const py::object& value) { return NormalizeServings(ToFieldValue(value)); },
      py::arg("value"),
      R"doc(
Convert a yield to a head count.

Ranges such as "4-6" or "4 to 6 servings" give the lower bound.
Never raises; unparseable input gives 0.
)doc");

  m.def(
      "classify_platform",
      [](const std::string& url) { return std::string(PlatformName(ClassifyPlatform(url))); },
      py::arg("url"),
      "Return 'tiktok', 'youtube' or 'website' for a URL.");
}

}  // namespace mise::python
