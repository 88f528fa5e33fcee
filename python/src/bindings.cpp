/**
 * Main pybind11 module definition for mise.
 */

#include <pybind11/pybind11.h>
#include <mise/version.hpp>

#include "normalize_bindings.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_mise, m) {
  m.doc() = R"doc(
mise: recipe field normalization.

Turns the durations and yields found on recipe pages into integers,
and tells short-video links apart from ordinary recipe sites.

Basic usage:
    import mise

    mise.normalize_duration("1 hr 30 min")   # 90
    mise.normalize_duration("PT45M")         # 45
    mise.normalize_servings("4-6 servings")  # 4
    mise.classify_platform("https://youtu.be/abc")  # "youtube"
)doc";

  mise::python::BindNormalizers(m);

  // Version info
  m.attr("__version__") = mise::Version();

#ifdef MISE_BUILD_SERVER
  m.attr("SERVER_AVAILABLE") = true;
#else
  m.attr("SERVER_AVAILABLE") = false;
#endif
}
