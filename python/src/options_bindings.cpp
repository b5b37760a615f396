/**
 * Options and enum bindings for canonurl Python bindings.
 */

#include "options_bindings.hpp"

#include <pybind11/pybind11.h>
#include <canonurl/normalizer.hpp>

#include <string>

namespace py = pybind11;

namespace canonurl::python {

void BindOptions(py::module_& m) {
  // Platform enum
  py::enum_<Platform>(m, "Platform", "Query policy selected from the host")
      .value("TWITTER", Platform::kTwitter, "twitter.com / x.com: query dropped")
      .value("YOUTUBE", Platform::kYouTube, "youtube.com / youtu.be: v and list kept")
      .value("GENERIC", Platform::kGeneric, "Tracking parameters removed");

  // HostMatching enum
  py::enum_<HostMatching>(m, "HostMatching", "Host comparison for platform labels")
      .value("SUFFIX", HostMatching::kSuffix,
             "Exact host or subdomain (default)")
      .value("SUBSTRING", HostMatching::kSubstring,
             "Legacy containment check");

  // NormalizeTier enum
  py::enum_<NormalizeTier>(m, "NormalizeTier", "Recovery stage that produced a result")
      .value("EMPTY", NormalizeTier::kEmpty, "Empty input")
      .value("STRICT", NormalizeTier::kStrict, "Parsed as an absolute URL")
      .value("SCHEME_REPAIR", NormalizeTier::kSchemeRepair,
             "Parsed after prepending https://")
      .value("MANUAL", NormalizeTier::kManual, "Host-only cleanup");

  m.def("platform_name",
        [](Platform p) { return std::string(PlatformName(p)); },
        py::arg("platform"),
        "Label for a platform: 'twitter', 'youtube' or 'generic'.");

  // Options class
  py::class_<Options>(m, "Options", "Normalizer configuration options")
      .def(py::init<>())
      .def_readwrite("platform_matching", &Options::platform_matching,
                     "Host matching for get_platform (default: SUFFIX)")
      .def("__repr__", [](const Options& o) {
        return std::string("Options(platform_matching=") +
               (o.platform_matching == HostMatching::kSuffix ? "SUFFIX" : "SUBSTRING") +
               ")";
      });
}

}  // namespace canonurl::python
