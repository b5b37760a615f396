/**
 * Normalizer class bindings for canonurl Python bindings.
 */

#include "normalizer_bindings.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <canonurl/normalizer.hpp>

#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;

namespace canonurl::python {

namespace {

// None is treated like the empty string: "" for normalize, "generic" for labels.
std::string_view ViewOrEmpty(const std::optional<std::string>& url) {
  return url ? std::string_view(*url) : std::string_view();
}

}  // namespace

void BindNormalizer(py::module_& m) {
  // NormalizeResult (read-only)
  py::class_<NormalizeResult>(m, "NormalizeResult",
                              "Canonical form plus how it was obtained")
      .def_readonly("canonical", &NormalizeResult::canonical)
      .def_readonly("platform", &NormalizeResult::platform)
      .def_readonly("tier", &NormalizeResult::tier)
      .def_readonly("params_removed", &NormalizeResult::params_removed)
      .def("__repr__", [](const NormalizeResult& r) {
        return "NormalizeResult(canonical='" + r.canonical + "', platform='" +
               std::string(PlatformName(r.platform)) + "', tier='" +
               std::string(TierName(r.tier)) + "', params_removed=" +
               std::to_string(r.params_removed) + ")";
      });

  // Normalizer class
  py::class_<Normalizer>(m, "Normalizer", R"doc(
Canonical URL normalizer.

Stateless apart from its Options and safe to share between threads.
)doc")
      .def(py::init<>())
      .def(py::init<Options>(), py::arg("options"))
      .def("explain",
           [](const Normalizer& n, const std::optional<std::string>& url) {
             py::gil_scoped_release release;
             return n.Explain(ViewOrEmpty(url));
           },
           py::arg("url"),
           "Canonical form with platform, tier and number of removed params.")
      .def("normalize",
           [](const Normalizer& n, const std::optional<std::string>& url) {
             py::gil_scoped_release release;
             return n.Normalize(ViewOrEmpty(url));
           },
           py::arg("url"), "Canonical form of url; '' for '' or None.")
      .def("normalize_many",
           [](const Normalizer& n, const std::vector<std::string>& urls) {
             std::vector<std::string> out;
             out.reserve(urls.size());
             py::gil_scoped_release release;
             for (const auto& url : urls) out.push_back(n.Normalize(url));
             return out;
           },
           py::arg("urls"), "Canonical forms of a list of URLs, in order.")
      .def("match",
           [](const Normalizer& n, const std::optional<std::string>& a,
              const std::optional<std::string>& b) {
             py::gil_scoped_release release;
             return n.Match(ViewOrEmpty(a), ViewOrEmpty(b));
           },
           py::arg("url1"), py::arg("url2"),
           "True iff both URLs have the same canonical form.")
      .def("get_platform",
           [](const Normalizer& n, const std::optional<std::string>& url) {
             return std::string(n.GetPlatform(ViewOrEmpty(url)));
           },
           py::arg("url"), "'twitter', 'youtube' or 'generic'.")
      .def_property_readonly("options", &Normalizer::options);

  // Module-level functions with default options
  m.def("normalize_url",
        [](const std::optional<std::string>& url) {
          py::gil_scoped_release release;
          return NormalizeUrl(ViewOrEmpty(url));
        },
        py::arg("url"), "Canonical form of url; '' for '' or None.");

  m.def("urls_match",
        [](const std::optional<std::string>& a, const std::optional<std::string>& b) {
          py::gil_scoped_release release;
          return UrlsMatch(ViewOrEmpty(a), ViewOrEmpty(b));
        },
        py::arg("url1"), py::arg("url2"),
        "True iff both URLs have the same canonical form.");

  m.def("get_platform",
        [](const std::optional<std::string>& url) {
          return std::string(GetPlatform(ViewOrEmpty(url)));
        },
        py::arg("url"),
        "'twitter', 'youtube' or 'generic'; 'generic' for None or unparsable input.");
}

}  // namespace canonurl::python
