/**
 * Main pybind11 module definition for canonurl.
 */

#include <pybind11/pybind11.h>
#include <canonurl/version.hpp>

#include "normalizer_bindings.hpp"
#include "options_bindings.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_canonurl, m) {
  m.doc() = R"doc(
canonurl: Canonical URL normalization.

Reduces URLs to a canonical string for content-identity comparison. The
scheme, port, fragment and tracking parameters are dropped, the host is
lowercased with one leading "www." removed, and twitter/youtube URLs get
platform-specific query rules.

Basic usage:
    import _canonurl as canonurl

    canonurl.normalize_url("https://www.example.com/a?utm_source=x")
    # 'example.com/a'

    canonurl.urls_match("https://x.com/a/status/1?s=20",
                        "https://twitter.com/a/status/1")
    # True

    canonurl.get_platform("https://youtu.be/abc")
    # 'youtube'
)doc";

  // Bind options and enums
  canonurl::python::BindOptions(m);

  // Bind Normalizer class and free functions
  canonurl::python::BindNormalizer(m);

  // Version info
  m.attr("__version__") = canonurl::Version();
}
