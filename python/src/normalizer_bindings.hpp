/**
 * Normalizer class bindings for canonurl Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>

namespace canonurl::python {

/**
 * Bind Normalizer, NormalizeResult and the module-level functions.
 */
void BindNormalizer(pybind11::module_& m);

}  // namespace canonurl::python
