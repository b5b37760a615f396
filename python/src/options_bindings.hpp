/**
 * Options and enum bindings for canonurl Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>

namespace canonurl::python {

/**
 * Bind Options struct and related enums to the Python module.
 */
void BindOptions(pybind11::module_& m);

}  // namespace canonurl::python
