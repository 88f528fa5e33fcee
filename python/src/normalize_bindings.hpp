/**
 * Normalizer bindings for mise Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>

#include <mise/field_value.hpp>

namespace mise::python {

/**
 * Map a Python value onto a FieldValue.
 * None -> absent, bool/int/float -> number, anything else -> str(value).
 */
FieldValue ToFieldValue(const pybind11::handle& value);

/**
 * Bind normalize_duration, normalize_servings and classify_platform.
 */
void BindNormalizers(pybind11::module_& m);

}  // namespace mise::python
