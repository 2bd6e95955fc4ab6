#pragma once

#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace golay {
namespace bindings {

/**
 * Create Python bindings for all utility functions.
 *
 * This function creates bindings for all utility functions defined in the golay/util/ directory.
 *
 * @param module The pybind11 module to add the bindings to.
 */
void bind_util(py::module& module);

/**
 * Create Python bindings for the BitMatrix class and the GF(2) matrix operations.
 *
 * @param module The pybind11 module to add the bindings to.
 */
void bind_bit_matrix(py::module& module);

}  // namespace bindings
}  // namespace golay
