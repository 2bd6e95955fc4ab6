#pragma once

#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace golay {
namespace bindings {

/**
 * Create Python bindings for the module containing the Golay code derivations.
 *
 * @param module The pybind11 module to add the bindings to.
 */
void bind_codes(py::module& module);

/**
 * Create Python bindings for the table-generation pipeline and its result types.
 *
 * @param module The pybind11 module to add the bindings to.
 */
void bind_tables(py::module& module);

/**
 * Register the Golay error kinds as Python exceptions.
 *
 * @param module The pybind11 module to add the exceptions to.
 */
void bind_errors(py::module& module);

}  // namespace bindings
}  // namespace golay
