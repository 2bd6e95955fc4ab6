#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "bindings/codes.pybind.hpp"
#include "bindings/util.pybind.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_golay, m) {
    m.doc() = "Golay code table generator core C++ bindings";

    // Register error kinds first so every submodule raises them.
    golay::bindings::bind_errors(m);

    // Bind utility functions.
    golay::bindings::bind_util(m);

    // Bind codes.
    golay::bindings::bind_codes(m);
}
