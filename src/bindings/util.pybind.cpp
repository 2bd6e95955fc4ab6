#include "bindings/util.pybind.hpp"

#include <pybind11/eigen.h>
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "golay/util/bit_matrix.hpp"

namespace py = pybind11;

namespace golay {
namespace bindings {

void bind_bit_matrix(py::module& util_module) {
    using util::BitMatrix;

    py::class_<BitMatrix>(util_module, "BitMatrix")
        .def(py::init<BitMatrix::Bits>(), py::arg("bits"),
             "Creates a BitMatrix from an integer array.\n\n"
             "Args:\n"
             "    bits: 2D array with entries 0 or 1.\n"
             "Raises:\n"
             "    NonBinaryEntry: If any entry is not 0 or 1.")
        .def_property_readonly("rows", &BitMatrix::rows)
        .def_property_readonly("cols", &BitMatrix::cols)
        .def_property_readonly("bits", &BitMatrix::bits, "The entries as an integer array.")
        .def("row", &BitMatrix::row, py::arg("index"))
        .def("col", &BitMatrix::col, py::arg("index"))
        .def("count_ones", &BitMatrix::count_ones)
        .def("to_words", &BitMatrix::to_words, "Rows packed MSB-first into unsigned integers.")
        .def(py::self == py::self)
        .def(py::self != py::self);

    // Bind the free GF(2) operations.
    util_module.def("identity", &util::identity, py::arg("n"), "Construct the n x n identity matrix.");
    util_module.def("hstack", &util::hstack, py::arg("a"), py::arg("b"),
                    "Concatenate two matrices with equal row counts side by side.");
    util_module.def("transpose", &util::transpose, py::arg("a"));
    util_module.def("dot", &util::dot, py::arg("a"), py::arg("b"), "Inner product of two bit vectors mod 2.");
    util_module.def("matmul", &util::matmul, py::arg("a"), py::arg("b"), "Matrix product over GF(2).");
}

void bind_util(py::module& module) {
    // Create a submodule for utility functions.
    auto util = module.def_submodule("util", "GF(2) matrix utilities");

    // Bind BitMatrix and its operations.
    bind_bit_matrix(util);
}

}  // namespace bindings
}  // namespace golay
