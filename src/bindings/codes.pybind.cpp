#include "bindings/codes.pybind.hpp"

#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "golay/codes/code_builder.hpp"
#include "golay/codes/golay_code.hpp"
#include "golay/codes/parity_check.hpp"
#include "golay/codes/self_duality.hpp"
#include "golay/codes/syndrome_table.hpp"
#include "golay/errors.hpp"

namespace py = pybind11;

namespace golay {
namespace bindings {

void bind_errors(py::module& module) {
    py::register_exception<DimensionMismatch>(module, "DimensionMismatch", PyExc_ValueError);
    py::register_exception<ShapeError>(module, "ShapeError", PyExc_ValueError);
    py::register_exception<InvalidDimension>(module, "InvalidDimension", PyExc_ValueError);
    py::register_exception<NonBinaryEntry>(module, "NonBinaryEntry", PyExc_ValueError);
    py::register_exception<SelfDualityViolation>(module, "SelfDualityViolation", PyExc_RuntimeError);
    py::register_exception<OrthogonalityViolation>(module, "OrthogonalityViolation", PyExc_RuntimeError);
    py::register_exception<SyndromeCollision>(module, "SyndromeCollision", PyExc_RuntimeError);
}

void bind_tables(py::module& codes_module) {
    py::enum_<Variant>(codes_module, "Variant")
        .value("standard", Variant::standard)
        .value("extended", Variant::extended);

    py::class_<CodeParameters>(codes_module, "CodeParameters")
        .def_readonly("length", &CodeParameters::length)
        .def_readonly("data_bits", &CodeParameters::data_bits)
        .def_readonly("self_dual", &CodeParameters::self_dual)
        .def_readonly("has_syndrome_table", &CodeParameters::has_syndrome_table)
        .def_property_readonly("parity_bits", &CodeParameters::parity_bits);

    py::class_<PackedTable>(codes_module, "PackedTable")
        .def_readonly("rows", &PackedTable::rows)
        .def_readonly("width", &PackedTable::width);

    py::class_<GolayTables>(codes_module, "GolayTables")
        .def_readonly("variant", &GolayTables::variant)
        .def_readonly("core", &GolayTables::core)
        .def_readonly("core_transpose", &GolayTables::core_transpose)
        .def_readonly("generator", &GolayTables::generator)
        .def_readonly("parity_check", &GolayTables::parity_check)
        .def_readonly("parity_check_transpose", &GolayTables::parity_check_transpose)
        .def_readonly("alt_parity_check", &GolayTables::alt_parity_check)
        .def_readonly("syndromes", &GolayTables::syndromes);

    codes_module.def("parameters", &parameters, py::arg("variant"));
    codes_module.def("parity", &parity, py::arg("variant"), py::return_value_policy::copy,
                     "The constant parity sub-matrix of a code variant.");
    codes_module.def("generate_tables", py::overload_cast<Variant, const util::BitMatrix&>(&generate_tables),
                     py::arg("variant"), py::arg("core"),
                     "Build and verify all constant tables of a code variant from a custom parity block.");
    codes_module.def("generate_tables", py::overload_cast<Variant>(&generate_tables), py::arg("variant"),
                     "Build and verify all constant tables of a code variant.\n\n"
                     "Args:\n"
                     "    variant: The code variant.\n"
                     "Returns:\n"
                     "    The packed generator, parity-check and syndrome tables.");
}

void bind_codes(py::module& module) {
    // Create a submodule codes.
    auto codes_module = module.def_submodule("codes", "Golay code table derivations");

    codes_module.def("build_generator", &build_generator, py::arg("parity"),
                     "Construct the systematic generator matrix [ I | P ].");
    codes_module.def("puncture", &puncture, py::arg("parity"), "Remove the rightmost column of a parity block.");
    codes_module.def("parity_check_transposed", &parity_check_transposed, py::arg("parity"),
                     "Derive the parity-check matrix [ P^T | I ].");
    codes_module.def("parity_check_identity_form", &parity_check_identity_form, py::arg("parity"),
                     "Derive the alternative parity-check matrix [ I | P ] of a square parity block.");
    codes_module.def("verify_orthogonal", &verify_orthogonal, py::arg("generator"), py::arg("parity_check"));
    codes_module.def("verify_self_dual", &verify_self_dual, py::arg("generator"));
    codes_module.def("build_syndrome_table", &build_syndrome_table, py::arg("parity_check"),
                     "Syndromes of the 12 rotated single-bit error patterns of the standard code.");
    codes_module.def("verify_syndromes", &verify_syndromes, py::arg("table"));

    // Bind the pipeline.
    bind_tables(codes_module);
}

}  // namespace bindings
}  // namespace golay
