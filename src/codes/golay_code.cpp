#include "golay/codes/golay_code.hpp"

#include <stdexcept>
#include <string>

#include "golay/codes/code_builder.hpp"
#include "golay/codes/parity_check.hpp"
#include "golay/codes/self_duality.hpp"
#include "golay/codes/syndrome_table.hpp"
#include "golay/errors.hpp"

namespace golay {

CodeParameters parameters(Variant variant) {
    switch (variant) {
        case Variant::standard:
            return {kStandardLength, kDataBits, false, true};
        case Variant::extended:
            return {kStandardLength + 1, kDataBits, true, false};
    }
    throw std::invalid_argument("Unknown Golay code variant");
}

const util::BitMatrix& extended_parity() {
    static const util::BitMatrix matrix{
        {1, 1, 0, 0, 0, 1, 1, 1, 0, 1, 0, 1},
        {0, 1, 1, 0, 0, 0, 1, 1, 1, 0, 1, 1},
        {1, 1, 1, 1, 0, 1, 1, 0, 1, 0, 0, 0},
        {0, 1, 1, 1, 1, 0, 1, 1, 0, 1, 0, 0},
        {0, 0, 1, 1, 1, 1, 0, 1, 1, 0, 1, 0},
        {1, 1, 0, 1, 1, 0, 0, 1, 1, 0, 0, 1},
        {0, 1, 1, 0, 1, 1, 0, 0, 1, 1, 0, 1},
        {0, 0, 1, 1, 0, 1, 1, 0, 0, 1, 1, 1},
        {1, 1, 0, 1, 1, 1, 0, 0, 0, 1, 1, 0},
        {1, 0, 1, 0, 1, 0, 0, 1, 0, 1, 1, 1},
        {1, 0, 0, 1, 0, 0, 1, 1, 1, 1, 1, 0},
        {1, 0, 0, 0, 1, 1, 1, 0, 1, 0, 1, 1},
    };
    return matrix;
}

const util::BitMatrix& standard_parity() {
    // Equals the extended block with its rightmost column removed.
    static const util::BitMatrix matrix{
        {1, 1, 0, 0, 0, 1, 1, 1, 0, 1, 0},
        {0, 1, 1, 0, 0, 0, 1, 1, 1, 0, 1},
        {1, 1, 1, 1, 0, 1, 1, 0, 1, 0, 0},
        {0, 1, 1, 1, 1, 0, 1, 1, 0, 1, 0},
        {0, 0, 1, 1, 1, 1, 0, 1, 1, 0, 1},
        {1, 1, 0, 1, 1, 0, 0, 1, 1, 0, 0},
        {0, 1, 1, 0, 1, 1, 0, 0, 1, 1, 0},
        {0, 0, 1, 1, 0, 1, 1, 0, 0, 1, 1},
        {1, 1, 0, 1, 1, 1, 0, 0, 0, 1, 1},
        {1, 0, 1, 0, 1, 0, 0, 1, 0, 1, 1},
        {1, 0, 0, 1, 0, 0, 1, 1, 1, 1, 1},
        {1, 0, 0, 0, 1, 1, 1, 0, 1, 0, 1},
    };
    return matrix;
}

const util::BitMatrix& parity(Variant variant) {
    return variant == Variant::extended ? extended_parity() : standard_parity();
}

PackedTable pack(const util::BitMatrix& m) {
    return {m.to_words(), m.cols()};
}

GolayTables generate_tables(Variant variant) {
    return generate_tables(variant, parity(variant));
}

GolayTables generate_tables(Variant variant, const util::BitMatrix& core) {
    const auto params = parameters(variant);
    if (core.rows() != params.data_bits || core.cols() != params.parity_bits()) {
        throw ShapeError("Parity block for a length " + std::to_string(params.length) + " code must be " +
                         std::to_string(params.data_bits) + "x" + std::to_string(params.parity_bits()) + ", got " +
                         std::to_string(core.rows()) + "x" + std::to_string(core.cols()));
    }

    const auto generator = build_generator(core);
    const auto check = parity_check_transposed(core);
    verify_orthogonal(generator, check);

    GolayTables tables{variant, pack(core), pack(util::transpose(core)), pack(generator), pack(check),
                       pack(util::transpose(check)), std::nullopt, std::nullopt};

    if (params.self_dual) {
        verify_self_dual(generator);
        const auto alt = parity_check_identity_form(core);
        verify_orthogonal(generator, alt);
        tables.alt_parity_check = pack(alt);
    }

    if (params.has_syndrome_table) {
        const auto syndromes = build_syndrome_table(check);
        verify_syndromes(syndromes);
        tables.syndromes = pack(syndromes);
    }

    return tables;
}

}  // namespace golay
