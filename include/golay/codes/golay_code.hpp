#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "golay/util/bit_matrix.hpp"

namespace golay {

enum class Variant { standard, extended };

/**
 * Parameters of one Golay code variant.
 */
struct CodeParameters {
    int length;
    int data_bits;
    bool self_dual;
    bool has_syndrome_table;

    int parity_bits() const { return length - data_bits; }
};

CodeParameters parameters(Variant variant);

/**
 * The 12 x 12 parity sub-matrix A of the extended (24, 12, 8) code, pieced together from the P25 and DMR
 * standards and appendix Q of the IRIG standard.
 */
const util::BitMatrix& extended_parity();

// The 12 x 11 parity sub-matrix of the standard (23, 12, 7) code.
const util::BitMatrix& standard_parity();

const util::BitMatrix& parity(Variant variant);

/**
 * Matrix rows packed MSB-first, with the number of significant bits per row.
 */
struct PackedTable {
    std::vector<std::uint32_t> rows;
    int width = 0;
};

PackedTable pack(const util::BitMatrix& m);

/**
 * Every constant table a Golay encoder/decoder needs for one variant.
 */
struct GolayTables {
    Variant variant;
    PackedTable core;
    PackedTable core_transpose;
    PackedTable generator;
    PackedTable parity_check;
    PackedTable parity_check_transpose;  // row i is column i of parity_check
    std::optional<PackedTable> alt_parity_check;  // extended only
    std::optional<PackedTable> syndromes;         // standard only
};

/**
 * Build and verify all tables of one code variant.
 *
 * Nothing is returned unless every integrity check passes: the generator is orthogonal to each published
 * parity-check matrix, the extended generator is self-dual and the standard syndromes are distinct and non-zero.
 *
 * @throws golay::SelfDualityViolation, golay::OrthogonalityViolation, golay::SyndromeCollision If the constant
 * parity block is malformed.
 */
GolayTables generate_tables(Variant variant);

/**
 * Build and verify all tables of one code variant from a caller-supplied parity block.
 *
 * @param variant The code variant the block belongs to.
 * @param core The 12 x K parity sub-matrix (K = 11 standard, 12 extended).
 * @throws golay::ShapeError If core does not have the variant's shape.
 */
GolayTables generate_tables(Variant variant, const util::BitMatrix& core);

}  // namespace golay
