#pragma once

#include "golay/util/bit_matrix.hpp"

namespace golay {

/**
 * Derive the parity-check matrix H = [ P^T | I ] from a generator's parity block.
 *
 * @param parity The 12 x K parity block.
 * @return A K x (12 + K) parity-check matrix.
 */
util::BitMatrix parity_check_transposed(const util::BitMatrix& parity);

/**
 * Derive the alternative parity-check matrix H = [ I | P ].
 *
 * This is the generator matrix itself, which is a valid parity-check matrix only because the extended code is
 * self-dual.
 *
 * @param parity The 12 x 12 parity block.
 * @throws golay::ShapeError If parity is not square.
 */
util::BitMatrix parity_check_identity_form(const util::BitMatrix& parity);

/**
 * Check that every generator row is orthogonal to every parity-check row, i.e. G H^T = 0 (mod 2).
 *
 * @throws golay::DimensionMismatch If the matrices have different column counts.
 * @throws golay::OrthogonalityViolation On the first non-zero entry of G H^T in row-major order.
 */
void verify_orthogonal(const util::BitMatrix& generator, const util::BitMatrix& parity_check);

}  // namespace golay
