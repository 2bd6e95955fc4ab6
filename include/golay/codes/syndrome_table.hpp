#pragma once

#include "golay/util/bit_matrix.hpp"

namespace golay {

// Length of the standard (23, 12, 7) code.
constexpr int kStandardLength = 23;

// Index of the single 1 in the canonical error pattern.
constexpr int kErrorPivot = 11;

// One syndrome per data bit.
constexpr int kSyndromeCount = 12;

/**
 * Construct a bit vector with a single 1.
 *
 * @throws golay::InvalidDimension If length is not positive.
 * @throws std::out_of_range If position is outside [0, length).
 */
util::BitMatrix::Row unit_vector(int length, int position);

/**
 * Rotate a bit vector cyclically toward index 0: the element at index j moves to index (j - shift) mod n.
 *
 * Negative shifts rotate the other way.
 */
util::BitMatrix::Row rotate_left(const util::BitMatrix::Row& v, int shift);

/**
 * Syndrome of an error pattern, (e H^T) mod 2.
 *
 * @throws golay::DimensionMismatch If the pattern length differs from the parity-check column count.
 */
util::BitMatrix::Row syndrome(const util::BitMatrix& parity_check, const util::BitMatrix::Row& error);

/**
 * Build the single-error syndrome table of the standard code.
 *
 * Row i of the result is the syndrome of the canonical error pattern (a 1 at index 11) rotated left by i, so
 * row i identifies an error in data bit i, counting from the data LSB.
 *
 * @param parity_check The 11 x 23 parity-check matrix.
 * @return A 12 x 11 matrix with one syndrome per row.
 * @throws golay::ShapeError If parity_check is not 11 x 23.
 */
util::BitMatrix build_syndrome_table(const util::BitMatrix& parity_check);

/**
 * Check that all syndromes in a table are non-zero and pairwise distinct.
 *
 * @throws golay::SyndromeCollision On the first zero row (other index -1) or the first equal pair.
 */
void verify_syndromes(const util::BitMatrix& table);

}  // namespace golay
