#pragma once

#include "golay/util/bit_matrix.hpp"

namespace golay {

// Number of data bits carried by every Golay codeword.
constexpr int kDataBits = 12;

/**
 * Construct the systematic generator matrix G = [ I | P ].
 *
 * @param parity The 12 x K parity sub-matrix (K = 11 for the standard code, 12 for the extended code).
 * @return The 12 x (12 + K) generator matrix.
 * @throws golay::DimensionMismatch If parity does not have exactly 12 rows.
 */
util::BitMatrix build_generator(const util::BitMatrix& parity);

/**
 * Remove the rightmost column of a parity sub-matrix, turning the extended code's block into the standard one.
 *
 * @throws golay::InvalidDimension If parity has no columns.
 */
util::BitMatrix puncture(const util::BitMatrix& parity);

}  // namespace golay
