#pragma once

#include "golay/util/bit_matrix.hpp"

namespace golay {

/**
 * Check that the code spanned by a generator matrix is self-dual: every pair of rows, including each row with
 * itself, has even inner product.
 *
 * Only meaningful for the extended (24, 12, 8) generator. The standard generator fails this test.
 *
 * @throws golay::SelfDualityViolation On the first failing pair (r, q), r <= q, scanning r then q ascending.
 */
void verify_self_dual(const util::BitMatrix& generator);

}  // namespace golay
