#include "golay/codes/parity_check.hpp"

#include <string>

#include "golay/errors.hpp"

namespace golay {

util::BitMatrix parity_check_transposed(const util::BitMatrix& parity) {
    return util::hstack(util::transpose(parity), util::identity(parity.cols()));
}

util::BitMatrix parity_check_identity_form(const util::BitMatrix& parity) {
    if (parity.rows() != parity.cols()) {
        throw ShapeError("Identity-form parity check needs a square parity block, got " +
                         std::to_string(parity.rows()) + "x" + std::to_string(parity.cols()));
    }
    return util::hstack(util::identity(parity.rows()), parity);
}

void verify_orthogonal(const util::BitMatrix& generator, const util::BitMatrix& parity_check) {
    if (generator.cols() != parity_check.cols()) {
        throw DimensionMismatch("Generator has " + std::to_string(generator.cols()) +
                                " columns but parity check has " + std::to_string(parity_check.cols()));
    }

    const auto product = util::matmul(generator, util::transpose(parity_check));
    for (int r = 0; r < product.rows(); r++) {
        for (int q = 0; q < product.cols(); q++) {
            if (product(r, q) != 0) throw OrthogonalityViolation(r, q);
        }
    }
}

}  // namespace golay
