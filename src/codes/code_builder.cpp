#include "golay/codes/code_builder.hpp"

#include <string>

#include "golay/errors.hpp"

namespace golay {

util::BitMatrix build_generator(const util::BitMatrix& parity) {
    if (parity.rows() != kDataBits) {
        throw DimensionMismatch("Parity sub-matrix must have " + std::to_string(kDataBits) + " rows, got " +
                                std::to_string(parity.rows()));
    }
    return util::hstack(util::identity(kDataBits), parity);
}

util::BitMatrix puncture(const util::BitMatrix& parity) {
    if (parity.cols() < 1) throw InvalidDimension("Cannot puncture a matrix without columns");
    return util::BitMatrix(util::BitMatrix::Bits(parity.bits().leftCols(parity.cols() - 1)));
}

}  // namespace golay
