#include "golay/codes/syndrome_table.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "golay/codes/code_builder.hpp"
#include "golay/errors.hpp"

namespace golay {

util::BitMatrix::Row unit_vector(int length, int position) {
    if (length <= 0) throw InvalidDimension("Vector length must be positive, got " + std::to_string(length));
    if (position < 0 || position >= length) {
        throw std::out_of_range("Position " + std::to_string(position) + " outside vector of length " +
                                std::to_string(length));
    }

    util::BitMatrix::Row v = util::BitMatrix::Row::Zero(length);
    v(position) = 1;
    return v;
}

util::BitMatrix::Row rotate_left(const util::BitMatrix::Row& v, int shift) {
    const auto n = static_cast<int>(v.size());
    if (n == 0) return v;

    const int s = shift % n;
    util::BitMatrix::Row out(n);
    for (int j = 0; j < n; j++) out(((j - s) % n + n) % n) = v(j);
    return out;
}

util::BitMatrix::Row syndrome(const util::BitMatrix& parity_check, const util::BitMatrix::Row& error) {
    const auto e = util::BitMatrix(util::BitMatrix::Bits(error));
    return util::matmul(e, util::transpose(parity_check)).row(0);
}

util::BitMatrix build_syndrome_table(const util::BitMatrix& parity_check) {
    if (parity_check.rows() != kStandardLength - kDataBits || parity_check.cols() != kStandardLength) {
        throw ShapeError("Syndrome table needs an " + std::to_string(kStandardLength - kDataBits) + "x" +
                         std::to_string(kStandardLength) + " parity check, got " +
                         std::to_string(parity_check.rows()) + "x" + std::to_string(parity_check.cols()));
    }

    const auto pivot = unit_vector(kStandardLength, kErrorPivot);

    util::BitMatrix::Bits table(kSyndromeCount, parity_check.rows());
    for (int i = 0; i < kSyndromeCount; i++) table.row(i) = syndrome(parity_check, rotate_left(pivot, i));
    return util::BitMatrix(std::move(table));
}

void verify_syndromes(const util::BitMatrix& table) {
    for (int i = 0; i < table.rows(); i++) {
        const auto s = table.row(i);
        if (s.sum() == 0) throw SyndromeCollision(i, -1);
        for (int j = 0; j < i; j++) {
            if (table.row(j) == s) throw SyndromeCollision(j, i);
        }
    }
}

}  // namespace golay
