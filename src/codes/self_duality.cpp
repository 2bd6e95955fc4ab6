#include "golay/codes/self_duality.hpp"

#include "golay/errors.hpp"

namespace golay {

void verify_self_dual(const util::BitMatrix& generator) {
    for (int r = 0; r < generator.rows(); r++) {
        const auto row = generator.row(r);
        for (int q = r; q < generator.rows(); q++) {
            if (util::dot(row, generator.row(q)) != 0) throw SelfDualityViolation(r, q);
        }
    }
}

}  // namespace golay
