#include "golay/util/bit_matrix.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "golay/errors.hpp"

namespace golay {
namespace util {

namespace {

std::string shape(const BitMatrix& m) {
    return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

}  // namespace

BitMatrix::BitMatrix(Bits bits) : m_bits(std::move(bits)) {
    for (Eigen::Index r = 0; r < m_bits.rows(); r++) {
        for (Eigen::Index c = 0; c < m_bits.cols(); c++) {
            const int v = m_bits(r, c);
            if (v != 0 && v != 1) throw NonBinaryEntry(static_cast<int>(r), static_cast<int>(c), v);
        }
    }
}

BitMatrix::BitMatrix(std::initializer_list<std::initializer_list<int>> rows) {
    const auto width = rows.size() == 0 ? 0 : rows.begin()->size();
    Bits bits(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(width));

    Eigen::Index r = 0;
    for (const auto& row : rows) {
        if (row.size() != width) {
            throw DimensionMismatch("Ragged matrix literal. Row " + std::to_string(r) + " has " +
                                    std::to_string(row.size()) + " entries, expected " + std::to_string(width));
        }
        Eigen::Index c = 0;
        for (int v : row) bits(r, c++) = v;
        r++;
    }

    *this = BitMatrix(std::move(bits));
}

BitMatrix::Row BitMatrix::row(int index) const {
    if (index < 0 || index >= rows()) throw std::out_of_range("Row index out of range: " + std::to_string(index));
    return m_bits.row(index);
}

BitMatrix::Row BitMatrix::col(int index) const {
    if (index < 0 || index >= cols()) throw std::out_of_range("Column index out of range: " + std::to_string(index));
    return m_bits.col(index).transpose();
}

std::vector<std::uint32_t> BitMatrix::to_words() const {
    if (cols() > 32) throw DimensionMismatch("Cannot pack " + std::to_string(cols()) + " columns into 32-bit words");

    std::vector<std::uint32_t> words;
    words.reserve(static_cast<size_t>(rows()));
    for (int r = 0; r < rows(); r++) {
        std::uint32_t word = 0;
        for (int c = 0; c < cols(); c++) word = (word << 1) | static_cast<std::uint32_t>(m_bits(r, c));
        words.push_back(word);
    }
    return words;
}

bool BitMatrix::operator==(const BitMatrix& other) const {
    return rows() == other.rows() && cols() == other.cols() && m_bits == other.m_bits;
}

BitMatrix identity(int n) {
    if (n <= 0) throw InvalidDimension("Identity size must be positive, got " + std::to_string(n));
    return BitMatrix(BitMatrix::Bits::Identity(n, n));
}

BitMatrix hstack(const BitMatrix& a, const BitMatrix& b) {
    if (a.rows() != b.rows()) {
        throw DimensionMismatch("Row count mismatch in hstack. Got " + shape(a) + " and " + shape(b));
    }

    BitMatrix::Bits bits(a.rows(), a.cols() + b.cols());
    bits.leftCols(a.cols()) = a.bits();
    bits.rightCols(b.cols()) = b.bits();
    return BitMatrix(std::move(bits));
}

BitMatrix transpose(const BitMatrix& a) {
    return BitMatrix(BitMatrix::Bits(a.bits().transpose()));
}

int dot(const BitMatrix::Row& a, const BitMatrix::Row& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatch("Vector length mismatch in dot. Got " + std::to_string(a.size()) + " and " +
                                std::to_string(b.size()));
    }
    return a.dot(b) & 1;
}

BitMatrix matmul(const BitMatrix& a, const BitMatrix& b) {
    if (a.cols() != b.rows()) {
        throw DimensionMismatch("Inner dimension mismatch in matmul. Got " + shape(a) + " and " + shape(b));
    }

    BitMatrix::Bits product = a.bits() * b.bits();
    return BitMatrix(BitMatrix::Bits(product.unaryExpr([](int v) { return v & 1; })));
}

}  // namespace util
}  // namespace golay
