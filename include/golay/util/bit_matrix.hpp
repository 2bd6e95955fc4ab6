#pragma once

#include <cstdint>
#include <initializer_list>
#include <vector>

#include <Eigen/Dense>

namespace golay {
namespace util {

/**
 * Immutable matrix over GF(2).
 *
 * Entries are stored as integers restricted to {0, 1}. Every operation returns a new matrix and never aliases
 * the storage of its operands.
 */
class BitMatrix {
public:
    using Bits = Eigen::MatrixXi;
    using Row = Eigen::RowVectorXi;

    BitMatrix() = default;

    /**
     * Wrap an integer matrix.
     *
     * @param bits Entries of the matrix.
     * @throws golay::NonBinaryEntry If any entry is not 0 or 1.
     */
    explicit BitMatrix(Bits bits);

    /**
     * Build a matrix from a row-major literal.
     *
     * @throws golay::DimensionMismatch If the rows have different lengths.
     * @throws golay::NonBinaryEntry If any entry is not 0 or 1.
     */
    BitMatrix(std::initializer_list<std::initializer_list<int>> rows);

    int rows() const { return static_cast<int>(m_bits.rows()); }
    int cols() const { return static_cast<int>(m_bits.cols()); }

    int operator()(int row, int col) const { return m_bits(row, col); }

    Row row(int index) const;

    // Column as a row vector.
    Row col(int index) const;

    const Bits& bits() const { return m_bits; }

    int count_ones() const { return m_bits.sum(); }

    /**
     * Pack every row into an unsigned integer, column 0 in the most significant position.
     *
     * @return One word per row, holding cols() significant bits.
     * @throws golay::DimensionMismatch If the matrix is wider than 32 columns.
     */
    std::vector<std::uint32_t> to_words() const;

    bool operator==(const BitMatrix& other) const;
    bool operator!=(const BitMatrix& other) const { return !(*this == other); }

private:
    Bits m_bits;
};

/**
 * Construct the n x n identity matrix.
 *
 * @throws golay::InvalidDimension If n is not positive.
 */
BitMatrix identity(int n);

/**
 * Concatenate two matrices side by side.
 *
 * @param a Left block.
 * @param b Right block.
 * @return A matrix with a.cols() + b.cols() columns.
 * @throws golay::DimensionMismatch If the row counts differ.
 */
BitMatrix hstack(const BitMatrix& a, const BitMatrix& b);

BitMatrix transpose(const BitMatrix& a);

/**
 * Inner product of two bit vectors, reduced mod 2.
 *
 * @throws golay::DimensionMismatch If the vectors have different lengths.
 */
int dot(const BitMatrix::Row& a, const BitMatrix::Row& b);

/**
 * Matrix product over GF(2).
 *
 * @throws golay::DimensionMismatch If a.cols() != b.rows().
 */
BitMatrix matmul(const BitMatrix& a, const BitMatrix& b);

}  // namespace util
}  // namespace golay
