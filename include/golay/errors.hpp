#pragma once

#include <stdexcept>
#include <string>

namespace golay {

/**
 * Operand shapes are incompatible for concatenation or product.
 */
class DimensionMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * The identity-form parity-check matrix was requested for a non-square parity block, or a derivation was
 * applied to a matrix of the wrong shape for its code variant.
 */
class ShapeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * A non-positive size was requested.
 */
class InvalidDimension : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * A matrix entry is neither 0 nor 1.
 */
class NonBinaryEntry : public std::invalid_argument {
public:
    NonBinaryEntry(int row, int col, int value)
        : std::invalid_argument("Matrix entry (" + std::to_string(row) + ", " + std::to_string(col) +
                                ") is not binary: " + std::to_string(value)),
          m_row(row),
          m_col(col),
          m_value(value) {}

    int row() const { return m_row; }
    int col() const { return m_col; }
    int value() const { return m_value; }

private:
    int m_row;
    int m_col;
    int m_value;
};

/**
 * Two generator rows have odd inner product.
 *
 * @param row Index of the first row.
 * @param other_row Index of the second row (equal to row for a self-pair).
 */
class SelfDualityViolation : public std::logic_error {
public:
    SelfDualityViolation(int row, int other_row)
        : std::logic_error("Generator is not self-dual: rows " + std::to_string(row) + " and " +
                           std::to_string(other_row) + " have odd inner product"),
          m_row(row),
          m_other_row(other_row) {}

    int row() const { return m_row; }
    int other_row() const { return m_other_row; }

private:
    int m_row;
    int m_other_row;
};

/**
 * A generator row is not orthogonal to a parity-check row.
 *
 * @param generator_row Index of the generator row.
 * @param check_row Index of the parity-check row.
 */
class OrthogonalityViolation : public std::logic_error {
public:
    OrthogonalityViolation(int generator_row, int check_row)
        : std::logic_error("Generator row " + std::to_string(generator_row) + " is not orthogonal to parity-check row " +
                           std::to_string(check_row)),
          m_generator_row(generator_row),
          m_check_row(check_row) {}

    int generator_row() const { return m_generator_row; }
    int check_row() const { return m_check_row; }

private:
    int m_generator_row;
    int m_check_row;
};

/**
 * Two syndrome table entries coincide, or one entry is zero (other_index is -1).
 */
class SyndromeCollision : public std::logic_error {
public:
    SyndromeCollision(int index, int other_index)
        : std::logic_error(other_index < 0 ? "Syndrome " + std::to_string(index) + " is zero"
                                           : "Syndromes " + std::to_string(index) + " and " +
                                                 std::to_string(other_index) + " are equal"),
          m_index(index),
          m_other_index(other_index) {}

    int index() const { return m_index; }
    int other_index() const { return m_other_index; }

private:
    int m_index;
    int m_other_index;
};

}  // namespace golay
