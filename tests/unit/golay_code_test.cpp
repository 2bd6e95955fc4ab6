#include "golay/codes/golay_code.hpp"

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

#include "golay/codes/code_builder.hpp"
#include "golay/errors.hpp"

namespace {

using golay::util::BitMatrix;
using Words = std::vector<std::uint32_t>;

// Generator parity sub-matrix A of the extended code.
const Words kExtendedCore = {
    0b110001110101, 0b011000111011, 0b111101101000, 0b011110110100, 0b001111011010, 0b110110011001,
    0b011011001101, 0b001101100111, 0b110111000110, 0b101010010111, 0b100100111110, 0b100011101011,
};

const Words kExtendedCoreTranspose = {
    0b101001001111, 0b111101101000, 0b011110110100, 0b001111011010, 0b000111101101, 0b101010111001,
    0b111100010011, 0b110111000110, 0b011011100011, 0b100100111110, 0b010010011111, 0b110001110101,
};

TEST(GolayCode, VariantParameters) {
    const auto standard = golay::parameters(golay::Variant::standard);
    EXPECT_EQ(standard.length, 23);
    EXPECT_EQ(standard.data_bits, 12);
    EXPECT_EQ(standard.parity_bits(), 11);
    EXPECT_FALSE(standard.self_dual);
    EXPECT_TRUE(standard.has_syndrome_table);

    const auto extended = golay::parameters(golay::Variant::extended);
    EXPECT_EQ(extended.length, 24);
    EXPECT_EQ(extended.parity_bits(), 12);
    EXPECT_TRUE(extended.self_dual);
    EXPECT_FALSE(extended.has_syndrome_table);
}

TEST(GolayCode, ParityConstantsHaveTwelveRows) {
    EXPECT_EQ(golay::parity(golay::Variant::standard).rows(), 12);
    EXPECT_EQ(golay::parity(golay::Variant::standard).cols(), 11);
    EXPECT_EQ(golay::parity(golay::Variant::extended).rows(), 12);
    EXPECT_EQ(golay::parity(golay::Variant::extended).cols(), 12);
}

TEST(GolayCode, ExtendedTables) {
    const auto tables = golay::generate_tables(golay::Variant::extended);

    EXPECT_EQ(tables.core.width, 12);
    EXPECT_EQ(tables.core.rows, kExtendedCore);
    EXPECT_EQ(tables.core_transpose.width, 12);
    EXPECT_EQ(tables.core_transpose.rows, kExtendedCoreTranspose);
    EXPECT_EQ(tables.generator.width, 24);
    EXPECT_EQ(tables.parity_check.width, 24);
    ASSERT_EQ(tables.parity_check.rows.size(), 12u);
    EXPECT_EQ(tables.parity_check.rows.front(), 0b101001001111100000000000u);

    ASSERT_TRUE(tables.alt_parity_check.has_value());
    EXPECT_EQ(tables.alt_parity_check->width, 24);
    EXPECT_EQ(tables.alt_parity_check->rows, tables.generator.rows);
    EXPECT_FALSE(tables.syndromes.has_value());
}

TEST(GolayCode, StandardTables) {
    const auto tables = golay::generate_tables(golay::Variant::standard);

    EXPECT_EQ(tables.core.width, 11);
    EXPECT_EQ(tables.core_transpose.width, 12);
    ASSERT_EQ(tables.core_transpose.rows.size(), 11u);
    // The standard core transpose is the extended one without its last row.
    EXPECT_EQ(tables.core_transpose.rows, Words(kExtendedCoreTranspose.begin(), kExtendedCoreTranspose.end() - 1));
    EXPECT_EQ(tables.generator.width, 23);
    EXPECT_EQ(tables.parity_check.width, 23);
    ASSERT_EQ(tables.parity_check.rows.size(), 11u);
    EXPECT_EQ(tables.parity_check.rows.back(), 0b01001001111100000000001u);
    EXPECT_FALSE(tables.alt_parity_check.has_value());

    ASSERT_TRUE(tables.syndromes.has_value());
    EXPECT_EQ(tables.syndromes->width, 11);
    ASSERT_EQ(tables.syndromes->rows.size(), 12u);
    EXPECT_EQ(tables.syndromes->rows.front(), 0b10001110101u);
    EXPECT_EQ(tables.syndromes->rows.back(), 0b11000111010u);
}

TEST(GolayCode, StandardParityCheckTranspose) {
    const auto tables = golay::generate_tables(golay::Variant::standard);

    EXPECT_EQ(tables.parity_check_transpose.width, 11);
    ASSERT_EQ(tables.parity_check_transpose.rows.size(), 23u);
    ASSERT_TRUE(tables.syndromes.has_value());
    EXPECT_EQ(tables.parity_check_transpose.rows[11], tables.syndromes->rows[0]);
    // The top 12 rows are the parity block, the bottom 11 the identity.
    EXPECT_EQ(tables.parity_check_transpose.rows.front(), 0b11000111010u);
    EXPECT_EQ(tables.parity_check_transpose.rows[12], 0b10000000000u);
    EXPECT_EQ(tables.parity_check_transpose.rows.back(), 0b00000000001u);
}

TEST(GolayCode, ExtendedParityCheckTranspose) {
    const auto tables = golay::generate_tables(golay::Variant::extended);

    EXPECT_EQ(tables.parity_check_transpose.width, 12);
    ASSERT_EQ(tables.parity_check_transpose.rows.size(), 24u);
    EXPECT_EQ(Words(tables.parity_check_transpose.rows.begin(), tables.parity_check_transpose.rows.begin() + 12),
              kExtendedCore);
}

TEST(GolayCode, ExplicitParityMatchesBuiltInConstant) {
    const auto tables = golay::generate_tables(golay::Variant::standard, golay::standard_parity());
    EXPECT_EQ(tables.syndromes->rows, golay::generate_tables(golay::Variant::standard).syndromes->rows);
}

TEST(GolayCode, RejectsParityOfWrongShape) {
    EXPECT_THROW(golay::generate_tables(golay::Variant::standard, golay::extended_parity()), golay::ShapeError);
    EXPECT_THROW(golay::generate_tables(golay::Variant::extended, golay::standard_parity()), golay::ShapeError);
}

TEST(GolayCode, TamperedExtendedParityPublishesNothing) {
    BitMatrix::Bits bits = golay::extended_parity().bits();
    bits(3, 0) ^= 1;

    try {
        golay::generate_tables(golay::Variant::extended, BitMatrix(bits));
        FAIL() << "Expected SelfDualityViolation";
    } catch (const golay::SelfDualityViolation& e) {
        EXPECT_EQ(e.row(), 0);
        EXPECT_EQ(e.other_row(), 3);
    }
}

TEST(GolayCode, DuplicateStandardParityRowsPublishNothing) {
    BitMatrix::Bits bits = golay::standard_parity().bits();
    bits.row(5) = bits.row(2);

    // Syndrome i is parity row 11 - i.
    try {
        golay::generate_tables(golay::Variant::standard, BitMatrix(bits));
        FAIL() << "Expected SyndromeCollision";
    } catch (const golay::SyndromeCollision& e) {
        EXPECT_EQ(e.index(), 6);
        EXPECT_EQ(e.other_index(), 9);
    }
}

TEST(GolayCode, GeneratorRowsCarryDataBitAndParity) {
    const auto tables = golay::generate_tables(golay::Variant::extended);
    for (size_t i = 0; i < 12; ++i) {
        const std::uint32_t data_bit = 1u << (23 - i);
        EXPECT_EQ(tables.generator.rows[i], data_bit | kExtendedCore[i]) << "Row " << i;
    }
}

TEST(GolayCode, GenerationIsIdempotent) {
    for (auto variant : {golay::Variant::standard, golay::Variant::extended}) {
        const auto first = golay::generate_tables(variant);
        const auto second = golay::generate_tables(variant);
        EXPECT_EQ(first.generator.rows, second.generator.rows);
        EXPECT_EQ(first.parity_check.rows, second.parity_check.rows);
    }
}

TEST(GolayCode, StandardParityIsPuncturedExtendedParity) {
    EXPECT_EQ(golay::standard_parity(), golay::puncture(golay::extended_parity()));
}

}  // namespace
