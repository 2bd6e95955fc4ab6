#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "golay.hpp"

namespace {

void print_table(const std::string& title, const golay::PackedTable& table) {
    std::cout << title << ":\n";
    for (auto word : table.rows) {
        std::string digits(static_cast<size_t>(table.width), '0');
        for (int i = 0; i < table.width; i++) {
            if ((word >> (table.width - 1 - i)) & 1u) digits[static_cast<size_t>(i)] = '1';
        }
        std::cout << "0b" << digits << ",\n";
    }
}

void print_tables(const golay::GolayTables& tables) {
    print_table("core transpose", tables.core_transpose);
    if (tables.variant == golay::Variant::extended) print_table("core", tables.core);
    print_table("parity check", tables.parity_check);
    print_table("parity check transpose", tables.parity_check_transpose);
    if (tables.alt_parity_check) print_table("alt parity check", *tables.alt_parity_check);
    if (tables.syndromes) print_table("syndromes", *tables.syndromes);
}

}  // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [standard|extended]\n";
        return 2;
    }

    bool standard = true;
    bool extended = true;
    if (argc == 2) {
        const std::string name = argv[1];
        if (name != "standard" && name != "extended") {
            std::cerr << "unknown variant '" << name << "'\nusage: " << argv[0] << " [standard|extended]\n";
            return 2;
        }
        standard = name == "standard";
        extended = name == "extended";
    }

    std::vector<golay::GolayTables> all;
    try {
        if (standard) all.push_back(golay::generate_tables(golay::Variant::standard));
        if (extended) all.push_back(golay::generate_tables(golay::Variant::extended));
    } catch (const std::logic_error& e) {
        std::cerr << "table generation failed: " << e.what() << "\n";
        return 1;
    }

    for (const auto& tables : all) {
        const auto params = golay::parameters(tables.variant);
        std::cout << "(" << params.length << ", " << params.data_bits << ") "
                  << (tables.variant == golay::Variant::extended ? "extended" : "standard") << " Golay code\n";
        print_tables(tables);
    }
    return 0;
}
