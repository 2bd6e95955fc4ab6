#pragma once

// Main header file for Golay
// Include this file to get access to all Golay components

#include "golay/errors.hpp"

// Core components
#include "golay/codes/code_builder.hpp"
#include "golay/codes/golay_code.hpp"
#include "golay/codes/parity_check.hpp"
#include "golay/codes/self_duality.hpp"
#include "golay/codes/syndrome_table.hpp"

// Utilities
#include "golay/util/bit_matrix.hpp"
