#pragma once

#include <cstdlib>
#include <iostream>

// -----------------------------------------------------------------------------
// Minimal test assertion helpers
// -----------------------------------------------------------------------------
#define TEST_CHECK(expr)                                                     \
    do {                                                                     \
        if (!(expr)) {                                                       \
            std::cerr << "[TEST FAILED] " << #expr                           \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)

// Prints both sides on failure; operands must be streamable
#define TEST_CHECK_EQ(lhs, rhs)                                              \
    do {                                                                     \
        const auto& test_lhs_ = (lhs);                                       \
        const auto& test_rhs_ = (rhs);                                       \
        if (!(test_lhs_ == test_rhs_)) {                                     \
            std::cerr << "[TEST FAILED] " << #lhs << " == " << #rhs          \
                      << " (" << test_lhs_ << " vs " << test_rhs_ << ")"     \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)
