#pragma once

#include <cstdlib>
#include <iostream>

#include "tickdb/core/status.hpp"

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

// Reports the status name on failure
#define TEST_CHECK_STATUS(expr, expected)                                    \
    do {                                                                     \
        const ::tickdb::Status s_ = (expr);                                  \
        if (s_ != (expected)) {                                              \
            std::cerr << "[TEST FAILED] " << #expr << " returned "           \
                      << ::tickdb::to_string(s_) << ", expected "            \
                      << ::tickdb::to_string(expected)                       \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)

#define TEST_CHECK_OK(expr) TEST_CHECK_STATUS(expr, ::tickdb::Status::OK)
