#pragma once

#include <cmath>
#include <cstdlib>
#include <iostream>

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

#define REQUIRE_NEAR(a, b, tol, msg)                                            \
    REQUIRE(std::fabs((a) - (b)) <= (tol),                                      \
            msg << " (" << (a) << " vs " << (b) << ")")

#define REQUIRE_THROWS(stmt, ExceptionType, msg)                                \
    do {                                                                        \
        bool thrown_ = false;                                                   \
        try {                                                                   \
            stmt;                                                               \
        } catch (const ExceptionType&) {                                        \
            thrown_ = true;                                                     \
        }                                                                       \
        REQUIRE(thrown_, msg);                                                  \
    } while (0)

#define RUN(test)                                                               \
    do {                                                                        \
        test();                                                                 \
        std::cout << "[PASS] " #test "\n";                                      \
    } while (0)
