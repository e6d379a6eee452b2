#pragma once

#include "bufobj/bbo.hpp"

#include <sstream>
#include <stdexcept>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

// Expression must throw BboError of the given kind.
#define CHECK_THROWS_KIND(expr, k) do { \
    bool _threw = false; \
    try { \
        (void)(expr); \
    } catch (const bufobj::BboError& _e) { \
        _threw = (_e.kind() == (k)); \
    } \
    if (!_threw) { \
        std::ostringstream _oss; \
        _oss << "CHECK_THROWS_KIND failed: " #expr " did not throw " #k " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)
