#pragma once

#include <iostream>

// Usage:
//   int failures = 0;
//   CHECK(expr);
//   CHECK_THROWS(expr, InvalidQuery);
//
// Both macros increment `failures` in the current scope and print a message.

#ifndef CHECK
#define CHECK(expr)                                                                                   \
    do                                                                                                \
    {                                                                                                 \
        if (!(expr))                                                                                  \
        {                                                                                             \
            std::cerr << "[routesearch_tests] CHECK failed: " #expr " (" << __FILE__ << ":" << __LINE__ \
                      << ")\n";                                                                       \
            ++failures;                                                                               \
        }                                                                                             \
    } while (0)
#endif

#ifndef CHECK_THROWS
#define CHECK_THROWS(expr, exception_type)                                                              \
    do                                                                                                  \
    {                                                                                                   \
        bool thrown_ = false;                                                                           \
        try                                                                                             \
        {                                                                                               \
            (void)(expr);                                                                               \
        }                                                                                               \
        catch (exception_type const&)                                                                   \
        {                                                                                               \
            thrown_ = true;                                                                             \
        }                                                                                               \
        if (!thrown_)                                                                                   \
        {                                                                                               \
            std::cerr << "[routesearch_tests] expected " #exception_type " from " #expr " (" << __FILE__ \
                      << ":" << __LINE__ << ")\n";                                                      \
            ++failures;                                                                                 \
        }                                                                                               \
    } while (0)
#endif
