#pragma once

#include "celio/config.hpp"
#include <cstdint>
#include <cstdlib>

// =============================================================================
// FILE: celio/core/macros.hpp
// BRIEF: Cross-platform compiler abstractions
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define CELIO_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define CELIO_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define CELIO_LIKELY(x)   (x)
    #define CELIO_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Compiler Attributes
// =============================================================================

#if defined(__has_cpp_attribute)
    #if __has_cpp_attribute(nodiscard) >= 201603L
        #define CELIO_NODISCARD [[nodiscard]]
    #else
        #define CELIO_NODISCARD
    #endif
#else
    #define CELIO_NODISCARD
#endif

// =============================================================================
// SECTION 3: Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define CELIO_EXPORT __declspec(dllexport)
#else
    #define CELIO_EXPORT __attribute__((visibility("default")))
#endif
