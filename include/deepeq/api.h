// api.h - DLL export/import macros for deepeq

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the deepeq library.
///
/// Usage:
/// - When building deepeq as a SHARED library:
///   - CMake defines DEEPEQ_EXPORTS (private) and DEEPEQ_SHARED (public)
///   - Functions/classes marked with DEEPEQ_API will be exported
///
/// - When using deepeq as a SHARED library:
///   - Link against the deepeq target (CMake propagates DEEPEQ_SHARED)
///   - Functions/classes marked with DEEPEQ_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, DEEPEQ_API expands to nothing
///
/// Example:
/// @code
/// class DEEPEQ_API ComparatorRegistry { ... };
/// DEEPEQ_API DifferenceCollector compare(...);
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DEEPEQ_SHARED
        #ifdef DEEPEQ_EXPORTS
            #define DEEPEQ_API __declspec(dllexport)
        #else
            #define DEEPEQ_API __declspec(dllimport)
        #endif
    #else
        #define DEEPEQ_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DEEPEQ_SHARED) && defined(DEEPEQ_EXPORTS)
        #define DEEPEQ_API __attribute__((visibility("default")))
    #else
        #define DEEPEQ_API
    #endif
#else
    #define DEEPEQ_API
#endif

// ============================================================
// Deprecation Warnings
// ============================================================

#if defined(__GNUC__) || defined(__clang__)
    #define DEEPEQ_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
    #define DEEPEQ_DEPRECATED(msg) __declspec(deprecated(msg))
#else
    #define DEEPEQ_DEPRECATED(msg)
#endif
