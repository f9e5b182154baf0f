// api.h - DLL export/import macros for keydiff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for keydiff library.
///
/// Usage:
/// - When building keydiff as a SHARED library:
///   - CMake defines KEYDIFF_EXPORTS (private) and KEYDIFF_SHARED (public)
///   - Functions/classes marked with KEYDIFF_API will be exported
///
/// - When building/using as a STATIC library:
///   - No macros defined, KEYDIFF_API expands to nothing
///
/// Most of keydiff is header-only templates; only the non-template helpers
/// (error types, strategy parsing, report labels) carry KEYDIFF_API.

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef KEYDIFF_SHARED
        #ifdef KEYDIFF_EXPORTS
            #define KEYDIFF_API __declspec(dllexport)
        #else
            #define KEYDIFF_API __declspec(dllimport)
        #endif
    #else
        #define KEYDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(KEYDIFF_SHARED) && defined(KEYDIFF_EXPORTS)
        #define KEYDIFF_API __attribute__((visibility("default")))
    #else
        #define KEYDIFF_API
    #endif
#else
    #define KEYDIFF_API
#endif
