// api.h - DLL export/import macros for listkit

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the listkit library.
///
/// Usage:
/// - When building listkit as a SHARED library:
///   - CMake defines LISTKIT_EXPORTS (private) and LISTKIT_SHARED (public)
///   - Functions/classes marked with LISTKIT_API are exported
///
/// - When building/using as a STATIC library:
///   - No macros defined, LISTKIT_API expands to nothing
///
/// Only the non-template parts of listkit (StagedChangeset, the move filter,
/// the transition pipeline and executors) need the decoration. The snapshot
/// and diff templates are header-only.

#if defined(_WIN32) || defined(_WIN64)
    #ifdef LISTKIT_SHARED
        #ifdef LISTKIT_EXPORTS
            #define LISTKIT_API __declspec(dllexport)
        #else
            #define LISTKIT_API __declspec(dllimport)
        #endif
    #else
        #define LISTKIT_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LISTKIT_SHARED) && defined(LISTKIT_EXPORTS)
        #define LISTKIT_API __attribute__((visibility("default")))
    #else
        #define LISTKIT_API
    #endif
#else
    #define LISTKIT_API
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define LISTKIT_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
    #define LISTKIT_DEPRECATED(msg) __declspec(deprecated(msg))
#else
    #define LISTKIT_DEPRECATED(msg)
#endif
