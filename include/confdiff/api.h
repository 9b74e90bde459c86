// api.h - DLL export/import macros for confdiff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the confdiff library.
///
/// Usage:
/// - When building confdiff as a SHARED library:
///   - CMake defines CONFDIFF_EXPORTS (private) and CONFDIFF_SHARED (public)
///   - Functions/classes marked with CONFDIFF_API will be exported
///
/// - When using confdiff as a SHARED library:
///   - Link against the confdiff target (CMake propagates CONFDIFF_SHARED)
///
/// - When building/using as a STATIC library:
///   - CONFDIFF_API expands to nothing
///
/// Example:
/// @code
/// class CONFDIFF_API StructuralDiffer { ... };
/// CONFDIFF_API Summary summarize(const ChangeList& changes);
/// @endcode

#if defined(_WIN32) || defined(_WIN64)
    #ifdef CONFDIFF_SHARED
        #ifdef CONFDIFF_EXPORTS
            #define CONFDIFF_API __declspec(dllexport)
        #else
            #define CONFDIFF_API __declspec(dllimport)
        #endif
    #else
        #define CONFDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(CONFDIFF_SHARED) && defined(CONFDIFF_EXPORTS)
        #define CONFDIFF_API __attribute__((visibility("default")))
    #else
        #define CONFDIFF_API
    #endif
#else
    #define CONFDIFF_API
#endif
