// api.h - DLL export/import macros for json_ivm

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the json_ivm library.
///
/// Usage:
/// - When building json_ivm as a SHARED library:
///   - CMake defines JSON_IVM_EXPORTS (private) and JSON_IVM_SHARED (public)
///   - Functions/classes marked with JSON_IVM_API will be exported
///
/// - When building/using as a STATIC library:
///   - No macros defined, JSON_IVM_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef JSON_IVM_SHARED
        #ifdef JSON_IVM_EXPORTS
            #define JSON_IVM_API __declspec(dllexport)
        #else
            #define JSON_IVM_API __declspec(dllimport)
        #endif
    #else
        #define JSON_IVM_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(JSON_IVM_SHARED) && defined(JSON_IVM_EXPORTS)
        #define JSON_IVM_API __attribute__((visibility("default")))
    #else
        #define JSON_IVM_API
    #endif
#else
    #define JSON_IVM_API
#endif

/// Mark a class for export
#define JSON_IVM_CLASS JSON_IVM_API
