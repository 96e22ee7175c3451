// api.h - DLL export/import macros for optics_ext

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for optics_ext library.
///
/// Usage:
/// - When building optics_ext as a SHARED library:
///   - CMake defines OPTICS_EXT_EXPORTS (private) and OPTICS_EXT_SHARED (public)
///   - Functions/classes marked with OPTICS_EXT_API will be exported
///
/// - When using optics_ext as a SHARED library:
///   - Link against the optics_ext target (CMake propagates OPTICS_EXT_SHARED)
///   - Functions/classes marked with OPTICS_EXT_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, OPTICS_EXT_API expands to nothing
///
/// Example:
/// @code
/// class OPTICS_EXT_API ErasedOptic { ... };      // Export entire class
/// OPTICS_EXT_API std::string value_to_string(const Value&);
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef OPTICS_EXT_SHARED
        #ifdef OPTICS_EXT_EXPORTS
            #define OPTICS_EXT_API __declspec(dllexport)
        #else
            #define OPTICS_EXT_API __declspec(dllimport)
        #endif
    #else
        #define OPTICS_EXT_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(OPTICS_EXT_SHARED) && defined(OPTICS_EXT_EXPORTS)
        #define OPTICS_EXT_API __attribute__((visibility("default")))
    #else
        #define OPTICS_EXT_API
    #endif
#else
    #define OPTICS_EXT_API
#endif
