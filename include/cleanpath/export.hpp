#ifndef CLEANPATH_EXPORT_HPP
#define CLEANPATH_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Shared library export/import macros.
 *
 * When building cleanpath as a shared library:
 * - Define CLEANPATH_SHARED when using the library
 * - CLEANPATH_BUILDING_SHARED is defined by the build during compilation
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef CLEANPATH_BUILDING_SHARED
        #define CLEANPATH_API __declspec(dllexport)
    #elif defined(CLEANPATH_SHARED)
        #define CLEANPATH_API __declspec(dllimport)
    #else
        #define CLEANPATH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef CLEANPATH_BUILDING_SHARED
        #define CLEANPATH_API __attribute__((visibility("default")))
    #else
        #define CLEANPATH_API
    #endif
#else
    #define CLEANPATH_API
#endif

#endif // CLEANPATH_EXPORT_HPP
