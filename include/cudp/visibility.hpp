#pragma once

/**
 * Cross-platform symbol visibility macros.
 *
 * - On Windows, expands to __declspec(dllexport) / __declspec(dllimport)
 * - On Linux/macOS, uses GCC visibility attributes when building shared libs
 *
 * Every exported C++ function and class should use CUDP_API.
 * Helpers private to a translation unit should use CUDP_LOCAL.
 */
#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(CUDP_BUILDING_DLL)
    #define CUDP_API __declspec(dllexport)
  #elif defined(CUDP_USING_DLL)
    #define CUDP_API __declspec(dllimport)
  #else
    #define CUDP_API
  #endif
  #define CUDP_LOCAL
#else
  #if __GNUC__ >= 4
    #ifdef CUDP_BUILDING_DLL
      #define CUDP_API   __attribute__((visibility("default")))
    #else
      #define CUDP_API
    #endif
    #define CUDP_LOCAL __attribute__((visibility("hidden")))
  #else
    #define CUDP_API
    #define CUDP_LOCAL
  #endif
#endif
