#pragma once

/// @file export.hpp
/// DIGEN_EXPORT marks the public API of libdigen.
///
/// The digen target defines DIGEN_BUILDING for its own sources.  The
/// default static build also exports DIGEN_STATIC to its consumers, which
/// leaves the macro empty; DIGEN_BUILD_SHARED=ON drops it so the API is
/// exported from the shared object (hidden visibility is the default).

#if defined(DIGEN_STATIC)
  #define DIGEN_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef DIGEN_BUILDING
    #define DIGEN_EXPORT __declspec(dllexport)
  #else
    #define DIGEN_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define DIGEN_EXPORT __attribute__((visibility("default")))
#else
  #define DIGEN_EXPORT
#endif
