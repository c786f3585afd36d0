#pragma once

// SVCDI_EXPORT marks the public API of libsvcdi.
//
// CMake defines SVCDI_BUILDING while compiling the library and adds
// SVCDI_STATIC to everything that links a static build.  Symbols are
// hidden by default, so only declarations carrying SVCDI_EXPORT are
// visible from a shared libsvcdi.

#if defined(SVCDI_STATIC)
  #define SVCDI_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #if defined(SVCDI_BUILDING)
    #define SVCDI_EXPORT __declspec(dllexport)
  #else
    #define SVCDI_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__)
  #define SVCDI_EXPORT __attribute__((visibility("default")))
#else
  #define SVCDI_EXPORT
#endif
