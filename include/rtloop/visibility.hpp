#pragma once

#if defined(_WIN32) || defined(_WIN64)

  #if defined(RTLOOP_BUILD_DLL)
    #define RTLOOP_API __declspec(dllexport)

  #else
    #define RTLOOP_API __declspec(dllimport)

  #endif

#else
  #define RTLOOP_API __attribute__((visibility("default")))

#endif
