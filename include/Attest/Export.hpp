#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(ATTEST_STATIC)
    #define ATTEST_API
  #else
    #if defined(ATTEST_EXPORTS)
      #define ATTEST_API __declspec(dllexport)
    #else
      #define ATTEST_API __declspec(dllimport)
    #endif
  #endif
#else
  #define ATTEST_API
#endif
