#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_PYTHON_STATIC)
    #define NGIN_PYTHON_API
  #else
    #if defined(NGIN_PYTHON_EXPORTS)
      #define NGIN_PYTHON_API __declspec(dllexport)
    #else
      #define NGIN_PYTHON_API __declspec(dllimport)
    #endif
  #endif
#else
  #if defined(NGIN_PYTHON_EXPORTS)
    #define NGIN_PYTHON_API __attribute__((visibility("default")))
  #else
    #define NGIN_PYTHON_API
  #endif
#endif
