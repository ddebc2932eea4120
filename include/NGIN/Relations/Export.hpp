#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_RELATIONS_STATIC)
    #define NGIN_RELATIONS_API
  #else
    #if defined(NGIN_RELATIONS_EXPORTS)
      #define NGIN_RELATIONS_API __declspec(dllexport)
    #else
      #define NGIN_RELATIONS_API __declspec(dllimport)
    #endif
  #endif
#else
  #if defined(NGIN_RELATIONS_EXPORTS)
    #define NGIN_RELATIONS_API __attribute__((visibility("default")))
  #else
    #define NGIN_RELATIONS_API
  #endif
#endif

