// Export.hpp
// Symbol visibility macro for the Trellis library
#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(TRELLIS_STATIC)
    #define TRELLIS_API
  #else
    #if defined(TRELLIS_EXPORTS)
      #define TRELLIS_API __declspec(dllexport)
    #else
      #define TRELLIS_API __declspec(dllimport)
    #endif
  #endif
#else
  #define TRELLIS_API
#endif
