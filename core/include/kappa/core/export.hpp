#pragma once

#if defined(_WIN32) && defined(KAPPA_CORE_SHARED)
  #if defined(KAPPA_CORE_BUILDING)
    #define KAPPA_CORE_API __declspec(dllexport)
  #else
    #define KAPPA_CORE_API __declspec(dllimport)
  #endif
#else
  #define KAPPA_CORE_API
#endif
