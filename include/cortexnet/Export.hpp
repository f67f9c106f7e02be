#pragma once

// Symbol visibility for the embedding facade when cortexnet_core is built as a shared library.
#if defined(CORTEXNET_BUILD_SHARED)
#  if defined(_WIN32)
#    if defined(cortexnet_core_EXPORTS)
#      define CORTEXNET_API __declspec(dllexport)
#    else
#      define CORTEXNET_API __declspec(dllimport)
#    endif
#    define CORTEXNET_LOCAL
#  else
#    define CORTEXNET_API __attribute__((visibility("default")))
#    define CORTEXNET_LOCAL __attribute__((visibility("hidden")))
#  endif
#else
#  define CORTEXNET_API
#  define CORTEXNET_LOCAL
#endif
