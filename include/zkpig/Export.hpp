#pragma once

#if defined(_WIN32)
#  if defined(ZKPIG_BUILD_SHARED)
#    if defined(zkpig_core_EXPORTS)
#      define ZKPIG_API __declspec(dllexport)
#    else
#      define ZKPIG_API __declspec(dllimport)
#    endif
#  else
#    define ZKPIG_API
#  endif
#else
#  if defined(ZKPIG_BUILD_SHARED)
#    define ZKPIG_API __attribute__((visibility("default")))
#  else
#    define ZKPIG_API
#  endif
#endif
