#pragma once

#if defined(HAL_COMPILER_GCC) || defined(HAL_COMPILER_CLANG) || defined(HAL_COMPILER_CLANG_CL)
#define HAL_FORCEINLINE inline __attribute__((always_inline))

#elif defined(HAL_COMPILER_MSVC)
#define HAL_FORCEINLINE __forceinline
#else
#error Unknown compiler...
#endif
