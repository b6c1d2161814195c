#pragma once

/**
 * Keeps #include's and #define's for intrinsic headers in one place,
 * across architectures and compilers.
 */

#if defined(HAL_ARCH_X64)

// MSVC family needs intrin.h on x64
#if defined(HAL_COMPILER_MSVC) || defined(HAL_COMPILER_CLANG_CL)
#include <intrin.h>
#endif /* if defined(HAL_COMPILER_MSVC) || defined(HAL_COMPILER_CLANG_CL) */
#include <immintrin.h>
#define HAL_INTRIN_PAUSE() _mm_pause()

#elif defined(HAL_ARCH_ARM64)
#define HAL_INTRIN_PAUSE() __asm__ __volatile__("yield")

#else
// No pause hint available; the spin loop simply retries.
#define HAL_INTRIN_PAUSE() ((void)0)
#endif /* if defined(HAL_ARCH_X64) */
