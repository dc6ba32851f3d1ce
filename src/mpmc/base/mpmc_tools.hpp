/*
 * mpmc_tools.hpp
 *
 *  Created on: 12 Oct. 2026
 *      Author: Shpegun60
 *
 * Compiler glue for the ring headers:
 *   MPMC_FORCEINLINE / MPMC_NOINLINE  hot counter ops vs. the catch-up path
 *   MPMC_UNLIKELY                     allocation failure, invalid handles
 *   MPMC_CPU_RELAX()                  caller-side backoff while polling a
 *                                     full or empty queue
 *   MPMC_TRY / MPMC_CATCH_ALL / MPMC_RETHROW
 *                                     create() cleanup, empty without exceptions
 *
 * Every macro can be predefined by the build.
 */

#ifndef MPMC_TOOLS_HPP_
#define MPMC_TOOLS_HPP_

#include "mpmc_config.hpp"

#if defined(__clang__) || defined(__GNUC__)
#  define MPMC__GNU_LIKE 1
#else
#  define MPMC__GNU_LIKE 0
#endif

// always_inline only works where the body is visible, so ring functions
// stay in headers.
#ifndef MPMC_FORCEINLINE
#  if defined(_MSC_VER)
#    define MPMC_FORCEINLINE __forceinline
#  elif MPMC__GNU_LIKE
#    define MPMC_FORCEINLINE inline __attribute__((always_inline))
#  else
#    define MPMC_FORCEINLINE inline
#  endif
#endif /* MPMC_FORCEINLINE */

#ifndef MPMC_NOINLINE
#  if defined(_MSC_VER)
#    define MPMC_NOINLINE __declspec(noinline)
#  elif MPMC__GNU_LIKE
#    define MPMC_NOINLINE __attribute__((noinline))
#  else
#    define MPMC_NOINLINE
#  endif
#endif /* MPMC_NOINLINE */

#ifndef MPMC_UNLIKELY
#  if MPMC__GNU_LIKE
#    define MPMC_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define MPMC_UNLIKELY(x) (x)
#  endif
#endif /* MPMC_UNLIKELY */

/* pause (x86) / yield (arm64); plain no-op elsewhere */
#ifndef MPMC_CPU_RELAX
#  if defined(_MSC_VER) && (defined(_M_X64) || defined(_M_IX86))
#    include <intrin.h>
#    define MPMC_CPU_RELAX() _mm_pause()
#  elif MPMC__GNU_LIKE && (defined(__x86_64__) || defined(__i386__))
#    define MPMC_CPU_RELAX() __builtin_ia32_pause()
#  elif MPMC__GNU_LIKE && defined(__aarch64__)
#    define MPMC_CPU_RELAX() __asm__ __volatile__("yield" ::: "memory")
#  else
#    define MPMC_CPU_RELAX() do {} while (0)
#  endif
#endif /* MPMC_CPU_RELAX */

// ----------------------------------------------------------------------------
// Exceptions
// ----------------------------------------------------------------------------

#if MPMC_ENABLE_EXCEPTIONS && !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && \
    !(defined(_MSC_VER) && defined(_CPPUNWIND))
#  error "MPMC_ENABLE_EXCEPTIONS=1 needs a build with exceptions enabled"
#endif

#ifndef MPMC_TRY
#  if MPMC_ENABLE_EXCEPTIONS
#    define MPMC_TRY       try
#    define MPMC_CATCH_ALL catch (...)
#    define MPMC_RETHROW   throw
#  else
     // The handler block still has to parse, it just never runs.
#    define MPMC_TRY
#    define MPMC_CATCH_ALL if constexpr (false)
#    define MPMC_RETHROW
#  endif
#endif /* MPMC_TRY */

#endif /* MPMC_TOOLS_HPP_ */
