/*
 * mpmc_cacheline.hpp
 *
 *  Created on: 12 Oct. 2026
 *      Author: Shpegun60
 *
 * Cache-line size and the ring geometry that follows from it.
 *
 *   MPMC_CACHELINE_BYTES       line size in bytes, per target, power of two
 *   mpmc::hw::cacheline_bytes  the same as a constant
 *   mpmc::hw::cacheline_shift  log2(cacheline_bytes)
 *   mpmc::hw::ring_min_order   log2 of ring words per line. The index_ring
 *                              permutation puts consecutive positions this
 *                              many cells apart.
 *
 * Build overrides:
 *   -DMPMC_FORCE_CACHELINE=N   use N (e.g. 128 to cover adjacent-line
 *                              prefetch on x86)
 *   -DMPMC_CACHELINE_MIN=N     lower clamp, 32 by default
 */

#ifndef MPMC_CACHELINE_HPP_
#define MPMC_CACHELINE_HPP_

#include "mpmc_config.hpp"
#include "basic_types.h"        // reg

#ifndef MPMC_CACHELINE_MIN
#  define MPMC_CACHELINE_MIN 32u
#endif /* MPMC_CACHELINE_MIN */

#ifndef MPMC_CACHELINE_BYTES
#  if defined(MPMC_FORCE_CACHELINE)
#    define MPMC_CACHELINE_BYTES (0u + MPMC_FORCE_CACHELINE)
#  elif (defined(__APPLE__) && defined(__aarch64__)) || \
        defined(__powerpc64__) || defined(__ppc64__) || defined(__powerpc__) || defined(__ppc__)
     /* Apple Silicon L1D, most ppc64 parts */
#    define MPMC_CACHELINE_BYTES 128u
#  elif defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86) || \
        defined(__aarch64__) || defined(_M_ARM64) || defined(__arm__) || defined(_M_ARM)
#    define MPMC_CACHELINE_BYTES 64u
#  elif defined(__riscv) && (defined(__linux__) || defined(_WIN32) || defined(__APPLE__))
#    define MPMC_CACHELINE_BYTES 64u
#  elif defined(__riscv) || defined(__XTENSA__) || defined(ESP_PLATFORM) || \
        defined(__mips__) || defined(__MIPS__)
     /* small cores, often no data cache at all */
#    define MPMC_CACHELINE_BYTES 32u
#  else
#    define MPMC_CACHELINE_BYTES 64u
#  endif
#endif /* MPMC_CACHELINE_BYTES */

#if (MPMC_CACHELINE_BYTES < MPMC_CACHELINE_MIN)
#  undef  MPMC_CACHELINE_BYTES
#  define MPMC_CACHELINE_BYTES (0u + MPMC_CACHELINE_MIN)
#endif

#if ((MPMC_CACHELINE_BYTES & (MPMC_CACHELINE_BYTES - 1u)) != 0)
#  error "MPMC_CACHELINE_BYTES must be a power-of-two"
#endif

namespace mpmc::hw {

namespace detail {

constexpr unsigned floor_log2(reg x) noexcept {
    unsigned s = 0u;
    for (; x > 1u; x >>= 1u) {
        ++s;
    }
    return s;
}

} // namespace detail

static constexpr unsigned cacheline_bytes = MPMC_CACHELINE_BYTES;
static constexpr unsigned cacheline_shift = detail::floor_log2(cacheline_bytes);

// A ring cell is one reg wide.
static constexpr unsigned ring_word_shift = detail::floor_log2(sizeof(reg));
static constexpr unsigned ring_min_order  =
    (cacheline_shift > ring_word_shift) ? (cacheline_shift - ring_word_shift) : 0u;

static_assert(cacheline_bytes >= sizeof(reg),
              "[mpmc::hw]: a cache line must hold at least one ring word");

} // namespace mpmc::hw

#endif /* MPMC_CACHELINE_HPP_ */
