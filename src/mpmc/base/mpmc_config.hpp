/*
 * mpmc_config.hpp
 *
 *  Created on: 12 Oct. 2026
 *      Author: Shpegun60
 *
 * Build knobs. Each one is #ifndef-guarded, pass -DNAME=value to change it.
 *
 *   MPMC_DEQUEUE_RETRY_BUDGET  (3000)
 *       Reloads a dequeuer spends on an empty cell before it stamps the cell
 *       with its own cycle and moves on. A late enqueuer may still be about to
 *       fill it. Any value keeps the ring correct; larger values trade spin
 *       time for fewer false "empty" results under contention.
 *
 *   MPMC_REQUIRE_LOCK_FREE     (1)
 *       static_assert that reg and sreg atomics are always lock-free.
 *       0 accepts a libatomic fallback.
 *
 *   MPMC_ENABLE_EXCEPTIONS     (0)
 *       0: create() reports allocation failure with invalid handles.
 *       1: std::bad_alloc leaves create(), nothing is leaked.
 *
 *   MPMC_ALLOC_PREFER_ALIGNED_NEW (0)
 *       1: block_allocator uses aligned operator new where available,
 *       0: over-allocation with a stashed base pointer.
 *
 *   MPMC_ASSERT(x)             (empty)
 *       Debug hook for precondition checks inside the ring.
 */

#ifndef MPMC_CONFIG_HPP_
#define MPMC_CONFIG_HPP_

#ifndef MPMC_DEQUEUE_RETRY_BUDGET
#  define MPMC_DEQUEUE_RETRY_BUDGET 3000
#endif /* MPMC_DEQUEUE_RETRY_BUDGET */

#ifndef MPMC_REQUIRE_LOCK_FREE
#  define MPMC_REQUIRE_LOCK_FREE 1
#endif /* MPMC_REQUIRE_LOCK_FREE */

#ifndef MPMC_ENABLE_EXCEPTIONS
#  define MPMC_ENABLE_EXCEPTIONS 0
#endif /* MPMC_ENABLE_EXCEPTIONS */

#ifndef MPMC_ALLOC_PREFER_ALIGNED_NEW
#  define MPMC_ALLOC_PREFER_ALIGNED_NEW 0
#endif /* MPMC_ALLOC_PREFER_ALIGNED_NEW */

#ifndef MPMC_ASSERT
#  define MPMC_ASSERT(x)
#endif /* MPMC_ASSERT */

#endif /* MPMC_CONFIG_HPP_ */
