/*
 * mpmc_counter.hpp
 *
 * Created on: 12 Oct. 2026
 *   Author: Shpegun60
 *
 *
 * Shared counters of the index ring (head, tail, threshold) and of the queue
 * block (handle refcount).
 *
 * All of them take writes from several threads at once, so the interface is
 * read-modify-write first:
 *
 *   load / store / fetch_add / fetch_sub / compare_exchange_weak
 *
 * Every call accepts an explicit std::memory_order. Without one, the order
 * comes from the Orders palette (acquire loads, release stores, acq_rel RMW).
 *
 *   * AtomicCounter<T, Orders>
 *       - std::atomic<T>, T integral and not bool. Signed T is allowed: the
 *         ring threshold goes negative when the ring is empty.
 *
 *   * CachelineCounter<Counter, AlignB>
 *       - Counter in a slot of its own: aligned to AlignB, sizeof a multiple
 *         of AlignB. head, tail and threshold each get one, so enqueuers and
 *         dequeuers do not bounce each other's lines.
 *
 * MPMC_REQUIRE_LOCK_FREE (default 1) turns a non lock-free T into a
 * compile error.
 */

#ifndef MPMC_COUNTER_HPP_
#define MPMC_COUNTER_HPP_

#include <atomic>
#include <type_traits>

#include "mpmc_tools.hpp"      // MPMC_FORCEINLINE
#include "mpmc_cacheline.hpp"  // ::mpmc::hw::cacheline_bytes
#include "basic_types.h"        // reg

namespace mpmc::cnt {

struct default_orders {
    static constexpr std::memory_order load  = std::memory_order_acquire;
    static constexpr std::memory_order store = std::memory_order_release;
    static constexpr std::memory_order rmw   = std::memory_order_acq_rel;
};

namespace detail {

    // A CAS may not fail with release semantics.
    constexpr std::memory_order cas_failure_order(const std::memory_order mo) noexcept {
        return (mo == std::memory_order_acq_rel) ? std::memory_order_acquire
             : (mo == std::memory_order_release) ? std::memory_order_relaxed
             : mo;
    }

    template<class Orders>
    inline constexpr bool orders_valid_v =
        (Orders::load  != std::memory_order_release) &&
        (Orders::load  != std::memory_order_acq_rel) &&
        (Orders::store != std::memory_order_acquire) &&
        (Orders::store != std::memory_order_acq_rel) &&
        (Orders::store != std::memory_order_consume) &&
        (Orders::rmw   != std::memory_order_consume);

} // namespace detail

/* ------------------------------ AtomicCounter ------------------------------ */
template<typename T, typename Orders = default_orders>
class AtomicCounter {
    static_assert(std::is_integral_v<T> && !std::is_same_v<std::remove_cv_t<T>, bool>,
                  "[mpmc::cnt]: counter type must be integral (not bool)");
    static_assert(detail::orders_valid_v<Orders>,
                  "[mpmc::cnt]: Orders palette has an order its operation does not accept");
#if MPMC_REQUIRE_LOCK_FREE
    static_assert(std::atomic<T>::is_always_lock_free,
                  "[mpmc::cnt]: counter type is not lock-free on this target");
#endif /* MPMC_REQUIRE_LOCK_FREE */

public:
    using value_type = T;

    [[nodiscard]] MPMC_FORCEINLINE T load(const std::memory_order mo = Orders::load) const noexcept {
        return v_.load(mo);
    }

    MPMC_FORCEINLINE void store(const T x, const std::memory_order mo = Orders::store) noexcept {
        v_.store(x, mo);
    }

    MPMC_FORCEINLINE T fetch_add(const T n, const std::memory_order mo = Orders::rmw) noexcept {
        return v_.fetch_add(n, mo);
    }

    MPMC_FORCEINLINE T fetch_sub(const T n, const std::memory_order mo = Orders::rmw) noexcept {
        return v_.fetch_sub(n, mo);
    }

    // 'expected' is refreshed with the current value on failure.
    MPMC_FORCEINLINE bool compare_exchange_weak(T& expected, const T desired,
                                                const std::memory_order mo = Orders::rmw) noexcept {
        return v_.compare_exchange_weak(expected, desired, mo, detail::cas_failure_order(mo));
    }

private:
    std::atomic<T> v_{0};
};

/* ---------------------------- CachelineCounter ----------------------------- */
template<class Counter, reg AlignB = ::mpmc::hw::cacheline_bytes>
class alignas(AlignB) CachelineCounter {
    static_assert(AlignB != 0u && (AlignB & (AlignB - 1u)) == 0u,
                  "[mpmc::cnt]: AlignB must be a power of two");

public:
    using underlying_type = Counter;
    using value_type      = typename Counter::value_type;

    [[nodiscard]] MPMC_FORCEINLINE value_type load() const noexcept { return c_.load(); }
    [[nodiscard]] MPMC_FORCEINLINE value_type load(const std::memory_order mo) const noexcept {
        return c_.load(mo);
    }

    MPMC_FORCEINLINE void store(const value_type x) noexcept { c_.store(x); }
    MPMC_FORCEINLINE void store(const value_type x, const std::memory_order mo) noexcept {
        c_.store(x, mo);
    }

    MPMC_FORCEINLINE value_type fetch_add(const value_type n) noexcept { return c_.fetch_add(n); }
    MPMC_FORCEINLINE value_type fetch_sub(const value_type n) noexcept { return c_.fetch_sub(n); }

    MPMC_FORCEINLINE bool compare_exchange_weak(value_type& expected, const value_type desired) noexcept {
        return c_.compare_exchange_weak(expected, desired);
    }

private:
    Counter c_{};
};

template<typename T, typename Orders = default_orders, reg AlignB = ::mpmc::hw::cacheline_bytes>
using CachelineAtomicCounter = CachelineCounter<AtomicCounter<T, Orders>, AlignB>;

static_assert(sizeof(CachelineAtomicCounter<reg>) % ::mpmc::hw::cacheline_bytes == 0u,
              "[mpmc::cnt]: a cache-line counter must fill whole lines");

} // namespace mpmc::cnt

#endif /* MPMC_COUNTER_HPP_ */
