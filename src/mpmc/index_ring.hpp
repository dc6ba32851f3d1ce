/*
 * index_ring.hpp
 *
 * Lock-free MPMC ring of slot indices (Scalable Circular Queue, single-width
 * CAS variant, R. Nikolaev, DISC 2019).
 *
 * The ring does not carry payloads. It carries indices in [0, capacity()),
 * and bounded_queue pairs two of them (free/ready) with a payload array.
 *
 * Geometry (Order is a compile-time exponent):
 *   - capacity() = 2^Order        ("half": indices the ring can hold)
 *   - cells()    = 2^(Order + 1)  ("full": physical cells)
 *
 * Cell encoding (one native word):
 *
 *   [ cycle bits ... | safe bit (cells) | index bits (cells - 1) ]
 *
 *   - index bits all ones  -> the cell is empty (consumed / never filled)
 *   - safe bit cleared     -> a dequeuer skipped this cell while an older
 *                             entry was still there; enqueuers may only reuse
 *                             it if head has not passed their position.
 *   - cycle bits           -> position >> (Order + 1), disambiguates reuses of
 *                             the same physical cell across wrap-arounds.
 *
 * Counters:
 *   - head / tail grow monotonically and wrap implicitly (modulo arithmetic,
 *     compared through signed differences).
 *   - threshold is a fast, approximate "drained" signal. Negative means every
 *     dequeue returns immediately. Enqueue restores it to
 *     capacity() + cells() - 1.
 *   - Each counter lives in its own cache-line slot.
 *
 * Cell placement:
 *   - Logical position p maps to a physical cell by rotating its bits so that
 *     consecutive positions fall on different cache lines. The rotation width
 *     is ::mpmc::hw::ring_min_order. Below that order the ring fits in a line
 *     anyway and the mapping degrades to identity, so every Order >= 0 works.
 *
 * Contracts:
 *   - enqueue() never fails, provided no more than capacity() indices are ever
 *     outstanding in the ring. bounded_queue guarantees this by construction.
 *   - dequeue() returning false means "empty, or believed empty". It is not a
 *     linearizable emptiness check: retry later.
 *   - reset()/fill() are NOT thread-safe with enqueue/dequeue.
 */

#ifndef MPMC_INDEX_RING_HPP_
#define MPMC_INDEX_RING_HPP_

#include <array>
#include <atomic>
#include <limits>
#include <type_traits>

#include "base/mpmc_cacheline.hpp" // ::mpmc::hw::cacheline_bytes, ring_min_order
#include "base/mpmc_counter.hpp"   // ::mpmc::cnt::CachelineAtomicCounter
#include "base/mpmc_tools.hpp"     // MPMC_FORCEINLINE, MPMC_ASSERT, MPMC_NOINLINE

namespace mpmc {

template <reg Order>
class index_ring {
public:
    using size_type   = reg;
    using word_type   = reg;
    using signed_type = sreg;

    // Cycle tags need headroom above the cell bits: keep half the word for them.
    static constexpr reg kMaxOrder = static_cast<reg>(std::numeric_limits<word_type>::digits / 2) - 1u;

    static_assert(Order <= kMaxOrder,
                  "[mpmc::index_ring]: Order leaves too few bits for cycle tags.");
    static_assert(std::is_unsigned_v<word_type> && std::is_signed_v<signed_type>,
                  "[mpmc::index_ring]: word_type must be unsigned, signed_type signed.");
    static_assert(sizeof(word_type) == sizeof(signed_type),
                  "[mpmc::index_ring]: word and signed word must have the same width.");
#if MPMC_REQUIRE_LOCK_FREE
    static_assert(std::atomic<word_type>::is_always_lock_free,
                  "[mpmc::index_ring]: ring cells are not lock-free on this target.");
#endif /* MPMC_REQUIRE_LOCK_FREE */

    static constexpr reg       kOrder     = Order;
    static constexpr size_type kCapacity  = size_type{1} << Order;
    static constexpr size_type kCells     = size_type{1} << (Order + 1u);
    static constexpr word_type kIndexMask = kCells - 1u;
    static constexpr word_type kCycleMask = (kCells << 1u) - 1u;
    static constexpr word_type kEmpty     = ~word_type{0};

    static constexpr signed_type kThresholdFull  = static_cast<signed_type>(kCapacity + kCells - 1u);
    static constexpr signed_type kThresholdEmpty = -1;

    static constexpr unsigned kRetryBudget = MPMC_DEQUEUE_RETRY_BUDGET;

    index_ring() noexcept { reset(); }

    index_ring(const index_ring&) = delete;
    index_ring& operator=(const index_ring&) = delete;
    index_ring(index_ring&&) = delete;
    index_ring& operator=(index_ring&&) = delete;

    // ------------------------------------------------------------------------------------------
    // Non-concurrent state setup
    // ------------------------------------------------------------------------------------------

    // Every cell empty, head = tail = 0, threshold = -1.
    void reset() noexcept {
        for (auto& c : cells_) {
            c.store(kEmpty, std::memory_order_relaxed);
        }
        head_.store(0u, std::memory_order_relaxed);
        tail_.store(0u, std::memory_order_relaxed);
        threshold_.store(kThresholdEmpty, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_release);
    }

    // Ring holding every index in [0, capacity()), head = 0, tail = capacity().
    // Indices come out in bit-rotated order, not 0, 1, 2, ...
    void fill() noexcept {
        for (size_type n = 0u; n < kCapacity; ++n) {
            const word_type idx = static_cast<word_type>(map_(kCells + n, kCapacity, Order));
            // Cycle 0, safe bit set.
            cells_[cell_index(n)].store(kCells | idx, std::memory_order_relaxed);
        }
        for (size_type n = kCapacity; n < kCells; ++n) {
            cells_[cell_index(n)].store(kEmpty, std::memory_order_relaxed);
        }
        head_.store(0u, std::memory_order_relaxed);
        tail_.store(kCapacity, std::memory_order_relaxed);
        threshold_.store(kThresholdFull, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_release);
    }

    // ------------------------------------------------------------------------------------------
    // Concurrent operations
    // ------------------------------------------------------------------------------------------

    void enqueue(const size_type index) noexcept {
        MPMC_ASSERT(index < kCapacity);

        const word_type eidx = static_cast<word_type>(index) ^ kIndexMask;

        for (;;) {
            const word_type tail   = tail_.fetch_add(1u);
            const word_type tcycle = (tail << 1u) | kCycleMask;
            std::atomic<word_type>& cell = cells_[cell_index(tail)];

            word_type entry = cell.load(std::memory_order_acquire);
            for (;;) {
                const word_type ecycle = entry | kCycleMask;

                if (diff_(ecycle, tcycle) >= 0) {
                    break; // cell already belongs to this or a later cycle
                }
                if (entry != ecycle) {
                    // Occupied, or empty-but-unsafe with head already past us.
                    if ((entry != (ecycle ^ kCells)) || (diff_(head_.load(), tail) > 0)) {
                        break;
                    }
                }
                if (cell.compare_exchange_weak(entry, tcycle ^ eidx,
                                               std::memory_order_acq_rel,
                                               std::memory_order_acquire)) {
                    if (threshold_.load(std::memory_order_relaxed) != kThresholdFull) {
                        threshold_.store(kThresholdFull, std::memory_order_relaxed);
                    }
                    return;
                }
            }
        }
    }

    [[nodiscard]] bool dequeue(size_type& index) noexcept {
        if (threshold_.load(std::memory_order_relaxed) < 0) {
            return false;
        }

        for (;;) {
            const word_type head   = head_.fetch_add(1u);
            const word_type hcycle = (head << 1u) | kCycleMask;
            std::atomic<word_type>& cell = cells_[cell_index(head)];

            unsigned  attempt = 0u;
            word_type entry   = cell.load(std::memory_order_acquire);

            for (;;) {
                const word_type ecycle = entry | kCycleMask;

                if (ecycle == hcycle) {
                    // Keep the safe bit, set the index bits: consumed.
                    (void)cell.fetch_or(kIndexMask, std::memory_order_acq_rel);
                    index = static_cast<size_type>(entry & kIndexMask);
                    return true;
                }

                word_type next;
                if ((entry | kCells) != ecycle) {
                    // Holds an index from another cycle: mark it unsafe.
                    next = entry & ~kCells;
                    if (entry == next) {
                        break;
                    }
                } else {
                    // Empty. An enqueuer may be about to fill it for our cycle.
                    if (++attempt <= kRetryBudget) {
                        entry = cell.load(std::memory_order_acquire);
                        continue;
                    }
                    next = hcycle ^ ((~entry) & kCells);
                }

                if (diff_(ecycle, hcycle) >= 0) {
                    break;
                }
                if (cell.compare_exchange_weak(entry, next,
                                               std::memory_order_acq_rel,
                                               std::memory_order_acquire)) {
                    break;
                }
            }

            const word_type tail = tail_.load();
            if (diff_(tail, head + 1u) <= 0) {
                catchup_(tail, head + 1u);
                (void)threshold_.fetch_sub(1);
                return false;
            }
            if (threshold_.fetch_sub(1) <= 0) {
                return false;
            }
        }
    }

    // ------------------------------------------------------------------------------------------
    // Geometry / diagnostics
    // ------------------------------------------------------------------------------------------

    [[nodiscard]] static constexpr size_type capacity() noexcept { return kCapacity; }
    [[nodiscard]] static constexpr size_type cells() noexcept { return kCells; }

    // Physical cell of logical position 'position'.
    [[nodiscard]] static constexpr size_type cell_index(const word_type position) noexcept {
        return map_(position, kCells, Order + 1u);
    }

    // Relaxed snapshots, meaningful only when the ring is quiescent.
    [[nodiscard]] word_type head() const noexcept { return head_.load(std::memory_order_relaxed); }
    [[nodiscard]] word_type tail() const noexcept { return tail_.load(std::memory_order_relaxed); }
    [[nodiscard]] signed_type threshold() const noexcept { return threshold_.load(std::memory_order_relaxed); }

private:
    static constexpr size_type map_(const word_type idx, const size_type limit, const reg order) noexcept {
        const reg shift = (order < ::mpmc::hw::ring_min_order) ? order : reg{::mpmc::hw::ring_min_order};
        return static_cast<size_type>(((idx & (limit - 1u)) >> (order - shift)) |
                                      ((idx << shift) & (limit - 1u)));
    }

    static constexpr signed_type diff_(const word_type a, const word_type b) noexcept {
        return static_cast<signed_type>(a - b);
    }

    // Drag tail up to head after a dequeuer overran it.
    MPMC_NOINLINE void catchup_(word_type tail, word_type head) noexcept {
        while (!tail_.compare_exchange_weak(tail, head)) {
            head = head_.load();
            if (diff_(tail, head) >= 0) {
                break;
            }
        }
    }

    using word_counter      = ::mpmc::cnt::CachelineAtomicCounter<word_type>;
    using threshold_counter = ::mpmc::cnt::CachelineAtomicCounter<signed_type>;

    alignas(::mpmc::hw::cacheline_bytes) std::array<std::atomic<word_type>, kCells> cells_;

    word_counter      head_;
    threshold_counter threshold_;
    word_counter      tail_;
};

} // namespace mpmc

#endif /* MPMC_INDEX_RING_HPP_ */
