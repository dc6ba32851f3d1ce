/*
 * bounded_queue.hpp
 *
 * Bounded lock-free MPMC queue of T built from two index rings:
 *
 *   free_  : indices of payload cells that may be written
 *   ready_ : indices of payload cells holding a message
 *
 *   send(msg): free_.dequeue(i)  -> payload_[i] = msg  -> ready_.enqueue(i)
 *   recv(out): ready_.dequeue(i) -> out = payload_[i]  -> free_.enqueue(i)
 *
 * Payload safety (no lock on payload_):
 *   - An index is resident in at most one ring at any time, and free_ + ready_
 *     + in-flight indices always cover exactly capacity() indices.
 *   - A cell is written only after its index left free_, and read only after
 *     its index left ready_. Hence no two threads ever touch the same cell
 *     (no W/W conflict) and no cell is read before it is fully written
 *     (no R/W conflict). The fences around the ring operations pair the
 *     payload accesses with the ring CAS that publishes the index.
 *   - Because the number of outstanding indices never exceeds capacity(),
 *     the enqueue half of both operations cannot fail.
 *
 * Requirements on T:
 *   - nothrow default constructible: cells start default-valued and are reset
 *     to T{} after each recv() so owned resources are released immediately.
 *   - nothrow move assignable: once an index is claimed nothing may throw,
 *     or the index would be stranded.
 *
 * Neither send() nor recv() ever blocks. false means full/empty *right now*.
 */

#ifndef MPMC_BOUNDED_QUEUE_HPP_
#define MPMC_BOUNDED_QUEUE_HPP_

#include <array>
#include <atomic>
#include <type_traits>
#include <utility> // std::move

#include "index_ring.hpp"

namespace mpmc {

template <class T, reg Order>
class bounded_queue {
public:
    using value_type      = T;
    using reference       = value_type&;
    using const_reference = const value_type&;
    using size_type       = reg;
    using ring_type       = index_ring<Order>;

    static constexpr size_type kCapacity = ring_type::kCapacity;

    static_assert(!std::is_const_v<value_type>,
                  "[mpmc::bounded_queue]: const T does not make sense for a writable queue.");
    static_assert(std::is_nothrow_default_constructible_v<value_type>,
                  "[mpmc::bounded_queue]: T must be nothrow default constructible.");
    static_assert(std::is_nothrow_move_assignable_v<value_type>,
                  "[mpmc::bounded_queue]: T must be nothrow move assignable.");

    bounded_queue() noexcept : payload_{} { free_.fill(); }

    bounded_queue(const bounded_queue&) = delete;
    bounded_queue& operator=(const bounded_queue&) = delete;
    bounded_queue(bounded_queue&&) = delete;
    bounded_queue& operator=(bounded_queue&&) = delete;

    // ------------------------------------------------------------------------------------------
    // Producer
    // ------------------------------------------------------------------------------------------

    // On failure msg is left untouched.
    [[nodiscard]] bool send(value_type&& msg) noexcept {
        size_type idx = 0u;
        if (!free_.dequeue(idx)) {
            return false;
        }

        payload_[idx] = std::move(msg);
        std::atomic_thread_fence(std::memory_order_release);

        ready_.enqueue(idx);
        return true;
    }

    // Copies before claiming a slot, so a throwing copy cannot strand an index.
    [[nodiscard]] bool send(const value_type& msg)
        noexcept(std::is_nothrow_copy_constructible_v<value_type>) {
        value_type tmp(msg);
        return send(std::move(tmp));
    }

    // ------------------------------------------------------------------------------------------
    // Consumer
    // ------------------------------------------------------------------------------------------

    // On failure out is left untouched.
    [[nodiscard]] bool recv(value_type& out) noexcept {
        size_type idx = 0u;
        if (!ready_.dequeue(idx)) {
            return false;
        }
        std::atomic_thread_fence(std::memory_order_acquire);

        value_type& cell = payload_[idx];
        out  = std::move(cell);
        cell = value_type{};

        std::atomic_thread_fence(std::memory_order_release);
        free_.enqueue(idx);
        return true;
    }

    [[nodiscard]] static constexpr size_type capacity() noexcept { return kCapacity; }

    // Test/diagnostic access, quiescent state only.
    [[nodiscard]] const ring_type& free_ring() const noexcept { return free_; }
    [[nodiscard]] const ring_type& ready_ring() const noexcept { return ready_; }

private:
    ring_type free_;
    ring_type ready_;
    std::array<value_type, kCapacity> payload_;
};

} // namespace mpmc

#endif /* MPMC_BOUNDED_QUEUE_HPP_ */
