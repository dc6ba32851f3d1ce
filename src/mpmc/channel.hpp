/*
 * channel.hpp
 *
 * Shared-ownership handles over one bounded_queue and the factory that
 * builds them.
 *
 *   auto [tx, rx] = mpmc::create<Msg, 6>();   // capacity 64
 *   auto tx2 = tx.clone();                    // another producer
 *   (void)tx2.send(Msg{...});
 *   Msg m;
 *   if (rx.recv(m)) { ... }
 *
 * Ownership:
 *   - create() allocates one cache-line aligned block holding the queue and an
 *     intrusive atomic reference count, through Alloc (stateless).
 *   - Every sender/receiver holds one reference. Copy/clone adds one, move
 *     transfers it and leaves the source invalid, destruction drops it.
 *   - The handle that drops the last reference destroys the queue (and every
 *     message still parked in it) and frees the block.
 *
 * Failure:
 *   - MPMC_ENABLE_EXCEPTIONS == 0: allocation failure returns a pair of
 *     invalid handles. send()/recv() on an invalid handle return false.
 *   - MPMC_ENABLE_EXCEPTIONS == 1: std::bad_alloc propagates out of create(),
 *     nothing leaks.
 *
 * Handles are cheap and NOT meant to be shared between threads by reference
 * while one of them is being reassigned. Give each thread its own clone.
 */

#ifndef MPMC_CHANNEL_HPP_
#define MPMC_CHANNEL_HPP_

#include <memory>  // std::allocator_traits, std::destroy_at
#include <new>     // placement new
#include <type_traits>
#include <utility> // std::pair, std::move, std::exchange, std::declval

#include "bounded_queue.hpp"
#include "base/mpmc_alloc.hpp"     // ::mpmc::alloc::align_alloc
#include "base/mpmc_cacheline.hpp" // ::mpmc::hw::cacheline_bytes
#include "base/mpmc_counter.hpp"   // ::mpmc::cnt::CachelineAtomicCounter
#include "base/mpmc_tools.hpp"     // MPMC_TRY, MPMC_CATCH_ALL, MPMC_RETHROW

namespace mpmc {

using default_alloc = ::mpmc::alloc::align_alloc<::mpmc::hw::cacheline_bytes>;

template <class T, reg Order, class Alloc = default_alloc>
class sender;

template <class T, reg Order, class Alloc = default_alloc>
class receiver;

namespace detail {

template <class T, reg Order>
struct shared_queue {
    bounded_queue<T, Order>                 queue;
    ::mpmc::cnt::CachelineAtomicCounter<reg> refs;
};

struct channel_access;

template <class T, reg Order, class Alloc>
struct block_alloc {
    using block_type     = shared_queue<T, Order>;
    using allocator_type = typename std::allocator_traits<Alloc>::template rebind_alloc<block_type>;
    using alloc_traits   = std::allocator_traits<allocator_type>;

    static constexpr bool kNoexceptAllocate =
        noexcept(std::declval<allocator_type&>().allocate(1u));
};

/* =======================================================================
 * handle_base<T, Order, Alloc>
 *
 * Reference-counted pointer to the shared block. sender/receiver add the
 * producer or consumer half of the API on top.
 * ======================================================================= */
template <class T, reg Order, class Alloc>
class handle_base {
protected:
    using block_type     = typename block_alloc<T, Order, Alloc>::block_type;
    using allocator_type = typename block_alloc<T, Order, Alloc>::allocator_type;
    using alloc_traits   = typename block_alloc<T, Order, Alloc>::alloc_traits;

    static_assert(alloc_traits::is_always_equal::value,
                  "[mpmc::channel]: allocator must be stateless (is_always_equal), handles"
                  " default-construct it to free the block.");
    static_assert(std::is_default_constructible_v<allocator_type>,
                  "[mpmc::channel]: allocator must be default-constructible.");
    static_assert(std::is_same_v<typename alloc_traits::pointer, block_type*>,
                  "[mpmc::channel]: allocator pointer type must be a raw pointer.");

public:
    using value_type = T;
    using size_type  = reg;

    static constexpr size_type kCapacity = bounded_queue<T, Order>::kCapacity;

    handle_base() noexcept = default;

    handle_base(const handle_base& other) noexcept : block_(other.block_) { retain_(block_); }

    handle_base(handle_base&& other) noexcept : block_(std::exchange(other.block_, nullptr)) {}

    handle_base& operator=(const handle_base& other) noexcept {
        if (block_ != other.block_) {
            retain_(other.block_);
            release_(std::exchange(block_, other.block_));
        }
        return *this;
    }

    handle_base& operator=(handle_base&& other) noexcept {
        if (this != &other) {
            release_(std::exchange(block_, std::exchange(other.block_, nullptr)));
        }
        return *this;
    }

    ~handle_base() noexcept { release_(block_); }

    [[nodiscard]] bool is_valid() const noexcept { return block_ != nullptr; }

    [[nodiscard]] static constexpr size_type capacity() noexcept { return kCapacity; }

    // Number of live handles on this queue (approximate under concurrency, 0 if invalid).
    [[nodiscard]] size_type use_count() const noexcept {
        return block_ ? block_->refs.load(std::memory_order_relaxed) : size_type{0};
    }

    // True if both handles refer to the same queue.
    [[nodiscard]] bool same_queue(const handle_base& other) const noexcept {
        return block_ != nullptr && block_ == other.block_;
    }

protected:
    explicit handle_base(block_type* block) noexcept : block_(block) {}

    block_type* block_{nullptr};

private:
    static void retain_(block_type* block) noexcept {
        if (block) {
            (void)block->refs.fetch_add(1u);
        }
    }

    static void release_(block_type* block) noexcept {
        if (block && block->refs.fetch_sub(1u) == 1u) {
            std::destroy_at(block);
            allocator_type a{};
            alloc_traits::deallocate(a, block, 1u);
        }
    }
};

} // namespace detail

/* =======================================================================
 * sender<T, Order, Alloc>
 * ======================================================================= */
template <class T, reg Order, class Alloc>
class sender : public detail::handle_base<T, Order, Alloc> {
    using Base = detail::handle_base<T, Order, Alloc>;

public:
    using typename Base::value_type;

    sender() noexcept = default;

    [[nodiscard]] sender clone() const noexcept { return sender(*this); }

    // false: queue full (or invalid handle); msg is left untouched.
    [[nodiscard]] bool send(value_type&& msg) noexcept {
        return this->block_ ? this->block_->queue.send(std::move(msg)) : false;
    }

    [[nodiscard]] bool send(const value_type& msg)
        noexcept(std::is_nothrow_copy_constructible_v<value_type>) {
        return this->block_ ? this->block_->queue.send(msg) : false;
    }

private:
    friend struct detail::channel_access;
    explicit sender(typename Base::block_type* block) noexcept : Base(block) {}
};

/* =======================================================================
 * receiver<T, Order, Alloc>
 * ======================================================================= */
template <class T, reg Order, class Alloc>
class receiver : public detail::handle_base<T, Order, Alloc> {
    using Base = detail::handle_base<T, Order, Alloc>;

public:
    using typename Base::value_type;

    receiver() noexcept = default;

    [[nodiscard]] receiver clone() const noexcept { return receiver(*this); }

    // false: queue empty (or invalid handle); out is left untouched.
    [[nodiscard]] bool recv(value_type& out) noexcept {
        return this->block_ ? this->block_->queue.recv(out) : false;
    }

private:
    friend struct detail::channel_access;
    explicit receiver(typename Base::block_type* block) noexcept : Base(block) {}
};

namespace detail {

struct channel_access {
    template <class T, reg Order, class Alloc>
    static std::pair<sender<T, Order, Alloc>, receiver<T, Order, Alloc>>
    adopt(shared_queue<T, Order>* block) noexcept {
        // The block arrives with refs == 2: one per handle.
        return { sender<T, Order, Alloc>(block), receiver<T, Order, Alloc>(block) };
    }
};

} // namespace detail

/* =======================================================================
 * create<T, Order, Alloc>()
 *
 * Queue of capacity 2^Order: free ring full, ready ring empty, every payload
 * cell default-constructed. Order is validated at compile time by index_ring.
 * ======================================================================= */
template <class T, reg Order, class Alloc = default_alloc>
[[nodiscard]] std::pair<sender<T, Order, Alloc>, receiver<T, Order, Alloc>> create()
    noexcept(detail::block_alloc<T, Order, Alloc>::kNoexceptAllocate)
{
    using block_type     = typename detail::block_alloc<T, Order, Alloc>::block_type;
    using allocator_type = typename detail::block_alloc<T, Order, Alloc>::allocator_type;
    using alloc_traits   = typename detail::block_alloc<T, Order, Alloc>::alloc_traits;

    allocator_type a{};
    block_type* const block = alloc_traits::allocate(a, 1u);
    if (MPMC_UNLIKELY(block == nullptr)) {
        return {};
    }

    MPMC_TRY {
        ::new (static_cast<void*>(block)) block_type();
    } MPMC_CATCH_ALL {
        alloc_traits::deallocate(a, block, 1u);
        MPMC_RETHROW;
    }

    block->refs.store(2u);
    return detail::channel_access::adopt<T, Order, Alloc>(block);
}

} // namespace mpmc

#endif /* MPMC_CHANNEL_HPP_ */
