/*
 * mpmc_alloc.hpp
 *
 * Created on: 12 Oct. 2026
 * Author: Shpegun60
 *
 * Stateless over-aligned allocator for the shared queue block.
 *
 * The block that create() hands out carries cache-line aligned ring counters,
 * so it must come back aligned to at least MPMC_CACHELINE_BYTES. Plain
 * ::operator new only promises __STDCPP_DEFAULT_NEW_ALIGNMENT__ (usually 16).
 *
 * Two strategies:
 *   - aligned new/delete when MPMC_ALLOC_PREFER_ALIGNED_NEW != 0 and the
 *     toolchain has it;
 *   - otherwise over-allocate with plain ::operator new and stash the raw
 *     pointer in the word right before the aligned block.
 *
 * Failure policy (fail_mode):
 *   - throws       : std::bad_alloc, requires MPMC_ENABLE_EXCEPTIONS != 0
 *   - returns_null : nullptr, create() turns it into invalid handles
 *
 * The allocator is stateless (is_always_equal), which is what lets the last
 * handle default-construct one to free the block.
 */

#ifndef MPMC_ALLOC_HPP_
#define MPMC_ALLOC_HPP_

#include <cstddef>     // std::size_t, std::byte
#include <cstdint>     // std::uintptr_t
#include <cstring>     // std::memcpy
#include <limits>      // std::numeric_limits
#include <new>         // std::nothrow, std::align_val_t, std::bad_alloc
#include <type_traits> // std::true_type

#include "mpmc_tools.hpp" // MPMC_UNLIKELY, MPMC_ENABLE_EXCEPTIONS

namespace mpmc::alloc {

enum class fail_mode : unsigned {
    throws,
    returns_null
};

static_assert(MPMC_ENABLE_EXCEPTIONS == 0 || MPMC_ENABLE_EXCEPTIONS == 1,
              "[mpmc::alloc]: MPMC_ENABLE_EXCEPTIONS must be 0 or 1");

inline constexpr fail_mode default_fail_mode =
    (MPMC_ENABLE_EXCEPTIONS != 0) ? fail_mode::throws : fail_mode::returns_null;

namespace detail {

inline constexpr bool kUseAlignedNew =
#if defined(__cpp_aligned_new)
    (MPMC_ALLOC_PREFER_ALIGNED_NEW != 0);
#else
    false;
#endif

inline constexpr std::size_t kStashSize = sizeof(void*);

constexpr bool is_pow2(const std::size_t x) noexcept {
    return (x != 0u) && ((x & (x - 1u)) == 0u);
}

template<fail_mode Mode>
[[nodiscard]] inline void* out_of_memory() noexcept(Mode == fail_mode::returns_null)
{
#if (MPMC_ENABLE_EXCEPTIONS != 0)
    if constexpr (Mode == fail_mode::throws) {
        throw std::bad_alloc{};
    }
#endif
    return nullptr;
}

/*
 *   raw ... [stash: raw ptr][block aligned to 'alignment' ...]
 */
template<fail_mode Mode>
[[nodiscard]] inline void* stash_alloc(const std::size_t alignment, const std::size_t bytes)
    noexcept(Mode == fail_mode::returns_null)
{
    const std::size_t slack = (alignment - 1u) + kStashSize;
    if (MPMC_UNLIKELY(bytes > std::numeric_limits<std::size_t>::max() - slack)) {
        return out_of_memory<Mode>();
    }

    void* raw = ::operator new(bytes + slack, std::nothrow);
    if (MPMC_UNLIKELY(raw == nullptr)) {
        return out_of_memory<Mode>();
    }

    const std::uintptr_t first = reinterpret_cast<std::uintptr_t>(raw) + kStashSize;
    const std::uintptr_t mask  = static_cast<std::uintptr_t>(alignment - 1u);
    const std::uintptr_t at    = (first + mask) & ~mask;

    std::byte* const block = static_cast<std::byte*>(raw) + (at - reinterpret_cast<std::uintptr_t>(raw));
    std::memcpy(block - kStashSize, &raw, kStashSize);
    return block;
}

inline void stash_free(void* block) noexcept
{
    void* raw = nullptr;
    std::memcpy(&raw, static_cast<std::byte*>(block) - kStashSize, kStashSize);
    ::operator delete(raw);
}

} // namespace detail

// ============================================================================
// block_allocator<T, Alignment, Mode>
// ============================================================================

template<class T, std::size_t Alignment, fail_mode Mode = default_fail_mode>
class block_allocator
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using is_always_equal = std::true_type;

    static_assert(detail::is_pow2(Alignment), "[mpmc::alloc]: Alignment must be a power of two");
    static_assert((Mode != fail_mode::throws) || (MPMC_ENABLE_EXCEPTIONS != 0),
                  "[mpmc::alloc]: fail_mode::throws requires MPMC_ENABLE_EXCEPTIONS");

    // Never below pointer alignment: the stash word must be aligned too.
    static constexpr size_type kAlign =
        (Alignment > alignof(T)) ? ((Alignment > alignof(void*)) ? Alignment : alignof(void*))
                                 : ((alignof(T) > alignof(void*)) ? alignof(T) : alignof(void*));

    block_allocator() noexcept = default;

    template<class U>
    block_allocator(const block_allocator<U, Alignment, Mode>&) noexcept {}

    [[nodiscard]] T* allocate(const size_type n) noexcept(Mode == fail_mode::returns_null)
    {
        if (MPMC_UNLIKELY(n == 0u)) {
            return nullptr;
        }
        if (MPMC_UNLIKELY(n > (std::numeric_limits<size_type>::max() / sizeof(T)))) {
            return static_cast<T*>(detail::out_of_memory<Mode>());
        }

        const size_type bytes = n * sizeof(T);

        if constexpr (detail::kUseAlignedNew) {
            void* p = ::operator new(bytes, std::align_val_t(kAlign), std::nothrow);
            return static_cast<T*>(p ? p : detail::out_of_memory<Mode>());
        } else {
            return static_cast<T*>(detail::stash_alloc<Mode>(kAlign, bytes));
        }
    }

    void deallocate(T* p, size_type /*n*/) noexcept
    {
        if (MPMC_UNLIKELY(p == nullptr)) {
            return;
        }
        if constexpr (detail::kUseAlignedNew) {
            ::operator delete(p, std::align_val_t(kAlign));
        } else {
            detail::stash_free(p);
        }
    }

    template<class U>
    struct rebind {
        using other = block_allocator<U, Alignment, Mode>;
    };
};

template<class T1, class T2, std::size_t A, fail_mode M>
inline bool operator==(const block_allocator<T1, A, M>&, const block_allocator<T2, A, M>&) noexcept
{
    return true;
}

template<class T1, class T2, std::size_t A, fail_mode M>
inline bool operator!=(const block_allocator<T1, A, M>&, const block_allocator<T2, A, M>&) noexcept
{
    return false;
}

template<std::size_t Alignment>
using align_alloc = block_allocator<std::byte, Alignment, default_fail_mode>;

} // namespace mpmc::alloc

#endif /* MPMC_ALLOC_HPP_ */
