/*
 * basic_types.h: platform-independent type aliases used by the mpmc headers
 *
 * ────────────────────────────────────────────────────────────────────────────────
 *  Category      │ Purpose                         │ Types
 * ───────────────┼─────────────────────────────────┼───────────────────────────────
 *  Exact-width   │ Fixed bit size                  │ u8..u64, i8..i64
 *  Native        │ Pointer-sized (register proxy)  │ reg, sreg
 *  Size-friendly │ API ergonomics for sizes        │ usize, isize
 * ────────────────────────────────────────────────────────────────────────────────
 *
 * The ring word is 'reg': one std::atomic<reg> per cell, and head/tail are
 * reg counters compared through 'sreg' differences. Both must be exactly one
 * pointer wide, which is checked below.
 */

#ifndef BASIC_TYPES_H_
#define BASIC_TYPES_H_

#include <cstdint>   /* integer types */
#include <cstddef>   /* size_t, ptrdiff_t */

/* Exact-width integer types (guaranteed size) */
using u8  = std::uint8_t;   using i8  = std::int8_t;
using u16 = std::uint16_t;  using i16 = std::int16_t;
using u32 = std::uint32_t;  using i32 = std::int32_t;
using u64 = std::uint64_t;  using i64 = std::int64_t;

/* Native register-size types (match pointer size) */
using reg  = std::size_t;      /* unsigned native word (ring cells, counters, indices) */
using sreg = std::ptrdiff_t;   /* signed native word (counter differences, threshold) */

/* Size-friendly aliases (API ergonomics) */
using usize = std::size_t;
using isize = std::ptrdiff_t;

/* ------------------------------ Sanity checks ------------------------------- */
static_assert(sizeof(u8)  == 1, "u8 must be 1 byte");
static_assert(sizeof(u16) == 2, "u16 must be 2 bytes");
static_assert(sizeof(u32) == 4, "u32 must be 4 bytes");
static_assert(sizeof(u64) == 8, "u64 must be 8 bytes");

static_assert(sizeof(reg)  == sizeof(void*), "reg must match pointer size");
static_assert(sizeof(sreg) == sizeof(void*), "sreg must match pointer size");
static_assert(sizeof(reg)  == sizeof(sreg),  "reg and sreg must have the same width");

#endif /* BASIC_TYPES_H_ */
