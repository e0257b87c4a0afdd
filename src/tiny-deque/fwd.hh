#pragma once

#include <cstddef>
#include <cstdint>


namespace td
{

//
// Primitives
//

// Explicitly-sized primitive types
// "int" is fine wherever the range doesn't matter much (loop counters, small counts).

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes and indices are signed i64:
// * ring index arithmetic subtracts (head - 1, size - 1) and must not underflow into huge values
// * negative indices are trivially detected as out of bounds instead of wrapping around
// * we only target 64-bit platforms, so i64 provides plenty of range
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;

//
// Views
//

template <class T>
struct span;
template <class T>
struct deque_segments;

//
// Errors
//

enum class deque_error : u8;

template <class T, class E>
struct result;
template <class E>
struct as_error_t;

//
// Deques
//

enum class deque_storage : u8;

template <class T, isize N>
struct array_deque;
template <class T, isize N>
struct tiny_deque;

} // namespace td
