#pragma once

#include <tiny-deque/assert.hh>
#include <tiny-deque/fwd.hh>

#include <cstring>
#include <new>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//
// Wrapping arithmetic (ring buffer indices):
//   wrapped_increment(pos, max) - increment with wrap-around to 0 at max
//   wrapped_decrement(pos, max) - decrement with wrap-around to max-1 at 0
//
// Alignment:
//   is_power_of_two(value)      - check if value is a power of 2
//
// Raw memory:
//   placement_new               - tag for constructing objects into raw storage
//   memcpy(dest, src, bytes)    - byte copy for trivially copyable payloads
//
// Template metaprogramming:
//   always_false_t<T...>        - always false for static_assert with type parameters
//   function_ptr<Signature>     - convert function signature to function pointer type
//

namespace td
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] TD_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] TD_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] TD_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto ring = td::exchange(rhs._ring, {});  // take over rhs' ring state, leave it empty
template <class T, class U = T>
[[nodiscard]] TD_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Wrapping arithmetic
// =========================================================================================================

/// Increment with wrap-around: (pos + 1) % max
/// Precondition: max > 0
/// No division, this is the hot path of every ring buffer push/pop
/// Usage:
///   // wrapped_increment(0, 3) == 1
///   // wrapped_increment(2, 3) == 0
template <class T>
[[nodiscard]] constexpr T wrapped_increment(T pos, T max)
{
    TD_ASSERT(max > 0, "wrapped_increment: max must be positive");
    ++pos;
    return pos == max ? T(0) : pos;
}

/// Decrement with wrap-around: (pos - 1 + max) % max
/// Precondition: max > 0
/// Usage:
///   // wrapped_decrement(1, 3) == 0
///   // wrapped_decrement(0, 3) == 2
template <class T>
[[nodiscard]] constexpr T wrapped_decrement(T pos, T max)
{
    TD_ASSERT(max > 0, "wrapped_decrement: max must be positive");
    return pos == 0 ? max - 1 : pos - 1;
}

// =========================================================================================================
// Alignment
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    TD_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

// =========================================================================================================
// Raw memory
// =========================================================================================================

/// Tag type selecting the td placement-new overload
/// Usage:
///   new (td::placement_new, slot_ptr) T(td::forward<Args>(args)...);
struct placement_new_t
{
    explicit placement_new_t() = default;
};
inline constexpr placement_new_t placement_new{};

/// Byte copy between non-overlapping buffers
/// Only used for trivially copyable payloads
TD_FORCE_INLINE void memcpy(void* dest, void const* src, isize bytes)
{
    TD_ASSERT(bytes >= 0, "memcpy: negative byte count");
    std::memcpy(dest, src, size_t(bytes));
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   td::function_ptr<void(td::byte*, td::isize)>  -> void (*)(td::byte*, td::isize)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

} // namespace td

/// Placement new overload selected by td::placement_new
/// Does not depend on <new>'s void* overload, so it cannot collide with user-provided global overloads
[[nodiscard]] TD_FORCE_INLINE void* operator new(std::size_t, td::placement_new_t, void* buffer) noexcept
{
    return buffer;
}

/// Matching placement delete, only called if a constructor throws during placement new
TD_FORCE_INLINE void operator delete(void*, td::placement_new_t, void*) noexcept {}
