#pragma once

#include <tiny-deque/assert.hh>
#include <tiny-deque/fwd.hh>
#include <tiny-deque/impl/object_lifetime_util.hh>
#include <tiny-deque/span.hh>
#include <tiny-deque/utility.hh>

#include <type_traits>

// Ring buffer primitives shared by td::array_deque and td::tiny_deque.
//
// A ring is described by three things:
// - a pointer to `capacity` slots (inline array or heap block, owned by the deque),
// - the ring_state {head, size},
// - the object lifetime rule: exactly the slots at logical indices [0, size) hold live objects.
//
// The primitives never store the slot pointer, so the owning deque can move its inline storage
// (or swap in a new heap block) without anything dangling.
//
// Invariants:
// - 0 <= size <= capacity
// - 0 <= head < capacity (head == 0 when capacity == 0)
// - logical index i lives in physical slot ring_physical_index(head, size, capacity, i)
//
// Exception guarantees:
// - emplace_* construct the new object before touching head/size, so a throwing constructor
//   leaves the ring unchanged.
// - relocation (move_linearized_to) does not promise anything if a move constructor throws.

/// The (at most) two contiguous runs of a deque's live objects, in logical order.
/// `second` is empty whenever the ring does not wrap.
template <class T>
struct td::deque_segments
{
    span<T> first;
    span<T> second;

    [[nodiscard]] constexpr isize size() const { return first.size() + second.size(); }
};

namespace td::impl
{
struct ring_state
{
    isize head = 0;
    isize size = 0;
};

/// Maps a logical index to its physical slot.
/// This is the only place that knows about wrap-around; every access goes through it.
/// logical == size is allowed (the next free back slot) as long as the ring is not full.
[[nodiscard]] constexpr isize ring_physical_index(isize head, isize size, isize capacity, isize logical)
{
    TD_ASSERT(0 <= size && size <= capacity, "ring size out of range");
    TD_ASSERT(0 <= head && (head < capacity || (head == 0 && capacity == 0)), "ring head out of range");
    TD_ASSERT(0 <= logical && logical <= size && logical < capacity, "logical index out of range");
    TD_UNUSED(size);

    // head < capacity and logical < capacity, so a single subtraction replaces the modulo
    auto const i = head + logical;
    return i < capacity ? i : i - capacity;
}

template <class T>
[[nodiscard]] constexpr T* ring_slot(T* slots, isize capacity, ring_state const& ring, isize logical)
{
    return slots + ring_physical_index(ring.head, ring.size, capacity, logical);
}

[[nodiscard]] constexpr bool ring_is_contiguous(isize capacity, ring_state const& ring)
{
    return ring.head + ring.size <= capacity;
}

template <class T>
[[nodiscard]] constexpr deque_segments<T> ring_get_segments(T* slots, isize capacity, ring_state const& ring)
{
    if (ring.size == 0)
        return {};

    auto const first_size = ring.head + ring.size <= capacity ? ring.size : capacity - ring.head;
    return {
        span<T>(slots + ring.head, first_size),
        span<T>(slots, ring.size - first_size),
    };
}

/// Constructs a new object behind the last live one.
/// Precondition: ring.size < capacity.
template <class T, class... Args>
constexpr T& ring_emplace_back(T* slots, isize capacity, ring_state& ring, Args&&... args)
{
    TD_ASSERT(ring.size < capacity, "ring is full");
    auto const p = new (td::placement_new, ring_slot(slots, capacity, ring, ring.size)) T(td::forward<Args>(args)...);
    ring.size++; // _after_ so exceptions in T(...) leave the state valid
    return *p;
}

/// Constructs a new object in front of the first live one.
/// Precondition: ring.size < capacity.
template <class T, class... Args>
constexpr T& ring_emplace_front(T* slots, isize capacity, ring_state& ring, Args&&... args)
{
    TD_ASSERT(ring.size < capacity, "ring is full");
    auto const new_head = td::wrapped_decrement(ring.head, capacity);
    auto const p = new (td::placement_new, slots + new_head) T(td::forward<Args>(args)...);
    ring.head = new_head; // _after_ so exceptions in T(...) leave the state valid
    ring.size++;
    return *p;
}

/// Destroys the first live object.
/// Precondition: ring.size > 0.
template <class T>
constexpr void ring_remove_front(T* slots, isize capacity, ring_state& ring)
{
    TD_ASSERT(ring.size > 0, "ring is empty");
    auto const p = slots + ring.head;
    ring.head = td::wrapped_increment(ring.head, capacity);
    ring.size--;
    p->~T();
}

/// Destroys the last live object.
/// Precondition: ring.size > 0.
template <class T>
constexpr void ring_remove_back(T* slots, isize capacity, ring_state& ring)
{
    TD_ASSERT(ring.size > 0, "ring is empty");
    auto const p = ring_slot(slots, capacity, ring, ring.size - 1);
    ring.size--;
    p->~T();
}

/// Moves out and destroys the first live object.
/// Precondition: ring.size > 0.
template <class T>
[[nodiscard]] constexpr T ring_pop_front(T* slots, isize capacity, ring_state& ring)
{
    TD_ASSERT(ring.size > 0, "ring is empty");
    T result = td::move(slots[ring.head]);
    ring_remove_front(slots, capacity, ring);
    return result;
}

/// Moves out and destroys the last live object.
/// Precondition: ring.size > 0.
template <class T>
[[nodiscard]] constexpr T ring_pop_back(T* slots, isize capacity, ring_state& ring)
{
    TD_ASSERT(ring.size > 0, "ring is empty");
    T result = td::move(*ring_slot(slots, capacity, ring, ring.size - 1));
    ring_remove_back(slots, capacity, ring);
    return result;
}

/// Destroys live objects from the back until ring.size <= new_size.
/// Objects are destroyed back to front, like a vector's clear.
template <class T>
constexpr void ring_truncate(T* slots, isize capacity, ring_state& ring, isize new_size)
{
    TD_ASSERT(new_size >= 0, "truncate size must be non-negative");
    if (new_size >= ring.size)
        return;

    if constexpr (std::is_trivially_destructible_v<T>)
    {
        ring.size = new_size;
    }
    else
    {
        while (ring.size > new_size)
            ring_remove_back(slots, capacity, ring);
    }

    if (ring.size == 0)
        ring.head = 0;
}

/// Copy-constructs all live objects, in logical order, into uninitialized memory at dest_end.
/// dest_end is advanced past every constructed object (also when a copy throws).
template <class T>
constexpr void ring_copy_linearized_to(T*& dest_end, T const* slots, isize capacity, ring_state const& ring)
{
    auto const segments = ring_get_segments(slots, capacity, ring);
    impl::copy_create_objects_to(dest_end, segments.first.begin(), segments.first.end());
    impl::copy_create_objects_to(dest_end, segments.second.begin(), segments.second.end());
}

/// Relocates all live objects, in logical order, into uninitialized memory at dest_end.
/// The originals are destroyed and the ring is left empty (head == 0).
/// dest must not overlap the ring's slots.
template <class T>
constexpr void ring_move_linearized_to(T*& dest_end, T* slots, isize capacity, ring_state& ring)
{
    auto const segments = ring_get_segments(slots, capacity, ring);
    impl::move_create_objects_to(dest_end, segments.first.begin(), segments.first.end());
    impl::move_create_objects_to(dest_end, segments.second.begin(), segments.second.end());

    impl::destroy_objects_in_reverse(segments.second.begin(), segments.second.end());
    impl::destroy_objects_in_reverse(segments.first.begin(), segments.first.end());
    ring = {};
}
} // namespace td::impl
