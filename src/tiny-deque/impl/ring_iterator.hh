#pragma once

#include <tiny-deque/fwd.hh>
#include <tiny-deque/impl/ring_ops.hh>

#include <compare>
#include <iterator>
#include <type_traits>

namespace td::impl
{
/// Random-access iterator over the live elements of a ring, front to back.
/// Holds a snapshot of the ring (slots, capacity, head, size) plus a logical position,
/// so it is invalidated by any operation that changes the deque's head or storage.
/// ring_iterator<T const> is the const_iterator; non-const iterators convert to it.
template <class T>
struct ring_iterator
{
    using iterator_category = std::random_access_iterator_tag;
    using iterator_concept = std::random_access_iterator_tag;
    using value_type = std::remove_const_t<T>;
    using difference_type = isize;
    using pointer = T*;
    using reference = T&;

    constexpr ring_iterator() = default;
    constexpr ring_iterator(T* slots, isize capacity, ring_state ring, isize index)
      : _slots(slots), _capacity(capacity), _ring(ring), _index(index)
    {
    }

    template <class U>
        requires(std::is_same_v<U const, T> && !std::is_same_v<U, T>)
    constexpr ring_iterator(ring_iterator<U> const& rhs) // NOLINT
      : _slots(rhs.impl_slots()), _capacity(rhs.impl_capacity()), _ring(rhs.impl_ring()), _index(rhs.index())
    {
    }

    // access
public:
    [[nodiscard]] constexpr T& operator*() const
    {
        TD_ASSERT(0 <= _index && _index < _ring.size, "dereferencing an iterator outside the live range");
        return *ring_slot(_slots, _capacity, _ring, _index);
    }
    [[nodiscard]] constexpr T* operator->() const { return &**this; }
    [[nodiscard]] constexpr T& operator[](isize offset) const { return *(*this + offset); }

    /// logical index of the referenced element (0 is the front)
    [[nodiscard]] constexpr isize index() const { return _index; }

    // movement
public:
    constexpr ring_iterator& operator++()
    {
        ++_index;
        return *this;
    }
    constexpr ring_iterator operator++(int)
    {
        auto r = *this;
        ++_index;
        return r;
    }
    constexpr ring_iterator& operator--()
    {
        --_index;
        return *this;
    }
    constexpr ring_iterator operator--(int)
    {
        auto r = *this;
        --_index;
        return r;
    }
    constexpr ring_iterator& operator+=(isize offset)
    {
        _index += offset;
        return *this;
    }
    constexpr ring_iterator& operator-=(isize offset)
    {
        _index -= offset;
        return *this;
    }

    [[nodiscard]] friend constexpr ring_iterator operator+(ring_iterator it, isize offset) { return it += offset; }
    [[nodiscard]] friend constexpr ring_iterator operator+(isize offset, ring_iterator it) { return it += offset; }
    [[nodiscard]] friend constexpr ring_iterator operator-(ring_iterator it, isize offset) { return it -= offset; }
    [[nodiscard]] friend constexpr isize operator-(ring_iterator const& lhs, ring_iterator const& rhs)
    {
        return lhs._index - rhs._index;
    }

    // comparison (only meaningful for iterators of the same deque)
public:
    [[nodiscard]] friend constexpr bool operator==(ring_iterator const& lhs, ring_iterator const& rhs)
    {
        return lhs._index == rhs._index;
    }
    [[nodiscard]] friend constexpr std::strong_ordering operator<=>(ring_iterator const& lhs, ring_iterator const& rhs)
    {
        return lhs._index <=> rhs._index;
    }

    // used by the const conversion
public:
    [[nodiscard]] constexpr T* impl_slots() const { return _slots; }
    [[nodiscard]] constexpr isize impl_capacity() const { return _capacity; }
    [[nodiscard]] constexpr ring_state impl_ring() const { return _ring; }

private:
    T* _slots = nullptr;
    isize _capacity = 0;
    ring_state _ring;
    isize _index = 0;
};
} // namespace td::impl
