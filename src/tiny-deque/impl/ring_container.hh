#pragma once

#include <tiny-deque/deque_error.hh>
#include <tiny-deque/impl/ring_iterator.hh>
#include <tiny-deque/impl/ring_ops.hh>
#include <tiny-deque/result.hh>


/// Mixin implementing the common "double-ended queue over a ring of slots" surface area.
///
/// This is a CRTP-style helper: concrete deques privately inherit it as
/// `td::impl::ring_container<T, Derived>`, befriend it, and re-expose members via `using`.
/// Example (abridged):
///
///     template <class T, isize N>
///     struct td::array_deque : private td::impl::ring_container<T, array_deque<T, N>> {
///         using base = td::impl::ring_container<T, array_deque<T, N>>;
///         friend base;
///         using base::push_back;
///         using base::pop_front;
///         // ... storage, capacity and lifecycle ...
///     };
///
/// The mixin owns the ring state {head, size}. The concrete deque owns the slots and provides:
///
///     T* impl_slots();  T const* impl_slots() const;   // first slot of the active buffer
///     isize impl_capacity() const;                     // slot count of the active buffer
///     static constexpr bool is_growable;               // can a full deque make room?
///
/// and, if is_growable:
///
///     T& impl_grow_and_emplace_back(Args&&...);         // called when full
///     T& impl_grow_and_emplace_front(Args&&...);
///
/// Pushing on a full non-growable deque is a contract violation for push_* and an expected failure
/// (deque_error::capacity_exceeded) for try_push_*. Popping an empty deque likewise asserts for pop_*
/// and fails with deque_error::empty_deque for try_pop_*.
///
/// === Exception & reference guarantees ===
///
/// Element construction failures leave size, head, and live objects unchanged.
/// Any growth invalidates pointers, references, and iterators; without growth, push/pop at one end
/// never moves live objects.
/// Constructing from existing elements (e.g. `push_back(d[0])`) is safe, also during growth.
namespace td::impl
{
template <class T, class ContainerT>
struct ring_container
{
    using container_t = ContainerT;
    using iterator = ring_iterator<T>;
    using const_iterator = ring_iterator<T const>;

    // element access
public:
    /// Returns a reference to the element at logical index i (0 is the front).
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        TD_ASSERT(0 <= i && i < _ring.size, "index out of bounds");
        return *impl_slot(i);
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        TD_ASSERT(0 <= i && i < _ring.size, "index out of bounds");
        return *impl_slot(i);
    }

    /// Returns a pointer to the element at logical index i,
    /// or deque_error::index_out_of_bounds unless 0 <= i < size().
    [[nodiscard]] constexpr result<T*, deque_error> get(isize i)
    {
        if (i < 0 || i >= _ring.size)
            return td::error(deque_error::index_out_of_bounds);
        return impl_slot(i);
    }
    [[nodiscard]] constexpr result<T const*, deque_error> get(isize i) const
    {
        if (i < 0 || i >= _ring.size)
            return td::error(deque_error::index_out_of_bounds);
        return impl_slot(i);
    }

    /// Returns a reference to the first element.
    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front()
    {
        TD_ASSERT(_ring.size > 0, "deque is empty");
        return *impl_slot(0);
    }
    [[nodiscard]] constexpr T const& front() const
    {
        TD_ASSERT(_ring.size > 0, "deque is empty");
        return *impl_slot(0);
    }

    /// Returns a reference to the last element.
    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back()
    {
        TD_ASSERT(_ring.size > 0, "deque is empty");
        return *impl_slot(_ring.size - 1);
    }
    [[nodiscard]] constexpr T const& back() const
    {
        TD_ASSERT(_ring.size > 0, "deque is empty");
        return *impl_slot(_ring.size - 1);
    }

    /// Returns the live elements as (at most) two contiguous spans in logical order.
    /// segments().second is empty iff is_contiguous().
    [[nodiscard]] constexpr deque_segments<T> segments()
    {
        return impl::ring_get_segments(derived().impl_slots(), derived().impl_capacity(), _ring);
    }
    [[nodiscard]] constexpr deque_segments<T const> segments() const
    {
        return impl::ring_get_segments(derived().impl_slots(), derived().impl_capacity(), _ring);
    }

    // iterators
public:
    /// Random-access iterators, front to back.
    /// Enables range-based for loops.
    [[nodiscard]] constexpr iterator begin() { return {derived().impl_slots(), derived().impl_capacity(), _ring, 0}; }
    [[nodiscard]] constexpr iterator end()
    {
        return {derived().impl_slots(), derived().impl_capacity(), _ring, _ring.size};
    }
    [[nodiscard]] constexpr const_iterator begin() const
    {
        return {derived().impl_slots(), derived().impl_capacity(), _ring, 0};
    }
    [[nodiscard]] constexpr const_iterator end() const
    {
        return {derived().impl_slots(), derived().impl_capacity(), _ring, _ring.size};
    }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _ring.size; }
    [[nodiscard]] constexpr bool empty() const { return _ring.size == 0; }

    /// True if every slot of the active buffer holds a live element.
    /// For growable deques, the next push will reallocate.
    [[nodiscard]] constexpr bool full() const { return _ring.size == derived().impl_capacity(); }

    /// True if the live elements occupy one contiguous run of slots (no wrap-around).
    [[nodiscard]] constexpr bool is_contiguous() const
    {
        return impl::ring_is_contiguous(derived().impl_capacity(), _ring);
    }

    // insertion
public:
    /// Constructs an element at the back and returns a reference to it.
    /// Non-growable deques must not be full.
    /// O(1), amortized O(1) if the deque grows.
    template <class... Args>
    constexpr T& emplace_back(Args&&... args)
    {
        static_assert(requires { T(td::forward<Args>(args)...); },
                      "emplace_back: T is not constructible from the provided argument types");

        if constexpr (container_t::is_growable)
        {
            if (full()) [[unlikely]]
                return derived().impl_grow_and_emplace_back(td::forward<Args>(args)...);
        }

        TD_ASSERT(!full(), "cannot push into a full deque");
        return impl::ring_emplace_back(derived().impl_slots(), derived().impl_capacity(), _ring,
                                       td::forward<Args>(args)...);
    }

    /// Constructs an element at the front and returns a reference to it.
    /// Same guarantees as emplace_back.
    template <class... Args>
    constexpr T& emplace_front(Args&&... args)
    {
        static_assert(requires { T(td::forward<Args>(args)...); },
                      "emplace_front: T is not constructible from the provided argument types");

        if constexpr (container_t::is_growable)
        {
            if (full()) [[unlikely]]
                return derived().impl_grow_and_emplace_front(td::forward<Args>(args)...);
        }

        TD_ASSERT(!full(), "cannot push into a full deque");
        return impl::ring_emplace_front(derived().impl_slots(), derived().impl_capacity(), _ring,
                                        td::forward<Args>(args)...);
    }

    constexpr T& push_back(T const& value) { return emplace_back(value); }
    constexpr T& push_back(T&& value) { return emplace_back(td::move(value)); }
    constexpr T& push_front(T const& value) { return emplace_front(value); }
    constexpr T& push_front(T&& value) { return emplace_front(td::move(value)); }

    /// Like emplace_back, but a full non-growable deque is an expected failure:
    /// returns deque_error::capacity_exceeded and leaves the deque and args untouched.
    /// Growable deques always succeed.
    template <class... Args>
    [[nodiscard]] constexpr result<void, deque_error> try_emplace_back(Args&&... args)
    {
        if constexpr (!container_t::is_growable)
        {
            if (full())
                return td::error(deque_error::capacity_exceeded);
        }
        emplace_back(td::forward<Args>(args)...);
        return td::success;
    }

    /// Front counterpart of try_emplace_back.
    template <class... Args>
    [[nodiscard]] constexpr result<void, deque_error> try_emplace_front(Args&&... args)
    {
        if constexpr (!container_t::is_growable)
        {
            if (full())
                return td::error(deque_error::capacity_exceeded);
        }
        emplace_front(td::forward<Args>(args)...);
        return td::success;
    }

    [[nodiscard]] constexpr result<void, deque_error> try_push_back(T const& value) { return try_emplace_back(value); }
    [[nodiscard]] constexpr result<void, deque_error> try_push_back(T&& value)
    {
        return try_emplace_back(td::move(value));
    }
    [[nodiscard]] constexpr result<void, deque_error> try_push_front(T const& value)
    {
        return try_emplace_front(value);
    }
    [[nodiscard]] constexpr result<void, deque_error> try_push_front(T&& value)
    {
        return try_emplace_front(td::move(value));
    }

    /// Appends copies of all values, in order.
    /// Non-growable deques must have room for all of them.
    /// values must not alias this deque's elements.
    constexpr void push_back_range(span<T const> values)
    {
        if constexpr (!container_t::is_growable)
            TD_ASSERT(values.size() <= derived().impl_capacity() - _ring.size, "range does not fit into the deque");

        for (auto const& v : values)
            emplace_back(v);
    }

    // removal
public:
    /// Removes and returns the first element by move.
    /// Precondition: !empty().
    /// NOTE: Prefer remove_front() if you don't need the return value (avoids an extra move).
    [[nodiscard("use remove_front() if you don't need the return value")]] constexpr T pop_front()
    {
        TD_ASSERT(_ring.size > 0, "cannot pop from empty deque");
        return impl::ring_pop_front(derived().impl_slots(), derived().impl_capacity(), _ring);
    }

    /// Removes and returns the last element by move.
    /// Precondition: !empty().
    /// NOTE: Prefer remove_back() if you don't need the return value (avoids an extra move).
    [[nodiscard("use remove_back() if you don't need the return value")]] constexpr T pop_back()
    {
        TD_ASSERT(_ring.size > 0, "cannot pop from empty deque");
        return impl::ring_pop_back(derived().impl_slots(), derived().impl_capacity(), _ring);
    }

    /// Removes and returns the first element, or deque_error::empty_deque.
    [[nodiscard]] constexpr result<T, deque_error> try_pop_front()
    {
        if (_ring.size == 0)
            return td::error(deque_error::empty_deque);
        return impl::ring_pop_front(derived().impl_slots(), derived().impl_capacity(), _ring);
    }

    /// Removes and returns the last element, or deque_error::empty_deque.
    [[nodiscard]] constexpr result<T, deque_error> try_pop_back()
    {
        if (_ring.size == 0)
            return td::error(deque_error::empty_deque);
        return impl::ring_pop_back(derived().impl_slots(), derived().impl_capacity(), _ring);
    }

    /// Destroys the first element.
    /// Precondition: !empty().
    constexpr void remove_front()
    {
        TD_ASSERT(_ring.size > 0, "cannot remove from empty deque");
        impl::ring_remove_front(derived().impl_slots(), derived().impl_capacity(), _ring);
    }

    /// Destroys the last element.
    /// Precondition: !empty().
    constexpr void remove_back()
    {
        TD_ASSERT(_ring.size > 0, "cannot remove from empty deque");
        impl::ring_remove_back(derived().impl_slots(), derived().impl_capacity(), _ring);
    }

    /// Destroys elements from the back until size() <= new_size.
    /// No-op if new_size >= size(). Never releases storage.
    constexpr void truncate(isize new_size)
    {
        impl::ring_truncate(derived().impl_slots(), derived().impl_capacity(), _ring, new_size);
    }

    /// Destroys all elements. Never releases storage.
    constexpr void clear() { truncate(0); }

    // comparison
public:
    /// Same size and pairwise equal elements in logical order.
    /// Storage (head position, inline or heap) does not participate.
    [[nodiscard]] friend constexpr bool operator==(container_t const& lhs, container_t const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.size() != rhs.size())
            return false;

        auto it_r = rhs.begin();
        for (auto const& v : lhs)
        {
            if (!bool(v == *it_r))
                return false;
            ++it_r;
        }
        return true;
    }

    // helpers for the concrete deques
protected:
    [[nodiscard]] constexpr container_t& derived() { return static_cast<container_t&>(*this); }
    [[nodiscard]] constexpr container_t const& derived() const { return static_cast<container_t const&>(*this); }

    [[nodiscard]] constexpr T* impl_slot(isize i)
    {
        return impl::ring_slot(derived().impl_slots(), derived().impl_capacity(), _ring, i);
    }
    [[nodiscard]] constexpr T const* impl_slot(isize i) const
    {
        return impl::ring_slot(derived().impl_slots(), derived().impl_capacity(), _ring, i);
    }

    ring_state _ring;
};
} // namespace td::impl
