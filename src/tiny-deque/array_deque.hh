#pragma once

#include <tiny-deque/impl/ring_container.hh>


/// Double-ended queue over a ring buffer of N inline slots.
/// Never allocates: all elements live inside the object.
/// push_* on a full deque is a contract violation, try_push_* reports deque_error::capacity_exceeded.
/// Slots outside the live window hold no objects, so T does not need to be default constructible.
///
/// Usage:
///   td::array_deque<int, 3> d;
///   d.push_back(1);
///   d.push_front(0);
///   if (d.try_push_back(2).has_error()) ...
///   int x = d.pop_front(); // 0
template <class T, td::isize N>
struct td::array_deque : private td::impl::ring_container<T, array_deque<T, N>>
{
    static_assert(N > 0, "array_deque needs at least one slot");

    using base = td::impl::ring_container<T, array_deque<T, N>>;
    friend base;

    using iterator = typename base::iterator;
    using const_iterator = typename base::const_iterator;

    static constexpr bool is_growable = false;

    // element access
public:
    using base::operator[]; // access element by logical index
    using base::back;       // access last element
    using base::front;      // access first element
    using base::get;        // checked access, index_out_of_bounds on failure
    using base::segments;   // live elements as two spans

    // iterators
public:
    using base::begin;
    using base::end;

    // queries
public:
    using base::empty;         // check if deque is empty
    using base::full;          // check if size() == N
    using base::is_contiguous; // check if live elements do not wrap
    using base::size;          // get number of elements

    [[nodiscard]] static constexpr isize capacity() { return N; }

    // factories
public:
    /// Creates a deque holding copies of values, front to back.
    /// Precondition: values.size() <= N.
    [[nodiscard]] static array_deque create_copy_of(span<T const> values)
    {
        TD_ASSERT(values.size() <= N, "too many values for array_deque");
        array_deque d;
        d.push_back_range(values);
        return d;
    }

    // insertion
public:
    using base::emplace_back;
    using base::emplace_front;
    using base::push_back;
    using base::push_back_range;
    using base::push_front;
    using base::try_emplace_back;
    using base::try_emplace_front;
    using base::try_push_back;
    using base::try_push_front;

    // removal
public:
    using base::clear;
    using base::pop_back;
    using base::pop_front;
    using base::remove_back;
    using base::remove_front;
    using base::truncate;
    using base::try_pop_back;
    using base::try_pop_front;

    // lifecycle
public:
    array_deque() {} // NOLINT: slots stay uninitialized

    /// Deep copy; the copy starts at slot 0.
    array_deque(array_deque const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        auto obj_end = impl_slots();
        try
        {
            impl::ring_copy_linearized_to(obj_end, rhs.impl_slots(), N, rhs._ring);
        }
        catch (...)
        {
            // no destructor runs for a throwing constructor
            impl::destroy_objects_in_reverse(impl_slots(), obj_end);
            throw;
        }
        this->_ring = {0, rhs._ring.size};
    }

    /// Moves all elements over; rhs is left empty.
    array_deque(array_deque&& rhs) noexcept
    {
        auto obj_end = impl_slots();
        impl::ring_move_linearized_to(obj_end, rhs.impl_slots(), N, rhs._ring);
        this->_ring = {0, isize(obj_end - impl_slots())};
    }

    array_deque& operator=(array_deque const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            // rhs might be owned by one of our elements
            auto tmp = rhs;
            *this = td::move(tmp);
        }
        return *this;
    }

    array_deque& operator=(array_deque&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto tmp = td::move(rhs);
            clear();
            auto obj_end = impl_slots();
            impl::ring_move_linearized_to(obj_end, tmp.impl_slots(), N, tmp._ring);
            this->_ring = {0, isize(obj_end - impl_slots())};
        }
        return *this;
    }

    ~array_deque() { clear(); }

    // ring storage hooks
private:
    [[nodiscard]] constexpr T* impl_slots() { return _slots; }
    [[nodiscard]] constexpr T const* impl_slots() const { return _slots; }
    [[nodiscard]] static constexpr isize impl_capacity() { return N; }

    union
    {
        T _slots[N];
    };
};
