#pragma once

#include <tiny-deque/macros.hh>

#include <tiny-deque/impl/ring_container.hh>

#include <limits>

#if TD_HAS_ALLOCATION
#include <tiny-deque/allocation.hh>
#endif

/// Which buffer a tiny_deque currently uses.
/// A deque starts inline and switches to heap storage at most once per lifetime.
enum class td::deque_storage : td::u8
{
    inline_storage,
    heap_storage,
};

/// Double-ended queue that keeps up to N elements inline and moves to the heap when it outgrows them.
///
/// Storage is a tagged union: either N inline slots or a td::allocation<T> heap block.
/// - Inline, with room: behaves exactly like td::array_deque<T, N>, no allocation.
/// - Inline and full, on push: migrates. A heap block of max(2N, N+1) slots is allocated,
///   the new element is constructed there, all elements move over in logical order starting at slot 0,
///   and the inline originals are destroyed.
/// - Heap and full, on push: grows to max(2 * capacity, capacity + 1) slots the same way.
/// - Popping never shrinks storage and never returns to inline.
///
/// Heap blocks come from the memory resource passed at construction (nullptr = td::default_memory_resource).
/// Allocation failure is fatal.
///
/// Without allocation support (TD_HAS_ALLOCATION == 0), the deque is inline-only and rejects
/// pushes beyond N exactly like td::array_deque.
///
/// Usage:
///   td::tiny_deque<int, 2> d;
///   d.push_back(1);
///   d.push_back(2); // still inline
///   d.push_back(3); // migrates, d.capacity() == 4
///   d.pop_front();  // 1, stays on the heap
template <class T, td::isize N>
struct td::tiny_deque : private td::impl::ring_container<T, tiny_deque<T, N>>
{
    static_assert(N > 0, "tiny_deque needs at least one inline slot");

    using base = td::impl::ring_container<T, tiny_deque<T, N>>;
    friend base;

    using iterator = typename base::iterator;
    using const_iterator = typename base::const_iterator;

    static constexpr bool is_growable = TD_HAS_ALLOCATION;
    static constexpr isize inline_capacity = N;

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
    using base::empty;
    using base::full; // next push migrates or grows
    using base::is_contiguous;
    using base::size;

    [[nodiscard]] constexpr deque_storage storage() const { return _storage; }
    [[nodiscard]] constexpr bool is_inline() const { return _storage == deque_storage::inline_storage; }
    [[nodiscard]] constexpr bool is_heap() const { return _storage == deque_storage::heap_storage; }

    /// N while inline, the heap slot count afterwards. Never decreases except through assignment.
    [[nodiscard]] constexpr isize capacity() const { return impl_capacity(); }

#if TD_HAS_ALLOCATION
    /// Resource used for heap storage, nullptr means td::default_memory_resource.
    [[nodiscard]] memory_resource const* resource() const { return _resource; }
#endif

    // factories
public:
#if TD_HAS_ALLOCATION
    /// Creates an empty deque that can hold `capacity` elements without further allocation.
    /// Starts on the heap iff capacity > N.
    [[nodiscard]] static tiny_deque create_with_capacity(isize capacity, memory_resource const* resource = nullptr)
    {
        tiny_deque d(resource);
        d.reserve(capacity);
        return d;
    }

    /// Creates a deque holding copies of values, front to back.
    [[nodiscard]] static tiny_deque create_copy_of(span<T const> values, memory_resource const* resource = nullptr)
    {
        auto d = create_with_capacity(values.size(), resource);
        d.push_back_range(values);
        return d;
    }
#else
    /// Creates a deque holding copies of values, front to back.
    /// Precondition: values.size() <= N.
    [[nodiscard]] static tiny_deque create_copy_of(span<T const> values)
    {
        TD_ASSERT(values.size() <= N, "too many values for an inline-only tiny_deque");
        tiny_deque d;
        d.push_back_range(values);
        return d;
    }
#endif

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

    // capacity
public:
#if TD_HAS_ALLOCATION
    /// Ensures room for `capacity` elements without further allocation.
    /// Migrates to the heap if capacity > N while inline, otherwise reallocates to exactly `capacity` slots.
    /// Invalidates references and iterators if it reallocates.
    void reserve(isize capacity)
    {
        TD_ASSERT(capacity >= 0, "capacity must be non-negative");
        if (capacity <= impl_capacity())
            return;

        auto const size = this->_ring.size;
        impl_relocate_to(allocation<T>::create_slots(capacity, _resource));
        this->_ring = {0, size};
    }
#endif

    // lifecycle
public:
    tiny_deque() {} // NOLINT: slots stay uninitialized

#if TD_HAS_ALLOCATION
    explicit tiny_deque(memory_resource const* resource) : _resource(resource) {}
#endif

    /// Deep copy with the same memory resource.
    /// The copy is inline if the elements fit, otherwise on a heap block of exactly size() slots.
    tiny_deque(tiny_deque const& rhs)
        requires std::is_copy_constructible_v<T>
    {
#if TD_HAS_ALLOCATION
        _resource = rhs._resource;
        if (rhs.size() > N)
            impl_relocate_to(allocation<T>::create_slots(rhs.size(), _resource));
#endif
        auto obj_end = impl_slots();
        try
        {
            impl::ring_copy_linearized_to(obj_end, rhs.impl_slots(), rhs.impl_capacity(), rhs._ring);
        }
        catch (...)
        {
            // no destructor runs for a throwing constructor
            impl::destroy_objects_in_reverse(impl_slots(), obj_end);
            impl_destroy();
            throw;
        }
        this->_ring = {0, rhs.size()};
    }

    /// Takes over rhs' heap block, or moves its inline elements.
    /// rhs is left as an empty inline deque.
    tiny_deque(tiny_deque&& rhs) noexcept { impl_take(rhs); }

    /// Copies rhs' elements, keeping this deque's memory resource and storage.
    tiny_deque& operator=(tiny_deque const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            // rhs might be owned by one of our elements
            auto tmp = rhs;
            clear();
#if TD_HAS_ALLOCATION
            reserve(tmp.size());
#endif
            for (auto& v : tmp)
                this->emplace_back(td::move(v));
        }
        return *this;
    }

    /// Replaces contents and storage with rhs'; rhs is left as an empty inline deque.
    tiny_deque& operator=(tiny_deque&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto tmp = td::move(rhs);
            impl_destroy();
            impl_take(tmp);
        }
        return *this;
    }

    ~tiny_deque() { impl_destroy(); }

    // ring storage hooks
private:
#if TD_HAS_ALLOCATION
    [[nodiscard]] constexpr T* impl_slots() { return is_heap() ? _heap.slots : _inline; }
    [[nodiscard]] constexpr T const* impl_slots() const { return is_heap() ? _heap.slots : _inline; }
    [[nodiscard]] constexpr isize impl_capacity() const { return is_heap() ? _heap.capacity : N; }
#else
    [[nodiscard]] constexpr T* impl_slots() { return _inline; }
    [[nodiscard]] constexpr T const* impl_slots() const { return _inline; }
    [[nodiscard]] constexpr isize impl_capacity() const { return N; }
#endif

    // growth
private:
#if TD_HAS_ALLOCATION
    [[nodiscard]] static constexpr isize impl_grown_capacity(isize capacity)
    {
        TD_ASSERT_ALWAYS(capacity <= std::numeric_limits<isize>::max() / 2, "deque capacity overflow");
        return td::max(2 * capacity, capacity + 1);
    }

    // the new element is constructed before any existing element moves,
    // so args may reference elements of this deque
    template <class... Args>
    TD_COLD_FUNC T& impl_grow_and_emplace_back(Args&&... args)
    {
        auto new_heap = allocation<T>::create_slots(impl_grown_capacity(impl_capacity()), _resource);
        auto const size = this->_ring.size;

        auto& obj = *new (td::placement_new, new_heap.slots + size) T(td::forward<Args>(args)...);

        impl_relocate_to(td::move(new_heap));
        this->_ring = {0, size + 1};
        return obj;
    }

    template <class... Args>
    TD_COLD_FUNC T& impl_grow_and_emplace_front(Args&&... args)
    {
        auto new_heap = allocation<T>::create_slots(impl_grown_capacity(impl_capacity()), _resource);
        auto const size = this->_ring.size;
        auto const new_head = new_heap.capacity - 1;

        // linearized elements occupy [0, size), the new front wraps around to the last slot
        auto& obj = *new (td::placement_new, new_heap.slots + new_head) T(td::forward<Args>(args)...);

        impl_relocate_to(td::move(new_heap));
        this->_ring = {new_head, size + 1};
        return obj;
    }

    // moves all live elements to [0, size) of new_heap, destroys the originals and adopts new_heap
    // the previous heap block (if any) is released, the ring is left empty for the caller to set
    void impl_relocate_to(allocation<T> new_heap)
    {
        TD_ASSERT(new_heap.capacity >= this->_ring.size, "relocation target too small");

        auto obj_end = new_heap.slots;
        impl::ring_move_linearized_to(obj_end, impl_slots(), impl_capacity(), this->_ring);

        if (is_heap())
        {
            _heap = td::move(new_heap);
        }
        else
        {
            new (td::placement_new, &_heap) allocation<T>(td::move(new_heap));
            _storage = deque_storage::heap_storage;
        }
    }
#endif

    // lifecycle helpers
private:
    // destroys all elements, releases the heap block and leaves an empty inline deque
    void impl_destroy()
    {
        clear();
#if TD_HAS_ALLOCATION
        if (is_heap())
        {
            _heap.~allocation();
            _storage = deque_storage::inline_storage;
        }
#endif
        this->_ring = {};
    }

    // precondition: this is an empty inline deque
    void impl_take(tiny_deque& rhs)
    {
        TD_ASSERT(this->empty() && is_inline(), "can only take over into an empty inline deque");

#if TD_HAS_ALLOCATION
        _resource = rhs._resource;
        if (rhs.is_heap())
        {
            new (td::placement_new, &_heap) allocation<T>(td::move(rhs._heap));
            _storage = deque_storage::heap_storage;
            this->_ring = td::exchange(rhs._ring, impl::ring_state{});
            rhs.impl_destroy();
            return;
        }
#endif

        auto obj_end = impl_slots();
        impl::ring_move_linearized_to(obj_end, rhs.impl_slots(), rhs.impl_capacity(), rhs._ring);
        this->_ring = {0, isize(obj_end - impl_slots())};
    }

    union
    {
        T _inline[N];
#if TD_HAS_ALLOCATION
        allocation<T> _heap;
#endif
    };
    deque_storage _storage = deque_storage::inline_storage;
#if TD_HAS_ALLOCATION
    memory_resource const* _resource = nullptr;
#endif
};
