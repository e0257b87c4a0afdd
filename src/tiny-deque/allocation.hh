#pragma once

#include <tiny-deque/macros.hh>

#if !TD_HAS_ALLOCATION
#error "td::allocation requires allocation support (configure with TINY_DEQUE_ENABLE_ALLOCATION=ON)"
#endif

#include <tiny-deque/assert.hh>
#include <tiny-deque/fwd.hh>
#include <tiny-deque/utility.hh>

#include <limits>

// td::allocation<T> is the owning handle for the heap slot block of a tiny_deque.
//
// Memory is obtained from a polymorphic td::memory_resource (POD, function-pointer based, static-init safe).
// The resource pointer is stored *in the allocation*, not as a template argument. A null resource
// means "use td::default_memory_resource". This avoids allocator-typed deque variants.
//
// Unlike contiguous containers, a ring buffer's live objects can wrap around the end of the block,
// so the allocation only owns the *bytes*: which slots hold live objects is tracked by the ring state
// of the owning deque, and the owner must destroy them before the allocation releases its block.
//
// Core invariants:
// - [slots, slots + capacity) is the owned slot range; capacity == 0 iff slots == nullptr.
// - slots is aligned to alignment, which is at least alignof(T).
// - custom_resource == nullptr implies use of td::default_memory_resource.

namespace td
{
/// Default memory resource used when allocation::custom_resource == nullptr.
/// This is a system allocator stored in the data segment, making the pointer valid even during
/// static initialization in other translation units.
extern td::memory_resource const* const default_memory_resource;
} // namespace td

/// Polymorphic memory resource interface powering td::allocation<T>.
/// Custom allocators implement this interface to provide pluggable allocation strategies.
/// This is a POD struct using function pointers to avoid virtual dispatch and non-trivial constructors.
struct td::memory_resource
{
    /// Allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size, which will be in [min_bytes, max_bytes].
    /// The allocated pointer is stored in `*out_ptr`.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// min_bytes > 0 always sets *out_ptr to non-null; failure is fatal (assert/terminate).
    td::function_ptr<isize(td::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> allocate_bytes
        = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    /// `p` must be the exact pointer returned by allocate_bytes.
    td::function_ptr<void(td::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

/// Owning handle for a block of uninitialized slots of type T.
/// Move-only; the moved-from handle is empty but keeps its resource.
template <class T>
struct td::allocation
{
    /// First slot of the block, nullptr for an empty allocation.
    T* slots = nullptr;

    /// Number of whole T slots in the block.
    isize capacity = 0;

    /// Number of bytes actually handed out by the resource (may exceed capacity * sizeof(T)).
    isize size_bytes = 0;

    /// Alignment used for allocate/deallocate of the block.
    isize alignment = 0;

    /// Memory resource that owns the block, or nullptr for the global default.
    td::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    /// Returns the effective resource to use for allocation operations.
    [[nodiscard]] td::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// True iff this owns a block (capacity > 0).
    [[nodiscard]] bool is_valid() const { return slots != nullptr; }

    // factories
public:
    /// Allocates a block of exactly `capacity` uninitialized slots from `resource`.
    /// capacity == 0 results in an empty allocation with no real allocation call.
    /// Allocation failure is fatal inside the resource.
    [[nodiscard]] static allocation create_slots(isize capacity, memory_resource const* resource)
    {
        TD_ASSERT(capacity >= 0, "slot count must be non-negative");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignof(T);

        if (capacity == 0)
            return result;

        TD_ASSERT_ALWAYS(capacity <= std::numeric_limits<isize>::max() / isize(sizeof(T)), "allocation size overflow");

        auto const& res = result.resource();
        auto const bytes = capacity * isize(sizeof(T));

        byte* p = nullptr;
        result.size_bytes = res.allocate_bytes(&p, bytes, bytes, result.alignment, res.userdata);
        TD_ASSERT(p != nullptr && result.size_bytes >= bytes, "memory resource violated its allocate_bytes contract");

        result.slots = reinterpret_cast<T*>(p);
        result.capacity = result.size_bytes / isize(sizeof(T));
        return result;
    }

    // lifecycle
public:
    allocation() = default;

    // no implicit copies for allocations
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : slots(td::exchange(rhs.slots, nullptr)),
        capacity(td::exchange(rhs.capacity, 0)),
        size_bytes(td::exchange(rhs.size_bytes, 0)),
        alignment(td::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = td::move(rhs);
            impl_release();

            slots = td::exchange(rhs_tmp.slots, nullptr);
            capacity = td::exchange(rhs_tmp.capacity, 0);
            size_bytes = td::exchange(rhs_tmp.size_bytes, 0);
            alignment = td::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource;
        }
        return *this;
    }

    /// Returns the block to its resource. Does NOT run destructors of slots.
    ~allocation() { impl_release(); }

private:
    void impl_release()
    {
        if (slots != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(reinterpret_cast<byte*>(slots), size_bytes, alignment, res.userdata);
            slots = nullptr;
            capacity = 0;
            size_bytes = 0;
        }
    }
};
