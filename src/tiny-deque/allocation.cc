#include "allocation.hh"

#include <tiny-deque/macros.hh>
#include <tiny-deque/utility.hh>

#include <cstdlib>

namespace
{
// Static function implementations for the system memory resource.
// These ignore the userdata parameter as the system allocator is stateless.

td::isize system_allocate_bytes(td::byte** out_ptr, td::isize min_bytes, td::isize max_bytes, td::isize alignment, void* userdata)
{
    TD_UNUSED(max_bytes);
    TD_UNUSED(userdata);

    TD_ASSERT(out_ptr != nullptr, "out_ptr must not be null");
    TD_ASSERT(alignment > 0 && td::is_power_of_two(alignment), "alignment must be a power of 2");
    TD_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    // Contract: min_bytes == 0 always returns nullptr
    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    td::byte* p = nullptr;

#ifdef TD_OS_WINDOWS
    p = static_cast<td::byte*>(_aligned_malloc(min_bytes, alignment));
#else
    // posix_memalign instead of std::aligned_alloc avoids the bytes % alignment == 0 requirement
    // posix_memalign requires alignment >= sizeof(void*), so we clamp to that minimum
    void* raw_ptr = nullptr;
    td::isize const effective_alignment = alignment < td::isize(sizeof(void*)) ? td::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, size_t(effective_alignment), size_t(min_bytes));
    p = result == 0 ? static_cast<td::byte*>(raw_ptr) : nullptr;
#endif

    // growing a deque has no recovery path, running out of memory is fatal
    TD_ASSERT_ALWAYS(p != nullptr, "allocation failed");

    *out_ptr = p;
    return min_bytes;
}

void system_deallocate_bytes(td::byte* p, td::isize bytes, td::isize alignment, void* userdata)
{
    TD_UNUSED(bytes);
    TD_UNUSED(alignment);
    TD_UNUSED(userdata);

    // IMPORTANT: Must use matching free function for the platform's allocator
#ifdef TD_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

/// System memory resource instance stored in the data segment.
/// This is the default fallback when td::allocation<T>::custom_resource is nullptr.
constinit td::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit td::memory_resource const* const td::default_memory_resource = &system_memory_resource;
