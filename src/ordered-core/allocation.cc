#include "allocation.hh"

#include <ordered-core/assert.hh>
#include <ordered-core/macros.hh>
#include <ordered-core/utility.hh>

#include <cstdlib>

namespace
{
// The system resource is stateless, userdata is ignored throughout.

oc::isize system_try_allocate_bytes(oc::byte** out_ptr,
                                    oc::isize min_bytes,
                                    oc::isize max_bytes,
                                    oc::isize alignment,
                                    void* userdata)
{
    OC_UNUSED(userdata);
    OC_UNUSED(max_bytes);

    OC_ASSERT(out_ptr != nullptr, "out_ptr must not be null");
    OC_ASSERT(alignment > 0 && oc::is_power_of_two(alignment), "alignment must be a power of 2");
    OC_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    *out_ptr = nullptr;
    if (min_bytes == 0)
        return 0;

    // malloc cannot report slack, so we always hand out exactly min_bytes
#ifdef OC_OS_WINDOWS
    *out_ptr = static_cast<oc::byte*>(_aligned_malloc(min_bytes, alignment));
#else
    // posix_memalign has no bytes % alignment == 0 requirement (unlike std::aligned_alloc)
    // but needs alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    oc::isize const effective_alignment = alignment < oc::isize(sizeof(void*)) ? oc::isize(sizeof(void*)) : alignment;
    if (posix_memalign(&raw_ptr, size_t(effective_alignment), size_t(min_bytes)) == 0)
        *out_ptr = static_cast<oc::byte*>(raw_ptr);
#endif

    return *out_ptr == nullptr ? -1 : min_bytes;
}

void system_deallocate_bytes(oc::byte* p, oc::isize bytes, oc::isize alignment, void* userdata)
{
    OC_UNUSED(bytes);
    OC_UNUSED(alignment);
    OC_UNUSED(userdata);

#ifdef OC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

oc::isize system_try_resize_bytes_in_place(oc::byte* p,
                                           oc::isize old_bytes,
                                           oc::isize min_bytes,
                                           oc::isize max_bytes,
                                           oc::isize alignment,
                                           void* userdata)
{
    OC_UNUSED(userdata);

    OC_ASSERT(p != nullptr, "cannot resize null pointer");
    OC_ASSERT(alignment > 0 && oc::is_power_of_two(alignment), "alignment must be a power of 2");
    OC_ASSERT(old_bytes > 0, "old_bytes must be positive");
    OC_ASSERT(1 <= min_bytes && min_bytes <= max_bytes, "must have 1 <= min_bytes <= max_bytes");

    // requests that fit the current size are trivially satisfied
    if (min_bytes <= old_bytes && old_bytes <= max_bytes)
        return old_bytes;

    // realloc may move, which would invalidate pointers into the block
    return -1;
}

constinit oc::memory_resource const system_memory_resource = {
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .try_resize_bytes_in_place = system_try_resize_bytes_in_place,
    .userdata = nullptr,
};

} // namespace

constinit oc::memory_resource const* const oc::default_memory_resource = &system_memory_resource;
