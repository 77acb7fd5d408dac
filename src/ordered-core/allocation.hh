#pragma once

#include <ordered-core/error.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/impl/object_lifetime_util.hh>
#include <ordered-core/result.hh>
#include <ordered-core/span.hh>
#include <ordered-core/utility.hh>

// oc::allocation<T> is the Buffer underneath every ordered container.
//
// It tracks two things explicitly:
// 1) which bytes are owned (a block from an oc::memory_resource),
// 2) which objects inside those bytes are currently alive (the live window).
//
// Containers decide *policy* (where entries go, when to grow); the sharp mechanics of ownership,
// resizing, alignment and object lifetime live here.
//
// The resource pointer is stored in the allocation, not as a template argument. A null resource
// means "use oc::default_memory_resource", which makes the all-zero state a valid empty buffer.
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - [obj_start, obj_end) is the live object range, always within the allocation.
// - obj_start and obj_end are always aligned to alignof(T), even when empty.
// - alloc_start == nullptr iff no bytes are owned.

namespace oc
{
/// Default memory resource used when allocation::custom_resource == nullptr.
/// A system allocator stored in the data segment, so the pointer is valid during static initialization.
extern oc::memory_resource const* const default_memory_resource;
} // namespace oc

/// Pluggable allocator capability.
/// A POD of function pointers plus userdata: no virtual dispatch, no non-trivial constructors,
/// usable as a constinit global.
///
/// All three operations report exhaustion by returning -1, never by throwing or aborting;
/// the containers turn -1 into an oc::error with kind allocation_failure.
struct oc::memory_resource
{
    /// Allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual size in [min_bytes, max_bytes] and stores the pointer in *out_ptr,
    /// or returns -1 and stores nullptr.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    oc::function_ptr<isize(oc::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> try_allocate_bytes
        = nullptr;

    /// Deallocate a block previously obtained from this resource.
    /// `bytes` and `alignment` must match the values the block currently has.
    oc::function_ptr<void(oc::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// Attempt to resize a block in place, without moving it.
    ///
    /// Preconditions:
    ///   `p` was allocated from this resource with `old_bytes` and `alignment`.
    ///   1 <= min_bytes <= max_bytes.
    ///
    /// Success: returns new_bytes in [min_bytes, max_bytes]; `p` stays valid and keeps its first
    /// min(old_bytes, new_bytes) bytes. new_bytes is the size for all future calls.
    /// Failure: returns -1; the block is unchanged and still owned by the caller.
    ///
    /// Used for both growth and explicit shrinking. Resources without in-place support simply return -1.
    oc::function_ptr<isize(oc::byte* p, isize old_bytes, isize min_bytes, isize max_bytes, isize alignment, void* userdata)>
        try_resize_bytes_in_place = nullptr;

    /// User-defined data for stateful resources. nullptr for stateless ones.
    void* userdata = nullptr;
};

/// Disassembled ordered container: everything needed to reassemble it with create_from_raw_parts.
/// `ptr` points at `capacity * sizeof(T)` bytes obtained from `resource` (nullptr meaning the default
/// resource) whose first `length` slots hold live objects. `ptr` is nullptr iff capacity == 0.
template <class T>
struct oc::raw_parts
{
    T* ptr = nullptr;
    isize length = 0;
    isize capacity = 0;
    oc::memory_resource const* resource = nullptr;
};

/// Owning allocation handle for a contiguous byte block plus a typed live window inside it.
///
/// Move-only. Destruction destroys the live objects (in reverse) and returns the bytes to the
/// resource exactly once. release() hands both over to the caller instead.
template <class T>
struct oc::allocation
{
    /// First live object. Aligned to alignof(T) even when the range is empty.
    T* obj_start = nullptr;

    /// One past the last live object.
    T* obj_end = nullptr;

    /// Base pointer returned by the memory resource; passed back for deallocation.
    oc::byte* alloc_start = nullptr;

    /// End of the owned bytes (exclusive).
    oc::byte* alloc_end = nullptr;

    /// Alignment the block was requested with. Needed again for resize and deallocation.
    isize alignment = 0;

    /// Resource that owns the block, or nullptr for the global default.
    /// Survives moves out of this handle, so an emptied container keeps allocating from the same place.
    oc::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    /// Returns the effective resource: custom_resource if set, otherwise the default.
    [[nodiscard]] oc::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// True iff bytes are owned. The live window may still be empty.
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Returns the span of live objects
    [[nodiscard]] oc::span<T> obj_span() const { return oc::span<T>(obj_start, obj_end); }

    /// Number of allocated bytes
    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    /// Number of live objects
    [[nodiscard]] isize obj_count() const { return obj_end - obj_start; }

    /// Number of whole T slots from obj_start to alloc_end
    [[nodiscard]] isize obj_capacity() const
    {
        // nullptr - nullptr == 0 is well-defined for the empty state
        return (alloc_end - (oc::byte const*)obj_start) / isize(sizeof(T));
    }

    /// Attempt to resize the block in place to a size between min_bytes and max_bytes.
    /// Returns true on success (alloc_end updated), false otherwise (nothing changed).
    /// Never moves objects. Cannot resize below the bytes occupied by live objects.
    [[nodiscard]] bool try_resize_alloc_inplace(isize min_bytes, isize max_bytes)
    {
        OC_ASSERT(min_bytes > 0 && max_bytes >= min_bytes, "try_resize_alloc_inplace: invalid size range");
        OC_ASSERT(min_bytes >= (oc::byte const*)obj_end - alloc_start, "try_resize_alloc_inplace: cannot resize below "
                                                                       "live object range");

        if (alloc_start == nullptr)
            return false;

        auto const& res = resource();
        isize const new_bytes = res.try_resize_bytes_in_place(alloc_start, alloc_end - alloc_start, min_bytes,
                                                              max_bytes, alignment, res.userdata);
        if (new_bytes == -1)
            return false;

        OC_ASSERT_ALWAYS(min_bytes <= new_bytes && new_bytes <= max_bytes, "memory resource violated its resize "
                                                                           "contract");
        alloc_end = alloc_start + new_bytes;
        return true;
    }

    /// Resize the block to a size between min_bytes and max_bytes, growing or shrinking.
    ///
    /// Tries in place first (when the current block already satisfies new_alignment). Otherwise
    /// allocates a new block from the same resource, moves the live objects to its front and
    /// adopts it. min_bytes == 0 (only valid with no live objects) releases the block.
    ///
    /// Returns false if the resource cannot provide the bytes; *this is then untouched.
    /// Live objects always end up at the start of the block.
    [[nodiscard]] bool try_resize_alloc(isize min_bytes, isize max_bytes, isize new_alignment)
    {
        OC_ASSERT(min_bytes >= 0 && max_bytes >= min_bytes, "try_resize_alloc: invalid size range");
        OC_ASSERT(new_alignment >= isize(alignof(T)), "new_alignment must be at least alignof(T)");
        OC_ASSERT(min_bytes >= obj_count() * isize(sizeof(T)), "try_resize_alloc: cannot resize below live object "
                                                               "range");

        if (min_bytes == 0)
        {
            OC_ASSERT(obj_start == obj_end, "try_resize_alloc: releasing a block with live objects");
            auto const res = custom_resource;
            *this = allocation();
            custom_resource = res;
            return true;
        }

        if (is_valid() && (oc::byte*)obj_start == alloc_start && alignment >= new_alignment
            && try_resize_alloc_inplace(min_bytes, max_bytes))
            return true;

        auto new_alloc = allocation::try_create_empty_bytes(min_bytes, max_bytes, new_alignment, custom_resource);
        if (new_alloc.has_error())
            return false;

        auto& fresh = new_alloc.value();
        impl::move_create_objects_to(fresh.obj_end, obj_start, obj_end);

        // destroys the moved-from objects and returns the old block
        *this = oc::move(fresh);
        return true;
    }

    /// Relinquishes ownership of the block and the live objects without destroying anything.
    /// Precondition: the live window starts at the block start (true for all ordered containers).
    /// Afterwards *this is empty but keeps its custom_resource.
    [[nodiscard]] oc::raw_parts<T> release()
    {
        OC_ASSERT(alloc_start == nullptr || (oc::byte*)obj_start == alloc_start, "release: live window must start at "
                                                                                 "the block start");
        oc::raw_parts<T> parts;
        parts.ptr = alloc_start == nullptr ? nullptr : obj_start;
        parts.length = obj_count();
        parts.capacity = obj_capacity();
        parts.resource = custom_resource;

        obj_start = nullptr;
        obj_end = nullptr;
        alloc_start = nullptr;
        alloc_end = nullptr;
        alignment = 0;
        return parts;
    }

    // factories
public:
    /// Creates an empty allocation (no live objects) of between min_bytes and max_bytes.
    ///
    /// Returns an allocation_failure error if the resource cannot provide the bytes.
    /// min_bytes == 0 results in an empty handle (carrying the resource) without calling the resource.
    [[nodiscard]] static oc::result<allocation> try_create_empty_bytes(isize min_bytes,
                                                                      isize max_bytes, // NOLINT
                                                                      isize alignment, // NOLINT
                                                                      memory_resource const* resource)
    {
        OC_ASSERT(alignment >= isize(alignof(T)), "alignment must be at least alignof(T)");
        OC_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

        allocation alloc;
        alloc.custom_resource = resource;

        if (min_bytes == 0)
            return oc::move(alloc);

        auto const& res = resource ? *resource : *default_memory_resource;
        auto const actual_byte_size
            = res.try_allocate_bytes(&alloc.alloc_start, min_bytes, max_bytes, alignment, res.userdata);
        if (actual_byte_size == -1)
            return oc::error::create_allocation_failure(min_bytes);

        OC_ASSERT_ALWAYS(alloc.alloc_start != nullptr && min_bytes <= actual_byte_size
                             && actual_byte_size <= max_bytes,
                         "memory resource violated its allocation contract");

        alloc.alignment = alignment;
        alloc.alloc_end = alloc.alloc_start + actual_byte_size;
        alloc.obj_start = (T*)alloc.alloc_start;
        alloc.obj_end = alloc.obj_start;
        return oc::move(alloc);
    }

    /// Adopts a block previously released from an allocation (or built by hand under the same rules).
    /// `alignment` must be the alignment the block was requested with.
    /// Nothing is validated beyond cheap shape checks; see oc::raw_parts for the contract.
    [[nodiscard]] static allocation create_from_raw_parts(oc::raw_parts<T> const& parts, isize alignment)
    {
        OC_ASSERT(0 <= parts.length && parts.length <= parts.capacity, "raw parts: length must be in [0, capacity]");
        OC_ASSERT((parts.ptr == nullptr) == (parts.capacity == 0), "raw parts: ptr must be null iff capacity is 0");

        allocation alloc;
        alloc.custom_resource = parts.resource;
        if (parts.ptr == nullptr)
            return alloc;

        OC_ASSERT(oc::is_aligned(parts.ptr, alignment), "raw parts: ptr is not aligned to the container alignment");

        alloc.alignment = alignment;
        alloc.alloc_start = (oc::byte*)parts.ptr;
        alloc.alloc_end = alloc.alloc_start + parts.capacity * isize(sizeof(T));
        alloc.obj_start = parts.ptr;
        alloc.obj_end = parts.ptr + parts.length;
        return alloc;
    }

    // lifecycle
public:
    allocation() = default;

    // no implicit copies, containers decide how to deep-copy
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(oc::exchange(rhs.obj_start, nullptr)),
        obj_end(oc::exchange(rhs.obj_end, nullptr)),
        alloc_start(oc::exchange(rhs.alloc_start, nullptr)),
        alloc_end(oc::exchange(rhs.alloc_end, nullptr)),
        alignment(oc::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    /// Safe even when rhs lives inside one of the objects owned by *this:
    /// rhs is moved into a temporary before anything in *this is destroyed.
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = oc::move(rhs);

            impl_destroy_and_deallocate();

            obj_start = oc::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = oc::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = oc::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = oc::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = oc::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource;
        }

        return *this;
    }

    ~allocation() { impl_destroy_and_deallocate(); }

private:
    void impl_destroy_and_deallocate()
    {
        impl::destroy_objects_in_reverse(obj_start, obj_end);

        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
    }
};
