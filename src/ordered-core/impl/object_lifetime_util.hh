#pragma once

#include <ordered-core/fwd.hh>
#include <ordered-core/utility.hh>

#include <type_traits>

// Low-level object lifetime helpers for the contiguous buffer of an ordered container.
//
// Naming:
//   *_create_*  -> constructs into uninitialized storage (placement new)
//   *_assign_*  -> writes over live objects (assignment)
//   destroy_*   -> ends the lifetime of live objects
//
// Trivially copyable types take a memcpy/memmove fast path everywhere.
// Throwing move constructors or move assignments leave the affected objects in moved-from states;
// the helpers never leak or double-destroy, but they do not restore values.

namespace oc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Copy-constructs objects from [src_start, src_end) into uninitialized storage at dest_end.
/// dest_end is incremented after each successful construction, so if a copy throws,
/// [original dest_end, dest_end) is exactly the constructed prefix.
///
/// Usage pattern:
///   auto obj_end = obj_start;
///   copy_create_objects_to(obj_end, src, src + count);
///   // [obj_start, obj_end) is now the constructed live range
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        oc::memcpy(dest_end, src_start, size * isize(sizeof(T)));
        dest_end += size;
    }
    else
    {
        while (src_start != src_end)
        {
            new (oc::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) into uninitialized storage at dest_end.
/// The sources stay alive (moved-from); the caller destroys them.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        oc::memcpy(dest_end, src_start, size * isize(sizeof(T)));
        dest_end += size;
    }
    else
    {
        while (src_start != src_end)
        {
            new (oc::placement_new, dest_end) T(oc::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) into uninitialized storage ending at dest_start,
/// last source first. dest_start is decremented after each construction so it always marks the
/// start of the constructed range.
///
/// Usage pattern (placing the prefix in front of an already-constructed element):
///   auto obj_start = new_slot;
///   move_create_objects_to_reverse(obj_start, old, old + idx);
///   // [obj_start, new_slot) now holds the moved prefix
template <class T>
constexpr void move_create_objects_to_reverse(T*& dest_start, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        dest_start -= size;
        oc::memcpy(dest_start, src_start, size * isize(sizeof(T)));
    }
    else
    {
        while (src_start != src_end)
        {
            --src_end;
            new (oc::placement_new, dest_start - 1) T(oc::move(*src_end));
            --dest_start; // _after_ construction so exceptions leave dest_start pointing to the constructed range
        }
    }
}

/// Closes the gap in front of [src_start, src_end) by moving every object one or more slots toward dest.
/// All objects in [dest, src_end) must be alive. Afterwards [dest, dest + (src_end - src_start)) holds
/// the moved values and the trailing (src_start - dest) objects are alive but moved-from
/// (trivially copyable types: stale bytes). The caller destroys the tail.
///
/// Used by positional removal:
///   compact_move_objects_backward(p, p + 1, obj_end);
///   (--obj_end)->~T();
template <class T>
constexpr void compact_move_objects_backward(T* dest, T* src_start, T* src_end)
{
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        oc::memmove(dest, src_start, (src_end - src_start) * isize(sizeof(T)));
    }
    else
    {
        while (src_start != src_end)
        {
            *dest = oc::move(*src_start);
            ++dest;
            ++src_start;
        }
    }
}

/// Opens a one-slot gap at `pos` inside the live range [pos, obj_end) by shifting every object one slot
/// toward the tail. Requires one slot of uninitialized capacity at obj_end.
/// obj_end is incremented once the new tail object exists.
///
/// Afterwards *pos is alive but moved-from and is meant to be assigned. For trivially copyable types it
/// holds stale bytes and may simply be overwritten.
/// If pos == obj_end there is nothing to shift and the caller constructs into *pos itself;
/// this function then returns false.
template <class T>
[[nodiscard]] constexpr bool open_gap_toward_tail(T* pos, T*& obj_end)
{
    static_assert(std::is_move_constructible_v<T> && std::is_move_assignable_v<T>, "T must be movable");

    if (pos == obj_end)
        return false;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        oc::memmove(pos + 1, pos, (obj_end - pos) * isize(sizeof(T)));
        ++obj_end;
    }
    else
    {
        // new tail object from the current last one
        new (oc::placement_new, obj_end) T(oc::move(*(obj_end - 1)));
        ++obj_end;

        // shift the rest by assignment, back to front
        for (auto p = obj_end - 2; p != pos; --p)
            *p = oc::move(*(p - 1));
    }

    return true;
}
} // namespace oc::impl
