#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>

#include <cstring>
#include <type_traits>

// =========================================================================================================
// Utility functions shared by the containers
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b) / min(a, b)       - larger / smaller of two values (requires operator<)
//
// Alignment (value or pointer):
//   is_power_of_two(value)           - check if value is a power of 2
//   align_up(value, alignment)       - increment to next aligned boundary (power of 2)
//   is_aligned(value, alignment)     - check if aligned at boundary (power of 2)
//
// Raw memory:
//   placement_new                    - tag for placement new without <new>
//   storage_for<T>                   - uninitialized, correctly aligned storage for one T
//   memcpy / memmove                 - byte copies with isize sizes
//
// Template metaprogramming:
//   always_false_t<T...>             - always false for static_assert with type parameters
//   function_ptr<Signature>          - convert function signature to function pointer type
//

namespace oc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto p = oc::exchange(obj_start, nullptr); // take ownership, leave null behind
template <class T, class U = T>
[[nodiscard]] OC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = oc::forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Alignment (for values or pointers)
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    OC_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Increment value to align at the given boundary
/// Usage:
///   isize bytes = oc::align_up(300, 64); // = 320
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    OC_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_up: alignment must be a power of 2");
    return (T)(((isize)value + (alignment - 1)) & ~(alignment - 1));
}

/// Check if value is aligned at the given boundary
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr bool is_aligned(T value, isize alignment)
{
    OC_ASSERT(alignment > 0 && is_power_of_two(alignment), "is_aligned: alignment must be a power of 2");
    return 0 == ((isize)value & (alignment - 1));
}

// =========================================================================================================
// Raw memory
// =========================================================================================================

/// Tag selecting the non-allocating placement operator new declared below
/// Usage:
///   new (oc::placement_new, ptr) T(args...);
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new = {};

/// Uninitialized storage for exactly one T, with T's size and alignment.
/// The value is neither constructed nor destroyed; the owner manages its lifetime.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}
    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

/// std::memcpy with signed sizes; bytes == 0 is valid with null pointers
OC_FORCE_INLINE void memcpy(void* dest, void const* src, isize bytes)
{
    OC_ASSERT(bytes >= 0, "memcpy: negative byte count");
    if (bytes > 0)
        std::memcpy(dest, src, size_t(bytes));
}

/// std::memmove with signed sizes; ranges may overlap
OC_FORCE_INLINE void memmove(void* dest, void const* src, isize bytes)
{
    OC_ASSERT(bytes >= 0, "memmove: negative byte count");
    if (bytes > 0)
        std::memmove(dest, src, size_t(bytes));
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Always false, but only after template instantiation
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   oc::function_ptr<void(oc::byte*, isize, isize, void*)> deallocate_bytes;
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

} // namespace oc

// non-allocating placement new selected via oc::placement_new (avoids including <new> everywhere)
[[nodiscard]] OC_FORCE_INLINE void* operator new(std::size_t, oc::placement_new_t, void* p) noexcept
{
    return p;
}
OC_FORCE_INLINE void operator delete(void*, oc::placement_new_t, void*) noexcept {}
