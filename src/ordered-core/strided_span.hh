#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/macros.hh>

#include <type_traits>

/// Random access iterator over elements of type T separated by a constant byte stride.
///
/// The ordered containers use it to walk one field of their entries,
/// e.g. only the keys or only the values of an oc::ordered_map, without copying.
///
/// The stride can be:
/// - positive: forward iteration through memory
/// - negative: backward iteration through memory (see strided_span::reversed)
///
/// IMPORTANT: the stride must keep every visited element aligned for T.
template <class T>
struct oc::strided_iterator
{
    using difference_type = isize;
    using value_type = std::remove_const_t<T>;
    using byte_ptr = std::conditional_t<std::is_const_v<T>, oc::byte const*, oc::byte*>;

    constexpr strided_iterator() = default;
    constexpr strided_iterator(byte_ptr ptr, isize stride) : _ptr(ptr), _stride_bytes(stride) {}

    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    [[nodiscard]] constexpr T& operator*() const { return *reinterpret_cast<T*>(_ptr); }
    [[nodiscard]] constexpr T* operator->() const { return reinterpret_cast<T*>(_ptr); }
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)

    constexpr strided_iterator& operator++()
    {
        _ptr += _stride_bytes;
        return *this;
    }
    constexpr strided_iterator operator++(int)
    {
        auto const tmp = *this;
        ++(*this);
        return tmp;
    }

    constexpr strided_iterator& operator--()
    {
        _ptr -= _stride_bytes;
        return *this;
    }
    constexpr strided_iterator operator--(int)
    {
        auto const tmp = *this;
        --(*this);
        return tmp;
    }

    constexpr strided_iterator& operator+=(isize n)
    {
        _ptr += n * _stride_bytes;
        return *this;
    }
    constexpr strided_iterator& operator-=(isize n)
    {
        _ptr -= n * _stride_bytes;
        return *this;
    }

    [[nodiscard]] friend constexpr strided_iterator operator+(strided_iterator it, isize n) { return it += n; }
    [[nodiscard]] friend constexpr strided_iterator operator-(strided_iterator it, isize n) { return it -= n; }

    [[nodiscard]] friend constexpr isize operator-(strided_iterator const& lhs, strided_iterator const& rhs)
    {
        OC_ASSERT(lhs._stride_bytes == rhs._stride_bytes, "cannot compute distance between iterators with "
                                                          "different strides");
        if (lhs._stride_bytes == 0)
            return 0;
        return (lhs._ptr - rhs._ptr) / lhs._stride_bytes;
    }

    [[nodiscard]] friend constexpr bool operator==(strided_iterator const& lhs, strided_iterator const& rhs)
    {
        return lhs._ptr == rhs._ptr;
    }

private:
    byte_ptr _ptr = nullptr;
    isize _stride_bytes = 0;
};

/// Non-owning view over elements of type T with a constant byte stride between elements.
///
/// Returned by ordered_map::keys() / values() (stride = sizeof(entry)) and by reversed() on both
/// containers (negative stride). Any structural mutation of the viewed container invalidates the view.
///
/// Unlike span, a strided_span is not necessarily contiguous, so it offers start_ptr() instead of data().
template <class T>
struct oc::strided_span
{
    // types
public:
    using byte_ptr = std::conditional_t<std::is_const_v<T>, oc::byte const*, oc::byte*>;

private:
    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    [[nodiscard]] OC_FORCE_INLINE static constexpr byte_ptr to_byte_ptr(T* ptr)
    {
        return reinterpret_cast<byte_ptr>(ptr);
    }
    [[nodiscard]] OC_FORCE_INLINE static constexpr T* from_byte_ptr(byte_ptr ptr) { return reinterpret_cast<T*>(ptr); }
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)

    // construction
public:
    /// Default strided_span is empty.
    constexpr strided_span() = default;

    /// Creates a strided_span viewing `size` elements starting at ptr, `stride_bytes` apart.
    /// Precondition: size >= 0.
    constexpr explicit strided_span(T* ptr, isize size, isize stride_bytes) // NOLINT(bugprone-easily-swappable-parameters)
      : _start(strided_span::to_byte_ptr(ptr)), _size(size), _stride_bytes(stride_bytes)
    {
        OC_ASSERT(size >= 0, "strided_span size must be non-negative");
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        OC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return *strided_span::from_byte_ptr(_start + i * _stride_bytes);
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front() const
    {
        OC_ASSERT(_size > 0, "front() called on empty strided_span");
        return *strided_span::from_byte_ptr(_start);
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back() const
    {
        OC_ASSERT(_size > 0, "back() called on empty strided_span");
        return *strided_span::from_byte_ptr(_start + (_size - 1) * _stride_bytes);
    }

    /// Pointer to the first element, nullptr for an empty view.
    [[nodiscard]] constexpr T* start_ptr() const { return strided_span::from_byte_ptr(_start); }

    // iterators
public:
    using iterator = oc::strided_iterator<T>;

    [[nodiscard]] constexpr iterator begin() const { return iterator(_start, _stride_bytes); }
    [[nodiscard]] constexpr iterator end() const { return iterator(_start + _size * _stride_bytes, _stride_bytes); }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }
    [[nodiscard]] constexpr isize stride_bytes() const { return _stride_bytes; }

    // operations
public:
    /// Returns a view over the same elements in reverse order (last element first, negated stride).
    /// An empty view stays empty.
    [[nodiscard]] constexpr strided_span reversed() const
    {
        if (_size == 0)
            return strided_span();
        auto const new_start = _start + (_size - 1) * _stride_bytes;
        return strided_span(strided_span::from_byte_ptr(new_start), _size, -_stride_bytes);
    }

    // members
private:
    byte_ptr _start = nullptr;
    isize _size = 0;
    isize _stride_bytes = 0;
};
