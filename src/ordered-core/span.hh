#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

/// Non-owning view over a contiguous sequence of T, similar to std::span.
/// The containers hand out span<T const> over their live entries and take span<T const> for bulk construction.
/// Does not own the underlying memory; caller must ensure the referenced data outlives the span.
template <class T>
struct oc::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        OC_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span viewing [begin, end).
    /// Precondition: begin <= end.
    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        OC_ASSERT(begin <= end, "invalid pointer range");
    }

    /// Creates a span from an initializer_list.
    /// Only available when T is const; allows oc::ordered_set<int>::create_from({3, 1, 2}).
    /// WARNING: initializer_list temporaries are destroyed at the end of the full expression.
    /// Safe ONLY as an immediate function argument.
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    /// Creates a span viewing the entire C array.
    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Creates a span from any container providing .data() and .size().
    template <class Container>
        requires requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    /// span<T> converts to span<T const>
    template <class U>
        requires(std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr span(span<U> rhs) : _data(rhs.data()), _size(rhs.size())
    {
    }

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        OC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front() const
    {
        OC_ASSERT(_size > 0, "front() called on empty span");
        return _data[0];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back() const
    {
        OC_ASSERT(_size > 0, "back() called on empty span");
        return _data[_size - 1];
    }

    /// May be nullptr if the span is default-constructed or empty.
    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
