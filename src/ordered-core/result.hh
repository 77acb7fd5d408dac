#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/error.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/utility.hh>

#include <type_traits>

/// Sum type representing either a success value T or an error value E.
///
/// Used for expected failures:
///   - ordered_map::create_from(...)  -> result<ordered_map>, error kind duplicate_key
///   - try_insert / try_reserve / try_shrink_to -> error kind allocation_failure
///
/// Like oc::optional there is no operator* / operator->; value() and error() assert the active state.
///
/// Usage:
///   auto r = oc::ordered_map<int, int>::create_from({{1, 2}, {1, 3}});
///   if (r.has_error())
///       report(r.error().to_string());
template <class T, class E>
struct oc::result
{
    static_assert(!std::is_same_v<std::remove_cv_t<T>, std::remove_cv_t<E>>, "value and error type must differ");
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "references are not supported");

    // construction
public:
    /// Success state holding a value.
    template <class U = T>
        requires(std::is_constructible_v<T, U &&> && !std::is_same_v<std::remove_cvref_t<U>, result>
                 && !std::is_same_v<std::remove_cvref_t<U>, E>)
    result(U&& value) : _has_value(true) // NOLINT
    {
        new (oc::placement_new, &_storage.value) T(oc::forward<U>(value));
    }

    /// Error state holding an error.
    result(E error) : _has_value(false) // NOLINT
    {
        new (oc::placement_new, &_storage.error) E(oc::move(error));
    }

    result(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (oc::placement_new, &_storage.value) T(oc::move(rhs._storage.value));
        else
            new (oc::placement_new, &_storage.error) E(oc::move(rhs._storage.error));
    }

    result(result const& rhs)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (oc::placement_new, &_storage.value) T(rhs._storage.value);
        else
            new (oc::placement_new, &_storage.error) E(rhs._storage.error);
    }

    /// rhs may be nested inside *this, so it is moved into a temporary before *this is destroyed.
    result& operator=(result&& rhs) noexcept
        requires(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
    {
        if (this != &rhs)
        {
            auto tmp = result(oc::move(rhs));
            impl_destroy();
            _has_value = tmp._has_value;
            if (_has_value)
                new (oc::placement_new, &_storage.value) T(oc::move(tmp._storage.value));
            else
                new (oc::placement_new, &_storage.error) E(oc::move(tmp._storage.error));
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>
                 && std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
    {
        if (this != &rhs)
            *this = result(rhs);
        return *this;
    }

    ~result() { impl_destroy(); }

    // queries
public:
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    // access
public:
    /// Precondition: has_value().
    [[nodiscard]] T& value() &
    {
        OC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        OC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        OC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return oc::move(_storage.value);
    }

    /// Precondition: has_error().
    [[nodiscard]] E& error() &
    {
        OC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return _storage.error;
    }
    [[nodiscard]] E const& error() const&
    {
        OC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return _storage.error;
    }
    [[nodiscard]] E&& error() &&
    {
        OC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return oc::move(_storage.error);
    }

    /// Returns the value or `fallback` in the error state.
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(oc::forward<U>(fallback));
    }

    /// Returns the value by move or throws oc::error_exception with the held error.
    /// Only available for E = oc::error; backs the throwing container APIs.
    [[nodiscard]] T value_or_throw() &&
        requires std::is_same_v<E, oc::error>
    {
        if (!_has_value) [[unlikely]]
            oc::impl::throw_error(oc::move(_storage.error));
        return oc::move(_storage.value);
    }

private:
    void impl_destroy()
    {
        if (_has_value)
            _storage.value.~T();
        else
            _storage.error.~E();
    }

    union storage_t
    {
        T value;
        E error;

        storage_t() {}
        ~storage_t() {}
    };

    storage_t _storage;
    bool _has_value;
};
