#pragma once

#include <ordered-core/fwd.hh>
#include <ordered-core/utility.hh>

#include <compare>
#include <utility>

/// Key/value entry stored by value in the buffer of an oc::ordered_map.
/// Aggregate with no user-defined constructors; supports structured bindings:
///
///     for (auto const& [k, v] : map) { ... }
///
/// Comparison is memberwise (key first, then value), which is what map equality and
/// lexicographic map ordering need. The map itself orders entries by key alone.
template <class K, class V>
struct oc::entry
{
    using key_t = K;
    using value_t = V;

    K key;
    V value;

    [[nodiscard]] friend constexpr bool operator==(entry const&, entry const&) = default;
    [[nodiscard]] friend constexpr auto operator<=>(entry const&, entry const&) = default;

    template <std::size_t I, class E>
    [[nodiscard]] friend constexpr decltype(auto) get(E&& e) noexcept
        requires(std::is_same_v<std::remove_cvref_t<E>, entry> && I < 2)
    {
        if constexpr (I == 0)
            return (oc::forward<E>(e).key);
        else
            return (oc::forward<E>(e).value);
    }
};

namespace std
{
template <class K, class V>
struct tuple_size<oc::entry<K, V>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class K, class V>
struct tuple_element<I, oc::entry<K, V>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, K, V>;
};
} // namespace std
