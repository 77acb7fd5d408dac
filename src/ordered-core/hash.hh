#pragma once

#include <ordered-core/entry.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/macros.hh>

#include <cstddef>
#include <functional>
#include <type_traits>

namespace oc
{
/// Mixes h into seed (MurmurHash2 64-bit mixing step).
/// Order-dependent: combining a then b differs from b then a.
OC_FORCE_INLINE constexpr void hash_combine(u64& seed, u64 h) noexcept
{
    constexpr u64 m = 14313749767032793493ULL;
    constexpr u64 r = 47;

    h *= m;
    h ^= h >> r;
    h *= m;

    seed ^= h;
    seed *= m;
}

/// Hash of an ordered live sequence: the length first, then every element in order.
/// Two collections with equal contents hash equally regardless of capacity or memory resource.
template <class Range>
[[nodiscard]] u64 hash_sequence(Range const& range)
{
    using elem_t = std::remove_cvref_t<decltype(*range.begin())>;

    u64 seed = 0;
    oc::hash_combine(seed, u64(range.size()));
    for (auto const& e : range)
        oc::hash_combine(seed, u64(std::hash<elem_t>{}(e)));
    return seed;
}
} // namespace oc

namespace std
{
template <class K, class V>
struct hash<oc::entry<K, V>>
{
    [[nodiscard]] std::size_t operator()(oc::entry<K, V> const& e) const noexcept
    {
        oc::u64 seed = 0;
        oc::hash_combine(seed, oc::u64(std::hash<K>{}(e.key)));
        oc::hash_combine(seed, oc::u64(std::hash<V>{}(e.value)));
        return std::size_t(seed);
    }
};

template <class K, class V>
struct hash<oc::ordered_map<K, V>>
{
    [[nodiscard]] std::size_t operator()(oc::ordered_map<K, V> const& m) const noexcept
    {
        return std::size_t(oc::hash_sequence(m));
    }
};

template <class T>
struct hash<oc::ordered_set<T>>
{
    [[nodiscard]] std::size_t operator()(oc::ordered_set<T> const& s) const noexcept
    {
        return std::size_t(oc::hash_sequence(s));
    }
};
} // namespace std
