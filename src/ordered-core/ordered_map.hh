#pragma once

#include <ordered-core/entry.hh>
#include <ordered-core/impl/ordered_container.hh>
#include <ordered-core/ordered_set.hh>
#include <ordered-core/strided_span.hh>

#include <algorithm>
#include <compare>
#include <cstddef>


namespace oc::impl
{
struct entry_key_of
{
    template <class K, class V>
    [[nodiscard]] static constexpr K const& get(oc::entry<K, V> const& e)
    {
        return e.key;
    }
};
} // namespace oc::impl

/// Ordered map from K to V stored as one contiguous, sorted array of oc::entry<K, V>.
///
/// Keys are ordered by operator< and are unique. Lookup is a binary search (O(log n)),
/// insertion and removal shift the tail of the array (O(n)). There are no per-entry allocations.
///
/// Usage:
///   auto m = oc::ordered_map<int, std::string>();
///   m.insert(3, "c");
///   m.insert(1, "a");
///   for (auto const& [k, v] : m) { ... } // 1 "a", 3 "c"
///
/// Iteration yields `entry const&`: keys can never be changed in place.
/// Values are mutable through get(), at(), operator[] and values_mut().
///
/// Lookup functions are templated on the query type, so e.g. a map with std::string keys can be
/// searched with a char const* or std::string_view without constructing a key.
template <class K, class V>
struct oc::ordered_map : private oc::ordered_container<oc::entry<K, V>, oc::impl::entry_key_of, ordered_map<K, V>>
{
    using entry_t = oc::entry<K, V>;
    using base = oc::ordered_container<entry_t, oc::impl::entry_key_of, ordered_map<K, V>>;

    using key_t = K;
    using value_t = V;

    using base::alloc_alignment;

    // element access
public:
    /// Pointer to the value for `key`, or nullptr if absent.
    template <class Q>
    [[nodiscard]] V* get(Q const& key)
    {
        auto const e = base::find(key);
        return e ? &e->value : nullptr;
    }
    template <class Q>
    [[nodiscard]] V const* get(Q const& key) const
    {
        auto const e = base::find(key);
        return e ? &e->value : nullptr;
    }

    /// Value for `key`. Throws oc::error_exception (key_not_found) if absent.
    template <class Q>
    [[nodiscard]] V& at(Q const& key, oc::source_location site = oc::source_location::current())
    {
        auto const e = base::find(key);
        if (e == nullptr) [[unlikely]]
            oc::impl::throw_error(oc::error::create_key_not_found(site));
        return e->value;
    }
    template <class Q>
    [[nodiscard]] V const& at(Q const& key, oc::source_location site = oc::source_location::current()) const
    {
        auto const e = base::find(key);
        if (e == nullptr) [[unlikely]]
            oc::impl::throw_error(oc::error::create_key_not_found(site));
        return e->value;
    }

    /// Value for `key`.
    /// Precondition: contains(key). Does NOT insert missing keys.
    template <class Q>
    [[nodiscard]] V& operator[](Q const& key)
    {
        auto const e = base::find(key);
        OC_ASSERT(e != nullptr, "ordered_map::operator[]: key not present (use get() or at() for checked access)");
        return e->value;
    }
    template <class Q>
    [[nodiscard]] V const& operator[](Q const& key) const
    {
        auto const e = base::find(key);
        OC_ASSERT(e != nullptr, "ordered_map::operator[]: key not present (use get() or at() for checked access)");
        return e->value;
    }

    using base::contains; // true iff an equivalent key is present
    using base::search;   // found index or insertion index of a key

    using base::first; // smallest entry or nullptr
    using base::last;  // largest entry or nullptr

    /// Smallest key and its value, or nullopt if empty.
    [[nodiscard]] oc::optional<entry_t> first_key_value() const
    {
        auto const e = base::first();
        return e ? oc::optional<entry_t>(*e) : oc::nullopt;
    }

    /// Largest key and its value, or nullopt if empty.
    [[nodiscard]] oc::optional<entry_t> last_key_value() const
    {
        auto const e = base::last();
        return e ? oc::optional<entry_t>(*e) : oc::nullopt;
    }

    /// Stored entry for `key`, or nullptr if absent.
    template <class Q>
    [[nodiscard]] entry_t const* get_key_value(Q const& key) const
    {
        return base::find(key);
    }

    using base::as_span; // all entries in key order

    /// Pointer to the first entry. Entries are read-only, so keys cannot be changed in place.
    [[nodiscard]] entry_t const* data() const { return base::data(); }

    // iterators and views
public:
    using base::begin;
    using base::end;

    /// Keys in ascending order.
    [[nodiscard]] oc::strided_span<K const> keys() const
    {
        return oc::strided_span<K const>(base::empty() ? nullptr : &base::data()->key, base::size(),
                                         isize(sizeof(entry_t)));
    }

    /// Values in ascending key order.
    [[nodiscard]] oc::strided_span<V const> values() const
    {
        return oc::strided_span<V const>(base::empty() ? nullptr : &base::data()->value, base::size(),
                                         isize(sizeof(entry_t)));
    }

    /// Mutable values in ascending key order.
    [[nodiscard]] oc::strided_span<V> values_mut()
    {
        return oc::strided_span<V>(base::empty() ? nullptr : &base::data()->value, base::size(),
                                   isize(sizeof(entry_t)));
    }

    /// Entries in descending key order.
    [[nodiscard]] oc::strided_span<entry_t const> reversed() const
    {
        return oc::strided_span<entry_t const>(base::data(), base::size(), isize(sizeof(entry_t))).reversed();
    }

    // queries
public:
    using base::capacity;
    using base::empty;
    using base::resource;
    using base::size;

    // insertion
public:
    /// Inserts or overwrites the value for `key`.
    ///
    /// Key present: the stored value is replaced and the previous value is returned; size and order
    /// are unchanged. Key absent: a new entry is placed at its sorted position and nullopt is returned.
    /// Only the absent case can allocate; on allocation failure the map is unchanged.
    template <class KK, class VV>
    [[nodiscard]] oc::result<oc::optional<V>> try_insert(KK&& key, VV&& value)
    {
        auto const pos = base::search(key);
        if (pos.found)
        {
            // value may refer to the stored value itself
            auto v = V(oc::forward<VV>(value));
            return oc::optional<V>(oc::exchange(base::data()[pos.index].value, oc::move(v)));
        }

        auto e = entry_t{K(oc::forward<KK>(key)), V(oc::forward<VV>(value))};
        auto placed = base::try_insert_at(pos.index, oc::move(e));
        if (placed.has_error())
            return oc::move(placed).error();

        return oc::optional<V>();
    }

    /// Throwing version of try_insert.
    template <class KK, class VV>
    oc::optional<V> insert(KK&& key, VV&& value)
    {
        return try_insert(oc::forward<KK>(key), oc::forward<VV>(value)).value_or_throw();
    }

    /// Inserts every entry of `entries` in order; for equivalent keys the later entry wins.
    template <class Range>
    void extend(Range&& entries)
    {
        for (auto&& [k, v] : entries)
            insert(k, v);
    }
    void extend(std::initializer_list<entry_t> entries) { extend(oc::span<entry_t const>(entries)); }

    /// Moves every entry of `other` into this map, overwriting values of equivalent keys.
    /// `other` is empty afterwards and keeps its capacity.
    void append(ordered_map& other)
    {
        if (this == &other)
            return;

        base::reserve(other.size());
        other.drain([this](entry_t&& e) { insert(oc::move(e.key), oc::move(e.value)); });
    }

    // removal
public:
    /// Removes `key` and returns its value, or nullopt if absent.
    template <class Q>
    [[nodiscard]] oc::optional<V> remove(Q const& key)
    {
        auto const pos = base::search(key);
        if (!pos.found)
            return oc::nullopt;
        return oc::optional<V>(base::pop_at(pos.index).value);
    }

    /// Removes `key` and returns the whole entry, or nullopt if absent.
    template <class Q>
    [[nodiscard]] oc::optional<entry_t> remove_entry(Q const& key)
    {
        auto const pos = base::search(key);
        if (!pos.found)
            return oc::nullopt;
        return oc::optional<entry_t>(base::pop_at(pos.index));
    }

    using base::pop_first; // remove and return the smallest entry
    using base::pop_last;  // remove and return the largest entry

    /// Keeps exactly the entries for which pred(key, value) is true.
    /// pred may modify the value.
    template <class Pred>
    void retain_where(Pred&& pred)
    {
        base::retain_where([&pred](entry_t& e) { return pred(static_cast<K const&>(e.key), e.value); });
    }

    using base::clear; // destroy all entries, keep capacity
    using base::drain; // move every entry out in key order, keep capacity

    // capacity
public:
    using base::reserve;
    using base::shrink_to;
    using base::shrink_to_fit;
    using base::try_reserve;
    using base::try_shrink_to;

    // factories
public:
    using base::create_from;              // sorted copy of a fixed set of entries, rejects duplicate keys
    using base::create_from_or_throw;     // throwing create_from
    using base::create_from_raw_parts;    // unchecked reassembly
    using base::create_with_capacity;     // empty with reserved capacity
    using base::create_with_resource;     // empty, allocating from a custom resource
    using base::try_create_with_capacity; // create_with_capacity reporting allocation failure

    // raw parts
public:
    using base::extract_raw_parts;

    /// Consumes the map and returns its keys as a set allocated from the same resource.
    /// The keys are already sorted and unique, so they are moved over without searching or sorting.
    [[nodiscard]] oc::ordered_set<K> into_keys() &&
    {
        auto const bytes = base::size() * isize(sizeof(K));
        auto keys = oc::allocation<K>::try_create_empty_bytes(bytes, bytes, oc::ordered_set<K>::alloc_alignment,
                                                              base::resource())
                        .value_or_throw();

        for (auto& e : oc::span<entry_t>(base::data(), base::size()))
        {
            new (oc::placement_new, keys.obj_end) K(oc::move(e.key));
            keys.obj_end++;
        }

        base::clear();
        return oc::ordered_set<K>::create_from_raw_parts(keys.release());
    }

    /// Consumes the map and returns its values in ascending key order, allocated from the same resource.
    [[nodiscard]] oc::allocation<V> into_values() &&
    {
        auto const bytes = base::size() * isize(sizeof(V));
        auto values = oc::allocation<V>::try_create_empty_bytes(bytes, bytes, isize(alignof(V)), base::resource())
                          .value_or_throw();

        for (auto& e : oc::span<entry_t>(base::data(), base::size()))
        {
            new (oc::placement_new, values.obj_end) V(oc::move(e.value));
            values.obj_end++;
        }

        base::clear();
        return values;
    }

    // comparison
public:
    /// Equal iff both maps hold the same entries. Capacity and resource are ignored.
    [[nodiscard]] friend bool operator==(ordered_map const& lhs, ordered_map const& rhs)
    {
        return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
    }

    /// Lexicographic comparison of the entry sequences.
    [[nodiscard]] friend auto operator<=>(ordered_map const& lhs, ordered_map const& rhs)
        requires std::three_way_comparable<entry_t>
    {
        return std::lexicographical_compare_three_way(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
    }

    // lifecycle
public:
    ordered_map() = default;
    ~ordered_map() = default;
    ordered_map(ordered_map&&) = default;
    ordered_map& operator=(ordered_map&&) = default;
    ordered_map(ordered_map const&) = default;
    ordered_map& operator=(ordered_map const&) = default;

    friend base;
};
