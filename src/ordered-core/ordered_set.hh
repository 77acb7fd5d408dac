#pragma once

#include <ordered-core/impl/ordered_container.hh>
#include <ordered-core/strided_span.hh>

#include <algorithm>
#include <compare>
#include <initializer_list>


namespace oc::impl
{
struct identity_key_of
{
    template <class T>
    [[nodiscard]] static constexpr T const& get(T const& v)
    {
        return v;
    }
};
} // namespace oc::impl

/// Ordered set of unique T stored as one contiguous, sorted array.
///
/// Same storage and complexity as oc::ordered_map (binary search lookup, shifting insert/remove),
/// with the element serving as its own key. Elements are only reachable as const.
///
/// Usage:
///   auto s = oc::ordered_set<int>::create_from_or_throw({5, 1, 3});
///   s.insert(2);      // true
///   s.insert(3);      // false, already present
///   s.contains(4);    // false
///
/// The set-algebra operations (union_with, intersection_with, ...) are linear merges of the two
/// sorted arrays and produce a new set from the resource of the left operand.
template <class T>
struct oc::ordered_set : private oc::ordered_container<T, oc::impl::identity_key_of, ordered_set<T>>
{
    using base = oc::ordered_container<T, oc::impl::identity_key_of, ordered_set<T>>;

    using value_t = T;

    using base::alloc_alignment;

    // element access
public:
    /// Pointer to the stored element equivalent to `key`, or nullptr.
    template <class Q>
    [[nodiscard]] T const* get(Q const& key) const
    {
        return base::find(key);
    }

    using base::contains;
    using base::search;

    using base::first; // smallest element or nullptr
    using base::last;  // largest element or nullptr

    using base::as_span;

    [[nodiscard]] T const* data() const { return base::data(); }

    // iterators
public:
    using base::begin;
    using base::end;

    /// Elements in descending order.
    [[nodiscard]] oc::strided_span<T const> reversed() const
    {
        return oc::strided_span<T const>(base::data(), base::size(), isize(sizeof(T))).reversed();
    }

    // queries
public:
    using base::capacity;
    using base::empty;
    using base::resource;
    using base::size;

    // insertion
public:
    /// Adds `value` if no equivalent element is present.
    /// Returns true if it was added; an existing element is left untouched.
    template <class U>
    [[nodiscard]] oc::result<bool> try_insert(U&& value)
    {
        auto const pos = base::search(value);
        if (pos.found)
            return false;

        auto v = T(oc::forward<U>(value));
        auto placed = base::try_insert_at(pos.index, oc::move(v));
        if (placed.has_error())
            return oc::move(placed).error();

        return true;
    }

    /// Throwing version of try_insert.
    template <class U>
    bool insert(U&& value)
    {
        return try_insert(oc::forward<U>(value)).value_or_throw();
    }

    /// Inserts every element of `values`. Elements already present are skipped.
    template <class Range>
    void extend(Range&& values)
    {
        for (auto&& v : values)
            insert(oc::forward<decltype(v)>(v));
    }
    void extend(std::initializer_list<T> values) { extend(oc::span<T const>(values)); }

    /// Moves every element of `other` into this set. `other` is empty afterwards and keeps its capacity.
    void append(ordered_set& other)
    {
        if (this == &other)
            return;

        base::reserve(other.size());
        other.drain([this](T&& v) { insert(oc::move(v)); });
    }

    // removal
public:
    /// Removes the element equivalent to `key`. Returns true if one was removed.
    template <class Q>
    bool remove(Q const& key)
    {
        auto const pos = base::search(key);
        if (!pos.found)
            return false;
        base::remove_at(pos.index);
        return true;
    }

    /// Removes and returns the element equivalent to `key`, or nullopt.
    template <class Q>
    [[nodiscard]] oc::optional<T> take(Q const& key)
    {
        auto const pos = base::search(key);
        if (!pos.found)
            return oc::nullopt;
        return oc::optional<T>(base::pop_at(pos.index));
    }

    using base::pop_first;
    using base::pop_last;

    /// Keeps exactly the elements for which pred(T const&) is true.
    template <class Pred>
    void retain_where(Pred&& pred)
    {
        base::retain_where([&pred](T const& v) { return pred(v); });
    }

    using base::clear;
    using base::drain;

    // capacity
public:
    using base::reserve;
    using base::shrink_to;
    using base::shrink_to_fit;
    using base::try_reserve;
    using base::try_shrink_to;

    // factories
public:
    using base::create_from;
    using base::create_from_or_throw;
    using base::create_from_raw_parts;
    using base::create_with_capacity;
    using base::create_with_resource;
    using base::try_create_with_capacity;

    // raw parts
public:
    using base::extract_raw_parts;

    // set algebra
public:
    /// Elements in this set, in `rhs`, or in both.
    [[nodiscard]] ordered_set union_with(ordered_set const& rhs) const
    {
        return impl_merge(rhs, true, true, true);
    }

    /// Elements in both sets.
    [[nodiscard]] ordered_set intersection_with(ordered_set const& rhs) const
    {
        return impl_merge(rhs, false, false, true);
    }

    /// Elements in this set but not in `rhs`.
    [[nodiscard]] ordered_set difference_with(ordered_set const& rhs) const
    {
        return impl_merge(rhs, true, false, false);
    }

    /// Elements in exactly one of the two sets.
    [[nodiscard]] ordered_set symmetric_difference_with(ordered_set const& rhs) const
    {
        return impl_merge(rhs, true, true, false);
    }

    [[nodiscard]] friend ordered_set operator|(ordered_set const& lhs, ordered_set const& rhs)
    {
        return lhs.union_with(rhs);
    }
    [[nodiscard]] friend ordered_set operator&(ordered_set const& lhs, ordered_set const& rhs)
    {
        return lhs.intersection_with(rhs);
    }
    [[nodiscard]] friend ordered_set operator-(ordered_set const& lhs, ordered_set const& rhs)
    {
        return lhs.difference_with(rhs);
    }
    [[nodiscard]] friend ordered_set operator^(ordered_set const& lhs, ordered_set const& rhs)
    {
        return lhs.symmetric_difference_with(rhs);
    }

    /// True iff every element of this set is in `rhs`.
    [[nodiscard]] bool is_subset_of(ordered_set const& rhs) const
    {
        if (size() > rhs.size())
            return false;
        return std::includes(rhs.begin(), rhs.end(), begin(), end());
    }

    /// True iff every element of `rhs` is in this set.
    [[nodiscard]] bool is_superset_of(ordered_set const& rhs) const { return rhs.is_subset_of(*this); }

    /// True iff the two sets have no element in common.
    [[nodiscard]] bool is_disjoint_from(ordered_set const& rhs) const
    {
        auto a = begin();
        auto b = rhs.begin();
        while (a != end() && b != rhs.end())
        {
            if (*a < *b)
                ++a;
            else if (*b < *a)
                ++b;
            else
                return false;
        }
        return true;
    }

    // comparison
public:
    /// Equal iff both sets hold the same elements. Capacity and resource are ignored.
    [[nodiscard]] friend bool operator==(ordered_set const& lhs, ordered_set const& rhs)
    {
        return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
    }

    /// Lexicographic comparison of the element sequences.
    [[nodiscard]] friend auto operator<=>(ordered_set const& lhs, ordered_set const& rhs)
        requires std::three_way_comparable<T>
    {
        return std::lexicographical_compare_three_way(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
    }

    // lifecycle
public:
    ordered_set() = default;
    ~ordered_set() = default;
    ordered_set(ordered_set&&) = default;
    ordered_set& operator=(ordered_set&&) = default;
    ordered_set(ordered_set const&) = default;
    ordered_set& operator=(ordered_set const&) = default;

    friend base;

private:
    // Linear merge of two sorted ranges. The flags select which elements survive:
    // only in *this, only in rhs, in both.
    [[nodiscard]] ordered_set impl_merge(ordered_set const& rhs,
                                         bool keep_lhs_only,
                                         bool keep_rhs_only,
                                         bool keep_both) const
    {
        auto bound = isize(0);
        if (keep_lhs_only)
            bound += size();
        if (keep_rhs_only)
            bound += rhs.size();
        if (keep_both && !keep_lhs_only)
            bound += oc::min(size(), rhs.size());

        auto result = ordered_set::create_with_capacity(bound, base::resource());

        // every kept element is larger than all previous ones, so it always goes to the end
        auto const push = [&result](T const& v)
        { (void)result.base::try_insert_at(result.size(), T(v)).value_or_throw(); };

        auto a = begin();
        auto b = rhs.begin();
        while (a != end() && b != rhs.end())
        {
            if (*a < *b)
            {
                if (keep_lhs_only)
                    push(*a);
                ++a;
            }
            else if (*b < *a)
            {
                if (keep_rhs_only)
                    push(*b);
                ++b;
            }
            else
            {
                if (keep_both)
                    push(*a);
                ++a;
                ++b;
            }
        }

        if (keep_lhs_only)
            for (; a != end(); ++a)
                push(*a);
        if (keep_rhs_only)
            for (; b != rhs.end(); ++b)
                push(*b);

        return result;
    }
};
