#pragma once

#include <ordered-core/allocation.hh>
#include <ordered-core/error.hh>
#include <ordered-core/optional.hh>
#include <ordered-core/result.hh>
#include <ordered-core/span.hh>

#include <algorithm>
#include <new>


/// Outcome of a binary search over the sorted live range.
/// found == true:  index is the position of the equivalent key.
/// found == false: index is where the key would have to be inserted to keep the range sorted.
struct oc::search_result
{
    bool found = false;
    isize index = 0;

    [[nodiscard]] constexpr bool operator==(search_result const&) const = default;
};

/// Sorted, duplicate-free storage engine shared by oc::ordered_map and oc::ordered_set.
///
/// CRTP mixin in the style of a contiguous container: the façade privately inherits it as
/// `oc::ordered_container<T, KeyOf, Derived>` and re-exposes what it wants via `using`.
/// KeyOf is a stateless projection with `static auto const& get(T const&)` that yields the sort key
/// (the entry key for maps, the element itself for sets).
///
/// State is a single oc::allocation<T>. Its live window always starts at the block start, so
/// index i of the collection is obj_start[i] and capacity is the number of T slots in the block.
///
/// Invariants kept by every operation:
/// - key(i) < key(i + 1) for all adjacent live entries (sorted and unique),
/// - [0, size()) are live objects, [size(), capacity()) is raw storage,
/// - the block is exactly capacity() * sizeof(T) bytes at alloc_alignment, or absent when capacity() == 0.
///
/// === Exception & reference guarantees ===
///
/// Allocation failures leave the collection unchanged (strong guarantee).
/// The try_* functions report them as oc::result, the others throw oc::error_exception.
/// Constructing the new entry happens before anything is shifted or reallocated, so a throwing
/// constructor leaves the collection unchanged as well.
/// If a move constructor or move assignment throws while entries are shifted, the collection stays
/// structurally valid but some entries may be moved-from.
///
/// Any insertion, removal, reserve or shrink invalidates pointers, references and iterators.
template <class T, class KeyOf, class ContainerT>
struct oc::ordered_container
{
    using container_t = ContainerT;

    /// Alignment of every block owned by an ordered collection.
    /// At least one destructive-interference unit, so distinct collections never share a cache line.
    /// Raw parts handed to create_from_raw_parts must have been allocated with this alignment.
    static constexpr isize alloc_alignment = isize(oc::max(alignof(T), std::hardware_destructive_interference_size));

    // element access
public:
    /// Pointer to the first live entry. nullptr for a collection that never allocated.
    [[nodiscard]] constexpr T* data() { return _data.obj_start; }
    [[nodiscard]] constexpr T const* data() const { return _data.obj_start; }

    /// All live entries in ascending key order.
    [[nodiscard]] constexpr oc::span<T const> as_span() const
    {
        return oc::span<T const>(_data.obj_start, _data.obj_end);
    }

    /// Smallest entry, or nullptr if empty.
    [[nodiscard]] constexpr T const* first() const { return empty() ? nullptr : _data.obj_start; }
    /// Largest entry, or nullptr if empty.
    [[nodiscard]] constexpr T const* last() const { return empty() ? nullptr : _data.obj_end - 1; }

    // iterators
public:
    [[nodiscard]] constexpr T const* begin() const { return _data.obj_start; }
    [[nodiscard]] constexpr T const* end() const { return _data.obj_end; }

    // queries
public:
    /// Number of live entries.
    [[nodiscard]] constexpr isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] constexpr bool empty() const { return _data.obj_start == _data.obj_end; }

    /// Number of entries the current block can hold without growing.
    [[nodiscard]] constexpr isize capacity() const { return _data.obj_capacity(); }

    /// The memory resource blocks are obtained from. Never nullptr.
    [[nodiscard]] oc::memory_resource const* resource() const { return &_data.resource(); }

    // search
public:
    /// Binary search for `key` over the live range.
    /// Q may be any type that is ordered against the key type with operator< in both directions.
    template <class Q>
    [[nodiscard]] constexpr oc::search_result search(Q const& key) const
    {
        isize lo = 0;
        isize hi = size();
        while (lo < hi)
        {
            auto const mid = lo + ((hi - lo) >> 1);
            auto const& k = KeyOf::get(_data.obj_start[mid]);
            if (k < key)
                lo = mid + 1;
            else if (key < k)
                hi = mid;
            else
                return {true, mid};
        }
        return {false, lo};
    }

    /// Pointer to the entry with an equivalent key, or nullptr.
    template <class Q>
    [[nodiscard]] constexpr T* find(Q const& key)
    {
        auto const r = search(key);
        return r.found ? _data.obj_start + r.index : nullptr;
    }
    template <class Q>
    [[nodiscard]] constexpr T const* find(Q const& key) const
    {
        auto const r = search(key);
        return r.found ? _data.obj_start + r.index : nullptr;
    }

    template <class Q>
    [[nodiscard]] constexpr bool contains(Q const& key) const
    {
        return search(key).found;
    }

    // capacity
public:
    /// Next capacity when an insertion needs room for min_capacity entries.
    ///
    /// Doubles (with a floor of 1), never below min_capacity, then rounds up so the block fills
    /// whole alloc_alignment units. The rounding adds less than one alignment unit of entries.
    [[nodiscard]] static constexpr isize alloc_grow_capacity_for(isize curr_capacity, isize min_capacity)
    {
        auto const capacity = oc::max(oc::max(curr_capacity << 1, min_capacity), isize(1));
        auto const bytes = capacity * isize(sizeof(T));
        return capacity + (oc::align_up(bytes, alloc_alignment) - bytes) / isize(sizeof(T));
    }

    /// Ensures capacity() >= size() + additional, growing geometrically.
    /// Returns the capacity after the call.
    [[nodiscard]] oc::result<isize> try_reserve(isize additional)
    {
        OC_ASSERT(additional >= 0, "reserve: additional must be non-negative");

        auto const required = size() + additional;
        if (required <= capacity())
            return capacity();

        auto const bytes = alloc_grow_capacity_for(capacity(), required) * isize(sizeof(T));
        if (!_data.try_resize_alloc(bytes, bytes, alloc_alignment))
            return oc::error::create_allocation_failure(bytes);

        return capacity();
    }

    /// Throwing version of try_reserve.
    void reserve(isize additional) { (void)try_reserve(additional).value_or_throw(); }

    /// Reduces capacity to max(size(), min_capacity). No-op if capacity() is already at most that.
    /// A target of 0 returns the block to the resource; the resource itself stays associated.
    /// On failure the collection keeps its previous block.
    /// Returns the capacity after the call.
    [[nodiscard]] oc::result<isize> try_shrink_to(isize min_capacity)
    {
        OC_ASSERT(min_capacity >= 0, "shrink_to: min_capacity must be non-negative");

        auto const target = oc::max(size(), min_capacity);
        if (capacity() <= target)
            return capacity();

        auto const bytes = target * isize(sizeof(T));
        if (!_data.try_resize_alloc(bytes, bytes, alloc_alignment))
            return oc::error::create_allocation_failure(bytes);

        return capacity();
    }

    /// Throwing version of try_shrink_to.
    void shrink_to(isize min_capacity) { (void)try_shrink_to(min_capacity).value_or_throw(); }

    /// Reduces capacity to exactly size().
    void shrink_to_fit() { shrink_to(0); }

    // insertion
public:
    /// Places `value` at position idx, shifting [idx, size()) one slot toward the tail.
    /// The caller guarantees that idx is the search() insertion index of the value's key.
    ///
    /// With spare capacity nothing is allocated. Otherwise the block is grown per
    /// alloc_grow_capacity_for: in place if the resource supports it, else into a new block where
    /// the value is constructed first and the old entries are moved around it.
    ///
    /// Returns a pointer to the placed entry, or allocation_failure with the collection unchanged.
    [[nodiscard]] oc::result<T*> try_insert_at(isize idx, T&& value)
    {
        OC_ASSERT(0 <= idx && idx <= size(), "insert position out of bounds");

        if (size() < capacity()) [[likely]]
        {
            auto const p = _data.obj_start + idx;
            if (impl::open_gap_toward_tail(p, _data.obj_end))
            {
                *p = oc::move(value);
            }
            else
            {
                new (oc::placement_new, p) T(oc::move(value));
                _data.obj_end++; // _after_ so a throwing T(...) leaves the state valid
            }
            return p;
        }

        return impl_try_insert_at_with_growth(idx, oc::move(value));
    }

    // removal
public:
    /// Removes the entry at idx, shifting [idx + 1, size()) one slot toward the head.
    /// Capacity is unchanged.
    constexpr void remove_at(isize idx)
    {
        auto const p = _data.obj_start + idx;
        OC_ASSERT(_data.obj_start <= p && p < _data.obj_end, "index out of bounds");

        impl::compact_move_objects_backward(p, p + 1, _data.obj_end);

        _data.obj_end--;
        _data.obj_end->~T();
    }

    /// Removes and returns the entry at idx by move.
    /// NOTE: Prefer remove_at() if you don't need the return value (avoids an extra move).
    [[nodiscard("use remove_at() if you don't need the return value")]] constexpr T pop_at(isize idx)
    {
        auto const p = _data.obj_start + idx;
        OC_ASSERT(_data.obj_start <= p && p < _data.obj_end, "index out of bounds");

        auto value = oc::move(*p);
        remove_at(idx);
        return value;
    }

    /// Removes and returns the smallest entry, or nullopt if empty.
    [[nodiscard]] oc::optional<T> pop_first()
    {
        if (empty())
            return oc::nullopt;
        return oc::optional<T>(pop_at(0));
    }

    /// Removes and returns the largest entry, or nullopt if empty.
    [[nodiscard]] oc::optional<T> pop_last()
    {
        if (empty())
            return oc::nullopt;
        auto value = oc::move(*(_data.obj_end - 1));
        _data.obj_end--;
        _data.obj_end->~T();
        return oc::optional<T>(oc::move(value));
    }

    /// Keeps exactly the entries for which pred(T&) is true, in their current order.
    /// Single pass; kept entries are moved toward the head and the tail is destroyed.
    /// pred must not change the key of an entry.
    template <class Pred>
    void retain_where(Pred&& pred)
    {
        auto write = _data.obj_start;
        for (auto read = _data.obj_start; read != _data.obj_end; ++read)
        {
            if (!pred(*read))
                continue;

            if (write != read)
                *write = oc::move(*read);
            ++write;
        }

        impl::destroy_objects_in_reverse(write, _data.obj_end);
        _data.obj_end = write;
    }

    /// Calls fn(T&&) for every entry in ascending order, then destroys all entries.
    /// The collection is empty afterwards but keeps its capacity and resource.
    /// If fn throws, the remaining entries (moved-from or not) are destroyed and the collection is empty.
    template <class Fn>
    void drain(Fn&& fn)
    {
        struct clear_on_exit
        {
            ordered_container* self;
            ~clear_on_exit() { self->clear(); }
        } const guard{this};

        for (auto p = _data.obj_start; p != _data.obj_end; ++p)
            fn(oc::move(*p));
    }

    /// Destroys all live entries. Capacity and resource are kept.
    constexpr void clear()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    // factories
public:
    /// Empty collection that allocates from `resource` (nullptr: default resource). Does not allocate.
    [[nodiscard]] static container_t create_with_resource(oc::memory_resource const* resource)
    {
        container_t c;
        c._data.custom_resource = resource;
        return c;
    }

    /// Empty collection with room for at least `capacity` entries.
    [[nodiscard]] static oc::result<container_t> try_create_with_capacity(isize capacity,
                                                                         oc::memory_resource const* resource = nullptr)
    {
        OC_ASSERT(capacity >= 0, "capacity must be non-negative");

        auto const bytes = capacity * isize(sizeof(T));
        auto data = oc::allocation<T>::try_create_empty_bytes(bytes, bytes, alloc_alignment, resource);
        if (data.has_error())
            return oc::move(data).error();

        container_t c;
        c._data = oc::move(data).value();
        return c;
    }

    /// Throwing version of try_create_with_capacity.
    [[nodiscard]] static container_t create_with_capacity(isize capacity, oc::memory_resource const* resource = nullptr)
    {
        return try_create_with_capacity(capacity, resource).value_or_throw();
    }

    /// One-shot bulk construction from a fixed collection of entries.
    ///
    /// Copies the entries into a block of exactly source.size() slots, stable-sorts them by key and
    /// rejects the input if any two keys are equivalent. The duplicate_key error carries the sorted
    /// position of the second of the pair. Nothing is kept on failure.
    [[nodiscard]] static oc::result<container_t> create_from(oc::span<T const> source,
                                                             oc::memory_resource const* resource = nullptr,
                                                             oc::source_location site = oc::source_location::current())
    {
        auto const bytes = source.size() * isize(sizeof(T));
        auto data = oc::allocation<T>::try_create_empty_bytes(bytes, bytes, alloc_alignment, resource);
        if (data.has_error())
            return oc::move(data).error();

        auto& d = data.value();
        impl::copy_create_objects_to(d.obj_end, source.data(), source.data() + source.size());

        std::stable_sort(d.obj_start, d.obj_end,
                         [](T const& a, T const& b) { return KeyOf::get(a) < KeyOf::get(b); });

        for (isize i = 1; i < d.obj_count(); ++i)
            if (!(KeyOf::get(d.obj_start[i - 1]) < KeyOf::get(d.obj_start[i])))
                return oc::error::create_duplicate_key(i, site);

        container_t c;
        c._data = oc::move(d);
        return c;
    }

    /// Throwing version of create_from.
    [[nodiscard]] static container_t create_from_or_throw(oc::span<T const> source,
                                                          oc::memory_resource const* resource = nullptr,
                                                          oc::source_location site = oc::source_location::current())
    {
        return create_from(source, resource, site).value_or_throw();
    }

    // raw parts
public:
    /// Reassembles a collection from parts produced by extract_raw_parts (or built under the same rules).
    ///
    /// This is the unchecked trust boundary of the collection. The caller guarantees that
    /// - parts.ptr holds parts.capacity * sizeof(T) bytes from parts.resource at alloc_alignment,
    /// - the first parts.length slots are live entries, sorted by key and free of duplicates,
    /// - nobody else owns the block anymore.
    /// Only the shape (length <= capacity, ptr null iff capacity is 0, alignment) is asserted.
    [[nodiscard]] static container_t create_from_raw_parts(oc::raw_parts<T> const& parts)
    {
        container_t c;
        c._data = oc::allocation<T>::create_from_raw_parts(parts, alloc_alignment);
        return c;
    }

    /// Disassembles the collection. The caller owns the block and the live entries afterwards and
    /// must either hand them back via create_from_raw_parts or destroy and deallocate them itself.
    /// The collection is left empty and keeps its resource.
    [[nodiscard]] oc::raw_parts<T> extract_raw_parts() { return _data.release(); }

    // lifecycle
public:
    ordered_container() = default;
    ~ordered_container() = default;

    ordered_container(ordered_container&&) = default;
    ordered_container& operator=(ordered_container&&) = default;

    /// Deep copy into a tight block from the source's resource.
    /// Throws oc::error_exception if the resource cannot provide the block.
    ordered_container(ordered_container const& rhs)
    {
        _data = impl_copy_of(rhs._data, rhs._data.custom_resource);
    }

    /// Deep copy that keeps the resource of *this.
    ordered_container& operator=(ordered_container const& rhs)
    {
        if (this != &rhs)
            _data = impl_copy_of(rhs._data, _data.custom_resource);
        return *this;
    }

private:
    OC_COLD_FUNC [[nodiscard]] oc::result<T*> impl_try_insert_at_with_growth(isize idx, T&& value)
    {
        auto const new_bytes = alloc_grow_capacity_for(capacity(), size() + 1) * isize(sizeof(T));

        if (_data.is_valid() && _data.try_resize_alloc_inplace(new_bytes, new_bytes))
            return try_insert_at(idx, oc::move(value));

        auto new_data
            = oc::allocation<T>::try_create_empty_bytes(new_bytes, new_bytes, alloc_alignment, _data.custom_resource);
        if (new_data.has_error())
            return oc::move(new_data).error();

        auto& fresh = new_data.value();

        // the live window of the new block starts at the new entry and grows outward,
        // so a throwing move leaves a contiguous range for fresh's destructor
        fresh.obj_start += idx;
        fresh.obj_end = fresh.obj_start;

        auto const p = new (oc::placement_new, fresh.obj_end) T(oc::move(value));
        fresh.obj_end++;

        impl::move_create_objects_to_reverse(fresh.obj_start, _data.obj_start, _data.obj_start + idx);
        impl::move_create_objects_to(fresh.obj_end, _data.obj_start + idx, _data.obj_end);

        // destroys the moved-from entries and returns the old block
        _data = oc::move(fresh);
        return p;
    }

    [[nodiscard]] static oc::allocation<T> impl_copy_of(oc::allocation<T> const& source,
                                                        oc::memory_resource const* resource)
    {
        auto const bytes = source.obj_count() * isize(sizeof(T));
        auto copy = oc::allocation<T>::try_create_empty_bytes(bytes, bytes, alloc_alignment, resource).value_or_throw();
        impl::copy_create_objects_to(copy.obj_end, source.obj_start, source.obj_end);
        return copy;
    }

    oc::allocation<T> _data;
};
