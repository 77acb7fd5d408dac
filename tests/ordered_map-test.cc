#include <ordered-core/assert-handler.hh>
#include <ordered-core/hash.hh>
#include <ordered-core/ordered_map.hh>

#include <nexus/test.hh>

#include "test-resources.hh"

#include <map>
#include <new>
#include <string>
#include <string_view>
#include <vector>

namespace
{
using map_t = oc::ordered_map<int, std::string>;

// Counts live instances; every constructed object must be destroyed exactly once.
struct Counted
{
    int value = 0;
    static inline int live = 0;
    static inline int constructed = 0;

    static void reset()
    {
        live = 0;
        constructed = 0;
    }

    explicit Counted(int v) : value(v)
    {
        ++live;
        ++constructed;
    }
    Counted(Counted const& rhs) : value(rhs.value)
    {
        ++live;
        ++constructed;
    }
    Counted(Counted&& rhs) noexcept : value(rhs.value)
    {
        ++live;
        ++constructed;
    }
    Counted& operator=(Counted const& rhs) = default;
    Counted& operator=(Counted&& rhs) noexcept = default;
    ~Counted() { --live; }

    friend bool operator==(Counted const&, Counted const&) = default;
};

#if OC_ASSERT_ENABLED
struct assertion_failed
{
};

// true if f() triggers an OC_ASSERT
template <class F>
bool triggers_assert(F&& f)
{
    auto handler = oc::impl::scoped_assertion_handler([](oc::impl::assertion_info const&) { throw assertion_failed{}; });
    try
    {
        f();
    }
    catch (assertion_failed const&)
    {
        return true;
    }
    return false;
}
#endif

bool has_entries(map_t const& m, std::vector<std::pair<int, std::string>> const& expected)
{
    if (m.size() != oc::isize(expected.size()))
        return false;
    for (size_t i = 0; i < expected.size(); ++i)
        if (m.as_span()[oc::isize(i)].key != expected[i].first || m.as_span()[oc::isize(i)].value != expected[i].second)
            return false;
    return true;
}

template <class Map>
bool is_strictly_sorted(Map const& m)
{
    for (oc::isize i = 1; i < m.size(); ++i)
        if (!(m.as_span()[i - 1].key < m.as_span()[i].key))
            return false;
    return true;
}
} // namespace

TEST("ordered_map - insert, search and remove scenario")
{
    map_t m;

    CHECK(!m.insert(3, "c").has_value());
    CHECK(!m.insert(1, "a").has_value());
    CHECK(!m.insert(2, "b").has_value());

    CHECK(has_entries(m, {{1, "a"}, {2, "b"}, {3, "c"}}));

    auto const found = m.search(2);
    CHECK(found.found);
    CHECK(found.index == 1);

    auto removed = m.remove(2);
    REQUIRE(removed.has_value());
    CHECK(removed.value() == "b");
    CHECK(has_entries(m, {{1, "a"}, {3, "c"}}));

    CHECK(!m.remove(2).has_value());
    CHECK(has_entries(m, {{1, "a"}, {3, "c"}}));
}

TEST("ordered_map - empty map")
{
    map_t m;

    CHECK(m.empty());
    CHECK(m.size() == 0);
    CHECK(m.capacity() == 0);
    CHECK(m.data() == nullptr);
    CHECK(m.begin() == m.end());
    CHECK(m.first() == nullptr);
    CHECK(m.last() == nullptr);
    CHECK(m.get(1) == nullptr);
    CHECK(!m.contains(1));
    CHECK(!m.remove(1).has_value());
    CHECK(!m.pop_first().has_value());
    CHECK(!m.pop_last().has_value());
    CHECK(!m.first_key_value().has_value());
    CHECK(m.keys().empty());
    CHECK(m.reversed().empty());
    CHECK(m.resource() == oc::default_memory_resource);

    auto const r = m.search(42);
    CHECK(!r.found);
    CHECK(r.index == 0);
}

TEST("ordered_map - search reports insertion points")
{
    auto m = map_t::create_from_or_throw({{10, "x"}, {20, "y"}, {30, "z"}});

    auto const check_search = [&](int key, bool found, oc::isize index)
    {
        auto const r = m.search(key);
        return r == oc::search_result{found, index};
    };

    CHECK(check_search(5, false, 0));
    CHECK(check_search(10, true, 0));
    CHECK(check_search(15, false, 1));
    CHECK(check_search(30, true, 2));
    CHECK(check_search(35, false, 3));
}

TEST("ordered_map - insert overwrites and returns the previous value")
{
    map_t m;
    m.insert(1, "a");
    m.insert(2, "b");
    auto const cap = m.capacity();

    auto old = m.insert(1, "z");

    REQUIRE(old.has_value());
    CHECK(old.value() == "a");
    CHECK(m.size() == 2);
    CHECK(m.capacity() == cap);
    CHECK(*m.get(1) == "z");
    CHECK(has_entries(m, {{1, "z"}, {2, "b"}}));
}

TEST("ordered_map - overwriting with a value read from the map itself")
{
    SECTION("insert")
    {
        map_t m;
        m.insert(1, "alpha");
        m.insert(2, "beta");

        auto prev = m.insert(1, m.at(1));

        REQUIRE(prev.has_value());
        CHECK(prev.value() == "alpha");
        CHECK(has_entries(m, {{1, "alpha"}, {2, "beta"}}));

        prev = m.insert(2, *m.get(1));

        REQUIRE(prev.has_value());
        CHECK(prev.value() == "beta");
        CHECK(has_entries(m, {{1, "alpha"}, {2, "alpha"}}));
    }

    SECTION("extend with itself")
    {
        auto n = map_t::create_from_or_throw({{1, "x"}, {2, "y"}});
        auto const cap = n.capacity();

        n.extend(n);

        CHECK(has_entries(n, {{1, "x"}, {2, "y"}}));
        CHECK(n.capacity() == cap);
    }
}

TEST("ordered_map - stays sorted and unique under mixed operations")
{
    oc::ordered_map<int, int> m;
    std::map<int, int> reference;

    // deterministic pseudo-random sequence
    unsigned state = 12345;
    auto next = [&]
    {
        state = state * 1103515245u + 12345u;
        return int((state >> 16) % 200);
    };

    for (int step = 0; step < 2000; ++step)
    {
        auto const key = next();
        if (step % 3 == 2)
        {
            auto const removed = m.remove(key);
            auto const it = reference.find(key);
            CHECK(removed.has_value() == (it != reference.end()));
            if (it != reference.end())
            {
                CHECK(removed.value() == it->second);
                reference.erase(it);
            }
            CHECK(!m.contains(key));
        }
        else
        {
            auto const prev = m.insert(key, step);
            auto const it = reference.find(key);
            CHECK(prev.has_value() == (it != reference.end()));
            reference[key] = step;
        }
    }

    REQUIRE(m.size() == oc::isize(reference.size()));
    CHECK(is_strictly_sorted(m));

    auto i = 0;
    for (auto const& [k, v] : reference)
    {
        CHECK(m.as_span()[i].key == k);
        CHECK(m.as_span()[i].value == v);
        ++i;
    }
}

TEST("ordered_map - get, at and operator[]")
{
    auto m = map_t::create_from_or_throw({{1, "a"}, {2, "b"}});

    SECTION("get")
    {
        REQUIRE(m.get(2) != nullptr);
        CHECK(*m.get(2) == "b");
        CHECK(m.get(3) == nullptr);

        *m.get(2) = "B";
        CHECK(*m.get(2) == "B");
    }

    SECTION("operator[] reads and writes present keys")
    {
        CHECK(m[1] == "a");
        m[1] = "A";
        CHECK(m[1] == "A");
        CHECK(m.size() == 2);
    }

    SECTION("at throws key_not_found")
    {
        CHECK(m.at(1) == "a");

        auto thrown = false;
        try
        {
            (void)m.at(7);
        }
        catch (oc::error_exception const& e)
        {
            thrown = true;
            CHECK(e.get_error().is(oc::error_kind::key_not_found));
            CHECK(std::string(e.get_error().site.file_name()).ends_with("ordered_map-test.cc"));
            CHECK(std::string(e.what()).find("key_not_found") != std::string::npos);
        }
        CHECK(thrown);
        CHECK(m.size() == 2);
    }

    SECTION("get_key_value")
    {
        auto const* e = m.get_key_value(2);
        REQUIRE(e != nullptr);
        CHECK(e->key == 2);
        CHECK(e->value == "b");
        CHECK(e == m.data() + 1);
        CHECK(m.get_key_value(0) == nullptr);
        CHECK(m.get_key_value(3) == nullptr);
    }

#if OC_ASSERT_ENABLED
    SECTION("operator[] on a missing key asserts")
    {
        CHECK(triggers_assert([&] { (void)m[7]; }));
        CHECK(!triggers_assert([&] { (void)m[2]; }));
    }
#endif
}

TEST("ordered_map - heterogeneous lookup")
{
    oc::ordered_map<std::string, int> m;
    m.insert(std::string("banana"), 2);
    m.insert("apple", 1);
    m.insert(std::string_view("cherry"), 3);

    CHECK(m.contains("apple"));
    CHECK(m.contains(std::string_view("cherry")));
    CHECK(!m.contains("durian"));
    REQUIRE(m.get("banana") != nullptr);
    CHECK(*m.get("banana") == 2);
    CHECK(m.remove(std::string_view("apple")).value() == 1);
    CHECK(m.size() == 2);
    CHECK(m.as_span()[0].key == "banana");
}

TEST("ordered_map - create_from sorts and rejects duplicates")
{
    SECTION("sorted result")
    {
        auto r = map_t::create_from({{3, "c"}, {1, "a"}, {2, "b"}});
        REQUIRE(r.has_value());
        CHECK(has_entries(r.value(), {{1, "a"}, {2, "b"}, {3, "c"}}));
        CHECK(r.value().capacity() == 3);
    }

    SECTION("duplicate key")
    {
        test::test_resource res;
        Counted::reset();

        {
            auto r = oc::ordered_map<int, Counted>::create_from(
                {{5, Counted(0)}, {1, Counted(1)}, {5, Counted(2)}, {3, Counted(3)}}, res.get());

            REQUIRE(r.has_error());
            CHECK(r.error().is(oc::error_kind::duplicate_key));
            // sorted keys are 1 3 5 5, the second 5 sits at index 3
            CHECK(r.error().index == 3);
            CHECK(std::string(r.error().site.file_name()).ends_with("ordered_map-test.cc"));
        }

        CHECK(Counted::live == 0);
        CHECK(res.stats.balanced());
    }

    SECTION("create_from_or_throw")
    {
        auto thrown = false;
        try
        {
            (void)map_t::create_from_or_throw({{1, "a"}, {1, "b"}});
        }
        catch (oc::error_exception const& e)
        {
            thrown = true;
            CHECK(e.get_error().is(oc::error_kind::duplicate_key));
            CHECK(e.get_error().index == 1);
        }
        CHECK(thrown);
    }

    SECTION("empty input")
    {
        auto r = map_t::create_from({});
        REQUIRE(r.has_value());
        CHECK(r.value().empty());
        CHECK(r.value().capacity() == 0);
    }
}

TEST("ordered_map - extend keeps the later entry")
{
    map_t m;
    m.extend({{2, "b"}, {1, "a"}, {2, "B"}});

    CHECK(has_entries(m, {{1, "a"}, {2, "B"}}));

    std::vector<std::pair<int, std::string>> more = {{0, "zero"}, {1, "one"}};
    m.extend(more);

    CHECK(has_entries(m, {{0, "zero"}, {1, "one"}, {2, "B"}}));
}

TEST("ordered_map - capacity growth")
{
    oc::ordered_map<int, int> m;
    using entry_t = oc::entry<int, int>;

    auto prev_capacity = m.capacity();
    for (int i = 0; i < 500; ++i)
    {
        m.insert((i * 37) % 500, i);
        CHECK(m.capacity() >= prev_capacity);
        CHECK(m.capacity() >= m.size());
        prev_capacity = m.capacity();
    }
    CHECK(m.size() == 500);
    CHECK(is_strictly_sorted(m));

    SECTION("first insertion allocates at least one slot")
    {
        oc::ordered_map<int, int> fresh;
        fresh.insert(1, 1);
        CHECK(fresh.capacity() >= 1);
        CHECK(fresh.capacity() == decltype(fresh)::base::alloc_grow_capacity_for(0, 1));
    }

    SECTION("growth policy")
    {
        using base = oc::ordered_map<int, int>::base;
        auto const per_line = oc::isize(std::hardware_destructive_interference_size / sizeof(entry_t));

        CHECK(base::alloc_grow_capacity_for(0, 1) == per_line);
        CHECK(base::alloc_grow_capacity_for(per_line, per_line + 1) == 2 * per_line);
        CHECK(base::alloc_grow_capacity_for(4, 100) >= 100);
        CHECK(base::alloc_grow_capacity_for(100, 101) >= 200);
    }
}

TEST("ordered_map - reserve and shrink")
{
    test::test_resource res;

    {
        auto m = map_t::create_with_resource(res.get());
        CHECK(m.resource() == res.get());
        CHECK(res.stats.allocate_calls == 0);

        m.reserve(10);
        CHECK(m.capacity() >= 10);
        auto const reserved = m.capacity();

        for (int i = 0; i < 10; ++i)
            m.insert(i, std::to_string(i));
        CHECK(m.capacity() == reserved);
        CHECK(res.stats.allocate_calls == 1);

        SECTION("shrink_to_fit")
        {
            (void)m.remove(0);
            (void)m.remove(1);
            m.shrink_to_fit();
            CHECK(m.capacity() == 8);
            CHECK(m.size() == 8);
            CHECK(m[9] == "9");
        }

        SECTION("shrink_to keeps at least the live entries")
        {
            m.shrink_to(4);
            CHECK(m.capacity() == 10);
        }

        SECTION("shrink_to never grows")
        {
            auto const cap = m.capacity();
            auto const r = m.try_shrink_to(cap + 100);
            REQUIRE(r.has_value());
            CHECK(r.value() == cap);
            CHECK(m.capacity() == cap);
        }

        SECTION("shrink to zero releases the block")
        {
            m.clear();
            CHECK(m.capacity() == reserved);
            m.shrink_to_fit();
            CHECK(m.capacity() == 0);
            CHECK(m.data() == nullptr);
            CHECK(m.resource() == res.get());

            m.insert(1, "again");
            CHECK(m.capacity() >= 1);
        }
    }

    CHECK(res.stats.balanced());
}

TEST("ordered_map - allocation failure leaves the map unchanged")
{
    test::test_resource res;
    Counted::reset();

    {
        auto m = oc::ordered_map<int, Counted>::create_with_capacity(2, res.get());
        m.insert(1, Counted(1));
        m.insert(3, Counted(3));
        REQUIRE(m.size() == m.capacity());

        auto const data_before = m.data();
        res.stats.refuse = true;

        auto r = m.try_insert(2, Counted(2));
        REQUIRE(r.has_error());
        CHECK(r.error().is(oc::error_kind::allocation_failure));

        CHECK(m.size() == 2);
        CHECK(m.capacity() == 2);
        CHECK(m.data() == data_before);
        CHECK(m[1].value == 1);
        CHECK(m[3].value == 3);
        CHECK(!m.contains(2));

        // overwriting needs no memory
        auto const old = m.try_insert(3, Counted(33));
        REQUIRE(old.has_value());
        CHECK(old.value().value().value == 3);

        SECTION("throwing insert")
        {
            auto thrown = false;
            try
            {
                m.insert(2, Counted(2));
            }
            catch (oc::error_exception const& e)
            {
                thrown = true;
                CHECK(e.get_error().is(oc::error_kind::allocation_failure));
            }
            CHECK(thrown);
            CHECK(m.size() == 2);
        }

        SECTION("reserve")
        {
            auto const rr = m.try_reserve(100);
            REQUIRE(rr.has_error());
            CHECK(m.capacity() == 2);
        }

        SECTION("shrink")
        {
            (void)m.remove(1);
            auto const rs = m.try_shrink_to(0);
            REQUIRE(rs.has_error());
            CHECK(m.capacity() == 2);
            CHECK(m.size() == 1);
        }
    }

    CHECK(Counted::live == 0);
    CHECK(res.stats.balanced());
}

TEST("ordered_map - growth inserts at every position")
{
    // std::string values take the non-trivial path through all shifting and growth code
    for (int pos = 0; pos <= 6; ++pos)
    {
        oc::ordered_map<int, std::string> m;
        for (int i = 0; i < 6; ++i)
            m.insert(i * 10, std::to_string(i * 10));

        // force a full block so the next insert has to grow
        m.shrink_to_fit();
        REQUIRE(m.capacity() == 6);

        auto const key = pos * 10 - 5;
        m.insert(key, "new");

        CHECK(m.size() == 7);
        CHECK(m.capacity() > 6);
        CHECK(is_strictly_sorted(m));
        CHECK(m.search(key).index == pos);
        CHECK(m[key] == "new");
        for (int i = 0; i < 6; ++i)
            CHECK(m[i * 10] == std::to_string(i * 10));
    }
}

TEST("ordered_map - growth uses in-place resizing when available")
{
    test::test_resource res;
    res.stats.inplace_bytes = 4096;

    {
        auto m = oc::ordered_map<int, int>::create_with_resource(res.get());
        for (int i = 0; i < 100; ++i)
            m.insert(100 - i, i);

        CHECK(res.stats.allocate_calls == 1);
        CHECK(res.stats.resize_calls > 0);
        CHECK(is_strictly_sorted(m));
        CHECK(m.size() == 100);
    }

    CHECK(res.stats.balanced());
}

TEST("ordered_map - every entry is destroyed exactly once")
{
    Counted::reset();

    {
        oc::ordered_map<int, Counted> m;
        for (int i = 0; i < 40; ++i)
            m.insert(i % 2 == 0 ? i : 100 - i, Counted(i));
        CHECK(Counted::live == 40);

        m.insert(0, Counted(-1)); // overwrite, old value returned and dropped
        CHECK(Counted::live == 40);

        for (int i = 0; i < 10; ++i)
            (void)m.remove(i * 2);
        CHECK(Counted::live == 30);

        auto copy = m;
        CHECK(Counted::live == 60);

        m.clear();
        CHECK(Counted::live == 30);
        CHECK(m.capacity() > 0);
    }

    CHECK(Counted::live == 0);
}

TEST("ordered_map - raw parts round trip")
{
    test::test_resource res;

    {
        auto m = map_t::create_with_resource(res.get());
        m.insert(2, "b");
        m.insert(1, "a");
        m.insert(3, "c");
        auto const cap = m.capacity();
        auto const ptr = m.data();

        auto parts = m.extract_raw_parts();

        CHECK(m.empty());
        CHECK(m.capacity() == 0);
        CHECK(m.resource() == res.get());

        CHECK(parts.ptr == ptr);
        CHECK(parts.length == 3);
        CHECK(parts.capacity == cap);
        CHECK(parts.resource == res.get());
        CHECK(oc::is_aligned(parts.ptr, map_t::alloc_alignment));
        CHECK(res.stats.deallocate_calls == 0);

        auto back = map_t::create_from_raw_parts(parts);

        CHECK(back.data() == ptr);
        CHECK(back.capacity() == cap);
        CHECK(back.resource() == res.get());
        CHECK(has_entries(back, {{1, "a"}, {2, "b"}, {3, "c"}}));

        back.insert(4, "d");
        CHECK(back.size() == 4);
    }

    CHECK(res.stats.balanced());
}

TEST("ordered_map - raw parts of an empty map")
{
    map_t m;
    auto parts = m.extract_raw_parts();

    CHECK(parts.ptr == nullptr);
    CHECK(parts.length == 0);
    CHECK(parts.capacity == 0);

    auto back = map_t::create_from_raw_parts(parts);
    CHECK(back.empty());

#if OC_ASSERT_ENABLED
    auto bad = parts;
    bad.length = 1;
    CHECK(triggers_assert([&] { (void)map_t::create_from_raw_parts(bad); }));
#endif
}

TEST("ordered_map - copy and move")
{
    test::test_resource res_a;
    test::test_resource res_b;

    {
        auto a = map_t::create_with_resource(res_a.get());
        a.insert(1, "a");
        a.insert(2, "b");
        a.reserve(20);

        SECTION("copy construction keeps the source resource")
        {
            auto copy = a;
            CHECK(copy.size() == 2);
            CHECK(copy.as_span()[1].value == "b");
            CHECK(copy.resource() == res_a.get());
            CHECK(copy.capacity() == 2);
            CHECK(copy.data() != a.data());

            copy.insert(3, "c");
            CHECK(a.size() == 2);
        }

        SECTION("copy assignment keeps the target resource")
        {
            auto b = map_t::create_with_resource(res_b.get());
            b.insert(9, "z");
            b = a;
            CHECK(b.size() == 2);
            CHECK(!b.contains(9));
            CHECK(b.resource() == res_b.get());
            CHECK(res_b.stats.allocate_calls == 2);
        }

        SECTION("move")
        {
            auto const data = a.data();
            auto moved = oc::move(a);
            CHECK(moved.data() == data);
            CHECK(moved.size() == 2);
            CHECK(a.empty());
            CHECK(a.capacity() == 0);
        }
    }

    CHECK(res_a.stats.balanced());
    CHECK(res_b.stats.balanced());
}

TEST("ordered_map - equality, ordering and hash ignore capacity")
{
    test::test_resource res;

    auto a = map_t::create_from_or_throw({{1, "a"}, {2, "b"}});
    auto b = map_t::create_with_capacity(64, res.get());
    b.insert(2, "b");
    b.insert(1, "a");

    auto const hash_of = [](map_t const& m) { return std::hash<map_t>{}(m); };

    CHECK(a.capacity() != b.capacity());
    CHECK(bool(a == b));
    CHECK(hash_of(a) == hash_of(b));

    b.insert(2, "c");
    CHECK(bool(a != b));
    CHECK(bool(a < b));
    CHECK(hash_of(a) != hash_of(b));

    map_t empty;
    CHECK(bool(empty < a));
    CHECK(bool(empty == map_t()));
    CHECK(hash_of(empty) == hash_of(map_t::create_with_capacity(8)));
}

TEST("ordered_map - views")
{
    auto m = map_t::create_from_or_throw({{3, "c"}, {1, "a"}, {2, "b"}});

    SECTION("iteration")
    {
        std::vector<int> keys;
        for (auto const& [k, v] : m)
            keys.push_back(k);
        REQUIRE(keys.size() == 3);
        CHECK(keys[0] == 1);
        CHECK(keys[1] == 2);
        CHECK(keys[2] == 3);
    }

    SECTION("keys and values")
    {
        auto const keys = m.keys();
        REQUIRE(keys.size() == 3);
        CHECK(keys[0] == 1);
        CHECK(keys[2] == 3);

        auto const values = m.values();
        REQUIRE(values.size() == 3);
        CHECK(values[1] == "b");

        for (auto& v : m.values_mut())
            v += "!";
        CHECK(m[1] == "a!");
        CHECK(m[3] == "c!");
    }

    SECTION("reversed")
    {
        std::vector<int> keys;
        for (auto const& e : m.reversed())
            keys.push_back(e.key);
        REQUIRE(keys.size() == 3);
        CHECK(keys[0] == 3);
        CHECK(keys[1] == 2);
        CHECK(keys[2] == 1);
    }

    SECTION("first and last")
    {
        REQUIRE(m.first() != nullptr);
        CHECK(m.first()->key == 1);
        CHECK(m.last()->key == 3);

        auto const fkv = m.first_key_value();
        REQUIRE(fkv.has_value());
        CHECK(fkv.value().key == 1);
        CHECK(fkv.value().value == "a");
        CHECK(m.last_key_value().value().value == "c");
    }
}

TEST("ordered_map - pop_first and pop_last")
{
    auto m = map_t::create_from_or_throw({{3, "c"}, {1, "a"}, {2, "b"}});

    auto first = m.pop_first();
    REQUIRE(first.has_value());
    CHECK(first.value().key == 1);
    CHECK(first.value().value == "a");

    auto last = m.pop_last();
    REQUIRE(last.has_value());
    CHECK(last.value().key == 3);

    CHECK(has_entries(m, {{2, "b"}}));

    auto entry = m.remove_entry(2);
    REQUIRE(entry.has_value());
    CHECK(entry.value().value == "b");
    CHECK(m.empty());
    CHECK(!m.pop_last().has_value());
}

TEST("ordered_map - retain_where")
{
    oc::ordered_map<int, int> m;
    for (int i = 0; i < 10; ++i)
        m.insert(i, i * i);
    auto const cap = m.capacity();

    m.retain_where(
        [](int const& k, int& v)
        {
            v += 1;
            return k % 3 == 0;
        });

    REQUIRE(m.size() == 4);
    CHECK(m[0] == 1);
    CHECK(m[3] == 10);
    CHECK(m[6] == 37);
    CHECK(m[9] == 82);
    CHECK(m.capacity() == cap);
    CHECK(is_strictly_sorted(m));
}

TEST("ordered_map - drain and append")
{
    auto a = map_t::create_from_or_throw({{1, "a"}, {3, "c"}});
    auto b = map_t::create_from_or_throw({{2, "b"}, {3, "C"}});
    auto const b_cap = b.capacity();

    SECTION("drain")
    {
        std::vector<int> keys;
        b.drain([&](map_t::entry_t&& e) { keys.push_back(e.key); });

        REQUIRE(keys.size() == 2);
        CHECK(keys[0] == 2);
        CHECK(keys[1] == 3);
        CHECK(b.empty());
        CHECK(b.capacity() == b_cap);
    }

    SECTION("append")
    {
        a.append(b);

        CHECK(has_entries(a, {{1, "a"}, {2, "b"}, {3, "C"}}));
        CHECK(b.empty());
        CHECK(b.capacity() == b_cap);

        a.append(a);
        CHECK(a.size() == 3);
    }
}

TEST("ordered_map - into_keys")
{
    test::test_resource res;

    {
        auto m = oc::ordered_map<std::string, int>::create_with_resource(res.get());
        m.insert("b", 2);
        m.insert("a", 1);
        m.insert("c", 3);

        auto keys = oc::move(m).into_keys();

        CHECK(keys.size() == 3);
        CHECK(keys.capacity() == 3);
        CHECK(keys.resource() == res.get());
        CHECK(keys.contains("a"));
        CHECK(keys.as_span()[0] == "a");
        CHECK(keys.as_span()[2] == "c");

        keys.insert("d");
        CHECK(keys.size() == 4);
    }

    CHECK(res.stats.balanced());
}

TEST("ordered_map - into_values")
{
    test::test_resource res;

    {
        auto m = oc::ordered_map<std::string, int>::create_with_resource(res.get());
        m.insert("c", 3);
        m.insert("a", 1);
        m.insert("b", 2);

        auto values = oc::move(m).into_values();

        REQUIRE(values.obj_count() == 3);
        CHECK(&values.resource() == res.get());
        CHECK(values.obj_span()[0] == 1);
        CHECK(values.obj_span()[1] == 2);
        CHECK(values.obj_span()[2] == 3);
        CHECK(m.empty());
    }

    SECTION("values are moved out once")
    {
        Counted::reset();
        {
            oc::ordered_map<int, Counted> m;
            m.insert(2, Counted(20));
            m.insert(1, Counted(10));

            auto values = oc::move(m).into_values();

            REQUIRE(values.obj_count() == 2);
            CHECK(values.obj_span()[0].value == 10);
            CHECK(values.obj_span()[1].value == 20);
            CHECK(Counted::live == 2);
        }
        CHECK(Counted::live == 0);
    }

    SECTION("empty map")
    {
        auto values = oc::ordered_map<int, int>().into_values();
        CHECK(values.obj_count() == 0);
    }

    CHECK(res.stats.balanced());
}
