#include <ordered-core/hash.hh>
#include <ordered-core/ordered_set.hh>

#include <nexus/test.hh>

#include "test-resources.hh"

#include <set>
#include <string>
#include <vector>

namespace
{
using set_t = oc::ordered_set<int>;

bool has_elements(set_t const& s, std::vector<int> const& expected)
{
    if (s.size() != oc::isize(expected.size()))
        return false;
    for (size_t i = 0; i < expected.size(); ++i)
        if (s.as_span()[oc::isize(i)] != expected[i])
            return false;
    return true;
}
} // namespace

TEST("ordered_set - insert and remove")
{
    set_t s;

    CHECK(s.empty());
    CHECK(s.insert(5));
    CHECK(s.insert(1));
    CHECK(s.insert(3));
    CHECK(!s.insert(3));

    CHECK(has_elements(s, {1, 3, 5}));
    CHECK(s.contains(3));
    CHECK(!s.contains(4));
    CHECK(s.search(4).index == 2);

    REQUIRE(s.get(5) != nullptr);
    CHECK(*s.get(5) == 5);
    CHECK(s.get(6) == nullptr);

    CHECK(s.remove(3));
    CHECK(!s.remove(3));
    CHECK(has_elements(s, {1, 5}));

    auto taken = s.take(5);
    REQUIRE(taken.has_value());
    CHECK(taken.value() == 5);
    CHECK(!s.take(5).has_value());
    CHECK(has_elements(s, {1}));
}

TEST("ordered_set - matches std::set under mixed operations")
{
    set_t s;
    std::set<int> reference;

    unsigned state = 777;
    auto next = [&]
    {
        state = state * 1103515245u + 12345u;
        return int((state >> 16) % 300);
    };

    for (int step = 0; step < 3000; ++step)
    {
        auto const v = next();
        if (step % 4 == 3)
            CHECK(s.remove(v) == (reference.erase(v) == 1));
        else
            CHECK(s.insert(v) == reference.insert(v).second);
    }

    REQUIRE(s.size() == oc::isize(reference.size()));
    auto i = 0;
    for (auto const v : reference)
        CHECK(s.as_span()[i++] == v);
}

TEST("ordered_set - create_from")
{
    auto r = set_t::create_from({4, 2, 8, 6});
    REQUIRE(r.has_value());
    CHECK(has_elements(r.value(), {2, 4, 6, 8}));

    auto dup = set_t::create_from({4, 2, 4});
    REQUIRE(dup.has_error());
    CHECK(dup.error().is(oc::error_kind::duplicate_key));
    CHECK(dup.error().index == 2);
}

TEST("ordered_set - strings and heterogeneous lookup")
{
    oc::ordered_set<std::string> s;
    s.extend({"pear", "apple", "fig", "apple"});

    REQUIRE(s.size() == 3);
    CHECK(s.as_span()[0] == "apple");
    CHECK(s.as_span()[1] == "fig");
    CHECK(s.as_span()[2] == "pear");

    CHECK(s.contains("fig"));
    CHECK(s.remove("fig"));
    CHECK(!s.contains(std::string("fig")));

    auto pear = s.pop_last();
    REQUIRE(pear.has_value());
    CHECK(pear.value() == "pear");
    CHECK(s.first() != nullptr);
    CHECK(*s.first() == "apple");
}

TEST("ordered_set - set algebra")
{
    auto const a = set_t::create_from_or_throw({1, 2, 3, 4});
    auto const b = set_t::create_from_or_throw({3, 4, 5});
    set_t const empty;

    SECTION("union")
    {
        CHECK(has_elements(a.union_with(b), {1, 2, 3, 4, 5}));
        CHECK(has_elements(a | b, {1, 2, 3, 4, 5}));
        CHECK(has_elements(a | empty, {1, 2, 3, 4}));
    }

    SECTION("intersection")
    {
        CHECK(has_elements(a.intersection_with(b), {3, 4}));
        CHECK(has_elements(a & b, {3, 4}));
        CHECK((a & empty).empty());
    }

    SECTION("difference")
    {
        CHECK(has_elements(a.difference_with(b), {1, 2}));
        CHECK(has_elements(b - a, {5}));
        CHECK(has_elements(a - empty, {1, 2, 3, 4}));
    }

    SECTION("symmetric difference")
    {
        CHECK(has_elements(a.symmetric_difference_with(b), {1, 2, 5}));
        CHECK(has_elements(a ^ b, {1, 2, 5}));
        CHECK((a ^ a).empty());
    }

    SECTION("result uses the left resource")
    {
        test::test_resource res;
        {
            auto c = set_t::create_with_resource(res.get());
            c.extend({2, 9});
            auto const u = c | a;
            CHECK(u.resource() == res.get());
            CHECK(has_elements(u, {1, 2, 3, 4, 9}));
        }
        CHECK(res.stats.balanced());
    }

    SECTION("relations")
    {
        auto const small = set_t::create_from_or_throw({2, 3});

        CHECK(small.is_subset_of(a));
        CHECK(!a.is_subset_of(small));
        CHECK(a.is_superset_of(small));
        CHECK(empty.is_subset_of(a));
        CHECK(a.is_subset_of(a));

        CHECK(!a.is_disjoint_from(b));
        CHECK(set_t::create_from_or_throw({1, 2}).is_disjoint_from(b));
        CHECK(empty.is_disjoint_from(empty));
    }
}

TEST("ordered_set - retain_where, drain and append")
{
    auto s = set_t::create_from_or_throw({1, 2, 3, 4, 5, 6});

    SECTION("retain_where")
    {
        s.retain_where([](int const& v) { return v % 2 == 0; });
        CHECK(has_elements(s, {2, 4, 6}));
    }

    SECTION("drain")
    {
        auto sum = 0;
        s.drain([&](int&& v) { sum += v; });
        CHECK(sum == 21);
        CHECK(s.empty());
        CHECK(s.capacity() == 6);
    }

    SECTION("append")
    {
        auto other = set_t::create_from_or_throw({0, 6, 7});
        s.append(other);
        CHECK(has_elements(s, {0, 1, 2, 3, 4, 5, 6, 7}));
        CHECK(other.empty());
    }

    SECTION("reversed")
    {
        auto const r = s.reversed();
        REQUIRE(r.size() == 6);
        CHECK(r[0] == 6);
        CHECK(r[5] == 1);
    }
}

TEST("ordered_set - equality, ordering and hash")
{
    auto a = set_t::create_from_or_throw({1, 2, 3});
    auto b = set_t::create_with_capacity(100);
    b.extend({3, 2, 1});

    auto const hash_of = [](set_t const& s) { return std::hash<set_t>{}(s); };

    CHECK(bool(a == b));
    CHECK(hash_of(a) == hash_of(b));

    CHECK(b.remove(2));
    CHECK(bool(a != b));
    CHECK(bool(a < b)); // [1, 2, ...] < [1, 3]
    CHECK(hash_of(a) != hash_of(b));
}

TEST("ordered_set - allocation failure")
{
    test::test_resource res;

    {
        auto s = set_t::create_with_capacity(1, res.get());
        CHECK(s.insert(1));
        REQUIRE(s.size() == s.capacity());

        res.stats.refuse = true;

        auto r = s.try_insert(2);
        REQUIRE(r.has_error());
        CHECK(r.error().is(oc::error_kind::allocation_failure));
        CHECK(has_elements(s, {1}));

        // already present: no allocation needed
        auto again = s.try_insert(1);
        REQUIRE(again.has_value());
        CHECK(!again.value());
    }

    CHECK(res.stats.balanced());
}
