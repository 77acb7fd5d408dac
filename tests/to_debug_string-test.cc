#include <ordered-core/error.hh>
#include <ordered-core/ordered_map.hh>
#include <ordered-core/ordered_set.hh>
#include <ordered-core/to_debug_string.hh>

#include <nexus/test.hh>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace
{
struct Opaque
{
    uint32_t a;
    uint16_t b;
};

struct Named
{
    int id;
    std::string to_string() const { return "named#" + std::to_string(id); }
};
} // namespace

TEST("to_debug_string - primitives")
{
    CHECK(oc::to_debug_string(42) == "42");
    CHECK(oc::to_debug_string(-7) == "-7");
    CHECK(oc::to_debug_string(true) == "true");
    CHECK(oc::to_debug_string(false) == "false");
    CHECK(oc::to_debug_string('x') == "'x'");
    CHECK(oc::to_debug_string('\n') == "'\\n'");
    CHECK(oc::to_debug_string('\x01') == "'\\x01'");
}

TEST("to_debug_string - strings are quoted")
{
    CHECK(oc::to_debug_string(std::string("abc")) == "\"abc\"");
    CHECK(oc::to_debug_string(std::string_view("")) == "\"\"");
    CHECK(oc::to_debug_string("lit") == "\"lit\"");
}

TEST("to_debug_string - to_string dispatch")
{
    CHECK(oc::to_debug_string(oc::error_kind::duplicate_key) == "duplicate_key");
    CHECK(oc::to_debug_string(Named{3}) == "named#3");

    auto const e = oc::error::create_key_not_found();
    CHECK(oc::to_debug_string(e) == e.to_string());
}

TEST("to_debug_string - ordered containers")
{
    SECTION("map")
    {
        auto m = oc::ordered_map<int, std::string>::create_from_or_throw({{2, "b"}, {1, "a"}});
        CHECK(oc::to_debug_string(m) == "[(1, \"a\"), (2, \"b\")]");
        CHECK(oc::to_debug_string(m.keys()) == "[1, 2]");
        CHECK(oc::to_debug_string(m.reversed()) == "[(2, \"b\"), (1, \"a\")]");
    }

    SECTION("set")
    {
        auto s = oc::ordered_set<int>::create_from_or_throw({2, 1});
        CHECK(oc::to_debug_string(s) == "[1, 2]");
    }

    SECTION("empty")
    {
        CHECK(oc::to_debug_string(oc::ordered_map<int, int>()) == "[]");
        CHECK(oc::to_debug_string(oc::ordered_set<int>()) == "[]");
    }

    SECTION("entry")
    {
        CHECK(oc::to_debug_string(oc::entry<int, bool>{5, true}) == "(5, true)");
    }
}

TEST("to_debug_string - long collections are cut off")
{
    oc::ordered_set<int> s;
    for (int i = 0; i < 100; ++i)
        s.insert(i);

    auto const str = oc::to_debug_string(s, {.max_length = 20});

    CHECK(str.starts_with("[0, 1, 2, "));
    CHECK(str.ends_with(", ...]"));
    CHECK(str.size() < 40);
}

TEST("to_debug_string - nested ranges")
{
    std::vector<std::vector<int>> const v = {{1}, {}, {2, 3}};
    CHECK(oc::to_debug_string(v) == "[[1], [], [2, 3]]");
}

TEST("to_debug_string - opaque types fall back to a hex dump")
{
    auto const s = oc::to_debug_string(Opaque{0x04030201, 0x0605});

    CHECK(s.starts_with("0x"));
    CHECK(s.find('_') != std::string::npos);
    CHECK(s.size() == 2 + 2 * sizeof(Opaque) + (sizeof(Opaque) / alignof(Opaque) - 1));
}
