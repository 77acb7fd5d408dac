#pragma once

#include <ordered-core/fwd.hh>

#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility> // for tuple_size

namespace oc
{
struct debug_string_config
{
    // soft limit: collections stop appending once the output is this long
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort, non-semantic, and intended only for diagnostics and test output.
//
// Strategy (in order):
//   - String-likes: wrap in double quotes "..."
//   - char: wrap in single quotes '...' with escape sequences for control/non-printable chars
//   - bool: true/false
//   - other arithmetic types: std::to_string
//   - Use to_string(v) if available (e.g. oc::error_kind)
//   - Use v.to_string() if available (e.g. oc::error)
//   - For ranges (ordered_map, ordered_set, spans), recursively format elements as [v0, v1, ...]
//   - For tuple-likes (oc::entry), recursively format elements as (v0, v1, ...)
//   - Otherwise emit a hex dump of the object representation
//
// So an ordered_map<int, std::string> prints as [(1, "a"), (2, "b")] and an ordered_set<int> as [1, 2].
//
// No stability, completeness, or user-facing guarantees.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
inline void to_debug_string_append_hex(std::string& s, unsigned char b)
{
    constexpr char digits[] = "0123456789ABCDEF";
    s += digits[b >> 4];
    s += digits[b & 0xF];
}

template <class T>
bool to_debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += oc::to_debug_string(v, cfg);

    return true;
}
template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    using std::get;
    (void)(oc::impl::to_debug_string_append_elem(s, get<I>(v), cfg) && ...);
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");

        if (v == '\0')
            s += "\\0";
        else if (v == '\n')
            s += "\\n";
        else if (v == '\r')
            s += "\\r";
        else if (v == '\t')
            s += "\\t";
        else if (v == '\\')
            s += "\\\\";
        else if (v == '\'')
            s += "\\'";
        else if (v < 32 || v == 127) // other control characters
        {
            s += "\\x";
            oc::impl::to_debug_string_append_hex(s, static_cast<unsigned char>(v));
        }
        else
            s += v;

        s += '\'';
        return s;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return v ? "true" : "false";
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        return std::to_string(v);
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
            if (!oc::impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        oc::impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = (unsigned char const*)&v;
        for (size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            oc::impl::to_debug_string_append_hex(s, p_v[i]);
        }
        return s;
    }
}
} // namespace oc
