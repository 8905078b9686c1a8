#pragma once

#include <verdict/fwd.hh>

#include <cstddef>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility> // for tuple_size

namespace vd
{
struct debug_string_config
{
    // not strict, collections stop appending once this is exceeded
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort, non-semantic, and intended only for diagnostics and failure messages.
//
// Strategy (in order):
//   - String-likes: wrap in double quotes "..."
//   - char: wrap in single quotes '...' with escape sequences for control chars
//   - bool: true/false
//   - arithmetic types: std::format("{}")
//   - Use to_string(v) if available (ADL)
//   - Use v.to_string() if available
//   - For collections, recursively format elements as [v0, v1, ...]
//   - For tuple-likes, recursively format elements as (v0, v1, ...)
//   - Otherwise emit raw memory dump
//
// No stability, completeness, or user-facing guarantees.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
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

    s += vd::to_debug_string(v, cfg);

    return true;
}

// printable form of a single char, control characters are escaped
inline std::string escape_char(char c)
{
    switch (c)
    {
    case '\0':
        return "\\0";
    case '\n':
        return "\\n";
    case '\r':
        return "\\r";
    case '\t':
        return "\\t";
    case '\\':
        return "\\\\";
    case '\'':
        return "\\'";
    default:
        if (c < 32 || c == 127)
            return std::format("\\x{:02X}", static_cast<unsigned char>(c));
        return std::string(1, c);
    }
}

template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(vd::impl::to_debug_string_append_elem(s, std::get<I>(v), cfg) && ...);
}

// the "string form" of a failure or success value, e.g. for std::runtime_error messages
// string-likes are taken verbatim, everything else goes through to_debug_string
template <class T>
[[nodiscard]] std::string to_message_string(T const& v)
{
    if constexpr (std::is_convertible_v<T const&, std::string_view>)
        return std::string(std::string_view(v));
    else
        return vd::to_debug_string(v);
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (std::is_convertible_v<T const&, std::string_view>)
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        return "'" + impl::escape_char(v) + "'";
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return v ? "true" : "false";
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        return std::format("{}", v);
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
            if (!vd::impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        vd::impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = reinterpret_cast<unsigned char const*>(&v);
        for (std::size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            s += std::format("{:02X}", p_v[i]);
        }
        return s;
    }
}
} // namespace vd
