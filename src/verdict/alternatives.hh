#pragma once

#include <verdict/fwd.hh>
#include <verdict/utility.hh>

#include <type_traits>

/// Empty value for operations that only report success or failure (e.g. safe_for_each)
struct vd::unit
{
    friend bool operator==(unit, unit) = default;
};

/// Marks a value as the success alternative of a result.
/// Created via vd::success(v), converts to any result<S, F> where S is constructible from T.
template <class T>
struct vd::as_success_t
{
    T value;
};

/// Marks a value as the failure alternative of a result.
/// Created via vd::failure(e), converts to any result<S, F> where F is constructible from T.
/// This is the only way to construct a failure from a value, so result<int, int>{42} is unambiguous.
template <class T>
struct vd::as_failure_t
{
    T error;
};

namespace vd
{
/// Usage:
///   vd::result<int, std::string> r = vd::success(42);
template <class T>
[[nodiscard]] constexpr as_success_t<std::decay_t<T>> success(T&& value)
{
    return {vd::forward<T>(value)};
}

/// Usage:
///   vd::result<int, std::string> r = vd::failure(std::string("no such file"));
///   if (r == vd::result<int, std::string>(vd::failure(std::string("no such file")))) ...
template <class T>
[[nodiscard]] constexpr as_failure_t<std::decay_t<T>> failure(T&& error)
{
    return {vd::forward<T>(error)};
}

namespace impl
{
template <class T>
constexpr bool is_result = false;
template <class S, class F>
constexpr bool is_result<result<S, F>> = true;

template <class T>
constexpr bool is_alternative_tag = false;
template <class T>
constexpr bool is_alternative_tag<as_success_t<T>> = true;
template <class T>
constexpr bool is_alternative_tag<as_failure_t<T>> = true;
} // namespace impl
} // namespace vd
