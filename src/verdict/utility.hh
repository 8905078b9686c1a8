#pragma once

#include <verdict/fwd.hh>
#include <verdict/macros.hh>

#include <functional> // std::invoke
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   forward_like_t<Self, T>     - T with the value category and constness of Self
//
// Invocation:
//   invoke(f, args...)          - call any callable (functions, lambdas, member pointers)
//   is_invocable<F, Args...>    - concept: f(args...) is well-formed
//   invoke_result<F, Args...>   - the type returned by invoke(f, args...)
//
// Template metaprogramming:
//   always_false_t<T...>        - always false for static_assert with type parameters
//   function_ptr<Signature>     - convert function signature to function pointer type
//
// Placement new:
//   new (vd::placement_new, ptr) T(...)  - construct in-place without including <new>
//

namespace vd
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   T b = vd::move(a);
template <class T>
[[nodiscard]] VD_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] VD_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] VD_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

namespace impl
{
template <class Self, class T>
struct forward_like_impl
{
    using base = std::conditional_t<std::is_const_v<std::remove_reference_t<Self>>, T const, T>;
    using type = std::conditional_t<std::is_lvalue_reference_v<Self>, base&, base&&>;
};
} // namespace impl

/// T as it is accessed through an object of type Self
/// Used with deducing this: a member of an rvalue result is handed on as an rvalue
/// Usage:
///   forward_like_t<result&, int>        -> int&
///   forward_like_t<result const&, int>  -> int const&
///   forward_like_t<result, int>         -> int&&
template <class Self, class T>
using forward_like_t = typename impl::forward_like_impl<Self, T>::type;

// =========================================================================================================
// Invocation
// =========================================================================================================

/// Invokes f with args, supporting all callables std::invoke supports
template <class F, class... Args>
VD_FORCE_INLINE constexpr decltype(auto) invoke(F&& f, Args&&... args)
{
    return std::invoke(vd::forward<F>(f), vd::forward<Args>(args)...);
}

/// True if F can be invoked with Args
template <class F, class... Args>
concept is_invocable = std::is_invocable_v<F, Args...>;

/// True if F can be invoked with Args and the result converts to R
template <class R, class F, class... Args>
concept is_invocable_r = std::is_invocable_r_v<R, F, Args...>;

/// Type returned by invoking F with Args
template <class F, class... Args>
using invoke_result = std::invoke_result_t<F, Args...>;

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
/// Always evaluates to false, but only after template instantiation
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   vd::function_ptr<int(float, double)>  -> int (*)(float, double)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Placement new
// =========================================================================================================

/// Tag for our own placement new so headers do not need <new>
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

} // namespace vd

// placement new overloads must live at global scope
[[nodiscard]] inline void* operator new(std::size_t, vd::placement_new_t, void* ptr) noexcept
{
    return ptr;
}
inline void operator delete(void*, vd::placement_new_t, void*) noexcept {}
