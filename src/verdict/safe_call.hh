#pragma once

#include <verdict/alternatives.hh>
#include <verdict/failure_producer.hh>
#include <verdict/fwd.hh>
#include <verdict/macros.hh>
#include <verdict/utility.hh>

#include <exception>
#include <type_traits>

#ifndef VD_HAS_CPP_EXCEPTIONS
#error "verdict translates exceptions into failures and requires C++ exceptions to be enabled"
#endif

// =========================================================================================================
// Fallible calls
// =========================================================================================================
//
// The exception boundary used by every safe operation of vd::result.
// Catches everything an opaque callback can throw and hands it to a failure producer.
// Exceptions thrown by the producer itself propagate.
//
//   try_call(fn, producer)         - success(fn()) or failure(producer(exception))
//   try_call_result(fn, producer)  - fn() (already a result) or failure(producer(exception))
//
// Usage:
//   auto r = vd::try_call([&] { return parse_port(text); },
//                         [](std::exception_ptr e) { return vd::exception_message(e, "unknown error"); });
//   // r is a vd::result<int, std::string>
//

namespace vd
{
/// Calls fn inside an exception boundary.
/// Returns result<S, F> where S is the decayed return type of fn (vd::unit for void functions)
/// and F is the decayed return type of producer.
template <class Fn, class Producer>
[[nodiscard]] auto try_call(Fn&& fn, Producer&& producer)
{
    using S_raw = std::remove_cvref_t<vd::invoke_result<Fn>>;
    using S = std::conditional_t<std::is_void_v<S_raw>, vd::unit, S_raw>;
    using F = std::remove_cvref_t<vd::invoke_result<Producer, std::exception_ptr>>;
    using R = result<S, F>;

    try
    {
        if constexpr (std::is_void_v<S_raw>)
        {
            vd::invoke(fn);
            return R(vd::success(vd::unit{}));
        }
        else
        {
            return R(vd::success(vd::invoke(fn)));
        }
    }
    catch (...)
    {
        return R(vd::failure(vd::invoke(producer, std::current_exception())));
    }
}

/// Calls fn, which already returns a result, inside an exception boundary.
/// A thrown exception becomes a failure of the same result type.
template <class Fn, class Producer>
[[nodiscard]] auto try_call_result(Fn&& fn, Producer&& producer) -> std::remove_cvref_t<vd::invoke_result<Fn>>
{
    using R = std::remove_cvref_t<vd::invoke_result<Fn>>;
    static_assert(impl::is_result<R>, "try_call_result requires a function returning a vd::result");

    try
    {
        return vd::invoke(fn);
    }
    catch (...)
    {
        return R(vd::failure(vd::invoke(producer, std::current_exception())));
    }
}
} // namespace vd

// result is needed to instantiate the functions above, but result.hh also needs them declared first
#include <verdict/result.hh>
