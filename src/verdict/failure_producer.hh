#pragma once

#include <verdict/fwd.hh>
#include <verdict/utility.hh>

#include <concepts>
#include <exception>
#include <string>
#include <string_view>

namespace vd
{
/// Converts a caught exception into a failure value of type F.
/// The exception_ptr may be null when there is no exception object to describe.
///
/// A success result can carry one of these so that chained safe operations keep catching exceptions
/// without the producer being passed again (the "safety chain").
/// Captureless lambdas convert implicitly:
///   vd::failure_producer<std::string> p = [](std::exception_ptr e) { return vd::exception_message(e, "boo!"); };
template <class F>
using failure_producer = vd::function_ptr<F(std::exception_ptr)>;

/// Customization point for failure types.
/// The primary template is empty: safe operations on result<S, F> need an explicit or attached producer.
/// Specializations may provide
///   static F from_exception(std::exception_ptr e);
/// which is then used as the ambient producer whenever no other producer is available.
/// See failure_traits<error_detail> in <verdict/error_detail.hh>.
template <class F>
struct failure_traits
{
};

/// True if failure_traits<F> provides an ambient producer
template <class F>
concept has_default_failure_producer = requires(std::exception_ptr e) {
    { failure_traits<F>::from_exception(e) } -> std::convertible_to<F>;
};

/// Message of a captured exception:
///   - what() for exceptions derived from std::exception
///   - the text for thrown std::string, std::string_view or char const*
///   - fallback for a null exception_ptr or anything else
[[nodiscard]] std::string exception_message(std::exception_ptr const& e, std::string_view fallback = "");
} // namespace vd
