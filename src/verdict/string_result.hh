#pragma once

#include <verdict/alternatives.hh>
#include <verdict/error_detail.hh>
#include <verdict/result.hh>

#include <string>

namespace vd
{
/// The common result shape: failures are an ordered list of (category, message) entries.
/// Safe operations need no producer, exceptions become an "error" entry with their message.
///
/// Usage:
///   vd::string_result<int> parse(std::string_view s)
///   {
///       if (s.empty())
///           return vd::failure_message("empty input");
///       ...
///   }
template <class S>
using string_result = result<S, error_detail>;

/// Failure tag holding a single ("error", message) entry; converts to any string_result<S>
[[nodiscard]] inline as_failure_t<error_detail> failure_message(std::string message)
{
    return vd::failure(error_detail::create_with(vd::move(message)));
}
} // namespace vd
