#pragma once

#include <verdict/macros.hh>

#include <functional>
#include <source_location>
#include <string>

namespace vd::impl
{
/// What a failed VD_ASSERT reports, e.g. reading value() of a failure result.
struct assertion_info
{
    std::string expression;
    std::string message;
    std::source_location location;
};

/// Replaces the reporting of failed assertions while alive.
/// Handlers nest: the innermost one is called, destruction restores the previous one.
/// A handler may throw to unwind instead of aborting, tests use this to observe precondition violations:
///
///   auto handler = vd::impl::scoped_assertion_handler([](vd::impl::assertion_info const& info) { throw my_error{info.message}; });
///   (void)failed_result.value(); // throws my_error
///
/// The handlers are process-wide and not synchronized.
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace vd::impl
