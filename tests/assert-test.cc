#include <verdict/assert-handler.hh>
#include <verdict/assert.hh>
#include <verdict/string_result.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

namespace
{
// thrown by the test handlers so that a failed assertion unwinds instead of aborting
struct assertion_thrown
{
    std::string message;
};

auto const throwing_handler = [](vd::impl::assertion_info const& info) { throw assertion_thrown{info.message}; };
} // namespace

TEST("assertions - failing assertion calls handler with correct payload")
{
    std::optional<vd::impl::assertion_info> captured;
    // CAREFUL: brittle wrt. formatting, the line below must stay in sync with VD_ASSERT_ALWAYS
    int const test_line = __LINE__ + 11;

    {
        auto handler = vd::impl::scoped_assertion_handler(
            [&](vd::impl::assertion_info const& info)
            {
                captured = info;
                throw 0;
            });
        try
        {
            VD_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic is broken");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());
    CHECK(captured->expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(captured->message == "arithmetic is broken");
    CHECK(std::string(captured->location.file_name()).ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
}

TEST("assertions - passing assertion does not call handler")
{
    bool handler_called = false;

    {
        auto handler = vd::impl::scoped_assertion_handler([&](vd::impl::assertion_info const&) { handler_called = true; });
        VD_ASSERT_ALWAYS(true, "should not matter");
        VD_ASSERT(2 > 1, "should not matter either");
    }

    CHECK(!handler_called);
}

TEST("assertions - handler stack is LIFO")
{
    std::vector<int> events;

    auto handler_a = vd::impl::scoped_assertion_handler(
        [&](vd::impl::assertion_info const&)
        {
            events.push_back(1);
            throw 0;
        });

    {
        auto handler_b = vd::impl::scoped_assertion_handler(
            [&](vd::impl::assertion_info const&)
            {
                events.push_back(2);
                throw 0;
            });

        try
        {
            VD_ASSERT_ALWAYS(false, "first failure");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    try
    {
        VD_ASSERT_ALWAYS(false, "second failure");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - result access preconditions")
{
    auto handler = vd::impl::scoped_assertion_handler(throwing_handler);

    SECTION("value of a failure")
    {
        vd::string_result<int> const r = vd::failure_message("nope");
        std::string message;
        try
        {
            (void)r.value();
        }
        catch (assertion_thrown const& e)
        {
            message = e.message;
        }
        CHECK(message == "attempted to access value of a failure result");
    }

    SECTION("error of a success")
    {
        auto const r = vd::string_result<int>{1};
        std::string message;
        try
        {
            (void)r.error();
        }
        catch (assertion_thrown const& e)
        {
            message = e.message;
        }
        CHECK(message == "attempted to access error of a success result");
    }

    SECTION("error detail index out of bounds")
    {
        auto const d = vd::error_detail::create_with("only");
        std::string message;
        try
        {
            (void)d[1];
        }
        catch (assertion_thrown const& e)
        {
            message = e.message;
        }
        CHECK(message == "index out of bounds");
    }
}
