#include <verdict/error_detail.hh>
#include <verdict/string_result.hh>

#include <nexus/test.hh>

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

TEST("error_detail - creation")
{
    SECTION("empty")
    {
        auto const d = vd::error_detail::create_empty();
        CHECK(d.empty());
        CHECK(d.size() == 0);
        CHECK(d.to_string() == "[]");
    }

    SECTION("with message")
    {
        auto const d = vd::error_detail::create_with("file not found");
        REQUIRE(d.size() == 1);
        CHECK(d[0].category == "error");
        CHECK(d[0].message == "file not found");
        CHECK(d.front() == d[0]);
    }

    SECTION("from exception")
    {
        auto const d = vd::error_detail::create_from_exception(std::make_exception_ptr(std::runtime_error("boom")));
        CHECK(d == vd::error_detail::create_with("boom"));

        auto const opaque = vd::error_detail::create_from_exception(std::make_exception_ptr(3));
        CHECK(opaque == vd::error_detail::create_with(""));

        auto const none = vd::error_detail::create_from_exception(nullptr);
        CHECK(none == vd::error_detail::create_with(""));
    }

    SECTION("initializer list")
    {
        auto const d = vd::error_detail{{"error", "a"}, {"warning", "b"}};
        CHECK(d.size() == 2);
        CHECK(d[1].category == "warning");
    }
}

TEST("error_detail - accumulation")
{
    SECTION("add preserves order and leaves the original untouched")
    {
        auto const first = vd::error_detail::create_with("first");
        auto const second = first.add("warning", "w");
        auto const third = second.add("info", "i");

        CHECK(first.size() == 1);
        CHECK(second.size() == 2);
        REQUIRE(third.size() == 3);

        auto const expected = vd::error_detail{{"error", "first"}, {"warning", "w"}, {"info", "i"}};
        CHECK(third == expected);
        CHECK(third.to_string() == R"([("error", "first"), ("warning", "w"), ("info", "i")])");
    }

    SECTION("add on string results")
    {
        vd::string_result<int> const failed = vd::failure_message("first");
        auto const annotated = failed.add("warning", "w").add("info", "i");

        REQUIRE(annotated.is_failure());
        auto const expected = vd::error_detail{{"error", "first"}, {"warning", "w"}, {"info", "i"}};
        CHECK(annotated.error() == expected);

        // the intermediate failure is unchanged
        CHECK(failed.error() == vd::error_detail::create_with("first"));
    }

    SECTION("add on successes does nothing")
    {
        auto const ok = vd::string_result<int>{5};
        auto const same = ok.add("warning", "w");
        CHECK(same == ok);
    }

    SECTION("concat")
    {
        auto const a = vd::error_detail::create_with("a");
        auto const b = vd::error_detail::create_with("b").add("info", "c");
        auto const ab = a.concat(b);
        REQUIRE(ab.size() == 3);
        CHECK(ab[0].message == "a");
        CHECK(ab[1].message == "b");
        CHECK(ab[2].message == "c");
    }
}

TEST("error_detail - queries")
{
    auto const d = vd::error_detail::create_with("first").add("warning", "w");

    CHECK(d.contains({"error", "first"}));
    CHECK(d.contains({"warning", "w"}));
    CHECK(!d.contains({"warning", "first"}));

    std::vector<std::string> categories;
    for (auto const& e : d)
        categories.push_back(e.category);
    REQUIRE(categories.size() == 2);
    CHECK(categories[0] == "error");
    CHECK(categories[1] == "warning");
}

TEST("error_detail - equality and hashing")
{
    auto const a = vd::error_detail::create_with("x").add("info", "y");
    auto const b = vd::error_detail::create_with("x").add("info", "y");
    auto const reordered = vd::error_detail{{"info", "y"}, {"error", "x"}};

    CHECK(a == b);
    CHECK(a != reordered);

    std::unordered_set<vd::error_detail> set;
    set.insert(a);
    set.insert(b);
    set.insert(reordered);
    CHECK(set.size() == 2);
}

TEST("failure_message")
{
    vd::string_result<std::string> const r = vd::failure_message("nope");
    REQUIRE(r.is_failure());
    CHECK(r.error() == vd::error_detail::create_with("nope"));
}
