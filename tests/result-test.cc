#include <verdict/result.hh>
#include <verdict/string_result.hh>

#include <nexus/test.hh>

#include <cctype>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

// result stays trivial when S and F are trivial
static_assert(std::is_constructible_v<vd::result<int, int>>);
static_assert(std::is_constructible_v<vd::result<int, int>, int>);
static_assert(std::is_constructible_v<vd::result<int, int>, vd::as_failure_t<int>>);
static_assert(std::is_trivially_copyable_v<vd::result<int, int>>);
static_assert(std::is_trivially_destructible_v<vd::result<int, int>>);
static_assert(!std::is_trivially_copyable_v<vd::result<std::string, int>>);

namespace
{
// test type for non-trivial operations
struct non_trivial
{
    int value = 0;
    bool* destroyed = nullptr;

    non_trivial() = default;
    explicit non_trivial(int v) : value(v) {}
    non_trivial(int v, bool* d) : value(v), destroyed(d) {}

    ~non_trivial()
    {
        if (destroyed)
            *destroyed = true;
    }

    non_trivial(non_trivial const&) = default;
    non_trivial(non_trivial&& rhs) noexcept : value(rhs.value), destroyed(rhs.destroyed) { rhs.destroyed = nullptr; }
    non_trivial& operator=(non_trivial const&) = default;
    non_trivial& operator=(non_trivial&& rhs) noexcept
    {
        value = rhs.value;
        destroyed = rhs.destroyed;
        rhs.destroyed = nullptr;
        return *this;
    }

    friend bool operator==(non_trivial const&, non_trivial const&) = default;
};

// move-only type for testing
struct move_only
{
    int value = 0;

    move_only() = default;
    explicit move_only(int v) : value(v) {}

    move_only(move_only const&) = delete;
    move_only(move_only&& rhs) noexcept : value(rhs.value) { rhs.value = -1; }
    move_only& operator=(move_only const&) = delete;
    move_only& operator=(move_only&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }

    ~move_only() = default;
};

// counting type to track special member function calls
struct counting_type
{
    int value = 0;

    static inline int value_ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        value_ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
    }

    explicit counting_type(int v) : value(v) { ++value_ctor_count; }

    counting_type(counting_type const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    counting_type(counting_type&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }

    counting_type& operator=(counting_type const& rhs) = default;
    counting_type& operator=(counting_type&& rhs) noexcept = default;

    ~counting_type() { ++dtor_count; }
};

std::string to_upper(std::string s)
{
    for (auto& c : s)
        c = char(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = char(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

using int_result = vd::result<int, std::string>;
using nested_result = vd::result<int_result, std::string>;

template <class R>
concept can_flatten = requires(R const& r) { r.flatten(); };

static_assert(can_flatten<nested_result>);
static_assert(!can_flatten<int_result>);
static_assert(!can_flatten<vd::result<vd::result<int, int>, std::string>>);
} // namespace

TEST("result - trivial types")
{
    SECTION("default construction creates failure")
    {
        auto const res = vd::result<int, int>{};
        CHECK(!res.is_success());
        CHECK(res.is_failure());
        CHECK(res.error() == 0);
    }

    SECTION("value construction")
    {
        auto const res = vd::result<int, int>{42};
        CHECK(res.is_success());
        CHECK(!res.is_failure());
        CHECK(res.value() == 42);
    }

    SECTION("construction via success and failure tags")
    {
        vd::result<int, int> const s = vd::success(42);
        vd::result<int, int> const f = vd::failure(99);
        CHECK(s.is_success());
        CHECK(s.value() == 42);
        CHECK(f.is_failure());
        CHECK(f.error() == 99);
    }

    SECTION("copy construction")
    {
        auto const res1 = vd::result<int, int>{vd::failure(99)};
        auto const res2 = res1;
        CHECK(res2.is_failure());
        CHECK(res2.error() == 99);
        CHECK(res1.is_failure());
        CHECK(res1.error() == 99);
    }

    SECTION("copy assignment - value to failure")
    {
        auto res1 = vd::result<int, int>{42};
        auto res2 = vd::result<int, int>{vd::failure(99)};
        res2 = res1;
        CHECK(res2.is_success());
        CHECK(res2.value() == 42);
    }

    SECTION("move assignment - failure to value")
    {
        auto res1 = vd::result<int, int>{vd::failure(99)};
        auto res2 = vd::result<int, int>{42};
        res2 = vd::move(res1);
        CHECK(res2.is_failure());
        CHECK(res2.error() == 99);
    }
}

TEST("result - non-trivial types")
{
    SECTION("value construction")
    {
        auto const res = vd::result<non_trivial, int>{non_trivial{42}};
        CHECK(res.is_success());
        CHECK(res.value().value == 42);
    }

    SECTION("failure construction")
    {
        auto const res = vd::result<int, non_trivial>{vd::failure(non_trivial{99})};
        CHECK(res.is_failure());
        CHECK(res.error().value == 99);
    }

    SECTION("held value is destroyed with the result")
    {
        bool destroyed = false;
        {
            auto const res = vd::result<non_trivial, int>{non_trivial{42, &destroyed}};
            CHECK(!destroyed);
        }
        CHECK(destroyed);
    }

    SECTION("assignment across alternatives destroys the old alternative")
    {
        bool destroyed = false;
        auto res = vd::result<int, non_trivial>{vd::failure(non_trivial{1, &destroyed})};
        res = vd::result<int, non_trivial>{7};
        CHECK(destroyed);
        CHECK(res.is_success());
        CHECK(res.value() == 7);
    }

    SECTION("string values and failures")
    {
        auto res = vd::result<std::string, std::string>{"hello"};
        CHECK(res.is_success());
        CHECK(res.value() == "hello");

        res = vd::result<std::string, std::string>{vd::failure(std::string("error"))};
        CHECK(res.is_failure());
        CHECK(res.error() == "error");
    }
}

TEST("result - counting special member functions")
{
    SECTION("value construction")
    {
        counting_type::reset_counters();
        {
            auto const res = vd::result<counting_type, int>{counting_type{42}};
            CHECK(res.value().value == 42);
        }
        CHECK(counting_type::value_ctor_count == 1);
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::dtor_count == 2); // temp + result contents
    }

    SECTION("failure construction")
    {
        counting_type::reset_counters();
        {
            auto const res = vd::result<int, counting_type>{vd::failure(counting_type{99})};
            CHECK(res.error().value == 99);
        }
        CHECK(counting_type::value_ctor_count == 1);
        CHECK(counting_type::move_ctor_count == 2); // move into vd::failure, then move into result
        CHECK(counting_type::dtor_count == 3);
    }

    SECTION("copy construction")
    {
        counting_type::reset_counters();
        {
            auto const res1 = vd::result<counting_type, int>{counting_type{42}};
            counting_type::reset_counters();
            auto const res2 = res1;
            CHECK(res2.is_success());
        }
        CHECK(counting_type::copy_ctor_count == 1);
        CHECK(counting_type::dtor_count == 2);
    }

    SECTION("move assignment - failure to value")
    {
        counting_type::reset_counters();
        {
            auto res1 = vd::result<int, counting_type>{vd::failure(counting_type{99})};
            auto res2 = vd::result<int, counting_type>{42};
            counting_type::reset_counters();
            res2 = vd::move(res1);
            CHECK(res2.is_failure());
        }
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::dtor_count == 2);
    }

    SECTION("map on an rvalue moves the value into the function")
    {
        counting_type::reset_counters();
        {
            auto res = vd::result<counting_type, int>{counting_type{3}};
            counting_type::reset_counters();
            auto const mapped = vd::move(res).map([](counting_type&& c) { return c.value * 2; });
            CHECK(mapped.value() == 6);
        }
        CHECK(counting_type::copy_ctor_count == 0);
    }
}

TEST("result - move-only types")
{
    SECTION("value construction and move")
    {
        auto res1 = vd::result<move_only, int>{move_only{42}};
        auto res2 = vd::move(res1);
        CHECK(res2.is_success());
        CHECK(res2.value().value == 42);
    }

    SECTION("value rvalue reference")
    {
        auto res = vd::result<move_only, int>{move_only{42}};
        auto moved = vd::move(res).value();
        CHECK(moved.value == 42);
    }

    SECTION("unique_ptr failure")
    {
        auto res = vd::result<int, std::unique_ptr<int>>{vd::failure(std::make_unique<int>(99))};
        auto res2 = vd::move(res);
        CHECK(res2.is_failure());
        CHECK(*res2.error() == 99);
    }

    SECTION("map and get_or_else on rvalues")
    {
        auto res = vd::result<move_only, int>{move_only{21}};
        auto const doubled = vd::move(res).map([](move_only m) { return move_only{m.value * 2}; });
        CHECK(doubled.value().value == 42);

        auto failed = vd::result<move_only, int>{vd::failure(0)};
        auto fallback = vd::move(failed).get_or_else([] { return move_only{99}; });
        CHECK(fallback.value == 99);
    }
}

TEST("result - fold")
{
    SECTION("success applies on_success")
    {
        auto const res = int_result{20};
        auto const n = res.fold([](int v) { return v + 1; }, [](std::string const& e) { return int(e.size()); });
        CHECK(n == 21);
    }

    SECTION("failure applies on_failure")
    {
        auto const res = int_result{vd::failure(std::string("four"))};
        auto const n = res.fold([](int v) { return v + 1; }, [](std::string const& e) { return int(e.size()); });
        CHECK(n == 4);
    }

    SECTION("failure with error detail")
    {
        vd::string_result<std::string> const res = vd::failure_message("BOO");
        auto const s = res.fold([](std::string const& v) { return to_upper(v); },
                                [](vd::error_detail const& d) { return to_lower(d[0].message); });
        CHECK(s == "boo");
    }

    SECTION("exceptions propagate")
    {
        auto const res = int_result{1};
        auto thrown = false;
        try
        {
            (void)res.fold([](int) -> int { throw std::runtime_error("nope"); }, [](std::string const&) { return 0; });
        }
        catch (std::runtime_error const& e)
        {
            thrown = std::string(e.what()) == "nope";
        }
        CHECK(thrown);
    }
}

TEST("result - map and flat_map")
{
    SECTION("map then get_or_else")
    {
        auto const res = vd::string_result<std::string>{"yay!"};
        auto const s = res.map([](std::string const& v) { return to_upper(v); }).get_or_else([] { return std::string("boo"); });
        CHECK(s == "YAY!");
    }

    SECTION("map on failure passes the failure through")
    {
        vd::string_result<std::string> const res = vd::failure_message("nope");
        auto called = false;
        auto const mapped = res.map(
            [&](std::string const& v)
            {
                called = true;
                return v.size();
            });
        CHECK(!called);
        CHECK(mapped.is_failure());
        CHECK(mapped.error() == vd::error_detail::create_with("nope"));
        CHECK(mapped.get_or_else([] { return std::size_t(7); }) == 7);
    }

    SECTION("map does not catch")
    {
        auto const res = vd::string_result<int>{1};
        auto thrown = false;
        try
        {
            (void)res.map([](int) -> int { throw std::runtime_error("nope"); });
        }
        catch (std::runtime_error const&)
        {
            thrown = true;
        }
        CHECK(thrown);
    }

    SECTION("flat_map returns the inner result")
    {
        auto const res = int_result{4};
        auto const half = [](int v) -> int_result
        {
            if (v % 2 != 0)
                return vd::failure(std::string("odd"));
            return v / 2;
        };

        auto const two = res.flat_map(half);
        CHECK(two.value() == 2);

        auto const one = two.flat_map(half);
        auto const odd = one.flat_map(half);
        CHECK(odd.is_failure());
        CHECK(odd.error() == "odd");
    }

    SECTION("flat_map short-circuits on failure")
    {
        auto const res = int_result{vd::failure(std::string("boo"))};
        auto called = false;
        auto const out = res.flat_map(
            [&](int v) -> vd::result<double, std::string>
            {
                called = true;
                return double(v);
            });
        CHECK(!called);
        CHECK(out.is_failure());
        CHECK(out.error() == "boo");
    }
}

TEST("result - flatten")
{
    SECTION("success of success")
    {
        auto const nested = nested_result{int_result{314}};
        auto const flat = nested.flatten();
        CHECK(flat.is_success());
        CHECK(flat.value() == 314);
    }

    SECTION("success of failure")
    {
        auto const nested = nested_result{int_result{vd::failure(std::string("inner"))}};
        auto const flat = nested.flatten();
        CHECK(flat.is_failure());
        CHECK(flat.error() == "inner");
    }

    SECTION("failure is returned unchanged")
    {
        auto const nested = nested_result{vd::failure(std::string("boo"))};
        auto const flat = nested.flatten();
        CHECK(flat.is_failure());
        CHECK(flat.error() == "boo");
    }
}

TEST("result - swap")
{
    SECTION("success becomes failure")
    {
        auto const res = int_result{42};
        auto const swapped = res.swap();
        CHECK(swapped.is_failure());
        CHECK(swapped.error() == 42);
    }

    SECTION("failure becomes success")
    {
        auto const res = int_result{vd::failure(std::string("boo"))};
        auto const swapped = res.swap();
        CHECK(swapped.is_success());
        CHECK(swapped.value() == "boo");
    }

    SECTION("swap twice restores the shape")
    {
        auto const res = int_result{42};
        CHECK(res.swap().swap() == res);
    }
}

TEST("result - side effects and fallbacks")
{
    SECTION("for_each only runs on success")
    {
        auto calls = 0;
        int_result{5}.for_each([&](int v) { calls += v; });
        int_result{vd::failure(std::string("boo"))}.for_each([&](int v) { calls += v; });
        CHECK(calls == 5);
    }

    SECTION("get_or_else")
    {
        auto const ok = int_result{1};
        auto const bad = int_result{vd::failure(std::string("boo"))};
        CHECK(ok.get_or_else([] { return 2; }) == 1);
        CHECK(bad.get_or_else([] { return 2; }) == 2);
    }

    SECTION("or_else")
    {
        auto const ok = int_result{1};
        auto const bad = int_result{vd::failure(std::string("boo"))};
        auto const alt = [] { return int_result{2}; };
        CHECK(ok.or_else(alt).value() == 1);
        CHECK(bad.or_else(alt).value() == 2);
    }
}

TEST("result - predicates")
{
    auto const ok = int_result{4};
    auto const bad = int_result{vd::failure(std::string("boo"))};
    auto const is_even = [](int v) { return v % 2 == 0; };
    auto const is_odd = [](int v) { return v % 2 != 0; };

    CHECK(ok.contains(4));
    CHECK(!ok.contains(5));
    CHECK(!bad.contains(4));

    CHECK(ok.for_all(is_even));
    CHECK(!ok.for_all(is_odd));
    CHECK(bad.for_all(is_odd)); // vacuously true

    CHECK(ok.exists(is_even));
    CHECK(!ok.exists(is_odd));
    CHECK(!bad.exists(is_even));
}

TEST("result - conversions")
{
    SECTION("to_optional")
    {
        CHECK(int_result{3}.to_optional() == std::optional<int>(3));
        CHECK(!int_result{vd::failure(std::string("boo"))}.to_optional().has_value());
    }

    SECTION("to_optional of a null pointer is empty")
    {
        int x = 0;
        auto const null_res = vd::result<int*, std::string>{nullptr};
        auto const res = vd::result<int*, std::string>{&x};
        CHECK(null_res.is_success());
        CHECK(!null_res.to_optional().has_value());
        CHECK(res.to_optional() == std::optional<int*>(&x));
    }

    SECTION("to_standard_result")
    {
        auto const ok = int_result{3}.to_standard_result();
        REQUIRE(ok.has_value());
        CHECK(ok.value() == 3);

        auto const bad = int_result{vd::failure(std::string("boo"))}.to_standard_result();
        REQUIRE(!bad.has_value());
        CHECK(std::string(bad.error().what()) == "boo");

        auto const code = vd::result<int, int>{vd::failure(7)}.to_standard_result();
        REQUIRE(!code.has_value());
        CHECK(std::string(code.error().what()) == "7");
    }

    SECTION("to_string")
    {
        CHECK(int_result{42}.to_string() == "success(42)");
        CHECK(int_result{vd::failure(std::string("boo"))}.to_string() == "failure(\"boo\")");

        vd::string_result<int> const detailed = vd::failure_message("nope");
        CHECK(detailed.to_string() == "failure([(\"error\", \"nope\")])");
    }
}

TEST("result - equality and hashing")
{
    auto const a = int_result{1};
    auto const b = int_result{1};
    auto const c = int_result{2};
    auto const f = int_result{vd::failure(std::string("1"))};

    CHECK(a == b);
    CHECK(a != c);
    CHECK(a != f);

    auto const hash = std::hash<int_result>{};
    CHECK(hash(a) == hash(b));

    // the same value on different sides must not compare equal
    using code_result = vd::result<int, int>;
    auto const s = code_result{1};
    auto const e = code_result{vd::failure(1)};
    CHECK(s != e);
    CHECK(std::hash<code_result>{}(s) != std::hash<code_result>{}(e));

    SECTION("producer does not take part in equality")
    {
        auto const with_producer = a.with_producer([](std::exception_ptr) { return std::string("x"); });
        CHECK(with_producer.has_producer());
        CHECK(with_producer == a);
        CHECK(hash(with_producer) == hash(a));
    }
}
