#pragma once

#include <verdict/alternatives.hh>
#include <verdict/fwd.hh>
#include <verdict/to_debug_string.hh>
#include <verdict/utility.hh>

#include <expected>
#include <optional>
#include <stdexcept>
#include <type_traits>

#include <verdict/result.hh>

/// Failure-biased view of a result: the same combinators as result, acting on the failure value.
/// Successes pass through unchanged, including the producer they carry as long as the failure type stays F.
/// Obtained via r.projection(). No safe variants: the callbacks here see failures, not values under construction.
///
/// Usage:
///   vd::result<int, std::string> r = vd::failure(std::string("BOO"));
///   auto lowered = r.projection().map(to_lower); // result<int, std::string>, failure("boo")
template <class S, class F>
struct vd::failure_projection
{
public:
    explicit failure_projection(result<S, F> r) : _result(vd::move(r)) {}

    /// The projected result
    template <class Self>
    [[nodiscard]] auto&& underlying(this Self&& self)
    {
        return static_cast<Self&&>(self)._result;
    }

    // side effects and fallbacks
public:
    /// Calls effect with the error on failure.
    template <class Effect>
    void for_each(Effect&& effect) const
    {
        if (_result.is_failure())
            (void)vd::invoke(effect, _result.error());
    }

    /// The error on failure, default_fn() otherwise.
    template <class Self, class Default>
    [[nodiscard]] F get_or_else(this Self&& self, Default&& default_fn)
    {
        if (self._result.is_failure())
            return static_cast<Self&&>(self)._result.error();
        return vd::invoke(default_fn);
    }

    /// The underlying result on failure, alternative() otherwise.
    template <class Self, class Alternative>
    [[nodiscard]] result<S, F> or_else(this Self&& self, Alternative&& alternative)
    {
        if (self._result.is_failure())
            return static_cast<Self&&>(self)._result;
        return vd::invoke(alternative);
    }

    // predicates
public:
    [[nodiscard]] bool contains(F const& e) const
        requires requires(F const& v) { bool(v == v); }
    {
        return _result.is_failure() && _result.error() == e;
    }

    /// True iff this is a failure whose error detail contains the given entry.
    [[nodiscard]] bool contains_deep(error_entry const& entry) const
        requires std::is_same_v<F, error_detail>
    {
        return _result.is_failure() && _result.error().contains(entry);
    }

    /// predicate(error) on failure, vacuously true on success.
    template <class Predicate>
    [[nodiscard]] bool for_all(Predicate&& predicate) const
    {
        return _result.is_success() || bool(vd::invoke(predicate, _result.error()));
    }

    /// predicate(error) on failure, false on success.
    template <class Predicate>
    [[nodiscard]] bool exists(Predicate&& predicate) const
    {
        return _result.is_failure() && bool(vd::invoke(predicate, _result.error()));
    }

    // transformations
public:
    /// fn(error) for fn: F -> result<S, F1>; successes pass through retyped.
    template <class Self, class Fn>
    [[nodiscard]] auto flat_map(this Self&& self, Fn&& fn)
    {
        using R = std::remove_cvref_t<vd::invoke_result<Fn&, forward_like_t<Self, F>>>;
        static_assert(impl::is_result<R>, "flat_map requires a function returning a vd::result");
        static_assert(std::is_same_v<typename R::success_type, S>, "projected flat_map cannot change the success type");

        if (self._result.is_success())
            return impl_pass_success<R>(static_cast<Self&&>(self)._result);
        return R(vd::invoke(fn, static_cast<Self&&>(self)._result.error()));
    }

    /// failure(fn(error)) on failure, successes pass through retyped.
    template <class Self, class Fn>
    [[nodiscard]] auto map(this Self&& self, Fn&& fn)
    {
        using F1 = std::remove_cvref_t<vd::invoke_result<Fn&, forward_like_t<Self, F>>>;
        static_assert(!std::is_void_v<F1>, "projected map requires a function returning a value");
        using R = result<S, F1>;

        if (self._result.is_success())
            return impl_pass_success<R>(static_cast<Self&&>(self)._result);
        return R(vd::failure(vd::invoke(fn, static_cast<Self&&>(self)._result.error())));
    }

    // conversions
public:
    /// The error on failure, empty on success.
    /// A failure holding a null pointer also yields an empty optional.
    template <class Self>
    [[nodiscard]] std::optional<F> to_optional(this Self&& self)
    {
        if (self._result.is_success())
            return std::nullopt;

        if constexpr (std::is_pointer_v<F>)
        {
            if (self._result.error() == nullptr)
                return std::nullopt;
        }

        return static_cast<Self&&>(self)._result.error();
    }

    /// The error on failure, otherwise a std::runtime_error with the string form of the value.
    template <class Self>
    [[nodiscard]] std::expected<F, std::runtime_error> to_standard_result(this Self&& self)
    {
        if (self._result.is_failure())
            return static_cast<Self&&>(self)._result.error();
        return std::unexpected(std::runtime_error(impl::to_message_string(self._result.value())));
    }

    [[nodiscard]] friend bool operator==(failure_projection const& lhs, failure_projection const& rhs)
        requires requires(result<S, F> const& r) { bool(r == r); }
    {
        return lhs._result == rhs._result;
    }

private:
    // retypes a success; the producer only survives while it still produces the right failure type
    template <class R, class Res>
    static R impl_pass_success(Res&& r)
    {
        auto const producer = r.producer();
        R out = vd::success(vd::forward<Res>(r).value());
        if constexpr (std::is_same_v<typename R::failure_type, F>)
            return vd::move(out).with_producer(producer);
        else
            return out;
    }

    result<S, F> _result;
};
