#pragma once

#include <verdict/alternatives.hh>
#include <verdict/assert.hh>
#include <verdict/failure_producer.hh>
#include <verdict/fwd.hh>
#include <verdict/safe_call.hh>
#include <verdict/to_debug_string.hh>
#include <verdict/utility.hh>

#include <cstddef>
#include <exception>
#include <expected>
#include <functional> // std::hash
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

// =========================================================================================================
// vd::result<S, F> - success-biased result
// =========================================================================================================
//
// Queries:
//   is_success() / is_failure()          - which alternative is held
//   value() / error()                    - access the held value (asserted)
//   has_producer() / producer()          - failure producer attached to a success
//
// Unsafe combinators (exceptions from callbacks propagate):
//   fold(on_success, on_failure)         - C from whichever function matches
//   map(fn)                              - result<S1, F>, failure passes through
//   flat_map(fn)                         - fn(value) for fn: S -> result<S1, F>
//   flatten()                            - result<result<S1, F>, F> -> result<S1, F>
//   swap()                               - result<F, S>
//   for_each(effect)                     - side effect on success
//   get_or_else(fn) / or_else(fn)        - fallback value / fallback result on failure
//   contains(x) / for_all(p) / exists(p) - queries against the success value
//
// Safe combinators (exceptions become failures, see "safety chain" below):
//   safe_fold, safe_map, safe_flat_map, safe_for_each, safe_for_all, safe_exists
//   all take an optional trailing producer: (std::exception_ptr) -> F
//
// Conversions:
//   to_optional()                        - std::optional<S>, empty on failure
//   to_standard_result()                 - std::expected<S, std::runtime_error>
//   projection()                         - failure_projection<S, F>, failure-biased view
//   to_string()                          - debug form "success(...)" / "failure(...)"
//
// Safety chain:
//   A safe operation picks its producer in this order:
//     1. the producer passed to the call (a null failure_producer<F> is skipped)
//     2. the producer attached to this success (vd::success(v) + producer, or with_producer)
//     3. failure_traits<F>::from_exception, if F provides it (error_detail does)
//   If none exists, the safe operation behaves like its unsafe counterpart.
//   Successes derived from a success keep its producer, so a chain started safe stays safe.
//   swap() is the exception: the failure type changes and the producer no longer fits.
//

namespace vd::impl
{
template <class S, class F>
constexpr bool is_trivial_result = std::is_trivially_copyable_v<S> && std::is_trivially_copyable_v<F>;

template <class S, class F>
constexpr bool is_trivially_destructible_result = std::is_trivially_destructible_v<S> && std::is_trivially_destructible_v<F>;

template <class S, class F>
concept flattenable = is_result<S> && std::is_same_v<typename S::failure_type, F>;

/// Uninitialized storage for one of S or F.
/// Which member is alive is tracked by the owning result.
template <class S, class F>
union result_storage
{
    S value;
    F error;

    result_storage() {}

    ~result_storage()
        requires is_trivially_destructible_result<S, F>
    = default;
    ~result_storage() {}
};

struct success_tag_t
{
};
struct failure_tag_t
{
};
constexpr success_tag_t success_tag = {};
constexpr failure_tag_t failure_tag = {};

/// Default for the trailing producer argument of safe operations
struct no_producer_t
{
};
} // namespace vd::impl

/// Sum type holding either a success value S or a failure value F, never neither.
/// Combinators are success-biased: they act on the success value and pass failures through unchanged.
/// Equality is structural and ignores the attached producer.
/// Trivially copyable when S and F are trivially copyable.
template <class S, class F>
struct vd::result
{
    static_assert(!std::is_reference_v<S> && !std::is_reference_v<F>, "result cannot hold references");
    static_assert(!std::is_void_v<S> && !std::is_void_v<F>, "result cannot hold void, use vd::unit instead");

public:
    using success_type = S;
    using failure_type = F;

    // construction
public:
    /// Default result is a failure holding a value-initialized F.
    result()
        requires std::is_default_constructible_v<F>
      : _is_success(false)
    {
        new (vd::placement_new, &_storage.error) F();
    }

    /// Constructs a success from anything S can be constructed from; conditionally explicit.
    template <class U = std::remove_cv_t<S>>
        requires(std::is_constructible_v<S, U> && !std::is_same_v<std::remove_cvref_t<U>, result>
                 && !impl::is_alternative_tag<std::remove_cvref_t<U>>)
    explicit(!std::is_convertible_v<U, S>) result(U&& value) : _is_success(true) // NOLINT
    {
        new (vd::placement_new, &_storage.value) S(vd::forward<U>(value));
    }

    template <class U>
        requires std::is_constructible_v<S, U&&>
    result(as_success_t<U>&& s) : _is_success(true) // NOLINT
    {
        new (vd::placement_new, &_storage.value) S(vd::move(s.value));
    }
    template <class U>
        requires std::is_constructible_v<S, U const&>
    result(as_success_t<U> const& s) : _is_success(true) // NOLINT
    {
        new (vd::placement_new, &_storage.value) S(s.value);
    }

    /// Constructs a success that carries a failure producer, so safe operations on it
    /// (and on the successes derived from it) turn exceptions into failures.
    template <class U>
        requires std::is_constructible_v<S, U&&>
    result(as_success_t<U> s, failure_producer<F> producer) : _is_success(true), _producer(producer)
    {
        new (vd::placement_new, &_storage.value) S(vd::move(s.value));
    }

    template <class U>
        requires std::is_constructible_v<F, U&&>
    result(as_failure_t<U>&& f) : _is_success(false) // NOLINT
    {
        new (vd::placement_new, &_storage.error) F(vd::move(f.error));
    }
    template <class U>
        requires std::is_constructible_v<F, U const&>
    result(as_failure_t<U> const& f) : _is_success(false) // NOLINT
    {
        new (vd::placement_new, &_storage.error) F(f.error);
    }

    // trivial copy/move/destroy - defaulted when S and F allow bitwise operations
public:
    result(result&&)
        requires impl::is_trivial_result<S, F>
    = default;
    result(result const&)
        requires impl::is_trivial_result<S, F>
    = default;
    result& operator=(result&&)
        requires impl::is_trivial_result<S, F>
    = default;
    result& operator=(result const&)
        requires impl::is_trivial_result<S, F>
    = default;

    ~result()
        requires impl::is_trivially_destructible_result<S, F>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Move-constructs the active alternative; rhs keeps its (moved-from) alternative.
    /// noexcept assumes S and F do not throw on move.
    result(result&& rhs) noexcept
        requires(!impl::is_trivial_result<S, F>)
      : _is_success(rhs._is_success), _producer(rhs._producer)
    {
        if (_is_success)
            new (vd::placement_new, &_storage.value) S(vd::move(rhs._storage.value));
        else
            new (vd::placement_new, &_storage.error) F(vd::move(rhs._storage.error));
    }

    result(result const& rhs)
        requires(!impl::is_trivial_result<S, F> && std::is_copy_constructible_v<S> && std::is_copy_constructible_v<F>)
      : _is_success(rhs._is_success), _producer(rhs._producer)
    {
        if (_is_success)
            new (vd::placement_new, &_storage.value) S(rhs._storage.value);
        else
            new (vd::placement_new, &_storage.error) F(rhs._storage.error);
    }

    /// Assigns within the same alternative, otherwise destroys and re-constructs.
    result& operator=(result&& rhs) noexcept
        requires(!impl::is_trivial_result<S, F>)
    {
        if (_is_success && rhs._is_success)
            _storage.value = vd::move(rhs._storage.value);
        else if (!_is_success && !rhs._is_success)
            _storage.error = vd::move(rhs._storage.error);
        else
        {
            impl_destroy();
            if (rhs._is_success)
                new (vd::placement_new, &_storage.value) S(vd::move(rhs._storage.value));
            else
                new (vd::placement_new, &_storage.error) F(vd::move(rhs._storage.error));
            _is_success = rhs._is_success;
        }

        _producer = rhs._producer;
        return *this;
    }

    result& operator=(result const& rhs)
        requires(!impl::is_trivial_result<S, F> && std::is_copy_constructible_v<S> && std::is_copy_assignable_v<S>
                 && std::is_copy_constructible_v<F> && std::is_copy_assignable_v<F>)
    {
        if (this == &rhs)
            return *this;

        if (_is_success && rhs._is_success)
            _storage.value = rhs._storage.value;
        else if (!_is_success && !rhs._is_success)
            _storage.error = rhs._storage.error;
        else
        {
            impl_destroy();
            if (rhs._is_success)
                new (vd::placement_new, &_storage.value) S(rhs._storage.value);
            else
                new (vd::placement_new, &_storage.error) F(rhs._storage.error);
            _is_success = rhs._is_success;
        }

        _producer = rhs._producer;
        return *this;
    }

    ~result()
        requires(!impl::is_trivially_destructible_result<S, F>)
    {
        impl_destroy();
    }

    // queries and access
public:
    [[nodiscard]] bool is_success() const { return _is_success; }
    [[nodiscard]] bool is_failure() const { return !_is_success; }

    /// True if this is a success that carries a failure producer.
    [[nodiscard]] bool has_producer() const { return _producer != nullptr; }
    /// The attached producer, nullptr if there is none (always for failures).
    [[nodiscard]] failure_producer<F> producer() const { return _producer; }

    /// Returns the success value, preserving the value category of the result itself.
    /// Precondition: is_success()
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        VD_ASSERT(self._is_success, "attempted to access value of a failure result");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Returns the failure value, preserving the value category of the result itself.
    /// Precondition: is_failure()
    template <class Self>
    [[nodiscard]] auto&& error(this Self&& self)
    {
        VD_ASSERT(!self._is_success, "attempted to access error of a success result");
        return static_cast<Self&&>(self)._storage.error;
    }

    /// Copy of this result with the given producer attached.
    /// Failures never carry a producer and are returned unchanged.
    template <class Self>
    [[nodiscard]] result with_producer(this Self&& self, failure_producer<F> producer)
    {
        result r(static_cast<Self&&>(self));
        if (r._is_success)
            r._producer = producer;
        return r;
    }

    // fold and swap
public:
    /// Applies on_success to the value or on_failure to the error and returns what it returns.
    /// Both functions must return the same type. Exceptions propagate.
    template <class Self, class OnSuccess, class OnFailure>
    auto fold(this Self&& self, OnSuccess&& on_success, OnFailure&& on_failure)
        -> std::remove_cvref_t<vd::invoke_result<OnSuccess&, forward_like_t<Self, S>>>
    {
        if (self._is_success)
            return vd::invoke(on_success, static_cast<Self&&>(self)._storage.value);
        return vd::invoke(on_failure, static_cast<Self&&>(self)._storage.error);
    }

    /// fold inside the failure boundary: the folded value becomes a success carrying the producer,
    /// an exception thrown by either function becomes failure(producer(exception)).
    /// This also folds failures into successes.
    /// Without any producer (see "safety chain") exceptions propagate.
    template <class Self, class OnSuccess, class OnFailure, class Producer = impl::no_producer_t>
    [[nodiscard]] auto safe_fold(this Self&& self, OnSuccess&& on_success, OnFailure&& on_failure, Producer&& producer = {})
    {
        using C = std::remove_cvref_t<vd::invoke_result<OnSuccess&, forward_like_t<Self, S>>>;
        static_assert(!std::is_void_v<C>, "safe_fold requires functions returning a value");
        using R = result<C, F>;

        auto const chained = self.impl_chained_producer(producer);
        return self.template impl_run_safe<R>(producer,
                                              [&]() -> R {
                                                  return R(impl::success_tag, chained,
                                                           static_cast<Self&&>(self).fold(on_success, on_failure));
                                              });
    }

    /// Success(v) becomes failure(v), failure(e) becomes success(e).
    /// The producer is dropped: it produces F, while the swapped result fails with S.
    template <class Self>
    [[nodiscard]] result<F, S> swap(this Self&& self)
    {
        if (self._is_success)
            return result<F, S>(impl::failure_tag, static_cast<Self&&>(self)._storage.value);
        return result<F, S>(impl::success_tag, nullptr, static_cast<Self&&>(self)._storage.error);
    }

    /// swap() that keeps the swapped result safe with a producer for the new failure type.
    template <class Self>
    [[nodiscard]] result<F, S> swap(this Self&& self, failure_producer<S> producer)
    {
        result<F, S> r = static_cast<Self&&>(self).swap();
        if (r._is_success)
            r._producer = producer;
        return r;
    }

    // side effects and fallbacks
public:
    /// Calls effect with the value on success; the return value of effect is discarded.
    template <class Effect>
    void for_each(Effect&& effect) const
    {
        if (_is_success)
            (void)vd::invoke(effect, _storage.value);
    }

    /// for_each inside the failure boundary. Failures pass through.
    template <class Effect, class Producer = impl::no_producer_t>
    [[nodiscard]] result<unit, F> safe_for_each(Effect&& effect, Producer&& producer = {}) const
    {
        using R = result<unit, F>;
        if (!_is_success)
            return R(impl::failure_tag, _storage.error);

        auto const chained = impl_chained_producer(producer);
        return impl_run_safe<R>(producer,
                                [&]() -> R
                                {
                                    for_each(effect);
                                    return R(impl::success_tag, chained, unit{});
                                });
    }

    /// The value on success, default_fn() otherwise.
    template <class Self, class Default>
    [[nodiscard]] S get_or_else(this Self&& self, Default&& default_fn)
    {
        if (self._is_success)
            return static_cast<Self&&>(self)._storage.value;
        return vd::invoke(default_fn);
    }

    /// This result on success, alternative() otherwise.
    template <class Self, class Alternative>
    [[nodiscard]] result or_else(this Self&& self, Alternative&& alternative)
    {
        if (self._is_success)
            return static_cast<Self&&>(self);
        return vd::invoke(alternative);
    }

    // predicates
public:
    /// True iff this is a success holding a value equal to x.
    [[nodiscard]] bool contains(S const& x) const
        requires requires(S const& v) { bool(v == v); }
    {
        return _is_success && _storage.value == x;
    }

    /// predicate(value) on success, vacuously true on failure.
    template <class Predicate>
    [[nodiscard]] bool for_all(Predicate&& predicate) const
    {
        return !_is_success || bool(vd::invoke(predicate, _storage.value));
    }

    /// predicate(value) on success, false on failure.
    template <class Predicate>
    [[nodiscard]] bool exists(Predicate&& predicate) const
    {
        return _is_success && bool(vd::invoke(predicate, _storage.value));
    }

    /// for_all inside the failure boundary. Failures pass through.
    template <class Predicate, class Producer = impl::no_producer_t>
    [[nodiscard]] result<bool, F> safe_for_all(Predicate&& predicate, Producer&& producer = {}) const
    {
        return impl_safe_predicate(producer, [&] { return for_all(predicate); });
    }

    /// exists inside the failure boundary. Failures pass through.
    template <class Predicate, class Producer = impl::no_producer_t>
    [[nodiscard]] result<bool, F> safe_exists(Predicate&& predicate, Producer&& producer = {}) const
    {
        return impl_safe_predicate(producer, [&] { return exists(predicate); });
    }

    // transformations
public:
    /// fn(value) for fn: S -> result<S1, F>; failures pass through retyped.
    /// A success returned by fn inherits this result's producer unless it has its own.
    template <class Self, class Fn>
    [[nodiscard]] auto flat_map(this Self&& self, Fn&& fn)
    {
        using R = std::remove_cvref_t<vd::invoke_result<Fn&, forward_like_t<Self, S>>>;
        static_assert(impl::is_result<R>, "flat_map requires a function returning a vd::result");
        static_assert(std::is_same_v<typename R::failure_type, F>,
                      "flat_map cannot change the failure type, use projection().map for that");

        if (!self._is_success)
            return R(impl::failure_tag, static_cast<Self&&>(self)._storage.error);

        auto const producer = self._producer;
        R r = vd::invoke(fn, static_cast<Self&&>(self)._storage.value);
        if (r._is_success && r._producer == nullptr)
            r._producer = producer;
        return r;
    }

    /// flat_map inside the failure boundary. Failures pass through.
    template <class Self, class Fn, class Producer = impl::no_producer_t>
    [[nodiscard]] auto safe_flat_map(this Self&& self, Fn&& fn, Producer&& producer = {})
    {
        using R = std::remove_cvref_t<vd::invoke_result<Fn&, forward_like_t<Self, S>>>;
        static_assert(impl::is_result<R>, "safe_flat_map requires a function returning a vd::result");
        static_assert(std::is_same_v<typename R::failure_type, F>,
                      "safe_flat_map cannot change the failure type, use projection().map for that");

        if (!self._is_success)
            return R(impl::failure_tag, static_cast<Self&&>(self)._storage.error);

        auto const chained = self.impl_chained_producer(producer);
        return self.template impl_run_safe<R>(producer,
                                              [&]() -> R
                                              {
                                                  R r = vd::invoke(fn, static_cast<Self&&>(self)._storage.value);
                                                  if (r._is_success && r._producer == nullptr)
                                                      r._producer = chained;
                                                  return r;
                                              });
    }

    /// Unwraps one level of nesting: success(inner) becomes inner, failures pass through retyped.
    /// Only available when S is a result with the same failure type.
    template <class Self>
        requires impl::flattenable<S, F>
    [[nodiscard]] S flatten(this Self&& self)
    {
        if (!self._is_success)
            return S(impl::failure_tag, static_cast<Self&&>(self)._storage.error);

        S inner = static_cast<Self&&>(self)._storage.value;
        if (inner._is_success && inner._producer == nullptr)
            inner._producer = self._producer;
        return inner;
    }

    /// success(fn(value)) on success, failures pass through retyped. Exceptions propagate.
    template <class Self, class Fn>
    [[nodiscard]] auto map(this Self&& self, Fn&& fn)
    {
        using S1 = std::remove_cvref_t<vd::invoke_result<Fn&, forward_like_t<Self, S>>>;
        static_assert(!std::is_void_v<S1>, "map requires a function returning a value, use for_each for side effects");
        using R = result<S1, F>;

        if (!self._is_success)
            return R(impl::failure_tag, static_cast<Self&&>(self)._storage.error);
        return R(impl::success_tag, self._producer, vd::invoke(fn, static_cast<Self&&>(self)._storage.value));
    }

    /// map inside the failure boundary. Failures pass through.
    template <class Self, class Fn, class Producer = impl::no_producer_t>
    [[nodiscard]] auto safe_map(this Self&& self, Fn&& fn, Producer&& producer = {})
    {
        using S1 = std::remove_cvref_t<vd::invoke_result<Fn&, forward_like_t<Self, S>>>;
        static_assert(!std::is_void_v<S1>, "safe_map requires a function returning a value");
        using R = result<S1, F>;

        if (!self._is_success)
            return R(impl::failure_tag, static_cast<Self&&>(self)._storage.error);

        auto const chained = self.impl_chained_producer(producer);
        return self.template impl_run_safe<R>(
            producer, [&]() -> R
            { return R(impl::success_tag, chained, vd::invoke(fn, static_cast<Self&&>(self)._storage.value)); });
    }

    /// Appends (category, message) to the error detail of a failure; successes are returned unchanged.
    /// Only available for string results (F = error_detail).
    template <class Self>
        requires std::is_same_v<F, error_detail>
    [[nodiscard]] result add(this Self&& self, std::string category, std::string message)
    {
        if (self._is_success)
            return static_cast<Self&&>(self);
        return result(impl::failure_tag, static_cast<Self&&>(self)._storage.error.add(vd::move(category), vd::move(message)));
    }

    // conversions
public:
    /// The value on success, empty on failure.
    /// A success holding a null pointer also yields an empty optional.
    template <class Self>
    [[nodiscard]] std::optional<S> to_optional(this Self&& self)
    {
        if (!self._is_success)
            return std::nullopt;

        if constexpr (std::is_pointer_v<S>)
        {
            if (self._storage.value == nullptr)
                return std::nullopt;
        }

        return static_cast<Self&&>(self)._storage.value;
    }

    /// The value on success, otherwise a std::runtime_error with the string form of the error.
    template <class Self>
    [[nodiscard]] std::expected<S, std::runtime_error> to_standard_result(this Self&& self)
    {
        if (self._is_success)
            return static_cast<Self&&>(self)._storage.value;
        return std::unexpected(std::runtime_error(impl::to_message_string(self._storage.error)));
    }

    /// Failure-biased view of this result, see <verdict/failure_projection.hh>.
    template <class Self>
    [[nodiscard]] failure_projection<S, F> projection(this Self&& self)
    {
        return failure_projection<S, F>(result(static_cast<Self&&>(self)));
    }

    [[nodiscard]] std::string to_string() const
    {
        if (_is_success)
            return "success(" + vd::to_debug_string(_storage.value) + ")";
        return "failure(" + vd::to_debug_string(_storage.error) + ")";
    }

    // comparison
public:
    /// Structural equality: same alternative holding equal values. Producers are ignored.
    [[nodiscard]] friend bool operator==(result const& lhs, result const& rhs)
        requires requires(S const& s, F const& f) {
            bool(s == s);
            bool(f == f);
        }
    {
        if (lhs._is_success != rhs._is_success)
            return false;
        if (lhs._is_success)
            return lhs._storage.value == rhs._storage.value;
        return lhs._storage.error == rhs._storage.error;
    }

    // helper
private:
    template <class... Args>
    explicit result(impl::success_tag_t, failure_producer<F> producer, Args&&... args)
      : _is_success(true), _producer(producer)
    {
        new (vd::placement_new, &_storage.value) S(vd::forward<Args>(args)...);
    }

    template <class... Args>
    explicit result(impl::failure_tag_t, Args&&... args) : _is_success(false)
    {
        new (vd::placement_new, &_storage.error) F(vd::forward<Args>(args)...);
    }

    void impl_destroy()
    {
        if (_is_success)
            _storage.value.~S();
        else
            _storage.error.~F();
    }

    // the producer a success derived through a safe operation carries on with
    // a null explicit producer counts as no producer at all
    template <class Producer>
    [[nodiscard]] failure_producer<F> impl_chained_producer(Producer const& producer) const
    {
        if constexpr (std::is_convertible_v<Producer const&, failure_producer<F>>)
        {
            failure_producer<F> const explicit_producer = producer;
            return explicit_producer != nullptr ? explicit_producer : _producer;
        }
        else
            return _producer;
    }

    // evaluates body in the failure boundary selected by the explicit producer,
    // the attached producer or failure_traits<F>, in that order
    template <class R, class Producer, class Body>
    [[nodiscard]] R impl_run_safe(Producer const& producer, Body&& body) const
    {
        if constexpr (std::is_convertible_v<Producer const&, failure_producer<F>>)
        {
            failure_producer<F> const explicit_producer = producer;
            if (explicit_producer != nullptr)
                return vd::try_call_result(body, explicit_producer);
        }
        else if constexpr (!std::is_same_v<Producer, impl::no_producer_t>)
        {
            static_assert(vd::is_invocable_r<F, Producer const&, std::exception_ptr>,
                          "producer must turn a std::exception_ptr into the failure type");
            return vd::try_call_result(body, producer);
        }

        if (_producer != nullptr)
            return vd::try_call_result(body, _producer);

        if constexpr (has_default_failure_producer<F>)
            return vd::try_call_result(body, [](std::exception_ptr e) -> F { return failure_traits<F>::from_exception(e); });
        else
            return vd::invoke(body);
    }

    template <class Producer, class Predicate>
    [[nodiscard]] result<bool, F> impl_safe_predicate(Producer const& producer, Predicate&& predicate) const
    {
        using R = result<bool, F>;
        if (!_is_success)
            return R(impl::failure_tag, _storage.error);

        auto const chained = impl_chained_producer(producer);
        return impl_run_safe<R>(producer, [&]() -> R { return R(impl::success_tag, chained, bool(predicate())); });
    }

    template <class, class>
    friend struct result;

    // members
private:
    impl::result_storage<S, F> _storage;

    /// true when _storage.value is alive, false when _storage.error is
    bool _is_success = false;

    /// only ever set on successes
    failure_producer<F> _producer = nullptr;
};

/// Structural hash, mixing in which alternative is held.
template <class S, class F>
    requires requires(S const& s, F const& f) {
        std::hash<S>{}(s);
        std::hash<F>{}(f);
    }
struct std::hash<vd::result<S, F>>
{
    [[nodiscard]] std::size_t operator()(vd::result<S, F> const& r) const
    {
        if (r.is_success())
            return std::hash<S>{}(r.value()) * 2 + 1;
        return std::hash<F>{}(r.error()) * 2;
    }
};

// the projection needs the complete result type, and result::projection needs the projection
#include <verdict/failure_projection.hh>
