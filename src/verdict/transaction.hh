#pragma once

#include <verdict/error_detail.hh>
#include <verdict/string_result.hh>
#include <verdict/utility.hh>

#include <exception>
#include <optional>
#include <type_traits>

namespace vd
{
/// Step of a transaction during which an exception escaped
enum class transaction_phase
{
    execute,
    commit,
    rollback,
};

[[nodiscard]] char const* to_string(transaction_phase phase);

namespace impl
{
// failure reported after the recovery rollback succeeded:
// the exception message first, then the entries of the failed operation result (if any)
[[nodiscard]] error_detail transaction_recovered_failure(std::exception_ptr const& e, error_detail const* operation_failure);

// failure reported when the recovery rollback threw as well
[[nodiscard]] error_detail transaction_unrecoverable_failure(transaction_phase phase, std::exception_ptr const& e);
} // namespace impl

/// Runs bounded_op on behalf of the transaction handle and commits or rolls back depending on its outcome.
///
///   - handle is a failure: returned (retyped), nothing is called
///   - otherwise bounded_op() runs first, then is_transactional(value) is asked
///   - is_transactional(value) is false: bounded_op() is returned as-is, no commit or rollback
///   - bounded_op() succeeded: commit(value), then the operation result
///   - bounded_op() failed: rollback(value), then the operation result
///   - a failed commit or rollback is returned instead of the operation result
///
/// Exceptions from any of the callbacks are caught. For a transactional handle, rollback(value) is then
/// attempted once more as recovery:
///   - recovery succeeded: failure [("error", <exception message>), <entries of the failed operation result>...]
///   - recovery failed: its failure is returned
///   - recovery threw: failure with the single entry
///       ("error", "Exception thrown when attempting to <phase> the transaction, and then again on the final
///                  rollback: <message of the second exception>")
///     where <phase> is commit or rollback after the operation returned, and execute if it threw.
///     The ": " before the second message is part of the format.
///
/// Signatures:
///   is_transactional: S const& -> bool
///   bounded_op:       () -> string_result<S1>
///   commit, rollback: S const& -> string_result<bool>
///
/// Usage:
///   auto r = vd::transaction(open_connection(), [](connection const& c) { return !c.in_transaction(); },
///                            [&] { return insert_rows(rows); },
///                            [](connection const& c) { return c.commit(); },
///                            [](connection const& c) { return c.rollback(); });
template <class S, class IsTransactional, class BoundedOp, class Commit, class Rollback>
[[nodiscard]] auto transaction(string_result<S> const& handle,
                               IsTransactional&& is_transactional,
                               BoundedOp&& bounded_op,
                               Commit&& commit,
                               Rollback&& rollback)
{
    using R = std::remove_cvref_t<vd::invoke_result<BoundedOp&>>;
    static_assert(impl::is_result<R>, "bounded operation must return a vd::string_result");
    static_assert(std::is_same_v<typename R::failure_type, error_detail>, "bounded operation must return a vd::string_result");

    if (handle.is_failure())
        return R(vd::failure(handle.error()));

    auto const& value = handle.value();

    // the bounded operation result, if it returned at all
    std::optional<R> op_result;
    auto phase = transaction_phase::execute;
    auto owns_transaction = true;

    try
    {
        op_result.emplace(vd::invoke(bounded_op));
        phase = op_result->is_success() ? transaction_phase::commit : transaction_phase::rollback;

        owns_transaction = bool(vd::invoke(is_transactional, value));
        if (!owns_transaction)
            return vd::move(*op_result);

        string_result<bool> const outcome
            = phase == transaction_phase::commit ? vd::invoke(commit, value) : vd::invoke(rollback, value);

        if (outcome.is_failure())
            return R(vd::failure(outcome.error()));

        return vd::move(*op_result);
    }
    catch (...)
    {
        auto const e = std::current_exception();
        auto const* operation_failure = op_result.has_value() && op_result->is_failure() ? &op_result->error() : nullptr;

        // someone else owns the transaction, rolling back is not ours to do
        if (!owns_transaction)
            return R(vd::failure(impl::transaction_recovered_failure(e, operation_failure)));

        try
        {
            string_result<bool> const recovery = vd::invoke(rollback, value);
            if (recovery.is_failure())
                return R(vd::failure(recovery.error()));

            return R(vd::failure(impl::transaction_recovered_failure(e, operation_failure)));
        }
        catch (...)
        {
            return R(vd::failure(impl::transaction_unrecoverable_failure(phase, std::current_exception())));
        }
    }
}
} // namespace vd
