#include <verdict/transaction.hh>

#include <verdict/failure_producer.hh>

#include <string>

char const* vd::to_string(transaction_phase phase)
{
    switch (phase)
    {
    case transaction_phase::execute:
        return "execute";
    case transaction_phase::commit:
        return "commit";
    case transaction_phase::rollback:
        return "rollback";
    }

    VD_ASSERT_ALWAYS(false, "invalid transaction phase");
    return "";
}

vd::error_detail vd::impl::transaction_recovered_failure(std::exception_ptr const& e, error_detail const* operation_failure)
{
    auto detail = error_detail::create_with(vd::exception_message(e, "[no message]"));
    if (operation_failure != nullptr)
        detail = detail.concat(*operation_failure);
    return detail;
}

vd::error_detail vd::impl::transaction_unrecoverable_failure(transaction_phase phase, std::exception_ptr const& e)
{
    auto message = std::string("Exception thrown when attempting to ") + vd::to_string(phase) + " the transaction";
    message += ", and then again on the final rollback: ";
    message += vd::exception_message(e, "[no message]");
    return error_detail::create_with(vd::move(message));
}
