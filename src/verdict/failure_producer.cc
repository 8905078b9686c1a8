#include <verdict/failure_producer.hh>

#include <stdexcept>

std::string vd::exception_message(std::exception_ptr const& e, std::string_view fallback)
{
    if (e == nullptr)
        return std::string(fallback);

    try
    {
        std::rethrow_exception(e);
    }
    catch (std::exception const& ex)
    {
        return ex.what();
    }
    catch (std::string const& s)
    {
        return s;
    }
    catch (std::string_view const& s)
    {
        return std::string(s);
    }
    catch (char const* s)
    {
        return s != nullptr ? std::string(s) : std::string(fallback);
    }
    catch (...)
    {
        // not something we know how to describe, the caller decides what to say
        return std::string(fallback);
    }
}
