#include <verdict/error_detail.hh>

#include <verdict/to_debug_string.hh>
#include <verdict/utility.hh>

#include <algorithm>

vd::error_detail vd::error_detail::create_with(std::string message)
{
    error_detail d;
    d._entries.push_back({"error", vd::move(message)});
    return d;
}

vd::error_detail vd::error_detail::create_from_exception(std::exception_ptr const& e)
{
    return create_with(vd::exception_message(e));
}

vd::error_detail vd::error_detail::add(std::string category, std::string message) const&
{
    auto d = *this;
    d._entries.push_back({vd::move(category), vd::move(message)});
    return d;
}

vd::error_detail vd::error_detail::add(std::string category, std::string message) &&
{
    _entries.push_back({vd::move(category), vd::move(message)});
    return vd::move(*this);
}

vd::error_detail vd::error_detail::concat(error_detail const& other) const
{
    auto d = *this;
    d._entries.insert(d._entries.end(), other._entries.begin(), other._entries.end());
    return d;
}

bool vd::error_detail::contains(error_entry const& entry) const
{
    return std::find(_entries.begin(), _entries.end(), entry) != _entries.end();
}

std::string vd::error_detail::to_string() const
{
    std::string s = "[";
    for (auto const& e : _entries)
    {
        if (s.size() > 1)
            s += ", ";
        s += "(" + vd::to_debug_string(e.category) + ", " + vd::to_debug_string(e.message) + ")";
    }
    s += "]";
    return s;
}
