#pragma once

#include <verdict/assert.hh>
#include <verdict/failure_producer.hh>
#include <verdict/fwd.hh>

#include <cstddef>
#include <exception>
#include <functional> // std::hash
#include <initializer_list>
#include <string>
#include <vector>

/// One annotation of a failure, e.g. {"error", "file not found"} or {"warning", "retrying"}
struct vd::error_entry
{
    std::string category;
    std::string message;

    friend bool operator==(error_entry const&, error_entry const&) = default;
};

/// Ordered (category, message) pairs describing a failure.
/// The first entry is usually the primary error, later entries annotate it.
/// Value type: add and concat return a new detail and leave the receiver untouched.
///
/// Usage:
///   auto d = vd::error_detail::create_with("first").add("warning", "w").add("info", "i");
///   // d == [("error", "first"), ("warning", "w"), ("info", "i")]
struct vd::error_detail
{
    // creation
public:
    error_detail() = default;
    error_detail(std::initializer_list<error_entry> entries) : _entries(entries) {}

    [[nodiscard]] static error_detail create_empty() { return {}; }

    /// Single entry with category "error"
    [[nodiscard]] static error_detail create_with(std::string message);

    /// Single "error" entry with the message of the exception (empty if it has none)
    [[nodiscard]] static error_detail create_from_exception(std::exception_ptr const& e);

    // accumulation
public:
    /// Copy of this detail with (category, message) appended
    [[nodiscard]] error_detail add(std::string category, std::string message) const&;
    [[nodiscard]] error_detail add(std::string category, std::string message) &&;

    /// Copy of this detail with all entries of other appended
    [[nodiscard]] error_detail concat(error_detail const& other) const;

    // queries
public:
    [[nodiscard]] isize size() const { return isize(_entries.size()); }
    [[nodiscard]] bool empty() const { return _entries.empty(); }

    [[nodiscard]] error_entry const& operator[](isize i) const
    {
        VD_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _entries[std::size_t(i)];
    }

    [[nodiscard]] error_entry const& front() const
    {
        VD_ASSERT(!_entries.empty(), "error detail is empty");
        return _entries.front();
    }

    [[nodiscard]] bool contains(error_entry const& entry) const;

    [[nodiscard]] auto begin() const { return _entries.begin(); }
    [[nodiscard]] auto end() const { return _entries.end(); }

    /// [("error", "msg"), ("warning", "w")]
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(error_detail const&, error_detail const&) = default;

private:
    std::vector<error_entry> _entries;
};

/// Safe operations on results failing with error_detail always have a producer:
/// an exception becomes a single "error" entry carrying its message.
template <>
struct vd::failure_traits<vd::error_detail>
{
    [[nodiscard]] static error_detail from_exception(std::exception_ptr e) { return error_detail::create_from_exception(e); }
};

template <>
struct std::hash<vd::error_entry>
{
    [[nodiscard]] std::size_t operator()(vd::error_entry const& e) const noexcept
    {
        auto const h = std::hash<std::string>{}(e.category);
        return h ^ (std::hash<std::string>{}(e.message) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

template <>
struct std::hash<vd::error_detail>
{
    [[nodiscard]] std::size_t operator()(vd::error_detail const& d) const noexcept
    {
        std::size_t h = 0;
        for (auto const& e : d)
            h ^= std::hash<vd::error_entry>{}(e) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};
