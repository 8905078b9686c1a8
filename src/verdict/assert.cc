#include "assert.hh"

#include <verdict/assert-handler.hh>
#include <verdict/utility.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef VD_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef VD_OS_LINUX
#include <cstring>
#endif

namespace
{
using assertion_handler = std::move_only_function<void(vd::impl::assertion_info const&)>;

// innermost scoped_assertion_handler last
std::vector<assertion_handler> g_handlers;

void report_to_stderr(vd::impl::assertion_info const& info)
{
    std::cerr << info.location.file_name() << ':' << info.location.line() << ": assertion `" << info.expression
              << "` failed in " << info.location.function_name() << '\n';
    std::cerr << "  " << info.message << '\n';
}
} // namespace

vd::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_handlers.push_back(vd::move(handler));
}

vd::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    g_handlers.pop_back();
}

VD_COLD_FUNC void vd::impl::handle_assert_failure(char const* expression, char const* message, std::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (g_handlers.empty())
        report_to_stderr(info);
    else
        g_handlers.back()(info);

    // the caller (VD_ASSERT) breaks or aborts afterwards
}

bool vd::impl::is_debugger_connected() noexcept
{
#ifdef VD_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(VD_OS_LINUX)
    // TracerPid in /proc/self/status is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                if (std::sscanf(buf + 10, "%d", &pid) != 1)
                    pid = 0;
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void vd::impl::perform_abort() noexcept
{
    std::abort();
}
