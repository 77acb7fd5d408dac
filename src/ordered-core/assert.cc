#include "assert.hh"

#include <ordered-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>
#include <version>

#ifdef __cpp_lib_stacktrace
#include <stacktrace>
#endif

#ifdef OC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef OC_COMPILER_POSIX
#include <unistd.h>

#include <cstring>
#endif

namespace
{
// Global stack of assertion handlers
// NOTE: not thread-safe, must be externally synchronized
std::vector<std::move_only_function<void(oc::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(oc::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";

#ifdef __cpp_lib_stacktrace
    std::cerr << "\nStacktrace:\n" << std::to_string(std::stacktrace::current()) << '\n';
#endif
}
} // namespace

void oc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void oc::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

oc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

oc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

OC_COLD_FUNC void oc::impl::handle_assert_failure(char const* expression, char const* message, oc::source_location location)
{
    assertion_info const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool oc::impl::is_debugger_connected() noexcept
{
#ifdef OC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(OC_OS_LINUX)
    // TracerPid in /proc/self/status is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                std::sscanf(buf + 10, "%d", &pid);
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

[[noreturn]] void oc::impl::perform_abort() noexcept
{
    std::abort();
}
