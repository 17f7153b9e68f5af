#include "assert.hh"

#include <labeled-core/misuse-handler.hh>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <vector>

#ifdef LC_OS_LINUX
#include <fstream>
#endif

#ifdef LC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
// topmost handler is back()
std::vector<std::move_only_function<void(lc::impl::misuse_report const&)>> g_misuse_handlers;
} // namespace

std::string lc::impl::describe(misuse_report const& report)
{
    std::ostringstream out;
    out << "labeled-core misuse: " << report.message << '\n';
    out << "  check:    " << report.expression << '\n';
    if (!report.active_slot.empty())
        out << "  active:   \"" << report.active_slot << "\"\n";
    out << "  location: " << report.location.file_name() << ':' << report.location.line() << ':' << report.location.column()
        << " (" << report.location.function_name() << ")\n";
    return out.str();
}

void lc::impl::push_misuse_handler(std::move_only_function<void(misuse_report const&)> handler)
{
    g_misuse_handlers.push_back(std::move(handler));
}

void lc::impl::pop_misuse_handler()
{
    if (!g_misuse_handlers.empty())
        g_misuse_handlers.pop_back();
}

lc::impl::scoped_misuse_handler::scoped_misuse_handler(std::move_only_function<void(misuse_report const&)> handler)
{
    push_misuse_handler(std::move(handler));
}

lc::impl::scoped_misuse_handler::~scoped_misuse_handler()
{
    pop_misuse_handler();
}

LC_COLD_FUNC void lc::impl::report_misuse(char const* expression, char const* message, std::string_view active_slot, lc::source_location location)
{
    misuse_report const report{
        .expression = expression,
        .message = message,
        .active_slot = std::string(active_slot),
        .location = location,
    };

    if (g_misuse_handlers.empty())
        std::cerr << describe(report);
    else
        g_misuse_handlers.back()(report);
}

bool lc::impl::is_debugger_connected() noexcept
{
#ifdef LC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(LC_OS_LINUX)
    // a traced process has a non-zero "TracerPid:" line in its status
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line))
    {
        if (line.starts_with("TracerPid:"))
            return std::atoi(line.c_str() + 10) != 0;
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void lc::impl::perform_abort() noexcept
{
    std::abort();
}
