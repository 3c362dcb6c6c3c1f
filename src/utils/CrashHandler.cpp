#include "CrashHandler.hpp"
#include <plog/Log.h>
#include <cpptrace/cpptrace.hpp>
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <exception>
#include <sstream>
#include <string>

namespace
{

std::atomic<void (*)()> g_fatal_cleanup{ nullptr };
std::atomic<bool> g_installed{ false };

thread_local const char* g_current_operation = nullptr;

// Shows paths from src/ onwards, otherwise the basename.
std::string trimPath(std::string filename)
{
    std::replace(filename.begin(), filename.end(), '\\', '/');
    size_t pos_src = filename.find("/src/");
    if (pos_src != std::string::npos)
        return filename.substr(pos_src + 5);

    size_t p = filename.find_last_of('/');
    return p != std::string::npos ? filename.substr(p + 1) : filename;
}

void logStackTrace()
{
    PLOG_FATAL << "Stack trace (most recent call first):";

    auto trace = cpptrace::generate_trace(1);
    if (trace.empty())
    {
        PLOG_FATAL << "No stack trace available (cpptrace returned empty).";
        return;
    }

    int idx = 0;
    for (const auto& frame : trace.frames)
    {
        std::ostringstream entry;
        entry << "#" << idx++ << " " << (frame.symbol.empty() ? std::string("??") : frame.symbol);
        if (!frame.filename.empty())
        {
            entry << " at " << trimPath(frame.filename);
            if (frame.line.has_value())
                entry << ":" << frame.line.value();
        }
        PLOG_FATAL << entry.str();
    }
}

void runFatalCleanup()
{
    if (auto fn = g_fatal_cleanup.load(std::memory_order_acquire))
    {
        fn();
    }
}

[[noreturn]] void crashTerminateHandler()
{
    PLOG_FATAL << "=== APPLICATION CRASHED ===";
    if (g_current_operation)
    {
        PLOG_FATAL << "Operation: " << g_current_operation;
    }

    if (auto current = std::current_exception())
    {
        try
        {
            std::rethrow_exception(current);
        }
        catch (const std::exception& e)
        {
            PLOG_FATAL << "Unhandled exception: " << e.what();
        }
        catch (...)
        {
            PLOG_FATAL << "Unhandled exception of unknown type";
        }
    }
    else
    {
        PLOG_FATAL << "std::terminate called without an active exception";
    }

    try
    {
        logStackTrace();
        runFatalCleanup();
    }
    catch (const std::exception& e)
    {
        PLOG_FATAL << "Crash reporting failed: " << e.what();
    }

    std::abort();
}

} // namespace

void utils::CrashHandler::Initialize()
{
    if (g_installed.exchange(true))
        return;

    std::set_terminate(crashTerminateHandler);
    PLOG_INFO << "Crash handler installed";
}

void utils::CrashHandler::SetContext(const char* operation) { g_current_operation = operation; }

void utils::CrashHandler::RegisterFatalCleanup(void (*fn)())
{
    g_fatal_cleanup.store(fn, std::memory_order_release);
}
