#pragma once

namespace utils
{

/**
 * Crash handler for unhandled exceptions.
 *
 * Replaces std::terminate() so an exception escaping a thread (including the
 * batch worker) is logged with its message, the thread's current operation
 * and a stack trace from cpptrace before the process aborts.
 */
class CrashHandler
{
public:
    /// Installs the terminate handler
    static void Initialize();

    /// Sets thread-local context string to be included in crash reports.
    /// The string must have static storage duration.
    static void SetContext(const char* operation);

    /// Registers a cleanup function to be called before crash termination (e.g., flush error log)
    static void RegisterFatalCleanup(void (*fn)());
};

} // namespace utils
