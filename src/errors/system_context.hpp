#pragma once

#include <exception>
#include <string>
#include "error_types.hpp"

using namespace std;

// Process and thread facts attached to error records
namespace system_context
{
    // Resident set size from /proc/self/status, 0 when unavailable
    double memoryUsageMb();

    // Process CPU time over wall time since the previous call, as a percentage of one core
    double cpuUsagePercent();

    // Number of numeric entries in /proc
    int activeProcesses();

    // Names the calling thread (truncated to 15 chars by the kernel)
    void setThreadName(const string &name);
    string threadName();

    ErrorContext snapshot(const string &session_id = "");

    string demangle(const char *mangled);
    string exceptionTypeName(const exception &e);

    // Symbolized backtrace of the caller, skipping this function
    string captureStackTrace(int max_frames = 32);

} // namespace system_context
