#include "system_context.hpp"

#include <cxxabi.h>
#include <dirent.h>
#include <execinfo.h>
#include <pthread.h>
#include <sys/resource.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <thread>
#include <typeinfo>

using namespace std;

namespace system_context
{
    double memoryUsageMb()
    {
        ifstream status("/proc/self/status");
        string line;

        while (getline(status, line))
        {
            if (line.rfind("VmRSS:", 0) == 0)
            {
                istringstream fields(line.substr(6));
                double kb = 0.0;
                fields >> kb;
                return kb / 1024.0;
            }
        }

        return 0.0;
    }

    double cpuUsagePercent()
    {
        static mutex m;
        static double last_cpu_seconds = -1.0;
        static chrono::steady_clock::time_point last_wall;

        rusage usage{};
        if (getrusage(RUSAGE_SELF, &usage) != 0)
            return 0.0;

        double cpu_seconds = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6 +
                             usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;
        auto now = chrono::steady_clock::now();

        lock_guard<mutex> lock(m);

        double percent = 0.0;
        if (last_cpu_seconds >= 0.0)
        {
            double wall_seconds = chrono::duration<double>(now - last_wall).count();
            if (wall_seconds > 0.0)
                percent = 100.0 * (cpu_seconds - last_cpu_seconds) / wall_seconds;
        }

        last_cpu_seconds = cpu_seconds;
        last_wall = now;
        return max(0.0, percent);
    }

    int activeProcesses()
    {
        DIR *proc = opendir("/proc");
        if (!proc)
            return 0;

        int count = 0;
        while (dirent *entry = readdir(proc))
        {
            const char *name = entry->d_name;
            if (*name && all_of(name, name + char_traits<char>::length(name), ::isdigit))
                count++;
        }

        closedir(proc);
        return count;
    }

    void setThreadName(const string &name)
    {
        pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
    }

    string threadName()
    {
        char buffer[16] = {0};
        if (pthread_getname_np(pthread_self(), buffer, sizeof(buffer)) == 0 && buffer[0] != '\0')
            return buffer;

        return "thread-" + to_string(hash<thread::id>{}(this_thread::get_id()) % 100000);
    }

    ErrorContext snapshot(const string &session_id)
    {
        ErrorContext context;
        context.session_id = session_id;
        context.thread_name = threadName();
        context.memory_usage_mb = memoryUsageMb();
        context.cpu_usage_percent = cpuUsagePercent();
        context.active_processes = activeProcesses();
        return context;
    }

    string demangle(const char *mangled)
    {
        int status = 0;
        char *readable = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
        if (status != 0 || !readable)
            return mangled;

        string result = readable;
        free(readable);
        return result;
    }

    string exceptionTypeName(const exception &e)
    {
        return demangle(typeid(e).name());
    }

    string captureStackTrace(int max_frames)
    {
        vector<void *> frames(max_frames + 1);
        int count = backtrace(frames.data(), static_cast<int>(frames.size()));
        char **symbols = backtrace_symbols(frames.data(), count);
        if (!symbols)
            return "";

        ostringstream trace;
        // Frame 0 is this function
        for (int i = 1; i < count; i++)
        {
            string line = symbols[i];

            // "binary(_ZN3Foo3barEv+0x1c) [0x...]" -> demangle the symbol part
            size_t open = line.find('(');
            size_t plus = line.find('+', open);
            if (open != string::npos && plus != string::npos && plus > open + 1)
            {
                string symbol = line.substr(open + 1, plus - open - 1);
                line = line.substr(0, open + 1) + demangle(symbol.c_str()) + line.substr(plus);
            }

            trace << "#" << (i - 1) << " " << line << "\n";
        }

        free(symbols);
        return trace.str();
    }

} // namespace system_context
