#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace time_utils
{
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // UTC, millisecond precision, lexically ordered: "2026-10-19T14:03:07.250Z"
    inline std::string toIsoString(TimePoint tp)
    {
        auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
        long long total_ms = since_epoch.count();
        long long ms = total_ms % 1000;
        if (ms < 0)
            ms += 1000;
        std::time_t seconds = static_cast<std::time_t>((total_ms - ms) / 1000);

        std::tm utc{};
        gmtime_r(&seconds, &utc);

        std::ostringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
        return ss.str();
    }

    // Accepts the format written by toIsoString, with or without milliseconds and 'Z'
    inline TimePoint fromIsoString(const std::string &text)
    {
        std::tm utc{};
        int millis = 0;
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

        int parsed = std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d.%d", &year, &month, &day, &hour, &minute, &second, &millis);
        if (parsed < 6)
        {
            throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
        }

        utc.tm_year = year - 1900;
        utc.tm_mon = month - 1;
        utc.tm_mday = day;
        utc.tm_hour = hour;
        utc.tm_min = minute;
        utc.tm_sec = second;

        std::time_t seconds = timegm(&utc);
        return Clock::from_time_t(seconds) + std::chrono::milliseconds(parsed == 7 ? millis : 0);
    }

    // Compact local time for file names: "20261019_140307"
    inline std::string fileStamp(TimePoint tp = Clock::now())
    {
        std::time_t t = Clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&t, &local);

        std::ostringstream ss;
        ss << std::put_time(&local, "%Y%m%d_%H%M%S");
        return ss.str();
    }

    inline TimePoint hoursAgo(double hours, TimePoint now = Clock::now())
    {
        return now - std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double, std::ratio<3600>>(hours));
    }

    inline double millisecondsBetween(std::chrono::steady_clock::time_point start, std::chrono::steady_clock::time_point end)
    {
        return std::chrono::duration<double, std::milli>(end - start).count();
    }
}
