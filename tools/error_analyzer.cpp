// pokervision-errors: inspect, export and prune the deduplicated error log
#include "config/app_config.hpp"
#include "errors/error_export.hpp"
#include "errors/error_store.hpp"
#include "utils/args.hpp"
#include "utils/logging.hpp"
#include "utils/signals.hpp"
#include "utils/time_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <map>
#include <string>
#include <thread>

using namespace std;

namespace
{
    void printHeader(const string &title)
    {
        cout << "\n"
             << string(60, '=') << "\n";
        cout << "  " << title << "\n";
        cout << string(60, '=') << "\n";
    }

    string severityIcon(ErrorSeverity severity)
    {
        switch (severity)
        {
        case ErrorSeverity::CRITICAL:
            return "[!]";
        case ErrorSeverity::HIGH:
            return "[H]";
        case ErrorSeverity::MEDIUM:
            return "[M]";
        case ErrorSeverity::LOW:
            return "[L]";
        case ErrorSeverity::INFO:
            return "[I]";
        }
        return "[?]";
    }

    // Local time in the given strftime format
    string localTime(time_utils::TimePoint tp, const char *format)
    {
        time_t t = time_utils::Clock::to_time_t(tp);
        tm local{};
        localtime_r(&t, &local);
        char buffer[32];
        strftime(buffer, sizeof(buffer), format, &local);
        return buffer;
    }

    string formatted(const char *format, double value)
    {
        char buffer[32];
        snprintf(buffer, sizeof(buffer), format, value);
        return buffer;
    }

    // Shared --severity/--category/--component/--hours/--limit parsing
    ErrorFilter filterFromArgs(int argc, char **argv, int default_limit)
    {
        ErrorFilter filter;
        filter.limit = getArg(argc, argv, "--limit", default_limit, 2);

        string severity = getArg(argc, argv, "--severity", "", 2);
        if (!severity.empty())
        {
            filter.severity = severityFromString(severity);
            if (!filter.severity)
                throw invalid_argument("Unknown severity: " + severity);
        }

        string category = getArg(argc, argv, "--category", "", 2);
        if (!category.empty())
        {
            filter.category = categoryFromString(category);
            if (!filter.category)
                throw invalid_argument("Unknown category: " + category);
        }

        string component = getArg(argc, argv, "--component", "", 2);
        if (!component.empty())
            filter.component = component;

        double hours = getArg(argc, argv, "--hours", 0.0, 2);
        if (hours > 0)
            filter.hours = hours;

        return filter;
    }

    string describeFilter(const ErrorFilter &filter)
    {
        vector<string> parts;
        if (filter.severity)
            parts.push_back("Severity: " + toString(*filter.severity));
        if (filter.category)
            parts.push_back("Category: " + toString(*filter.category));
        if (filter.component)
            parts.push_back("Component: " + *filter.component);
        if (filter.hours)
            parts.push_back("Last " + formatted("%g", *filter.hours) + "h");

        if (parts.empty())
            return "All";

        string text;
        for (size_t i = 0; i < parts.size(); i++)
            text += (i ? ", " : "") + parts[i];
        return text;
    }

    int printSummary(ErrorStore &store, double hours)
    {
        ErrorSummary summary = store.getSummary(hours);

        printHeader("Error Summary - Last " + formatted("%g", hours) + " Hours");
        cout << "[STATS] Total Unique Errors: " << summary.total_unique << "\n";
        cout << "[STATS] Total Occurrences: " << summary.total_occurrences << "\n";
        cout << "[STATS] Generated: " << time_utils::toIsoString(time_utils::Clock::now()) << "\n";

        cout << "\n[SEVERITY] Breakdown:\n";
        for (ErrorSeverity severity : allSeverities())
        {
            auto it = summary.by_severity.find(toString(severity));
            if (it == summary.by_severity.end())
                continue;
            printf("  %s %-10s: %3d unique, %4lld total\n", severityIcon(severity).c_str(), toString(severity).c_str(),
                   it->second.unique, (long long)it->second.total);
        }

        cout << "\n[CATEGORY] Breakdown:\n";
        vector<pair<string, CategoryBreakdown>> categories(summary.by_category.begin(), summary.by_category.end());
        sort(categories.begin(), categories.end(), [](const auto &a, const auto &b)
             { return a.second.total > b.second.total; });
        for (const auto &entry : categories)
        {
            printf("  [C] %-15s: %3d unique, %4lld total (%.1f/hr)\n", entry.first.c_str(),
                   entry.second.unique, (long long)entry.second.total, entry.second.rate_per_hour);
        }

        cout << "\n[TOP] Error Sources:\n";
        int rank = 1;
        for (const auto &source : summary.top_components)
        {
            string where = source.component + "." + source.function;
            printf("  %2d. %-40s: %3lld errors\n", rank++, where.c_str(), (long long)source.total);
        }

        cout << "\n[CRITICAL] Recent Errors:\n";
        if (summary.recent_critical.empty())
        {
            cout << "  [OK] No critical errors in time range\n";
        }
        for (const auto &error : summary.recent_critical)
        {
            cout << "  [!] [" << localTime(error.last_seen, "%m/%d %H:%M") << "] " << error.component << "."
                 << error.function << ": " << error.message.substr(0, 50) << "\n";
        }
        return 0;
    }

    int printDetails(ErrorStore &store, const ErrorFilter &filter)
    {
        vector<ErrorRecord> errors = store.getErrors(filter);

        printHeader("Error Details (" + describeFilter(filter) + ")");
        if (errors.empty())
        {
            cout << "No errors found matching criteria.\n";
            return 0;
        }

        cout << "Found " << errors.size() << " errors\n\n";

        int index = 1;
        for (const auto &error : errors)
        {
            printf("%3d. %s [%s] %s/%s  #%lld %s\n", index++, severityIcon(error.severity).c_str(),
                   localTime(error.last_seen, "%m/%d %H:%M:%S").c_str(),
                   toString(error.severity).c_str(), toString(error.category).c_str(),
                   (long long)error.id, error.resolution_status.c_str());
            cout << "     [LOC] " << error.component << "." << error.function << "\n";
            cout << "     [MSG] " << error.message << "\n";
            if (!error.exception_type.empty())
                cout << "     [EXC] " << error.exception_type << "\n";
            if (error.occurrence_count > 1)
                cout << "     [CNT] Occurred " << error.occurrence_count << " times since "
                     << localTime(error.first_seen, "%m/%d %H:%M:%S") << "\n";

            const auto &context = error.context;
            if (context.is_object() && context.value("memory_usage_mb", 0.0) > 0)
            {
                printf("     [SYS] Memory: %.1fMB, CPU: %.1f%%\n", context.value("memory_usage_mb", 0.0),
                       context.value("cpu_usage_percent", 0.0));
            }
            if (context.is_object() && context.contains("additional_data") && context["additional_data"].is_object())
            {
                for (const auto &item : context["additional_data"].items())
                {
                    if (item.key() == "processing_time_ms" || item.key() == "callback_time_ms" || item.key() == "duration_ms")
                        cout << "     [TIME] " << item.key() << ": " << item.value().dump() << "ms\n";
                }
            }
            cout << "\n";
        }
        return 0;
    }

    int exportErrors(ErrorStore &store, const ErrorFilter &filter, const string &format_name, const string &out_dir)
    {
        optional<error_export::ExportFormat> format = error_export::formatFromString(format_name);
        if (!format)
        {
            cerr << "Unknown export format: " << format_name << " (json or csv)\n";
            return 1;
        }

        vector<ErrorRecord> errors = store.getErrors(filter);
        string path = error_export::exportErrors(errors, *format, out_dir);
        cout << "[OK] Errors exported to: " << path << "\n";
        cout << "[STATS] Exported " << errors.size() << " error records\n";
        return 0;
    }

    int cleanup(ErrorStore &store, int days, bool dry_run)
    {
        printHeader("Cleanup Old Errors (>" + to_string(days) + " days)");

        if (dry_run)
        {
            cout << "DRY RUN - No changes will be made\n";
            cout << "Would remove " << store.countResolvedOlderThan(days) << " resolved error records\n";
            return 0;
        }

        cout << "Cleaned up " << store.cleanupResolved(days) << " old error records\n";
        return 0;
    }

    int resolve(ErrorStore &store, int64_t id, const string &notes)
    {
        if (id <= 0)
        {
            cerr << "resolve needs --id <record id>\n";
            return 1;
        }

        if (!store.markResolved(id, notes))
        {
            cerr << "No error record with id " << id << "\n";
            return 1;
        }

        cout << "[OK] Error #" << id << " marked RESOLVED\n";
        return 0;
    }

    int monitor(ErrorStore &store, int interval_s)
    {
        printHeader("Live Error Monitor");
        cout << "Monitoring for new errors... (Press Ctrl+C to stop)" << endl;

        signals::setupSignalHandlers();
        time_utils::TimePoint last_check = time_utils::Clock::now();

        while (!signals::shutdownRequested)
        {
            for (int waited = 0; waited < interval_s * 10 && !signals::shutdownRequested; waited++)
                this_thread::sleep_for(chrono::milliseconds(100));

            time_utils::TimePoint now = time_utils::Clock::now();

            ErrorFilter filter;
            filter.hours = chrono::duration<double, ratio<3600>>(now - last_check).count() + 1.0 / 3600;
            vector<ErrorRecord> errors = store.getErrors(filter);

            // Oldest first so the feed reads top to bottom
            for (auto it = errors.rbegin(); it != errors.rend(); ++it)
            {
                if (it->last_seen <= last_check)
                    continue;
                cout << severityIcon(it->severity) << " [" << localTime(it->last_seen, "%H:%M:%S") << "] "
                     << toString(it->severity) << "/" << toString(it->category) << " - " << it->component << "."
                     << it->function << ": " << it->message.substr(0, 60);
                if (it->occurrence_count > 1)
                    cout << " (x" << it->occurrence_count << ")";
                cout << endl;
            }

            last_check = now;
        }

        cout << "\nMonitoring stopped." << endl;
        return 0;
    }

    int trends(ErrorStore &store, int days)
    {
        printHeader("Error Trends - Last " + to_string(days) + " Days");

        ErrorFilter filter;
        filter.hours = days * 24.0;
        filter.limit = 100000;

        map<string, int64_t> per_day;
        for (int offset = days - 1; offset >= 0; offset--)
            per_day[localTime(time_utils::hoursAgo(offset * 24.0), "%Y-%m-%d")] = 0;

        for (const auto &error : store.getErrors(filter))
        {
            auto it = per_day.find(localTime(error.last_seen, "%Y-%m-%d"));
            if (it != per_day.end())
                it->second += error.occurrence_count;
        }

        cout << "Daily Error Counts (by last occurrence):\n";
        for (const auto &day : per_day)
        {
            printf("  %s: %4lld %s\n", day.first.c_str(), (long long)day.second, string(day.second / 5, '#').c_str());
        }
        return 0;
    }

    void printUsage()
    {
        cout << "Usage: pokervision-errors <command> [options]\n\n";
        cout << "Commands:\n";
        cout << "  summary  [--hours N]                              Severity, category and source breakdown\n";
        cout << "  details  [--severity S] [--category C] [--component X] [--hours N] [--limit N]\n";
        cout << "  export   [--format json|csv] [filters] [--out DIR] Write matching records to a file\n";
        cout << "  cleanup  [--days N] [--dry-run]                   Remove resolved records older than N days\n";
        cout << "  resolve  --id N [--notes TEXT]                    Mark one record resolved\n";
        cout << "  monitor  [--interval S]                           Print new errors as they arrive\n";
        cout << "  trends   [--days N]                               Daily error counts\n\n";
        cout << "Global options:\n";
        cout << "  --db <path>          Error log database (default: from --config, else data/error_logs.db)\n";
        cout << "  --config <path>      Settings file to read the error log path from\n";
    }
}

int main(int argc, char **argv)
{
    if (argc < 2 || hasFlag(argc, argv, "--help"))
    {
        printUsage();
        return argc < 2 ? 1 : 0;
    }

    // Only warnings and errors from the store itself
    logging::setLogLevel(logging::LogLevel::WARNING);

    string command = argv[1];

    try
    {
        string db_path = getArg(argc, argv, "--db", "", 2);
        if (db_path.empty())
        {
            string config_path = getArg(argc, argv, "--config", "config/settings.json", 2);
            db_path = config::load(config_path).database.error_db_path;
        }

        ErrorStore store(db_path);
        if (!store.initialize())
        {
            cerr << "[ERROR] Cannot open error log at " << db_path << "\n";
            return 1;
        }

        if (command == "summary")
            return printSummary(store, getArg(argc, argv, "--hours", 24.0, 2));
        if (command == "details")
            return printDetails(store, filterFromArgs(argc, argv, 50));
        if (command == "export")
            return exportErrors(store, filterFromArgs(argc, argv, 100000),
                                getArg(argc, argv, "--format", "json", 2),
                                getArg(argc, argv, "--out", "logs", 2));
        if (command == "cleanup")
            return cleanup(store, getArg(argc, argv, "--days", 30, 2), hasFlag(argc, argv, "--dry-run", 2));
        if (command == "resolve")
            return resolve(store, getArg(argc, argv, "--id", 0, 2), getArg(argc, argv, "--notes", "", 2));
        if (command == "monitor")
            return monitor(store, max(1, getArg(argc, argv, "--interval", 5, 2)));
        if (command == "trends")
            return trends(store, max(1, getArg(argc, argv, "--days", 7, 2)));

        cerr << "Unknown command: " << command << "\n\n";
        printUsage();
        return 1;
    }
    catch (const exception &e)
    {
        cerr << "[ERROR] Command failed: " << e.what() << "\n";
        return 1;
    }
}
