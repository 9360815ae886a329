#include "error_types.hpp"

#include <algorithm>
#include <cctype>

using namespace std;
using json = nlohmann::json;

static string upper(string text)
{
    transform(text.begin(), text.end(), text.begin(), ::toupper);
    return text;
}

const vector<ErrorSeverity> &allSeverities()
{
    static const vector<ErrorSeverity> severities = {
        ErrorSeverity::CRITICAL, ErrorSeverity::HIGH, ErrorSeverity::MEDIUM, ErrorSeverity::LOW, ErrorSeverity::INFO};
    return severities;
}

const vector<ErrorCategory> &allCategories()
{
    static const vector<ErrorCategory> categories = {
        ErrorCategory::VISION, ErrorCategory::CAPTURE, ErrorCategory::DATABASE,
        ErrorCategory::GUI, ErrorCategory::NETWORK, ErrorCategory::FILE_SYSTEM,
        ErrorCategory::CONFIGURATION, ErrorCategory::PERFORMANCE, ErrorCategory::UNKNOWN};
    return categories;
}

string toString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::CRITICAL:
        return "CRITICAL";
    case ErrorSeverity::HIGH:
        return "HIGH";
    case ErrorSeverity::MEDIUM:
        return "MEDIUM";
    case ErrorSeverity::LOW:
        return "LOW";
    case ErrorSeverity::INFO:
        return "INFO";
    }
    return "MEDIUM";
}

string toString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::VISION:
        return "VISION";
    case ErrorCategory::CAPTURE:
        return "CAPTURE";
    case ErrorCategory::DATABASE:
        return "DATABASE";
    case ErrorCategory::GUI:
        return "GUI";
    case ErrorCategory::NETWORK:
        return "NETWORK";
    case ErrorCategory::FILE_SYSTEM:
        return "FILE_SYSTEM";
    case ErrorCategory::CONFIGURATION:
        return "CONFIGURATION";
    case ErrorCategory::PERFORMANCE:
        return "PERFORMANCE";
    case ErrorCategory::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

optional<ErrorSeverity> severityFromString(const string &name)
{
    string wanted = upper(name);
    for (ErrorSeverity severity : allSeverities())
    {
        if (toString(severity) == wanted)
            return severity;
    }
    return nullopt;
}

optional<ErrorCategory> categoryFromString(const string &name)
{
    string wanted = upper(name);
    for (ErrorCategory category : allCategories())
    {
        if (toString(category) == wanted)
            return category;
    }
    return nullopt;
}

json ErrorContext::toJson() const
{
    json j;
    j["session_id"] = session_id;
    j["thread_name"] = thread_name;
    j["memory_usage_mb"] = memory_usage_mb;
    j["cpu_usage_percent"] = cpu_usage_percent;
    j["active_processes"] = active_processes;
    j["frame_number"] = frame_number ? json(*frame_number) : json(nullptr);
    j["processing_time_ms"] = processing_time_ms ? json(*processing_time_ms) : json(nullptr);
    j["additional_data"] = additional_data;
    return j;
}

json ErrorRecord::toJson() const
{
    return {{"id", id},
            {"severity", toString(severity)},
            {"category", toString(category)},
            {"component", component},
            {"function", function},
            {"message", message},
            {"exception_type", exception_type},
            {"stack_trace", stack_trace},
            {"context", context},
            {"occurrence_count", occurrence_count},
            {"first_seen", time_utils::toIsoString(first_seen)},
            {"last_seen", time_utils::toIsoString(last_seen)},
            {"resolution_status", resolution_status},
            {"resolution_notes", resolution_notes}};
}

json ErrorSummary::toJson() const
{
    json j;
    j["period_hours"] = period_hours;
    j["total_unique_errors"] = total_unique;
    j["total_occurrences"] = total_occurrences;

    j["severity_breakdown"] = json::object();
    for (const auto &[name, b] : by_severity)
        j["severity_breakdown"][name] = {{"unique_errors", b.unique}, {"total_occurrences", b.total}};

    j["category_breakdown"] = json::object();
    for (const auto &[name, b] : by_category)
        j["category_breakdown"][name] = {{"unique_errors", b.unique}, {"total_occurrences", b.total}, {"rate_per_hour", b.rate_per_hour}};

    j["top_error_components"] = json::array();
    for (const auto &c : top_components)
        j["top_error_components"].push_back({{"component", c.component}, {"function", c.function}, {"unique_errors", c.unique}, {"total_occurrences", c.total}});

    j["recent_critical_errors"] = json::array();
    for (const auto &r : recent_critical)
        j["recent_critical_errors"].push_back(r.toJson());

    return j;
}
