#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"

using namespace std;

enum class ErrorSeverity
{
    CRITICAL,
    HIGH,
    MEDIUM,
    LOW,
    INFO
};

enum class ErrorCategory
{
    VISION,
    CAPTURE,
    DATABASE,
    GUI,
    NETWORK,
    FILE_SYSTEM,
    CONFIGURATION,
    PERFORMANCE,
    UNKNOWN
};

string toString(ErrorSeverity severity);
string toString(ErrorCategory category);

// Case-insensitive, nullopt for unknown names
optional<ErrorSeverity> severityFromString(const string &name);
optional<ErrorCategory> categoryFromString(const string &name);

const vector<ErrorSeverity> &allSeverities();
const vector<ErrorCategory> &allCategories();

// Runtime snapshot attached to every error
struct ErrorContext
{
    string session_id;
    string thread_name;
    double memory_usage_mb = 0.0;
    double cpu_usage_percent = 0.0;
    int active_processes = 0;
    optional<int64_t> frame_number;
    optional<double> processing_time_ms;
    nlohmann::json additional_data = nlohmann::json::object();

    nlohmann::json toJson() const;
};

struct ErrorRecord
{
    int64_t id = 0;
    ErrorSeverity severity = ErrorSeverity::MEDIUM;
    ErrorCategory category = ErrorCategory::UNKNOWN;
    string component;
    string function;
    string message;
    string exception_type;
    string stack_trace;
    nlohmann::json context = nlohmann::json::object();
    int occurrence_count = 1;
    time_utils::TimePoint first_seen;
    time_utils::TimePoint last_seen;
    string resolution_status = "OPEN"; // OPEN or RESOLVED
    string resolution_notes;

    nlohmann::json toJson() const;
};

// Every field optional; an unset field does not filter
struct ErrorFilter
{
    optional<ErrorSeverity> severity;
    optional<ErrorCategory> category;
    optional<string> component; // Substring match
    optional<double> hours;     // Trailing window on last_seen
    int limit = 100;
};

struct ErrorBreakdown
{
    int unique = 0;
    int64_t total = 0;
};

struct CategoryBreakdown
{
    int unique = 0;
    int64_t total = 0;
    double rate_per_hour = 0.0;
};

struct ComponentCount
{
    string component;
    string function;
    int unique = 0;
    int64_t total = 0;
};

struct ErrorSummary
{
    double period_hours = 24.0;
    int total_unique = 0;
    int64_t total_occurrences = 0;
    map<string, ErrorBreakdown> by_severity;
    map<string, CategoryBreakdown> by_category;
    vector<ComponentCount> top_components; // Highest total first
    vector<ErrorRecord> recent_critical;   // Newest first

    nlohmann::json toJson() const;
};
