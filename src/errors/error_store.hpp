#pragma once

#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "error_types.hpp"

using namespace std;

namespace sqlite
{
    class Connection;
    class Statement;
}

// Deduplicating error log backed by SQLite.
// Records are keyed by (component, function, exception_type, message); a repeat
// increments occurrence_count and refreshes last_seen instead of adding a row.
// Every write opens its own connection, the dedup cache is guarded by one mutex.
// Persistence failures are reported to the console log and swallowed.
class ErrorStore
{
public:
    explicit ErrorStore(const string &db_path);

    // Creates the schema. false when the database cannot be used
    bool initialize();

    void setSessionId(const string &session_id);
    const string &path() const { return db_path_; }

    // Returns the record id, or -1 when nothing could be persisted
    int64_t logError(ErrorSeverity severity,
                     ErrorCategory category,
                     const string &component,
                     const string &function,
                     const string &message,
                     const exception *error = nullptr,
                     const nlohmann::json &additional_data = nlohmann::json::object(),
                     optional<int64_t> frame_number = nullopt,
                     optional<double> processing_time_ms = nullopt);

    int64_t logVisionError(const string &component, const string &function, const string &message,
                           const exception *error = nullptr,
                           ErrorSeverity severity = ErrorSeverity::MEDIUM,
                           const nlohmann::json &additional_data = nlohmann::json::object());

    int64_t logCaptureError(const string &component, const string &function, const string &message,
                            const exception *error = nullptr,
                            ErrorSeverity severity = ErrorSeverity::HIGH,
                            const nlohmann::json &additional_data = nlohmann::json::object());

    int64_t logDatabaseError(const string &component, const string &function, const string &message,
                             const exception *error = nullptr,
                             ErrorSeverity severity = ErrorSeverity::HIGH,
                             const nlohmann::json &additional_data = nlohmann::json::object());

    int64_t logPerformanceIssue(const string &component, const string &function, const string &message,
                                double duration_ms,
                                ErrorSeverity severity = ErrorSeverity::LOW,
                                const nlohmann::json &additional_data = nlohmann::json::object());

    // Newest last_seen first, capped at filter.limit
    vector<ErrorRecord> getErrors(const ErrorFilter &filter = ErrorFilter()) const;
    optional<ErrorRecord> getError(int64_t id) const;

    ErrorSummary getSummary(double hours = 24.0, int top_n = 10, int critical_n = 5) const;

    bool markResolved(int64_t id, const string &notes = "");

    // Resolved records whose last_seen is older than the given age
    int countResolvedOlderThan(int days) const;
    int cleanupResolved(int days);

    static string dedupKey(const string &component, const string &function,
                           const string &exception_type, const string &message);

private:
    int64_t record(const ErrorRecord &entry, const string &key);
    void mirrorToLog(const ErrorRecord &entry) const;

    static ErrorRecord readRecord(const sqlite::Statement &row);

    string db_path_;
    string session_id_;

    mutable mutex mutex_;
    unordered_map<string, int64_t> dedup_cache_; // dedup key -> row id
};
