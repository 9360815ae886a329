#include "error_store.hpp"
#include "system_context.hpp"
#include "data/sqlite_connection.hpp"
#include "utils.hpp"

#include <algorithm>

using namespace std;
using json = nlohmann::json;

static const char *kSelectColumns =
    "SELECT id, severity, category, component, function, message, exception_type, stack_trace, "
    "context_json, occurrence_count, first_seen, last_seen, resolution_status, resolution_notes "
    "FROM error_logs";

// Longer messages are truncated before keying so near-identical floods collapse
static const size_t kDedupMessageLength = 100;

// Component filters match literally, so LIKE wildcards are escaped with '\'
static string escapeLike(const string &text)
{
    string escaped;
    for (char c : text)
    {
        if (c == '\\' || c == '%' || c == '_')
            escaped += '\\';
        escaped += c;
    }
    return escaped;
}

ErrorStore::ErrorStore(const string &db_path) : db_path_(db_path)
{
}

bool ErrorStore::initialize()
{
    try
    {
        sqlite::Connection db(db_path_);
        db.execute(R"(
            CREATE TABLE IF NOT EXISTS error_logs (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                timestamp TEXT NOT NULL,
                severity TEXT NOT NULL,
                category TEXT NOT NULL,
                component TEXT NOT NULL,
                function TEXT NOT NULL,
                message TEXT NOT NULL,
                exception_type TEXT,
                stack_trace TEXT,
                context_json TEXT,
                dedup_key TEXT NOT NULL,
                resolution_status TEXT DEFAULT 'OPEN',
                resolution_notes TEXT,
                occurrence_count INTEGER DEFAULT 1,
                first_seen TEXT NOT NULL,
                last_seen TEXT NOT NULL,
                created_at TEXT DEFAULT CURRENT_TIMESTAMP
            ))");
        db.execute("CREATE INDEX IF NOT EXISTS idx_error_timestamp ON error_logs(timestamp)");
        db.execute("CREATE INDEX IF NOT EXISTS idx_error_severity_category ON error_logs(severity, category)");
        db.execute("CREATE INDEX IF NOT EXISTS idx_error_component ON error_logs(component, function)");
        db.execute("CREATE UNIQUE INDEX IF NOT EXISTS idx_error_dedup ON error_logs(dedup_key)");
    }
    catch (const exception &e)
    {
        log_error("Error store unavailable at " + db_path_ + ": " + e.what());
        return false;
    }

    log_debug("Error store ready at " + db_path_);
    return true;
}

void ErrorStore::setSessionId(const string &session_id)
{
    lock_guard<mutex> lock(mutex_);
    session_id_ = session_id;
}

string ErrorStore::dedupKey(const string &component, const string &function,
                            const string &exception_type, const string &message)
{
    return component + ":" + function + ":" + exception_type + ":" + message.substr(0, kDedupMessageLength);
}

int64_t ErrorStore::logError(ErrorSeverity severity, ErrorCategory category,
                             const string &component, const string &function,
                             const string &message, const exception *error,
                             const json &additional_data,
                             optional<int64_t> frame_number,
                             optional<double> processing_time_ms)
{
    ErrorRecord entry;
    entry.severity = severity;
    entry.category = category;
    entry.component = component;
    entry.function = function;
    entry.message = message;

    if (error)
    {
        entry.exception_type = system_context::exceptionTypeName(*error);
        entry.stack_trace = system_context::captureStackTrace();
    }

    string session_id;
    {
        lock_guard<mutex> lock(mutex_);
        session_id = session_id_;
    }

    ErrorContext context = system_context::snapshot(session_id);
    context.frame_number = frame_number;
    context.processing_time_ms = processing_time_ms;
    if (additional_data.is_object())
        context.additional_data = additional_data;
    else if (!additional_data.is_null())
        context.additional_data = {{"value", additional_data}};
    entry.context = context.toJson();

    entry.first_seen = entry.last_seen = time_utils::Clock::now();

    mirrorToLog(entry);

    return record(entry, dedupKey(component, function, entry.exception_type, message));
}

int64_t ErrorStore::record(const ErrorRecord &entry, const string &key)
{
    string now = time_utils::toIsoString(entry.last_seen);

    // One writer at a time keeps check-then-insert atomic
    lock_guard<mutex> lock(mutex_);

    try
    {
        sqlite::Connection db(db_path_);

        auto bump = [&](int64_t id) -> bool
        {
            sqlite::Statement update = db.prepare(
                "UPDATE error_logs SET occurrence_count = occurrence_count + 1, last_seen = ?, "
                "resolution_status = 'OPEN' WHERE id = ?");
            update.bind(1, now).bind(2, id);
            update.step();
            return db.changes() > 0;
        };

        auto cached = dedup_cache_.find(key);
        if (cached != dedup_cache_.end())
        {
            if (bump(cached->second))
                return cached->second;

            // Row was cleaned up since it was cached
            dedup_cache_.erase(cached);
        }

        // Rows from an earlier run are not in the cache yet
        sqlite::Statement lookup = db.prepare("SELECT id FROM error_logs WHERE dedup_key = ?");
        lookup.bind(1, key);
        if (lookup.step())
        {
            int64_t id = lookup.getInt64(0);
            if (bump(id))
            {
                dedup_cache_[key] = id;
                return id;
            }
        }

        sqlite::Statement insert = db.prepare(
            "INSERT INTO error_logs (timestamp, severity, category, component, function, message, "
            "exception_type, stack_trace, context_json, dedup_key, occurrence_count, first_seen, last_seen) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 1, ?, ?)");
        insert.bind(1, now)
            .bind(2, toString(entry.severity))
            .bind(3, toString(entry.category))
            .bind(4, entry.component)
            .bind(5, entry.function)
            .bind(6, entry.message)
            .bind(7, entry.exception_type)
            .bind(8, entry.stack_trace)
            .bind(9, entry.context.dump())
            .bind(10, key)
            .bind(11, now)
            .bind(12, now);
        insert.step();

        int64_t id = db.lastInsertId();
        dedup_cache_[key] = id;
        return id;
    }
    catch (const exception &e)
    {
        log_error("Failed to persist error record: " + string(e.what()));
        return -1;
    }
}

void ErrorStore::mirrorToLog(const ErrorRecord &entry) const
{
    string text = "[" + toString(entry.category) + "] " + entry.component + "." + entry.function + ": " + entry.message;
    if (!entry.exception_type.empty())
        text += " (" + entry.exception_type + ")";

    switch (entry.severity)
    {
    case ErrorSeverity::CRITICAL:
    case ErrorSeverity::HIGH:
        logging::error(text, "ERRORS");
        break;
    case ErrorSeverity::MEDIUM:
        logging::warning(text, "ERRORS");
        break;
    case ErrorSeverity::LOW:
    case ErrorSeverity::INFO:
        logging::info(text, "ERRORS");
        break;
    }
}

int64_t ErrorStore::logVisionError(const string &component, const string &function, const string &message,
                                   const exception *error, ErrorSeverity severity, const json &additional_data)
{
    return logError(severity, ErrorCategory::VISION, component, function, message, error, additional_data);
}

int64_t ErrorStore::logCaptureError(const string &component, const string &function, const string &message,
                                    const exception *error, ErrorSeverity severity, const json &additional_data)
{
    return logError(severity, ErrorCategory::CAPTURE, component, function, message, error, additional_data);
}

int64_t ErrorStore::logDatabaseError(const string &component, const string &function, const string &message,
                                     const exception *error, ErrorSeverity severity, const json &additional_data)
{
    return logError(severity, ErrorCategory::DATABASE, component, function, message, error, additional_data);
}

int64_t ErrorStore::logPerformanceIssue(const string &component, const string &function, const string &message,
                                        double duration_ms, ErrorSeverity severity, const json &additional_data)
{
    json data = additional_data.is_object() ? additional_data : json::object();
    if (!data.contains("duration_ms"))
        data["duration_ms"] = duration_ms;

    return logError(severity, ErrorCategory::PERFORMANCE, component, function, message, nullptr, data, nullopt, duration_ms);
}

ErrorRecord ErrorStore::readRecord(const sqlite::Statement &row)
{
    ErrorRecord r;
    r.id = row.getInt64(0);
    r.severity = severityFromString(row.getText(1)).value_or(ErrorSeverity::MEDIUM);
    r.category = categoryFromString(row.getText(2)).value_or(ErrorCategory::UNKNOWN);
    r.component = row.getText(3);
    r.function = row.getText(4);
    r.message = row.getText(5);
    r.exception_type = row.getText(6);
    r.stack_trace = row.getText(7);

    string context = row.getText(8);
    r.context = context.empty() ? json::object() : json::parse(context, nullptr, false);
    if (r.context.is_discarded())
        r.context = {{"raw", context}};

    r.occurrence_count = row.getInt(9);
    r.first_seen = time_utils::fromIsoString(row.getText(10));
    r.last_seen = time_utils::fromIsoString(row.getText(11));
    r.resolution_status = row.getText(12);
    r.resolution_notes = row.getText(13);
    return r;
}

vector<ErrorRecord> ErrorStore::getErrors(const ErrorFilter &filter) const
{
    vector<ErrorRecord> records;

    string sql = string(kSelectColumns) + " WHERE 1=1";
    if (filter.severity)
        sql += " AND severity = ?";
    if (filter.category)
        sql += " AND category = ?";
    if (filter.component)
        sql += " AND component LIKE ? ESCAPE '\\'";
    if (filter.hours)
        sql += " AND last_seen >= ?";
    sql += " ORDER BY last_seen DESC, id DESC LIMIT ?";

    try
    {
        sqlite::Connection db(db_path_);
        sqlite::Statement query = db.prepare(sql);

        int index = 1;
        if (filter.severity)
            query.bind(index++, toString(*filter.severity));
        if (filter.category)
            query.bind(index++, toString(*filter.category));
        if (filter.component)
            query.bind(index++, "%" + escapeLike(*filter.component) + "%");
        if (filter.hours)
            query.bind(index++, time_utils::toIsoString(time_utils::hoursAgo(*filter.hours)));
        query.bind(index++, max(0, filter.limit));

        while (query.step())
            records.push_back(readRecord(query));
    }
    catch (const exception &e)
    {
        log_error("Error query failed: " + string(e.what()));
    }

    return records;
}

optional<ErrorRecord> ErrorStore::getError(int64_t id) const
{
    try
    {
        sqlite::Connection db(db_path_);
        sqlite::Statement query = db.prepare(string(kSelectColumns) + " WHERE id = ?");
        query.bind(1, id);
        if (query.step())
            return readRecord(query);
    }
    catch (const exception &e)
    {
        log_error("Error lookup failed: " + string(e.what()));
    }

    return nullopt;
}

ErrorSummary ErrorStore::getSummary(double hours, int top_n, int critical_n) const
{
    ErrorSummary summary;
    summary.period_hours = hours;
    string since = time_utils::toIsoString(time_utils::hoursAgo(hours));

    try
    {
        sqlite::Connection db(db_path_);

        sqlite::Statement severities = db.prepare(
            "SELECT severity, COUNT(*), SUM(occurrence_count) FROM error_logs "
            "WHERE last_seen >= ? GROUP BY severity");
        severities.bind(1, since);
        while (severities.step())
        {
            ErrorBreakdown b;
            b.unique = severities.getInt(1);
            b.total = severities.getInt64(2);
            summary.by_severity[severities.getText(0)] = b;
            summary.total_unique += b.unique;
            summary.total_occurrences += b.total;
        }

        sqlite::Statement categories = db.prepare(
            "SELECT category, COUNT(*), SUM(occurrence_count) FROM error_logs "
            "WHERE last_seen >= ? GROUP BY category");
        categories.bind(1, since);
        while (categories.step())
        {
            CategoryBreakdown b;
            b.unique = categories.getInt(1);
            b.total = categories.getInt64(2);
            b.rate_per_hour = hours > 0.0 ? b.total / hours : 0.0;
            summary.by_category[categories.getText(0)] = b;
        }

        sqlite::Statement components = db.prepare(
            "SELECT component, function, COUNT(*), SUM(occurrence_count) AS total FROM error_logs "
            "WHERE last_seen >= ? GROUP BY component, function ORDER BY total DESC, component LIMIT ?");
        components.bind(1, since).bind(2, top_n);
        while (components.step())
        {
            ComponentCount c;
            c.component = components.getText(0);
            c.function = components.getText(1);
            c.unique = components.getInt(2);
            c.total = components.getInt64(3);
            summary.top_components.push_back(c);
        }

        sqlite::Statement critical = db.prepare(
            string(kSelectColumns) + " WHERE severity = 'CRITICAL' AND last_seen >= ? ORDER BY last_seen DESC, id DESC LIMIT ?");
        critical.bind(1, since).bind(2, critical_n);
        while (critical.step())
            summary.recent_critical.push_back(readRecord(critical));
    }
    catch (const exception &e)
    {
        log_error("Error summary failed: " + string(e.what()));
    }

    return summary;
}

bool ErrorStore::markResolved(int64_t id, const string &notes)
{
    lock_guard<mutex> lock(mutex_);

    try
    {
        sqlite::Connection db(db_path_);
        sqlite::Statement update = db.prepare(
            "UPDATE error_logs SET resolution_status = 'RESOLVED', resolution_notes = ? WHERE id = ?");
        update.bind(1, notes).bind(2, id);
        update.step();

        if (db.changes() == 0)
        {
            log_warning("No error record with id " + log_string(id));
            return false;
        }
    }
    catch (const exception &e)
    {
        log_error("Failed to resolve error " + to_string(id) + ": " + e.what());
        return false;
    }

    log_info("Error " + log_string(id) + " marked as resolved");
    return true;
}

int ErrorStore::countResolvedOlderThan(int days) const
{
    string cutoff = time_utils::toIsoString(time_utils::hoursAgo(days * 24.0));

    try
    {
        sqlite::Connection db(db_path_);
        sqlite::Statement count = db.prepare(
            "SELECT COUNT(*) FROM error_logs WHERE resolution_status = 'RESOLVED' AND last_seen < ?");
        count.bind(1, cutoff);
        if (count.step())
            return count.getInt(0);
    }
    catch (const exception &e)
    {
        log_error("Failed to count old errors: " + string(e.what()));
    }

    return 0;
}

int ErrorStore::cleanupResolved(int days)
{
    string cutoff = time_utils::toIsoString(time_utils::hoursAgo(days * 24.0));
    int deleted = 0;

    lock_guard<mutex> lock(mutex_);

    try
    {
        sqlite::Connection db(db_path_);
        sqlite::Statement purge = db.prepare(
            "DELETE FROM error_logs WHERE resolution_status = 'RESOLVED' AND last_seen < ?");
        purge.bind(1, cutoff);
        purge.step();
        deleted = db.changes();
    }
    catch (const exception &e)
    {
        log_error("Error cleanup failed: " + string(e.what()));
        return 0;
    }

    // Cached ids may point at purged rows; they are re-resolved on next use
    dedup_cache_.clear();

    log_info("Cleaned up " + log_string(deleted) + " resolved errors older than " + log_string(days) + " days");
    return deleted;
}
