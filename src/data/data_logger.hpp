#pragma once

#include <atomic>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "database.hpp"
#include "errors/error_store.hpp"

using namespace std;

// Per-session event journal: one JSON object per line in
// <log_dir>/session_<id>_<stamp>.jsonl, plus the matching database writes.
// Nothing here throws; failures go to the error store.
class DataLogger
{
public:
    DataLogger(Database &database, ErrorStore &errors, const string &log_dir = "logs");
    ~DataLogger();

    // Opens a database session and the journal file
    bool startSession();
    void endSession();

    void logGameState(const GameState &state, bool new_hand, int hand_number);
    void logVisionMetrics(const VisionMetrics &metrics);
    void logEvent(const string &event_type, const nlohmann::json &data = nlohmann::json::object());
    void logError(const string &error_type, const string &message, const nlohmann::json &context = nlohmann::json::object());

    int64_t sessionId() const { return session_id_; }
    const string &journalPath() const { return journal_path_; }
    nlohmann::json summary() const;

private:
    void writeEntry(const string &type, const nlohmann::json &data);

    Database &database_;
    ErrorStore &errors_;
    string log_dir_;

    int64_t session_id_ = -1;
    string journal_path_;
    mutex file_mutex_;
    ofstream journal_;

    atomic<int64_t> states_logged_{0};
    atomic<int64_t> metrics_logged_{0};
    atomic<int64_t> hands_logged_{0};
    atomic<int64_t> write_failures_{0};
};
