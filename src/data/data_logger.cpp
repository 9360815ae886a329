#include "data_logger.hpp"
#include "utils.hpp"

#include <filesystem>

using namespace std;
using json = nlohmann::json;

DataLogger::DataLogger(Database &database, ErrorStore &errors, const string &log_dir)
    : database_(database), errors_(errors), log_dir_(log_dir)
{
}

DataLogger::~DataLogger()
{
    endSession();
}

bool DataLogger::startSession()
{
    try
    {
        session_id_ = database_.createSession();
    }
    catch (const exception &e)
    {
        errors_.logDatabaseError("DataLogger", "startSession", "Failed to create session", &e, ErrorSeverity::CRITICAL);
        return false;
    }

    error_code ec;
    filesystem::create_directories(log_dir_, ec);
    journal_path_ = (filesystem::path(log_dir_) / ("session_" + to_string(session_id_) + "_" + time_utils::fileStamp() + ".jsonl")).string();

    {
        lock_guard<mutex> lock(file_mutex_);
        journal_.open(journal_path_, ios::app);
    }

    if (!journal_.is_open())
    {
        errors_.logError(ErrorSeverity::MEDIUM, ErrorCategory::FILE_SYSTEM, "DataLogger", "startSession",
                         "Cannot open session journal", nullptr, {{"path", journal_path_}});
    }

    errors_.setSessionId(to_string(session_id_));
    logEvent("session_start", {{"session_id", session_id_}});
    log_info("Session " + log_string(session_id_) + " journal: " + journal_path_);
    return true;
}

void DataLogger::endSession()
{
    if (session_id_ < 0)
        return;

    logEvent("session_end", summary());

    try
    {
        database_.endSession(session_id_);
    }
    catch (const exception &e)
    {
        errors_.logDatabaseError("DataLogger", "endSession", "Failed to close session", &e);
    }

    lock_guard<mutex> lock(file_mutex_);
    if (journal_.is_open())
        journal_.close();
    session_id_ = -1;
}

void DataLogger::writeEntry(const string &type, const json &data)
{
    json entry = {{"timestamp", time_utils::toIsoString(time_utils::Clock::now())},
                  {"session_id", session_id_},
                  {"type", type},
                  {"data", data}};

    lock_guard<mutex> lock(file_mutex_);
    if (!journal_.is_open())
        return;

    journal_ << entry.dump() << "\n";
    journal_.flush();

    if (!journal_)
    {
        write_failures_++;
        journal_.clear();
        log_warning("Journal write failed for " + journal_path_);
    }
}

void DataLogger::logGameState(const GameState &state, bool new_hand, int hand_number)
{
    if (new_hand)
    {
        hands_logged_++;
        writeEntry("hand_start", {{"hand_id", state.hand_id}, {"hand_number", hand_number}, {"players", state.players.size()}});
    }

    writeEntry("game_state", state);
    states_logged_++;

    if (session_id_ < 0)
        return;

    try
    {
        database_.saveGameState(state, session_id_);
    }
    catch (const exception &e)
    {
        errors_.logDatabaseError("DataLogger", "logGameState", "Failed to save game state", &e, ErrorSeverity::HIGH,
                                 {{"hand_id", state.hand_id}});
    }
}

void DataLogger::logVisionMetrics(const VisionMetrics &metrics)
{
    writeEntry("vision_metrics", metrics);
    metrics_logged_++;

    try
    {
        database_.saveVisionMetrics(metrics, session_id_ >= 0 ? optional<int64_t>(session_id_) : nullopt);
    }
    catch (const exception &e)
    {
        errors_.logDatabaseError("DataLogger", "logVisionMetrics", "Failed to save vision metrics", &e, ErrorSeverity::MEDIUM);
    }
}

void DataLogger::logEvent(const string &event_type, const json &data)
{
    writeEntry("event", {{"event_type", event_type}, {"details", data}});
}

void DataLogger::logError(const string &error_type, const string &message, const json &context)
{
    writeEntry("error", {{"error_type", error_type}, {"message", message}, {"context", context}});
}

json DataLogger::summary() const
{
    return {{"session_id", session_id_},
            {"journal", journal_path_},
            {"game_states_logged", states_logged_.load()},
            {"vision_metrics_logged", metrics_logged_.load()},
            {"hands_logged", hands_logged_.load()},
            {"journal_write_failures", write_failures_.load()}};
}
