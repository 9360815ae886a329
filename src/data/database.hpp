#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "state/game_models.hpp"

using namespace std;

struct SessionStats
{
    int64_t session_id = 0;
    string start_time;
    string end_time;
    string status;
    int total_hands = 0;
    int64_t total_frames = 0;
    double avg_card_confidence = 0.0; // Last hour of vision metrics
    double avg_ocr_confidence = 0.0;
    double avg_frame_rate = 0.0;
    double avg_processing_time = 0.0;
    int recent_metrics_count = 0;

    nlohmann::json toJson() const;
};

// Session / hand / game-state store. Each call opens its own connection.
// Failures surface as std::runtime_error; callers decide whether to swallow them
class Database
{
public:
    explicit Database(const string &path);

    void initialize();

    int64_t createSession();

    // Totals are recounted from the stored rows, status becomes "completed"
    void endSession(int64_t session_id);

    // Creates the hand row the first time a hand_id is seen in the session,
    // numbering hands from 1. Returns the game_states row id
    int64_t saveGameState(const GameState &state, int64_t session_id);

    void saveVisionMetrics(const VisionMetrics &metrics, optional<int64_t> session_id = nullopt);

    optional<SessionStats> getSessionStats(int64_t session_id) const;

    // Newest first, each with its hand_number and players
    nlohmann::json getRecentGameStates(int limit = 10) const;

    // Writes <out_dir>/session_<id>_<stamp>.json, returns the path
    string exportSessionData(int64_t session_id, const string &out_dir = "exports") const;

    // Removes sessions started more than `days` ago with everything under them,
    // and vision metrics older than that. Returns the number of rows removed
    int cleanupOldData(int days);

    const string &path() const { return path_; }

private:
    nlohmann::json statesWithPlayers(const string &where, int64_t key, int limit, bool newest_first) const;

    string path_;
};
