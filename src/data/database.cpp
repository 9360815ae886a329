#include "database.hpp"
#include "sqlite_connection.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace std;
using json = nlohmann::json;

json SessionStats::toJson() const
{
    return {{"session_id", session_id},
            {"start_time", start_time},
            {"end_time", end_time.empty() ? json(nullptr) : json(end_time)},
            {"status", status},
            {"total_hands", total_hands},
            {"total_frames", total_frames},
            {"avg_card_confidence", avg_card_confidence},
            {"avg_ocr_confidence", avg_ocr_confidence},
            {"avg_frame_rate", avg_frame_rate},
            {"avg_processing_time", avg_processing_time},
            {"recent_metrics_count", recent_metrics_count}};
}

Database::Database(const string &path) : path_(path)
{
}

void Database::initialize()
{
    sqlite::Connection db(path_);
    db.execute(R"(
        CREATE TABLE IF NOT EXISTS sessions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            start_time TEXT NOT NULL,
            end_time TEXT,
            total_hands INTEGER DEFAULT 0,
            total_frames_processed INTEGER DEFAULT 0,
            status TEXT DEFAULT 'active'
        ))");
    db.execute(R"(
        CREATE TABLE IF NOT EXISTS hands (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id INTEGER NOT NULL REFERENCES sessions(id),
            hand_number INTEGER NOT NULL,
            hand_id TEXT NOT NULL,
            start_time TEXT NOT NULL,
            end_time TEXT,
            final_pot REAL,
            UNIQUE(session_id, hand_id)
        ))");
    db.execute(R"(
        CREATE TABLE IF NOT EXISTS game_states (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            hand_ref INTEGER NOT NULL REFERENCES hands(id),
            hand_id TEXT NOT NULL,
            timestamp TEXT NOT NULL,
            game_phase TEXT NOT NULL,
            pot_size REAL,
            community_cards TEXT,
            timer_remaining INTEGER,
            current_player_position INTEGER,
            available_actions TEXT,
            betting_options TEXT
        ))");
    db.execute(R"(
        CREATE TABLE IF NOT EXISTS player_states (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            game_state_id INTEGER NOT NULL REFERENCES game_states(id),
            position INTEGER,
            name TEXT,
            stack_size REAL,
            hole_cards TEXT,
            current_bet REAL,
            is_active INTEGER,
            is_current INTEGER
        ))");
    db.execute(R"(
        CREATE TABLE IF NOT EXISTS vision_metrics (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id INTEGER,
            timestamp TEXT NOT NULL,
            processing_time_ms REAL,
            frame_rate REAL,
            card_detection_confidence REAL,
            text_ocr_confidence REAL,
            elements_detected INTEGER,
            elements_failed INTEGER,
            fallback_elements INTEGER,
            error_details TEXT
        ))");
    db.execute("CREATE INDEX IF NOT EXISTS idx_hands_session_id ON hands(session_id)");
    db.execute("CREATE INDEX IF NOT EXISTS idx_game_states_hand_ref ON game_states(hand_ref)");
    db.execute("CREATE INDEX IF NOT EXISTS idx_game_states_timestamp ON game_states(timestamp)");
    db.execute("CREATE INDEX IF NOT EXISTS idx_player_states_game_state ON player_states(game_state_id)");
    db.execute("CREATE INDEX IF NOT EXISTS idx_vision_metrics_timestamp ON vision_metrics(timestamp)");

    log_debug("Database tables verified at " + path_);
}

int64_t Database::createSession()
{
    sqlite::Connection db(path_);
    sqlite::Statement insert = db.prepare("INSERT INTO sessions (start_time, status) VALUES (?, 'active')");
    insert.bind(1, time_utils::toIsoString(time_utils::Clock::now()));
    insert.step();

    int64_t id = db.lastInsertId();
    log_info("Created session " + log_string(id));
    return id;
}

void Database::endSession(int64_t session_id)
{
    sqlite::Connection db(path_);

    sqlite::Statement hands = db.prepare("SELECT COUNT(*) FROM hands WHERE session_id = ?");
    hands.bind(1, session_id);
    int total_hands = hands.step() ? hands.getInt(0) : 0;

    sqlite::Statement frames = db.prepare(
        "SELECT COUNT(*) FROM game_states gs JOIN hands h ON gs.hand_ref = h.id WHERE h.session_id = ?");
    frames.bind(1, session_id);
    int64_t total_frames = frames.step() ? frames.getInt64(0) : 0;

    sqlite::Statement update = db.prepare(
        "UPDATE sessions SET end_time = ?, total_hands = ?, total_frames_processed = ?, status = 'completed' WHERE id = ?");
    update.bind(1, time_utils::toIsoString(time_utils::Clock::now()))
        .bind(2, total_hands)
        .bind(3, total_frames)
        .bind(4, session_id);
    update.step();

    log_info("Session " + log_string(session_id) + " ended - " + log_string(total_hands) + " hands, " + log_string(total_frames) + " frames");
}

int64_t Database::saveGameState(const GameState &state, int64_t session_id)
{
    sqlite::Connection db(path_);
    sqlite::Transaction transaction(db);

    string timestamp = time_utils::toIsoString(state.timestamp);

    int64_t hand_ref = 0;
    sqlite::Statement find_hand = db.prepare("SELECT id FROM hands WHERE session_id = ? AND hand_id = ?");
    find_hand.bind(1, session_id).bind(2, state.hand_id);
    if (find_hand.step())
    {
        hand_ref = find_hand.getInt64(0);
    }
    else
    {
        sqlite::Statement next = db.prepare("SELECT COALESCE(MAX(hand_number), 0) + 1 FROM hands WHERE session_id = ?");
        next.bind(1, session_id);
        int hand_number = next.step() ? next.getInt(0) : 1;

        sqlite::Statement insert_hand = db.prepare(
            "INSERT INTO hands (session_id, hand_number, hand_id, start_time) VALUES (?, ?, ?, ?)");
        insert_hand.bind(1, session_id).bind(2, hand_number).bind(3, state.hand_id).bind(4, timestamp);
        insert_hand.step();
        hand_ref = db.lastInsertId();
    }

    // Keep the hand row's pot and end time current
    sqlite::Statement touch_hand = db.prepare("UPDATE hands SET end_time = ?, final_pot = ? WHERE id = ?");
    touch_hand.bind(1, timestamp).bind(2, state.pot_size).bind(3, hand_ref);
    touch_hand.step();

    optional<int> current_position;
    for (const auto &player : state.players)
    {
        if (player.is_current)
        {
            current_position = player.position;
            break;
        }
    }

    sqlite::Statement insert_state = db.prepare(
        "INSERT INTO game_states (hand_ref, hand_id, timestamp, game_phase, pot_size, community_cards, "
        "timer_remaining, current_player_position, available_actions, betting_options) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    insert_state.bind(1, hand_ref)
        .bind(2, state.hand_id)
        .bind(3, timestamp)
        .bind(4, toString(state.phase))
        .bind(5, state.pot_size)
        .bind(6, json(state.community_cards).dump())
        .bind(7, state.timer_remaining)
        .bind(8, current_position)
        .bind(9, json(state.available_actions).dump())
        .bind(10, json(state.betting_options).dump());
    insert_state.step();
    int64_t state_id = db.lastInsertId();

    sqlite::Statement insert_player = db.prepare(
        "INSERT INTO player_states (game_state_id, position, name, stack_size, hole_cards, current_bet, is_active, is_current) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    for (const auto &player : state.players)
    {
        insert_player.reset();
        insert_player.bind(1, state_id)
            .bind(2, player.position)
            .bind(3, player.name)
            .bind(4, player.stack_size)
            .bind(5, json(player.hole_cards).dump())
            .bind(6, player.current_bet)
            .bind(7, player.is_active)
            .bind(8, player.is_current);
        insert_player.step();
    }

    transaction.commit();
    return state_id;
}

void Database::saveVisionMetrics(const VisionMetrics &metrics, optional<int64_t> session_id)
{
    sqlite::Connection db(path_);
    sqlite::Statement insert = db.prepare(
        "INSERT INTO vision_metrics (session_id, timestamp, processing_time_ms, frame_rate, card_detection_confidence, "
        "text_ocr_confidence, elements_detected, elements_failed, fallback_elements, error_details) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    insert.bind(1, session_id)
        .bind(2, time_utils::toIsoString(metrics.timestamp))
        .bind(3, metrics.processing_time_ms)
        .bind(4, metrics.frame_rate)
        .bind(5, metrics.detection_confidence)
        .bind(6, metrics.text_confidence)
        .bind(7, metrics.elements_detected)
        .bind(8, metrics.elements_failed)
        .bind(9, metrics.fallback_elements)
        .bind(10, json(metrics.error_details).dump());
    insert.step();
}

optional<SessionStats> Database::getSessionStats(int64_t session_id) const
{
    sqlite::Connection db(path_);

    sqlite::Statement session = db.prepare("SELECT start_time, end_time, status FROM sessions WHERE id = ?");
    session.bind(1, session_id);
    if (!session.step())
        return nullopt;

    SessionStats stats;
    stats.session_id = session_id;
    stats.start_time = session.getText(0);
    stats.end_time = session.getText(1);
    stats.status = session.getText(2);

    sqlite::Statement hands = db.prepare("SELECT COUNT(*) FROM hands WHERE session_id = ?");
    hands.bind(1, session_id);
    if (hands.step())
        stats.total_hands = hands.getInt(0);

    sqlite::Statement frames = db.prepare(
        "SELECT COUNT(*) FROM game_states gs JOIN hands h ON gs.hand_ref = h.id WHERE h.session_id = ?");
    frames.bind(1, session_id);
    if (frames.step())
        stats.total_frames = frames.getInt64(0);

    sqlite::Statement metrics = db.prepare(
        "SELECT AVG(card_detection_confidence), AVG(text_ocr_confidence), AVG(frame_rate), AVG(processing_time_ms), COUNT(*) "
        "FROM vision_metrics WHERE timestamp > ?");
    metrics.bind(1, time_utils::toIsoString(time_utils::hoursAgo(1.0)));
    if (metrics.step())
    {
        stats.avg_card_confidence = metrics.getDouble(0);
        stats.avg_ocr_confidence = metrics.getDouble(1);
        stats.avg_frame_rate = metrics.getDouble(2);
        stats.avg_processing_time = metrics.getDouble(3);
        stats.recent_metrics_count = metrics.getInt(4);
    }

    return stats;
}

json Database::statesWithPlayers(const string &where, int64_t key, int limit, bool newest_first) const
{
    sqlite::Connection db(path_);

    string sql =
        "SELECT gs.id, gs.hand_id, gs.timestamp, gs.game_phase, gs.pot_size, gs.community_cards, gs.timer_remaining, "
        "gs.current_player_position, gs.available_actions, gs.betting_options, h.hand_number "
        "FROM game_states gs JOIN hands h ON gs.hand_ref = h.id " +
        where + " ORDER BY gs.timestamp " + (newest_first ? "DESC" : "ASC") + ", gs.id " + (newest_first ? "DESC" : "ASC");
    if (limit > 0)
        sql += " LIMIT " + to_string(limit);

    sqlite::Statement states = db.prepare(sql);
    if (!where.empty())
        states.bind(1, key);

    sqlite::Statement players = db.prepare(
        "SELECT position, name, stack_size, hole_cards, current_bet, is_active, is_current "
        "FROM player_states WHERE game_state_id = ? ORDER BY position");

    json result = json::array();
    while (states.step())
    {
        json state;
        state["id"] = states.getInt64(0);
        state["hand_id"] = states.getText(1);
        state["timestamp"] = states.getText(2);
        state["phase"] = states.getText(3);
        state["pot_size"] = states.getDouble(4);
        state["community_cards"] = json::parse(states.getText(5), nullptr, false);
        state["timer_remaining"] = states.isNull(6) ? json(nullptr) : json(states.getInt(6));
        state["current_player_position"] = states.isNull(7) ? json(nullptr) : json(states.getInt(7));
        state["available_actions"] = json::parse(states.getText(8), nullptr, false);
        state["betting_options"] = json::parse(states.getText(9), nullptr, false);
        state["hand_number"] = states.getInt(10);

        state["players"] = json::array();
        players.reset();
        players.bind(1, states.getInt64(0));
        while (players.step())
        {
            state["players"].push_back({{"position", players.getInt(0)},
                                        {"name", players.getText(1)},
                                        {"stack_size", players.getDouble(2)},
                                        {"hole_cards", json::parse(players.getText(3), nullptr, false)},
                                        {"current_bet", players.getDouble(4)},
                                        {"is_active", players.getInt(5) != 0},
                                        {"is_current", players.getInt(6) != 0}});
        }

        result.push_back(state);
    }

    return result;
}

json Database::getRecentGameStates(int limit) const
{
    return statesWithPlayers("", 0, limit, true);
}

string Database::exportSessionData(int64_t session_id, const string &out_dir) const
{
    json states = statesWithPlayers("WHERE h.session_id = ?", session_id, 0, false);

    json document;
    document["session_id"] = session_id;
    document["export_timestamp"] = time_utils::toIsoString(time_utils::Clock::now());
    document["total_states"] = states.size();
    document["game_states"] = states;

    error_code ec;
    filesystem::create_directories(out_dir, ec);

    string path = (filesystem::path(out_dir) / ("session_" + to_string(session_id) + "_" + time_utils::fileStamp() + ".json")).string();
    ofstream file(path);
    if (!file)
        throw runtime_error("Cannot write session export " + path);
    file << document.dump(2) << "\n";

    log_info("Session data exported to " + path);
    return path;
}

int Database::cleanupOldData(int days)
{
    string cutoff = time_utils::toIsoString(time_utils::hoursAgo(days * 24.0));

    sqlite::Connection db(path_);
    sqlite::Transaction transaction(db);
    int removed = 0;

    auto purge = [&](const string &sql)
    {
        sqlite::Statement statement = db.prepare(sql);
        statement.bind(1, cutoff);
        statement.step();
        removed += db.changes();
    };

    purge("DELETE FROM vision_metrics WHERE timestamp < ?");
    purge("DELETE FROM player_states WHERE game_state_id IN ("
          "SELECT gs.id FROM game_states gs JOIN hands h ON gs.hand_ref = h.id "
          "JOIN sessions s ON h.session_id = s.id WHERE s.start_time < ?)");
    purge("DELETE FROM game_states WHERE hand_ref IN ("
          "SELECT h.id FROM hands h JOIN sessions s ON h.session_id = s.id WHERE s.start_time < ?)");
    purge("DELETE FROM hands WHERE session_id IN (SELECT id FROM sessions WHERE start_time < ?)");
    purge("DELETE FROM sessions WHERE start_time < ?");

    transaction.commit();

    log_info("Removed " + log_string(removed) + " rows older than " + log_string(days) + " days");
    return removed;
}
