#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include "time_utils.hpp"

using namespace std;

enum class GamePhase
{
    PREFLOP,
    FLOP,
    TURN,
    RIVER
};

string toString(GamePhase phase);

// Throws std::invalid_argument for unknown names
GamePhase phaseFromString(const string &name);

struct Card
{
    string rank;                // "2".."10", "J", "Q", "K", "A" or "?" when unknown
    string suit;                // "h", "d", "c", "s" or "?"
    float confidence = 0.0f;    // [0,1]
    cv::Point2f position{0, 0}; // Center in frame coordinates
    bool from_fallback = false; // Produced by the heuristic detector

    bool isKnown() const { return rank != "?" && suit != "?" && !rank.empty() && !suit.empty(); }
    string code() const { return rank + suit; }
};

struct Player
{
    int position = 0;
    string name;
    double stack_size = 0.0;
    vector<Card> hole_cards;
    double current_bet = 0.0;
    bool is_active = true;
    bool is_current = false;
};

struct GameState
{
    time_utils::TimePoint timestamp;
    string hand_id;
    GamePhase phase = GamePhase::PREFLOP;
    double pot_size = 0.0;
    vector<Card> community_cards; // Left to right
    vector<Player> players;       // Ordered by position
    optional<int> timer_remaining; // Seconds
    vector<string> available_actions;
    vector<string> betting_options;
};

struct VisionMetrics
{
    time_utils::TimePoint timestamp;
    double processing_time_ms = 0.0;
    double frame_rate = 0.0;
    double detection_confidence = 0.0; // Mean over primary card detections
    double text_confidence = 0.0;      // Mean over accepted primary OCR readings
    int elements_detected = 0;
    int elements_failed = 0;
    int fallback_elements = 0;
    vector<string> error_details;
};

void to_json(nlohmann::json &j, const Card &card);
void from_json(const nlohmann::json &j, Card &card);
void to_json(nlohmann::json &j, const Player &player);
void from_json(const nlohmann::json &j, Player &player);
void to_json(nlohmann::json &j, const GameState &state);
void from_json(const nlohmann::json &j, GameState &state);
void to_json(nlohmann::json &j, const VisionMetrics &metrics);
void from_json(const nlohmann::json &j, VisionMetrics &metrics);
