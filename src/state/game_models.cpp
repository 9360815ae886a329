#include "game_models.hpp"

#include <algorithm>
#include <stdexcept>

using namespace std;
using json = nlohmann::json;

string toString(GamePhase phase)
{
    switch (phase)
    {
    case GamePhase::PREFLOP:
        return "preflop";
    case GamePhase::FLOP:
        return "flop";
    case GamePhase::TURN:
        return "turn";
    case GamePhase::RIVER:
        return "river";
    }
    return "preflop";
}

GamePhase phaseFromString(const string &name)
{
    if (name == "preflop")
        return GamePhase::PREFLOP;
    if (name == "flop")
        return GamePhase::FLOP;
    if (name == "turn")
        return GamePhase::TURN;
    if (name == "river")
        return GamePhase::RIVER;
    throw invalid_argument("Unknown game phase: " + name);
}

void to_json(json &j, const Card &card)
{
    j = json{{"rank", card.rank},
             {"suit", card.suit},
             {"confidence", card.confidence},
             {"position", {{"x", card.position.x}, {"y", card.position.y}}},
             {"fallback", card.from_fallback}};
}

void from_json(const json &j, Card &card)
{
    card.rank = j.at("rank").get<string>();
    card.suit = j.at("suit").get<string>();
    card.confidence = j.value("confidence", 0.0f);
    if (j.contains("position"))
    {
        card.position.x = j["position"].value("x", 0.0f);
        card.position.y = j["position"].value("y", 0.0f);
    }
    card.from_fallback = j.value("fallback", false);
}

void to_json(json &j, const Player &player)
{
    j = json{{"position", player.position},
             {"name", player.name},
             {"stack_size", player.stack_size},
             {"hole_cards", player.hole_cards},
             {"current_bet", player.current_bet},
             {"is_active", player.is_active},
             {"is_current", player.is_current}};
}

void from_json(const json &j, Player &player)
{
    player.position = j.at("position").get<int>();
    player.name = j.value("name", "");
    player.stack_size = j.value("stack_size", 0.0);
    player.hole_cards = j.value("hole_cards", vector<Card>());
    player.current_bet = j.value("current_bet", 0.0);
    player.is_active = j.value("is_active", true);
    player.is_current = j.value("is_current", false);
}

void to_json(json &j, const GameState &state)
{
    j = json{{"timestamp", time_utils::toIsoString(state.timestamp)},
             {"hand_id", state.hand_id},
             {"phase", toString(state.phase)},
             {"pot_size", state.pot_size},
             {"community_cards", state.community_cards},
             {"players", state.players},
             {"timer_remaining", state.timer_remaining ? json(*state.timer_remaining) : json(nullptr)},
             {"available_actions", state.available_actions},
             {"betting_options", state.betting_options}};
}

void from_json(const json &j, GameState &state)
{
    state.timestamp = time_utils::fromIsoString(j.at("timestamp").get<string>());
    state.hand_id = j.at("hand_id").get<string>();
    state.phase = phaseFromString(j.at("phase").get<string>());
    state.pot_size = j.value("pot_size", 0.0);
    state.community_cards = j.value("community_cards", vector<Card>());
    state.players = j.value("players", vector<Player>());

    if (j.contains("timer_remaining") && !j["timer_remaining"].is_null())
        state.timer_remaining = j["timer_remaining"].get<int>();
    else
        state.timer_remaining.reset();

    state.available_actions = j.value("available_actions", vector<string>());
    state.betting_options = j.value("betting_options", vector<string>());

    stable_sort(state.players.begin(), state.players.end(),
                [](const Player &a, const Player &b)
                { return a.position < b.position; });
}

void to_json(json &j, const VisionMetrics &metrics)
{
    j = json{{"timestamp", time_utils::toIsoString(metrics.timestamp)},
             {"processing_time_ms", metrics.processing_time_ms},
             {"frame_rate", metrics.frame_rate},
             {"detection_confidence", metrics.detection_confidence},
             {"text_confidence", metrics.text_confidence},
             {"elements_detected", metrics.elements_detected},
             {"elements_failed", metrics.elements_failed},
             {"fallback_elements", metrics.fallback_elements},
             {"error_details", metrics.error_details}};
}

void from_json(const json &j, VisionMetrics &metrics)
{
    metrics.timestamp = time_utils::fromIsoString(j.at("timestamp").get<string>());
    metrics.processing_time_ms = j.value("processing_time_ms", 0.0);
    metrics.frame_rate = j.value("frame_rate", 0.0);
    metrics.detection_confidence = j.value("detection_confidence", 0.0);
    metrics.text_confidence = j.value("text_confidence", 0.0);
    metrics.elements_detected = j.value("elements_detected", 0);
    metrics.elements_failed = j.value("elements_failed", 0);
    metrics.fallback_elements = j.value("fallback_elements", 0);
    metrics.error_details = j.value("error_details", vector<string>());
}
