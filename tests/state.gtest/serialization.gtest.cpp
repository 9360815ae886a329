#include "state/game_models.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

using fakes::makeCard;
using fakes::makePlayer;
using json = nlohmann::json;

namespace gtest
{

    static GameState sampleState()
    {
        GameState state;
        state.timestamp = time_utils::fromIsoString("2026-10-19T14:03:07.250Z");
        state.hand_id = "hand_00112233aabbccdd";
        state.phase = GamePhase::TURN;
        state.pot_size = 1250.5;
        state.community_cards = {makeCard("A", "h"), makeCard("10", "d"), makeCard("7", "c"), makeCard("2", "s")};
        state.players = {makePlayer(1, "alice", 900), makePlayer(2, "bob", 1500), makePlayer(3, "Player_3", 0)};
        state.players[1].hole_cards = {makeCard("K", "s"), makeCard("Q", "s")};
        state.players[1].is_current = true;
        state.timer_remaining = 12;
        state.available_actions = {"fold", "check_call"};
        state.betting_options = {"1/2 pot", "pot"};
        return state;
    }

    TEST(Serialization, GameStateRoundTripKeepsIdentityAndOrder)
    {
        GameState original = sampleState();
        GameState restored = json::parse(json(original).dump()).get<GameState>();

        EXPECT_EQ(restored.hand_id, original.hand_id);
        EXPECT_EQ(restored.phase, GamePhase::TURN);
        EXPECT_EQ(restored.timestamp, original.timestamp);
        EXPECT_DOUBLE_EQ(restored.pot_size, 1250.5);
        ASSERT_EQ(restored.community_cards.size(), 4u);
        for (size_t i = 0; i < 4; i++)
            EXPECT_EQ(restored.community_cards[i].code(), original.community_cards[i].code());

        ASSERT_EQ(restored.players.size(), 3u);
        EXPECT_EQ(restored.players[1].name, "bob");
        EXPECT_TRUE(restored.players[1].is_current);
        ASSERT_EQ(restored.players[1].hole_cards.size(), 2u);
        EXPECT_EQ(restored.players[1].hole_cards[0].code(), "Ks");
        ASSERT_TRUE(restored.timer_remaining.has_value());
        EXPECT_EQ(*restored.timer_remaining, 12);
        EXPECT_EQ(restored.available_actions, original.available_actions);
    }

    TEST(Serialization, PlayersComeBackOrderedByPosition)
    {
        json j = sampleState();
        std::swap(j["players"][0], j["players"][2]);

        GameState restored = j.get<GameState>();
        ASSERT_EQ(restored.players.size(), 3u);
        EXPECT_EQ(restored.players[0].position, 1);
        EXPECT_EQ(restored.players[1].position, 2);
        EXPECT_EQ(restored.players[2].position, 3);
    }

    TEST(Serialization, MissingTimerStaysEmpty)
    {
        GameState state = sampleState();
        state.timer_remaining.reset();
        json j = state;
        EXPECT_TRUE(j["timer_remaining"].is_null());
        EXPECT_FALSE(j.get<GameState>().timer_remaining.has_value());
    }

    TEST(Serialization, UnknownPhaseIsRejected)
    {
        json j = sampleState();
        j["phase"] = "showdown";
        EXPECT_THROW(j.get<GameState>(), std::invalid_argument);
    }

    TEST(Serialization, VisionMetricsKeepFallbackCount)
    {
        VisionMetrics metrics;
        metrics.timestamp = time_utils::Clock::now();
        metrics.processing_time_ms = 42.0;
        metrics.elements_detected = 7;
        metrics.elements_failed = 1;
        metrics.fallback_elements = 3;
        metrics.error_details = {"timer unreadable"};

        VisionMetrics restored = json(metrics).get<VisionMetrics>();
        EXPECT_EQ(restored.fallback_elements, 3);
        EXPECT_EQ(restored.elements_failed, 1);
        EXPECT_EQ(restored.error_details, metrics.error_details);
    }

} // namespace gtest
