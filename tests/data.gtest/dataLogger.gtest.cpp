#include "data/data_logger.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

#include <fstream>

namespace gtest
{

    class DataLoggerTest : public ::testing::Test
    {
    protected:
        fakes::TempDir dir;
        ErrorStore errors{dir.file("errors.db")};
        Database database{dir.file("poker.db")};

        void SetUp() override
        {
            ASSERT_TRUE(errors.initialize());
            database.initialize();
        }

        static vector<nlohmann::json> readJournal(const string &path)
        {
            vector<nlohmann::json> entries;
            ifstream file(path);
            string line;
            while (getline(file, line))
                entries.push_back(nlohmann::json::parse(line));
            return entries;
        }
    };

    TEST_F(DataLoggerTest, JournalAndDatabaseStayInStep)
    {
        string journal;
        int64_t session = 0;
        {
            DataLogger logger(database, errors, dir.file("logs"));
            ASSERT_TRUE(logger.startSession());
            session = logger.sessionId();
            journal = logger.journalPath();

            GameState state;
            state.timestamp = time_utils::Clock::now();
            state.hand_id = "h1";
            state.players = {fakes::makePlayer(0, "Alice")};

            logger.logGameState(state, true, 1);
            logger.logGameState(state, false, 1);

            VisionMetrics metrics;
            metrics.timestamp = time_utils::Clock::now();
            logger.logVisionMetrics(metrics);
            logger.logEvent("system_start");

            nlohmann::json summary = logger.summary();
            EXPECT_EQ(summary["game_states_logged"], 2);
            EXPECT_EQ(summary["hands_logged"], 1);
            EXPECT_EQ(summary["vision_metrics_logged"], 1);
        }

        vector<nlohmann::json> entries = readJournal(journal);
        ASSERT_EQ(entries.size(), 7u);
        EXPECT_EQ(entries[0]["type"], "event");
        EXPECT_EQ(entries[0]["data"]["event_type"], "session_start");
        EXPECT_EQ(entries[1]["type"], "hand_start");
        EXPECT_EQ(entries[1]["data"]["hand_id"], "h1");
        EXPECT_EQ(entries[2]["type"], "game_state");
        EXPECT_EQ(entries[3]["type"], "game_state");
        EXPECT_EQ(entries[4]["type"], "vision_metrics");
        EXPECT_EQ(entries[5]["data"]["event_type"], "system_start");
        EXPECT_EQ(entries[6]["data"]["event_type"], "session_end");
        for (const auto &entry : entries)
            EXPECT_EQ(entry["session_id"], session);

        auto stats = database.getSessionStats(session);
        ASSERT_TRUE(stats.has_value());
        EXPECT_EQ(stats->status, "completed");
        EXPECT_EQ(stats->total_hands, 1);
        EXPECT_EQ(stats->total_frames, 2);
    }

    TEST_F(DataLoggerTest, SessionFailureIsRecorded)
    {
        Database broken("/nonexistent/dir/poker.db");
        DataLogger logger(broken, errors, dir.file("logs"));

        EXPECT_FALSE(logger.startSession());
        EXPECT_EQ(logger.sessionId(), -1);

        ErrorFilter filter;
        filter.category = ErrorCategory::DATABASE;
        auto logged = errors.getErrors(filter);
        ASSERT_EQ(logged.size(), 1u);
        EXPECT_EQ(logged[0].severity, ErrorSeverity::CRITICAL);
        EXPECT_EQ(logged[0].function, "startSession");
    }

    //! Without a session, states are journaled nowhere and nothing throws
    TEST_F(DataLoggerTest, NoSessionIsHarmless)
    {
        DataLogger logger(database, errors, dir.file("logs"));
        GameState state;
        state.hand_id = "h1";
        EXPECT_NO_THROW(logger.logGameState(state, true, 1));
        EXPECT_NO_THROW(logger.endSession());
        EXPECT_TRUE(database.getRecentGameStates().empty());
    }

} // namespace gtest
