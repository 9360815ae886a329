#include "monitor/table_monitor.hpp"
#include "data/sqlite_connection.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

namespace gtest
{

    class TableMonitorTest : public ::testing::Test
    {
    protected:
        fakes::TempDir dir;
        AppConfig config;
        unique_ptr<ErrorStore> errors;
        fakes::FakeFrameSource *source = nullptr;

        void SetUp() override
        {
            config.database.path = dir.file("poker.db");
            config.database.error_db_path = dir.file("errors.db");
            config.log_dir = dir.file("logs");
            config.dashboard.enabled = false;
            config.capture.fps = 50;

            errors = make_unique<ErrorStore>(config.database.error_db_path);
            ASSERT_TRUE(errors->initialize());
        }

        MonitorComponents components()
        {
            MonitorComponents c;

            auto fake_source = make_unique<fakes::FakeFrameSource>();
            source = fake_source.get();
            c.source = move(fake_source);

            vector<Card> flop = {fakes::makeCard("A", "s"), fakes::makeCard("K", "h"), fakes::makeCard("7", "d")};
            c.detection = make_unique<CardDetectionStage>(
                make_unique<fakes::FakeCardDetector>(DetectorKind::PRIMARY, DetectionStatus::DETECTED, flop),
                make_unique<fakes::FakeCardDetector>(DetectorKind::FALLBACK, DetectionStatus::NO_DETECTION));

            auto engine = make_unique<fakes::FakeTextEngine>();
            engine->available = false;
            c.text = make_unique<TextRecognizer>(move(engine), config.ocr);
            c.text->initialize();
            return c;
        }

        static CapturedFrame frame(int64_t number)
        {
            CapturedFrame f;
            f.frame_number = number;
            f.timestamp = time_utils::Clock::now();
            f.image = cv::Mat(120, 160, CV_8UC3, cv::Scalar(30, 90, 30));
            return f;
        }
    };

    TEST_F(TableMonitorTest, ProcessedFrameBecomesCurrentState)
    {
        TableMonitor monitor(config, *errors, components());

        EXPECT_FALSE(monitor.currentGameState().has_value());

        monitor.processFrame(frame(1));

        auto state = monitor.currentGameState();
        ASSERT_TRUE(state.has_value());
        EXPECT_EQ((*state)["hand_number"], 1);
        EXPECT_EQ((*state)["community_cards"].size(), 3u);

        nlohmann::json perf = monitor.performanceStats();
        EXPECT_EQ(perf["frames_processed"], 1);
        EXPECT_EQ(perf["frames_without_state"], 0);
        EXPECT_EQ(perf["community_cards_count"], 3);
        EXPECT_EQ(perf["primary_detector"], true);
        EXPECT_EQ(perf["primary_text_engine"], false);

        // No session until start()
        EXPECT_TRUE(monitor.sessionStats().empty());
    }

    TEST_F(TableMonitorTest, RunsAndRecordsSession)
    {
        TableMonitor monitor(config, *errors, components());
        ASSERT_TRUE(monitor.start());
        EXPECT_TRUE(monitor.isRunning());

        auto deadline = chrono::steady_clock::now() + chrono::seconds(5);
        while (monitor.performanceStats()["frames_processed"].get<int64_t>() < 3 && chrono::steady_clock::now() < deadline)
            this_thread::sleep_for(chrono::milliseconds(20));

        nlohmann::json session = monitor.sessionStats();
        ASSERT_FALSE(session.empty());
        EXPECT_EQ(session["status"], "active");
        int64_t session_id = session["session_id"];

        monitor.stop();
        EXPECT_FALSE(monitor.isRunning());
        EXPECT_GE(source->opens, 1);
        EXPECT_GE(source->releases.load(), 1);

        Database database(config.database.path);
        auto stats = database.getSessionStats(session_id);
        ASSERT_TRUE(stats.has_value());
        EXPECT_EQ(stats->status, "completed");
        EXPECT_EQ(stats->total_hands, 1);
        EXPECT_GE(stats->total_frames, 3);
    }

    TEST_F(TableMonitorTest, UnparsedFrameIsJournaledAsError)
    {
        MonitorComponents c = components();
        source->default_ok = false; // keep the capture loop from producing frames
        TableMonitor monitor(config, *errors, move(c));
        ASSERT_TRUE(monitor.start());

        CapturedFrame blank = frame(77);
        blank.image = cv::Mat();
        monitor.processFrame(blank);
        monitor.stop();

        vector<nlohmann::json> failures;
        for (const auto &entry : std::filesystem::directory_iterator(config.log_dir))
        {
            std::ifstream journal(entry.path());
            string line;
            while (std::getline(journal, line))
            {
                nlohmann::json j = nlohmann::json::parse(line);
                if (j["type"] == "error")
                    failures.push_back(j);
            }
        }

        ASSERT_EQ(failures.size(), 1u);
        EXPECT_EQ(failures[0]["data"]["error_type"], "parse_failure");
        EXPECT_EQ(failures[0]["data"]["context"]["frame_number"], 77);
        EXPECT_EQ(monitor.performanceStats()["frames_without_state"], 1);
    }

    TEST_F(TableMonitorTest, StartAppliesRetention)
    {
        config.database.retention_days = 30;
        {
            Database database(config.database.path);
            database.initialize();
            sqlite::Connection db(config.database.path);
            sqlite::Statement insert = db.prepare("INSERT INTO sessions (start_time, status) VALUES (?, 'completed')");
            insert.bind(1, time_utils::toIsoString(time_utils::hoursAgo(45 * 24.0)));
            insert.step();
        }

        MonitorComponents c = components();
        source->default_ok = false;
        TableMonitor monitor(config, *errors, move(c));
        ASSERT_TRUE(monitor.start());
        monitor.stop();

        Database database(config.database.path);
        EXPECT_FALSE(database.getSessionStats(1).has_value());
    }

    TEST_F(TableMonitorTest, ExportsActiveSession)
    {
        TableMonitor monitor(config, *errors, components());
        EXPECT_EQ(monitor.exportSession(dir.file("exports")), "");

        ASSERT_TRUE(monitor.start());
        auto deadline = chrono::steady_clock::now() + chrono::seconds(5);
        // The first frame is fully persisted once the second one is counted
        while (monitor.performanceStats()["frames_processed"].get<int64_t>() < 2 && chrono::steady_clock::now() < deadline)
            this_thread::sleep_for(chrono::milliseconds(20));

        string path = monitor.exportSession(dir.file("exports"));
        monitor.stop();

        ASSERT_FALSE(path.empty());
        std::ifstream file(path);
        nlohmann::json document = nlohmann::json::parse(file);
        EXPECT_GE(document["total_states"].get<int>(), 1);
    }

    TEST_F(TableMonitorTest, StartFailsWithoutSource)
    {
        MonitorComponents c = components();
        source->open_ok = false;
        TableMonitor monitor(config, *errors, move(c));

        EXPECT_FALSE(monitor.start());
        EXPECT_FALSE(monitor.isRunning());

        ErrorFilter filter;
        filter.category = ErrorCategory::CAPTURE;
        auto logged = errors->getErrors(filter);
        ASSERT_EQ(logged.size(), 1u);
        EXPECT_EQ(logged[0].severity, ErrorSeverity::HIGH);
        EXPECT_EQ(logged[0].function, "start");
    }

} // namespace gtest
