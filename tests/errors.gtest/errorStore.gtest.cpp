#include "errors/error_store.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace gtest
{

    class ErrorStoreTest : public ::testing::Test
    {
    protected:
        fakes::TempDir dir;
        ErrorStore store{dir.file("errors.db")};

        void SetUp() override
        {
            ASSERT_TRUE(store.initialize());
        }
    };

    TEST_F(ErrorStoreTest, RepeatedErrorIsDeduplicated)
    {
        std::runtime_error failure("grab failed");
        int64_t first = store.logCaptureError("CaptureScheduler", "captureCycle", "grab failed", &failure);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        int64_t second = store.logCaptureError("CaptureScheduler", "captureCycle", "grab failed", &failure);

        ASSERT_GT(first, 0);
        EXPECT_EQ(first, second);

        vector<ErrorRecord> records = store.getErrors();
        ASSERT_EQ(records.size(), 1u);
        EXPECT_EQ(records[0].occurrence_count, 2);
        EXPECT_GT(records[0].last_seen, records[0].first_seen);
        EXPECT_EQ(records[0].exception_type, "std::runtime_error");
        EXPECT_FALSE(records[0].stack_trace.empty());
    }

    TEST_F(ErrorStoreTest, DedupSurvivesANewStoreInstance)
    {
        store.logVisionError("GameStateParser", "parse", "board unreadable");

        ErrorStore reopened(store.path());
        ASSERT_TRUE(reopened.initialize());
        reopened.logVisionError("GameStateParser", "parse", "board unreadable");

        vector<ErrorRecord> records = reopened.getErrors();
        ASSERT_EQ(records.size(), 1u);
        EXPECT_EQ(records[0].occurrence_count, 2);
    }

    TEST_F(ErrorStoreTest, KeyDistinguishesEveryPart)
    {
        store.logVisionError("A", "f", "message");
        store.logVisionError("B", "f", "message");
        store.logVisionError("A", "g", "message");
        store.logVisionError("A", "f", "other message");
        std::invalid_argument typed("message");
        store.logVisionError("A", "f", "message", &typed);

        EXPECT_EQ(store.getErrors().size(), 5u);
    }

    TEST_F(ErrorStoreTest, LongMessagesShareKeyPastTruncation)
    {
        string prefix(100, 'x');
        EXPECT_EQ(ErrorStore::dedupKey("c", "f", "", prefix + "tail one"),
                  ErrorStore::dedupKey("c", "f", "", prefix + "tail two"));

        store.logVisionError("c", "f", prefix + "tail one");
        store.logVisionError("c", "f", prefix + "tail two");
        EXPECT_EQ(store.getErrors().size(), 1u);
    }

    TEST_F(ErrorStoreTest, ContextCarriesSystemSnapshot)
    {
        store.setSessionId("42");
        store.logError(ErrorSeverity::LOW, ErrorCategory::VISION, "OCR", "read", "weak reading", nullptr,
                       {{"region", "pot_display"}}, 17, 12.5);

        vector<ErrorRecord> records = store.getErrors();
        ASSERT_EQ(records.size(), 1u);
        const auto &context = records[0].context;
        EXPECT_EQ(context["session_id"], "42");
        EXPECT_TRUE(context.contains("memory_usage_mb"));
        EXPECT_TRUE(context.contains("cpu_usage_percent"));
        EXPECT_TRUE(context.contains("thread_name"));
        EXPECT_EQ(context["frame_number"], 17);
        EXPECT_DOUBLE_EQ(context["processing_time_ms"].get<double>(), 12.5);
        EXPECT_EQ(context["additional_data"]["region"], "pot_display");
    }

    TEST_F(ErrorStoreTest, FiltersAreIndependent)
    {
        store.logCaptureError("CaptureScheduler", "captureCycle", "a", nullptr, ErrorSeverity::CRITICAL);
        store.logVisionError("YoloCardDetector", "detect", "b", nullptr, ErrorSeverity::MEDIUM);
        store.logVisionError("HeuristicCardDetector", "detect", "c", nullptr, ErrorSeverity::LOW);
        store.logDatabaseError("Database", "saveGameState", "d");

        ErrorFilter by_severity;
        by_severity.severity = ErrorSeverity::CRITICAL;
        EXPECT_EQ(store.getErrors(by_severity).size(), 1u);

        ErrorFilter by_category;
        by_category.category = ErrorCategory::VISION;
        EXPECT_EQ(store.getErrors(by_category).size(), 2u);

        ErrorFilter by_component;
        by_component.component = "CardDetector";
        EXPECT_EQ(store.getErrors(by_component).size(), 2u);

        ErrorFilter combined;
        combined.category = ErrorCategory::VISION;
        combined.severity = ErrorSeverity::LOW;
        vector<ErrorRecord> one = store.getErrors(combined);
        ASSERT_EQ(one.size(), 1u);
        EXPECT_EQ(one[0].component, "HeuristicCardDetector");

        ErrorFilter recent;
        recent.hours = 1.0;
        recent.limit = 3;
        EXPECT_EQ(store.getErrors(recent).size(), 3u);
    }

    TEST_F(ErrorStoreTest, ComponentFilterMatchesLiterally)
    {
        store.logVisionError("Seat_Reader", "read", "a");
        store.logVisionError("SeatXReader", "read", "b");
        store.logVisionError("Pot100%", "read", "c");

        ErrorFilter underscore;
        underscore.component = "t_R";
        vector<ErrorRecord> one = store.getErrors(underscore);
        ASSERT_EQ(one.size(), 1u);
        EXPECT_EQ(one[0].component, "Seat_Reader");

        ErrorFilter percent;
        percent.component = "%";
        vector<ErrorRecord> pot = store.getErrors(percent);
        ASSERT_EQ(pot.size(), 1u);
        EXPECT_EQ(pot[0].component, "Pot100%");

        ErrorFilter backslash;
        backslash.component = "\\";
        EXPECT_TRUE(store.getErrors(backslash).empty());
    }

    TEST_F(ErrorStoreTest, SummaryBreaksDownByWindow)
    {
        for (int i = 0; i < 3; i++)
            store.logCaptureError("CaptureScheduler", "captureCycle", "grab failed", nullptr, ErrorSeverity::CRITICAL);
        store.logVisionError("GameStateParser", "parse", "board unreadable");
        store.logPerformanceIssue("FrameConsumer", "invoke", "slow", 120.0, ErrorSeverity::MEDIUM);

        ErrorSummary summary = store.getSummary(24.0);
        EXPECT_EQ(summary.total_unique, 3);
        EXPECT_EQ(summary.total_occurrences, 5);

        ASSERT_EQ(summary.by_severity.count("CRITICAL"), 1u);
        EXPECT_EQ(summary.by_severity["CRITICAL"].unique, 1);
        EXPECT_EQ(summary.by_severity["CRITICAL"].total, 3);
        EXPECT_EQ(summary.by_severity["MEDIUM"].unique, 2);

        ASSERT_EQ(summary.by_category.count("CAPTURE"), 1u);
        EXPECT_NEAR(summary.by_category["CAPTURE"].rate_per_hour, 3.0 / 24.0, 1e-9);

        ASSERT_FALSE(summary.top_components.empty());
        EXPECT_EQ(summary.top_components[0].component, "CaptureScheduler");
        EXPECT_EQ(summary.top_components[0].total, 3);

        ASSERT_EQ(summary.recent_critical.size(), 1u);
        EXPECT_EQ(summary.recent_critical[0].message, "grab failed");

        nlohmann::json j = summary.toJson();
        EXPECT_TRUE(j.contains("severity_breakdown"));
        EXPECT_TRUE(j.contains("recent_critical_errors"));
    }

    TEST_F(ErrorStoreTest, ResolvedRecordReopensOnRepeat)
    {
        int64_t id = store.logVisionError("OCR", "read", "garbled");
        ASSERT_TRUE(store.markResolved(id, "retrained"));

        optional<ErrorRecord> resolved = store.getError(id);
        ASSERT_TRUE(resolved.has_value());
        EXPECT_EQ(resolved->resolution_status, "RESOLVED");
        EXPECT_EQ(resolved->resolution_notes, "retrained");

        store.logVisionError("OCR", "read", "garbled");
        EXPECT_EQ(store.getError(id)->resolution_status, "OPEN");
        EXPECT_FALSE(store.markResolved(id + 1000));
    }

    TEST_F(ErrorStoreTest, CleanupOnlyRemovesOldResolvedRecords)
    {
        int64_t resolved = store.logVisionError("OCR", "read", "resolved one");
        store.logVisionError("OCR", "read", "still open");
        ASSERT_TRUE(store.markResolved(resolved));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

        // Nothing is old enough yet
        EXPECT_EQ(store.countResolvedOlderThan(30), 0);
        EXPECT_EQ(store.cleanupResolved(30), 0);

        EXPECT_EQ(store.countResolvedOlderThan(0), 1);
        EXPECT_EQ(store.cleanupResolved(0), 1);

        vector<ErrorRecord> remaining = store.getErrors();
        ASSERT_EQ(remaining.size(), 1u);
        EXPECT_EQ(remaining[0].message, "still open");

        // A purged record starts over as a new row
        store.logVisionError("OCR", "read", "resolved one");
        EXPECT_EQ(store.getErrors().size(), 2u);
    }

    TEST_F(ErrorStoreTest, UnusableDatabaseIsReportedNotThrown)
    {
        ErrorStore broken(dir.file("missing_dir/is_a_file/errors.db"));
        // Parent path component is a regular file, so the database cannot be created
        std::ofstream(dir.file("missing_dir")) << "x";
        EXPECT_FALSE(broken.initialize());
        EXPECT_EQ(broken.logVisionError("c", "f", "m"), -1);
        EXPECT_TRUE(broken.getErrors().empty());
    }

    TEST(ErrorTypes, NamesParseCaseInsensitively)
    {
        EXPECT_EQ(severityFromString("critical"), ErrorSeverity::CRITICAL);
        EXPECT_EQ(categoryFromString("File_System"), ErrorCategory::FILE_SYSTEM);
        EXPECT_FALSE(severityFromString("fatal").has_value());
        EXPECT_EQ(allSeverities().size(), 5u);
        EXPECT_EQ(allCategories().size(), 9u);
    }

} // namespace gtest
