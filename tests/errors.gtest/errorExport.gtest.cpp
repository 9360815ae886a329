#include "errors/error_export.hpp"
#include "../support/fakes.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace gtest
{

    static ErrorRecord sampleRecord(int64_t id, const string &message, const json &context)
    {
        ErrorRecord record;
        record.id = id;
        record.severity = ErrorSeverity::HIGH;
        record.category = ErrorCategory::CAPTURE;
        record.component = "CaptureScheduler";
        record.function = "captureCycle";
        record.message = message;
        record.context = context;
        record.occurrence_count = 3;
        record.first_seen = record.last_seen = time_utils::Clock::now();
        return record;
    }

    static string readFile(const string &path)
    {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    TEST(ErrorExport, FlattensNestedContext)
    {
        json context = {{"session_id", "7"},
                        {"frame_number", 12},
                        {"frame", nullptr},
                        {"additional_data", {{"source", "/dev/video0"}, {"streak", {{"count", 6}}}}}};

        map<string, string> flat = error_export::flattenContext(context);
        EXPECT_EQ(flat["context_session_id"], "7");
        EXPECT_EQ(flat["context_frame_number"], "12");
        EXPECT_EQ(flat["context_frame"], "");
        EXPECT_EQ(flat["context_additional_data_source"], "/dev/video0");
        EXPECT_EQ(flat["context_additional_data_streak_count"], "6");
    }

    TEST(ErrorExport, CsvUnionsContextColumnsAndQuotes)
    {
        vector<ErrorRecord> records = {
            sampleRecord(1, "plain", {{"a", 1}}),
            sampleRecord(2, "needs, \"quotes\"", {{"b", "x"}})};

        string csv = error_export::toCsv(records);
        std::istringstream lines(csv);
        string header, first, second;
        std::getline(lines, header);
        std::getline(lines, first);
        std::getline(lines, second);

        EXPECT_NE(header.find("id,severity,category,component,function,message"), string::npos);
        EXPECT_NE(header.find(",context_a,context_b"), string::npos);
        EXPECT_EQ(first.substr(first.size() - 3), ",1,");
        EXPECT_NE(second.find("\"needs, \"\"quotes\"\"\""), string::npos);
        EXPECT_EQ(second.substr(second.size() - 2), ",x");
    }

    TEST(ErrorExport, WritesJsonDocument)
    {
        fakes::TempDir dir;
        vector<ErrorRecord> records = {sampleRecord(1, "a", json::object()), sampleRecord(2, "b", json::object())};

        string path = error_export::exportErrors(records, error_export::ExportFormat::JSON, dir.file("out"));
        EXPECT_NE(path.find("error_export_"), string::npos);
        EXPECT_EQ(path.substr(path.size() - 5), ".json");

        json document = json::parse(readFile(path));
        EXPECT_EQ(document["total_records"], 2);
        ASSERT_EQ(document["errors"].size(), 2u);
        EXPECT_EQ(document["errors"][1]["message"], "b");
        EXPECT_EQ(document["errors"][0]["occurrence_count"], 3);
    }

    TEST(ErrorExport, WritesCsvFile)
    {
        fakes::TempDir dir;
        string path = error_export::exportErrors({sampleRecord(5, "m", {{"k", "v"}})}, error_export::ExportFormat::CSV, dir.path().string());
        EXPECT_EQ(path.substr(path.size() - 4), ".csv");
        EXPECT_NE(readFile(path).find("context_k"), string::npos);
    }

    TEST(ErrorExport, FormatNames)
    {
        EXPECT_EQ(error_export::formatFromString("CSV"), error_export::ExportFormat::CSV);
        EXPECT_EQ(error_export::formatFromString("json"), error_export::ExportFormat::JSON);
        EXPECT_FALSE(error_export::formatFromString("xml").has_value());
    }

} // namespace gtest
