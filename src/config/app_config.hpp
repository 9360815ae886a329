#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "region.hpp"

using namespace std;

struct CaptureConfig
{
    string source = "/dev/video0"; // V4L2 device, video file or image sequence pattern
    int width = 1920;
    int height = 1080;
    int fps = 10;
    Region crop;                   // Empty = use the full frame
    int join_timeout_ms = 2000;
};

struct VisionConfig
{
    string model_path = "models/playing_cards.onnx";
    string labels_path = "models/playing_cards.names";
    int input_size = 640;
    float confidence_threshold = 0.25f;
    float nms_threshold = 0.45f;
};

struct OcrConfig
{
    string language = "eng";
    string tessdata_path = "";  // Empty = Tesseract default search path
    int min_interval_ms = 100;  // Rate limit between primary passes
    int min_region_width = 40;  // Smaller regions go straight to the fallback
    int min_region_height = 20;
    int max_duration_ms = 1000; // Hard ceiling for one primary pass
    int fallback_ttl_ms = 3000; // How long a last-known reading stays usable
};

// Minimum confidence for an observation to be accepted per field type
struct ThresholdConfig
{
    double stack_size = 0.7;
    double pot_size = 0.7;
    double timer = 0.7;
    double player_name = 0.6;
};

struct DatabaseConfig
{
    string path = "data/pokervision.db";
    string error_db_path = "data/error_logs.db";
    int retention_days = 30;
};

struct DashboardConfig
{
    bool enabled = true;
    int port = 13520;
};

struct PerformanceConfig
{
    double callback_warning_ms = 50.0;
};

struct AppConfig
{
    CaptureConfig capture;
    VisionConfig vision;
    OcrConfig ocr;
    ThresholdConfig thresholds;
    DatabaseConfig database;
    DashboardConfig dashboard;
    PerformanceConfig performance;
    RegionMap regions = defaultRegions();
    string log_dir = "logs";

    static RegionMap defaultRegions();

    // Seats are the "player_N" regions, in N order
    vector<string> playerRegionNames() const;

    // Throws std::invalid_argument describing the first bad value
    void validate() const;
};

namespace config
{
    // Missing file -> defaults. Malformed file or bad values -> std::invalid_argument
    AppConfig load(const string &path);

    void save(const AppConfig &config, const string &path);

    nlohmann::json toJson(const AppConfig &config);
    AppConfig fromJson(const nlohmann::json &j);
}
