#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "capture/capture_scheduler.hpp"
#include "capture/frame_consumer.hpp"
#include "capture/frame_source.hpp"
#include "communication/dashboard_service.hpp"
#include "communication/status_provider.hpp"
#include "config/app_config.hpp"
#include "data/data_logger.hpp"
#include "data/database.hpp"
#include "detector/card_detection_stage.hpp"
#include "errors/error_store.hpp"
#include "ocr/text_recognizer.hpp"
#include "state/game_state_parser.hpp"

using namespace std;

// Replaceable pieces of the pipeline
struct MonitorComponents
{
    unique_ptr<FrameSource> source;
    unique_ptr<CardDetectionStage> detection;
    unique_ptr<TextRecognizer> text;

    // Video source, probed YOLO/heuristic stage and Tesseract from the config
    static MonitorComponents fromConfig(const AppConfig &config);
};

// Wires capture, extraction, reconstruction and persistence together and
// answers dashboard polls.
class TableMonitor : public StatusProvider
{
public:
    TableMonitor(const AppConfig &config, ErrorStore &errors, MonitorComponents components);
    ~TableMonitor();

    bool start();
    void stop();
    bool isRunning() const { return running; }

    // Consumer callback: one frame through parse, log and publish
    void processFrame(const CapturedFrame &frame);

    virtual optional<nlohmann::json> currentGameState() const override;
    virtual nlohmann::json performanceStats() const override;
    virtual nlohmann::json sessionStats() const override;

    // Exports the active session, empty string when there is none
    string exportSession(const string &out_dir = "exports");

private:
    bool openPersistence();

    AppConfig config;
    ErrorStore &errors;

    unique_ptr<CardDetectionStage> detection;
    unique_ptr<TextRecognizer> text;
    unique_ptr<GameStateParser> parser;

    Database database;
    unique_ptr<DataLogger> data_logger;

    shared_ptr<FrameSlot> frame_slot_;
    unique_ptr<CaptureScheduler> scheduler_;
    unique_ptr<FrameConsumer> consumer_;
    unique_ptr<DashboardService> dashboard_service_;

    atomic<bool> running{false};

    mutable mutex state_mutex_;
    optional<GameState> current_state_;
    optional<VisionMetrics> last_metrics_;
    int64_t frames_processed_ = 0;
    int64_t frames_without_state_ = 0;
    int current_hand_number_ = 0;
    time_utils::TimePoint started_at_;
};
