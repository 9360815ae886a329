#include "table_monitor.hpp"
#include "capture/video_frame_source.hpp"
#include "detector/detector_factory.hpp"
#include "ocr/tesseract_engine.hpp"
#include "utils.hpp"

using namespace std;
using json = nlohmann::json;

MonitorComponents MonitorComponents::fromConfig(const AppConfig &config)
{
    MonitorComponents components;
    components.source = make_unique<VideoFrameSource>(config.capture);
    components.detection = DetectorFactory::createStage(config.vision);

    components.text = make_unique<TextRecognizer>(
        make_unique<TesseractEngine>(config.ocr.language, config.ocr.tessdata_path), config.ocr);
    if (!components.text->initialize())
    {
        log_warning("Tesseract unavailable, text fields will use last-known readings only");
    }

    return components;
}

TableMonitor::TableMonitor(const AppConfig &config, ErrorStore &errors, MonitorComponents components)
    : config(config), errors(errors),
      detection(move(components.detection)),
      text(move(components.text)),
      database(config.database.path)
{
    parser = make_unique<GameStateParser>(this->config, *detection, *text, errors);

    frame_slot_ = make_shared<FrameSlot>();
    scheduler_ = make_unique<CaptureScheduler>(move(components.source), frame_slot_, errors, config.capture);
    consumer_ = make_unique<FrameConsumer>(frame_slot_, errors, config.performance);
    consumer_->setCallback([this](const CapturedFrame &frame)
                           { processFrame(frame); });

    if (config.dashboard.enabled)
    {
        dashboard_service_ = make_unique<DashboardService>(*this, errors, config.dashboard.port);
    }
}

TableMonitor::~TableMonitor()
{
    stop();
}

bool TableMonitor::openPersistence()
{
    try
    {
        database.initialize();
    }
    catch (const exception &e)
    {
        errors.logDatabaseError("TableMonitor", "openPersistence", "Game database unavailable, running without persistence",
                                &e, ErrorSeverity::CRITICAL, {{"path", database.path()}});
        return false;
    }

    try
    {
        database.cleanupOldData(config.database.retention_days);
    }
    catch (const exception &e)
    {
        errors.logDatabaseError("TableMonitor", "openPersistence", "Retention cleanup failed",
                                &e, ErrorSeverity::MEDIUM, {{"retention_days", config.database.retention_days}});
    }

    data_logger = make_unique<DataLogger>(database, errors, config.log_dir);
    if (!data_logger->startSession())
    {
        data_logger.reset();
        return false;
    }

    data_logger->logEvent("system_start", config::toJson(config));
    return true;
}

bool TableMonitor::start()
{
    if (running)
    {
        log_warning("Table monitor already running");
        return false;
    }

    openPersistence();

    {
        lock_guard<mutex> lock(state_mutex_);
        current_state_.reset();
        last_metrics_.reset();
        frames_processed_ = 0;
        frames_without_state_ = 0;
        started_at_ = time_utils::Clock::now();
    }

    frame_slot_->reopen();
    consumer_->start();

    if (!scheduler_->start())
    {
        log_error("Capture could not start, table monitor not running");
        consumer_->stop();
        if (data_logger)
        {
            data_logger->endSession();
            data_logger.reset();
        }
        return false;
    }

    if (dashboard_service_)
        dashboard_service_->start();

    running = true;
    log_info("Table monitor running with " + log_string(config.playerRegionNames().size()) + " seats");
    log_info("Card detection: " + log_string_src(detection->describe()));
    return true;
}

void TableMonitor::stop()
{
    if (!running.exchange(false))
        return;

    scheduler_->stop();
    consumer_->stop();

    if (dashboard_service_)
        dashboard_service_->stop();

    if (data_logger)
    {
        int64_t processed;
        {
            lock_guard<mutex> lock(state_mutex_);
            processed = frames_processed_;
        }
        data_logger->logEvent("system_stop",
                              {{"frames_processed", processed},
                               {"session_duration_s", chrono::duration<double>(time_utils::Clock::now() - started_at_).count()}});
        data_logger->endSession();
        data_logger.reset();
    }

    log_info("Table monitor stopped");
}

void TableMonitor::processFrame(const CapturedFrame &frame)
{
    ParseResult result = parser->parse(frame.image, frame.capture_fps, frame.frame_number);

    {
        lock_guard<mutex> lock(state_mutex_);
        frames_processed_++;
        last_metrics_ = result.metrics;
        if (result.state)
        {
            current_state_ = result.state;
            current_hand_number_ = result.hand_number;
        }
        else
        {
            frames_without_state_++;
        }
    }

    if (data_logger)
    {
        if (result.state)
            data_logger->logGameState(*result.state, result.new_hand, result.hand_number);
        else
            data_logger->logError("parse_failure", "No game state for frame " + to_string(frame.frame_number),
                                  {{"frame_number", frame.frame_number},
                                   {"processing_time_ms", result.metrics.processing_time_ms},
                                   {"error_details", result.metrics.error_details}});
        data_logger->logVisionMetrics(result.metrics);
    }

    if (result.state && result.new_hand)
    {
        log_info("Hand " + log_string(result.hand_number) + " started: " + log_string_src(result.state->hand_id));
    }

    if (frame.frame_number % 30 == 0 && result.state)
    {
        log_debug("Frame " + log_string(frame.frame_number) + " | Hand: " + result.state->hand_id +
                  " | Phase: " + toString(result.state->phase) +
                  " | Processing: " + log_string(result.metrics.processing_time_ms) + "ms");
    }
}

optional<json> TableMonitor::currentGameState() const
{
    lock_guard<mutex> lock(state_mutex_);
    if (!current_state_)
        return nullopt;

    json j = *current_state_;
    j["hand_number"] = current_hand_number_;
    return j;
}

json TableMonitor::performanceStats() const
{
    json stats;
    {
        lock_guard<mutex> lock(state_mutex_);
        stats["frames_processed"] = frames_processed_;
        stats["frames_without_state"] = frames_without_state_;
        if (last_metrics_)
        {
            stats["processing_time_ms"] = last_metrics_->processing_time_ms;
            stats["detection_confidence"] = last_metrics_->detection_confidence;
            stats["text_confidence"] = last_metrics_->text_confidence;
            stats["elements_detected"] = last_metrics_->elements_detected;
            stats["elements_failed"] = last_metrics_->elements_failed;
            stats["fallback_elements"] = last_metrics_->fallback_elements;
        }
        stats["community_cards_count"] = current_state_ ? current_state_->community_cards.size() : 0;
    }

    CaptureStats capture = scheduler_->stats();
    stats["frame_rate"] = capture.current_fps;
    stats["capture"] = capture.toJson();
    stats["consumer"] = consumer_->stats().toJson();
    stats["primary_detector"] = detection->hasPrimary();
    stats["primary_text_engine"] = text->isPrimaryAvailable();
    stats["errors_last_hour"] = errors.getSummary(1.0, 0, 0).total_occurrences;
    return stats;
}

json TableMonitor::sessionStats() const
{
    if (!data_logger || data_logger->sessionId() < 0)
        return json::object();

    try
    {
        optional<SessionStats> stats = database.getSessionStats(data_logger->sessionId());
        if (!stats)
            return json::object();

        json j = stats->toJson();
        j["journal"] = data_logger->summary();
        return j;
    }
    catch (const exception &e)
    {
        errors.logDatabaseError("TableMonitor", "sessionStats", "Failed to read session stats", &e, ErrorSeverity::MEDIUM);
        return json::object();
    }
}

string TableMonitor::exportSession(const string &out_dir)
{
    if (!data_logger || data_logger->sessionId() < 0)
    {
        log_warning("No active session to export");
        return "";
    }

    try
    {
        string path = database.exportSessionData(data_logger->sessionId(), out_dir);
        data_logger->logEvent("data_export", {{"filename", path}});
        return path;
    }
    catch (const exception &e)
    {
        errors.logError(ErrorSeverity::MEDIUM, ErrorCategory::FILE_SYSTEM, "TableMonitor", "exportSession",
                        "Session export failed", &e);
        return "";
    }
}
