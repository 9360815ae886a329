#include "frame_consumer.hpp"
#include "errors/system_context.hpp"
#include "utils.hpp"

#include <chrono>

using namespace std;

nlohmann::json ConsumerStats::toJson() const
{
    return {
        {"frames_processed", frames_processed},
        {"callback_failures", callback_failures},
        {"slow_callbacks", slow_callbacks},
        {"last_callback_ms", last_callback_ms},
        {"avg_callback_ms", avg_callback_ms}};
}

FrameConsumer::FrameConsumer(shared_ptr<FrameSlot> slot, ErrorStore &errors, const PerformanceConfig &config)
    : slot_(move(slot)), errors_(errors), config_(config)
{
}

FrameConsumer::~FrameConsumer()
{
    stop();
}

void FrameConsumer::setCallback(FrameCallback callback)
{
    lock_guard<mutex> lock(mutex_);
    callback_ = move(callback);
}

optional<ErrorSeverity> FrameConsumer::severityForCallbackTime(double duration_ms, double warning_ms)
{
    if (duration_ms > warning_ms * 2.0)
        return ErrorSeverity::MEDIUM;
    if (duration_ms > warning_ms)
        return ErrorSeverity::LOW;
    return nullopt;
}

void FrameConsumer::start()
{
    if (running_)
    {
        log_warning("Frame consumer already running");
        return;
    }

    running_ = true;
    worker_ = thread(&FrameConsumer::run, this);
    log_debug("Frame consumer started");
}

void FrameConsumer::stop()
{
    running_ = false;
    slot_->close();

    if (worker_.joinable())
    {
        worker_.join();
        log_info("Frame consumer stopped after " + log_string(stats().frames_processed) + " frames");
    }
}

void FrameConsumer::run()
{
    system_context::setThreadName("consumer");

    while (running_)
    {
        processOne(100);
    }
}

bool FrameConsumer::processOne(int timeout_ms)
{
    CapturedFrame frame;
    if (!slot_->take(frame, timeout_ms))
        return false;

    invoke(frame);
    return true;
}

void FrameConsumer::invoke(const CapturedFrame &frame)
{
    FrameCallback callback;
    {
        lock_guard<mutex> lock(mutex_);
        callback = callback_;
    }

    if (!callback)
    {
        log_debug("No frame callback registered, dropping frame " + log_string(frame.frame_number));
        return;
    }

    auto start = chrono::steady_clock::now();
    bool failed = false;

    try
    {
        callback(frame);
    }
    catch (const exception &e)
    {
        failed = true;
        errors_.logError(ErrorSeverity::HIGH, ErrorCategory::UNKNOWN, "FrameConsumer", "invoke",
                         "Frame callback failed: " + string(e.what()), &e,
                         nlohmann::json::object(), frame.frame_number);
    }
    catch (...)
    {
        failed = true;
        errors_.logError(ErrorSeverity::HIGH, ErrorCategory::UNKNOWN, "FrameConsumer", "invoke",
                         "Frame callback threw a non-standard exception", nullptr,
                         nlohmann::json::object(), frame.frame_number);
    }

    double duration_ms = time_utils::millisecondsBetween(start, chrono::steady_clock::now());

    {
        lock_guard<mutex> lock(mutex_);
        stats_.frames_processed++;
        if (failed)
            stats_.callback_failures++;
        stats_.last_callback_ms = duration_ms;
        stats_.avg_callback_ms += (duration_ms - stats_.avg_callback_ms) / stats_.frames_processed;
    }

    recordCallbackTime(duration_ms, frame.frame_number);
}

void FrameConsumer::recordCallbackTime(double duration_ms, int64_t frame_number)
{
    optional<ErrorSeverity> severity = severityForCallbackTime(duration_ms, config_.callback_warning_ms);
    if (!severity)
        return;

    {
        lock_guard<mutex> lock(mutex_);
        stats_.slow_callbacks++;
    }

    // Each band gets its own record; the store keys on the message
    string threshold = to_string((int)config_.callback_warning_ms) + "ms";
    string message = *severity == ErrorSeverity::MEDIUM ? "Frame callback exceeded 2x " + threshold
                                                        : "Frame callback exceeded " + threshold;

    errors_.logPerformanceIssue("FrameConsumer", "invoke", message,
                                duration_ms, *severity,
                                {{"callback_time_ms", duration_ms},
                                 {"threshold_ms", config_.callback_warning_ms},
                                 {"frame_number", frame_number}});
}

ConsumerStats FrameConsumer::stats() const
{
    lock_guard<mutex> lock(mutex_);
    return stats_;
}
