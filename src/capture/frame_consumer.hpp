#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <nlohmann/json.hpp>
#include "config/app_config.hpp"
#include "errors/error_store.hpp"
#include "frame_slot.hpp"

struct ConsumerStats
{
    int64_t frames_processed = 0;
    int64_t callback_failures = 0;
    int64_t slow_callbacks = 0;
    double last_callback_ms = 0.0;
    double avg_callback_ms = 0.0;

    nlohmann::json toJson() const;
};

// Consumer side of the pipeline: takes the most recent frame from the slot and
// runs the registered callback on it, one frame at a time in acquisition order.
// Callback exceptions are recorded and never leave the loop; callbacks slower
// than the warning threshold are reported as performance issues.
class FrameConsumer
{
public:
    using FrameCallback = function<void(const CapturedFrame &)>;

    FrameConsumer(shared_ptr<FrameSlot> slot, ErrorStore &errors, const PerformanceConfig &config);
    ~FrameConsumer();

    void setCallback(FrameCallback callback);

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // Waits for one frame and processes it. false when nothing arrived
    bool processOne(int timeout_ms = 100);

    // Runs the callback with timing and exception capture
    void invoke(const CapturedFrame &frame);

    // Files a performance event when duration_ms crosses the threshold
    void recordCallbackTime(double duration_ms, int64_t frame_number);

    ConsumerStats stats() const;

    // nullopt at or under the threshold, LOW above it, MEDIUM above twice it
    static optional<ErrorSeverity> severityForCallbackTime(double duration_ms, double warning_ms);

private:
    void run();

    shared_ptr<FrameSlot> slot_;
    ErrorStore &errors_;
    PerformanceConfig config_;

    mutable mutex mutex_;
    FrameCallback callback_;
    ConsumerStats stats_;

    atomic<bool> running_{false};
    thread worker_;
};
