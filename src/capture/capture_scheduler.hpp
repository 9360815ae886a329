#pragma once
#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <nlohmann/json.hpp>
#include "config/app_config.hpp"
#include "errors/error_store.hpp"
#include "fps_counter.hpp"
#include "frame_slot.hpp"
#include "frame_source.hpp"

struct CaptureStats
{
    int64_t frames_captured = 0;
    int64_t capture_failures = 0;
    int consecutive_failures = 0;
    double current_fps = 0.0;
    int target_fps = 0;
    uint64_t frames_dropped = 0;
    bool running = false;

    nlohmann::json toJson() const;
};

// Producer side of the pipeline. A dedicated thread grabs one frame per cycle
// from the frame source, publishes it into the single-slot channel and sleeps
// out the rest of the cycle. Late cycles start the next one immediately.
//
// Consecutive acquisition failures escalate: 1-5 MEDIUM, 6-10 HIGH, >10 CRITICAL.
// Any successful grab resets the streak.
class CaptureScheduler
{
public:
    CaptureScheduler(unique_ptr<FrameSource> source, shared_ptr<FrameSlot> slot,
                     ErrorStore &errors, const CaptureConfig &config);
    ~CaptureScheduler();

    // false when already running or the source cannot be opened
    bool start();

    // Bounded join; safe without a prior start()
    void stop();

    bool isRunning() const { return state_->running; }

    // One acquisition cycle without sleeping. true when a frame was published
    bool captureOnce();

    CaptureStats stats() const;
    int consecutiveFailures() const;

    static ErrorSeverity severityForFailures(int consecutive_failures);

private:
    // Everything the capture thread touches; outlives the scheduler when a
    // stuck thread has to be detached
    struct State
    {
        unique_ptr<FrameSource> source;
        shared_ptr<FrameSlot> slot;
        ErrorStore *errors;
        CaptureConfig config;

        atomic<bool> running{false};
        atomic<bool> detached{false};

        mutable mutex stats_mutex;
        CaptureStats stats;
        FpsCounter fps;
        int64_t next_frame_number = 1;
    };

    static void runLoop(const shared_ptr<State> &state);
    static bool captureCycle(State &state);
    static void recordFailure(State &state, const string &reason);

    shared_ptr<State> state_;
    thread worker_;
    future<void> exited_;
};
