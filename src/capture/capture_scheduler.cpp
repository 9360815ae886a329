#include "capture_scheduler.hpp"
#include "errors/system_context.hpp"
#include "utils.hpp"

#include <chrono>

using namespace std;

nlohmann::json CaptureStats::toJson() const
{
    return {
        {"frames_captured", frames_captured},
        {"capture_failures", capture_failures},
        {"consecutive_failures", consecutive_failures},
        {"current_fps", current_fps},
        {"target_fps", target_fps},
        {"frames_dropped", frames_dropped},
        {"is_running", running}};
}

CaptureScheduler::CaptureScheduler(unique_ptr<FrameSource> source, shared_ptr<FrameSlot> slot,
                                   ErrorStore &errors, const CaptureConfig &config)
    : state_(make_shared<State>())
{
    state_->source = move(source);
    state_->slot = move(slot);
    state_->errors = &errors;
    state_->config = config;
    state_->stats.target_fps = config.fps;
}

CaptureScheduler::~CaptureScheduler()
{
    stop();
}

ErrorSeverity CaptureScheduler::severityForFailures(int consecutive_failures)
{
    if (consecutive_failures > 10)
        return ErrorSeverity::CRITICAL;
    if (consecutive_failures > 5)
        return ErrorSeverity::HIGH;
    return ErrorSeverity::MEDIUM;
}

bool CaptureScheduler::start()
{
    if (state_->running)
    {
        log_warning("Capture already running");
        return false;
    }

    // A detached loop still owns the source until it notices the stop
    if (state_->detached)
    {
        if (exited_.valid() && exited_.wait_for(chrono::milliseconds(0)) != future_status::ready)
        {
            state_->errors->logCaptureError("CaptureScheduler", "start",
                                            "Previous capture thread has not exited yet",
                                            nullptr, ErrorSeverity::HIGH,
                                            {{"source", state_->source->describe()}});
            return false;
        }
        state_->detached = false;
    }

    if (!state_->source->isOpened() && !state_->source->open())
    {
        state_->errors->logCaptureError("CaptureScheduler", "start",
                                        "Frame source could not be opened",
                                        nullptr, ErrorSeverity::HIGH,
                                        {{"source", state_->source->describe()}});
        return false;
    }

    state_->fps.reset();
    state_->running = true;

    auto exited = make_shared<promise<void>>();
    exited_ = exited->get_future();

    shared_ptr<State> state = state_;
    worker_ = thread([state, exited]()
                     {
        system_context::setThreadName("capture");
        runLoop(state);
        state->source->release();
        exited->set_value(); });

    log_info("Capture started at " + log_string(state_->config.fps) + " FPS from " + state_->source->describe());
    return true;
}

void CaptureScheduler::stop()
{
    bool was_running = state_->running.exchange(false);

    if (!worker_.joinable())
    {
        // Never started, or already stopped; captureOnce() may still have opened the source
        if (state_->source && state_->source->isOpened())
            state_->source->release();
        return;
    }

    auto timeout = chrono::milliseconds(state_->config.join_timeout_ms);
    if (exited_.wait_for(timeout) == future_status::ready)
    {
        worker_.join();
        if (was_running)
            log_info("Capture stopped");
    }
    else
    {
        log_error("Capture thread did not stop within " + log_string(state_->config.join_timeout_ms) + "ms, detaching it");
        state_->detached = true;
        worker_.detach();
    }
}

bool CaptureScheduler::captureOnce()
{
    return captureCycle(*state_);
}

CaptureStats CaptureScheduler::stats() const
{
    lock_guard<mutex> lock(state_->stats_mutex);
    CaptureStats snapshot = state_->stats;
    snapshot.current_fps = state_->fps.rate();
    snapshot.frames_dropped = state_->slot->droppedCount();
    snapshot.running = state_->running;
    return snapshot;
}

int CaptureScheduler::consecutiveFailures() const
{
    lock_guard<mutex> lock(state_->stats_mutex);
    return state_->stats.consecutive_failures;
}

void CaptureScheduler::runLoop(const shared_ptr<State> &state)
{
    auto interval = chrono::duration<double, milli>(1000.0 / max(1, state->config.fps));
    log_debug("Capture loop running, interval " + log_string(interval.count()) + "ms");

    while (state->running)
    {
        auto cycle_start = chrono::steady_clock::now();

        captureCycle(*state);

        auto elapsed = chrono::steady_clock::now() - cycle_start;
        auto remaining = interval - elapsed;
        if (remaining > chrono::duration<double, milli>::zero() && state->running)
        {
            this_thread::sleep_for(chrono::duration_cast<chrono::microseconds>(remaining));
        }
    }

    log_debug("Capture loop exited");
}

bool CaptureScheduler::captureCycle(State &state)
{
    Mat image;
    try
    {
        if (!state.source->isOpened() && !state.source->open())
        {
            recordFailure(state, "source unavailable");
            return false;
        }

        if (!state.source->read(image) || image.empty())
        {
            recordFailure(state, "empty frame");
            return false;
        }
    }
    catch (const cv::Exception &e)
    {
        log_error("Frame source threw: " + string(e.what()));
        recordFailure(state, "source exception");
        return false;
    }

    CapturedFrame frame;
    frame.image = image;
    frame.timestamp = time_utils::Clock::now();
    {
        lock_guard<mutex> lock(state.stats_mutex);
        if (state.stats.consecutive_failures > 0)
            log_info("Capture recovered after " + log_string(state.stats.consecutive_failures) + " failures");

        state.stats.consecutive_failures = 0;
        state.stats.frames_captured++;
        state.fps.tick();
        frame.frame_number = state.next_frame_number++;
        frame.capture_fps = state.fps.rate();
    }

    if (state.slot->publish(move(frame)))
        log_debug("Consumer busy, replaced unprocessed frame");

    return true;
}

void CaptureScheduler::recordFailure(State &state, const string &reason)
{
    int streak = 0;
    {
        lock_guard<mutex> lock(state.stats_mutex);
        streak = ++state.stats.consecutive_failures;
        state.stats.capture_failures++;
    }

    // A detached loop must not touch the error store after stop()
    if (state.detached)
        return;

    ErrorSeverity severity = severityForFailures(streak);
    string band = streak > 10  ? "more than 10"
                  : streak > 5 ? "6-10"
                               : "1-5";

    state.errors->logCaptureError("CaptureScheduler", "captureCycle",
                                  "Frame acquisition failed (" + band + " consecutive failures)",
                                  nullptr, severity,
                                  {{"consecutive_failures", streak},
                                   {"reason", reason},
                                   {"source", state.source->describe()}});

    // Force a reopen on the next cycle once the device looks gone
    if (streak % 5 == 0)
    {
        log_warning("Reopening " + state.source->describe() + " after " + log_string(streak) + " failures");
        state.source->release();
    }
}
