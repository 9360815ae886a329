#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <opencv2/opencv.hpp>
#include "time_utils.hpp"

struct CapturedFrame
{
    cv::Mat image;
    int64_t frame_number = 0;
    time_utils::TimePoint timestamp;
    double capture_fps = 0.0; // Producer's rolling rate when the frame was taken
};

// Single-slot channel between the capture producer and the consumer loop.
// Publishing over an unconsumed frame replaces it, so the consumer always gets
// the most recent frame and never a backlog.
class FrameSlot
{
public:
    // true when an unconsumed frame was dropped
    bool publish(CapturedFrame frame);

    // Waits up to timeout_ms. false on timeout or once closed and empty
    bool take(CapturedFrame &frame, int timeout_ms = 100);

    // Wakes all waiters; later publishes are ignored
    void close();
    void reopen();

    bool isClosed() const;
    bool hasFrame() const;
    uint64_t droppedCount() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::optional<CapturedFrame> slot_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
};
