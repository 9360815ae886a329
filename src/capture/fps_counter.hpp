#pragma once
#include <chrono>

// Rolling frame rate: frames that arrived during a window of at least one
// second, divided by the wall time the window actually covered.
class FpsCounter
{
public:
    using Clock = std::chrono::steady_clock;

    explicit FpsCounter(std::chrono::milliseconds window = std::chrono::milliseconds(1000))
        : window_(window) {}

    void tick(Clock::time_point now = Clock::now())
    {
        // The first frame only opens the window
        if (!window_start_)
        {
            window_start_ = true;
            start_ = now;
            return;
        }

        frames_++;

        auto elapsed = now - start_;
        if (elapsed >= window_)
        {
            double seconds = std::chrono::duration<double>(elapsed).count();
            rate_ = frames_ / seconds;
            frames_ = 0;
            start_ = now;
        }
    }

    double rate() const { return rate_; }

    void reset()
    {
        window_start_ = false;
        frames_ = 0;
        rate_ = 0.0;
    }

private:
    std::chrono::milliseconds window_;
    bool window_start_ = false;
    Clock::time_point start_;
    int frames_ = 0;
    double rate_ = 0.0;
};
