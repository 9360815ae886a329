#include "frame_slot.hpp"

bool FrameSlot::publish(CapturedFrame frame)
{
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return false;

        if (slot_)
        {
            dropped = true;
            dropped_++;
        }
        slot_ = std::move(frame);
    }
    condition_.notify_one();
    return dropped;
}

bool FrameSlot::take(CapturedFrame &frame, int timeout_ms)
{
    std::unique_lock<std::mutex> lock(mutex_);

    if (condition_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this]
                            { return slot_.has_value() || closed_; }))
    {
        if (!slot_)
            return false;

        frame = std::move(*slot_);
        slot_.reset();
        return true;
    }
    return false;
}

void FrameSlot::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

void FrameSlot::reopen()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
    slot_.reset();
}

bool FrameSlot::isClosed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool FrameSlot::hasFrame() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return slot_.has_value();
}

uint64_t FrameSlot::droppedCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
