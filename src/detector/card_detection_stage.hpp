#pragma once

#include <memory>
#include <string>
#include "detector_interface.hpp"

// Primary detector with a heuristic substitute.
// The primary is used whenever it is initialized; only an UNAVAILABLE or FAILED
// result switches that call to the fallback. An empty primary result is final.
class CardDetectionStage
{
public:
    CardDetectionStage(unique_ptr<CardDetectorInterface> primary, unique_ptr<CardDetectorInterface> fallback);

    DetectionResult detect(const Mat &frame, const Region &region);

    bool hasPrimary() const { return primary_ && primary_->isInitialized(); }
    string describe() const;

private:
    unique_ptr<CardDetectorInterface> primary_;
    unique_ptr<CardDetectorInterface> fallback_;
};
