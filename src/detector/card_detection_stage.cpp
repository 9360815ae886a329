#include "card_detection_stage.hpp"
#include "utils.hpp"

CardDetectionStage::CardDetectionStage(unique_ptr<CardDetectorInterface> primary, unique_ptr<CardDetectorInterface> fallback)
    : primary_(move(primary)), fallback_(move(fallback))
{
}

string CardDetectionStage::describe() const
{
    string text = hasPrimary() ? primary_->name() : "none";
    text += " (fallback: " + (fallback_ ? fallback_->name() : string("none")) + ")";
    return text;
}

DetectionResult CardDetectionStage::detect(const Mat &frame, const Region &region)
{
    string primary_error;

    if (hasPrimary())
    {
        DetectionResult result = primary_->detect(frame, region);
        if (result.status == DetectionStatus::DETECTED || result.status == DetectionStatus::NO_DETECTION)
            return result;

        primary_error = toString(result.status) + (result.error.empty() ? "" : ": " + result.error);
        log_debug("Primary detector " + primary_error + ", using fallback");
    }

    if (!fallback_)
    {
        DetectionResult result;
        result.status = DetectionStatus::UNAVAILABLE;
        result.error = "no detector available";
        result.primary_error = primary_error;
        return result;
    }

    DetectionResult result = fallback_->detect(frame, region);
    result.source = DetectorKind::FALLBACK;
    result.primary_error = primary_error;
    for (auto &card : result.cards)
        card.from_fallback = true;
    return result;
}
