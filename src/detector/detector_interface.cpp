#include "detector_interface.hpp"

string toString(DetectionStatus status)
{
    switch (status)
    {
    case DetectionStatus::DETECTED:
        return "detected";
    case DetectionStatus::NO_DETECTION:
        return "no_detection";
    case DetectionStatus::UNAVAILABLE:
        return "unavailable";
    case DetectionStatus::FAILED:
        return "failed";
    }
    return "failed";
}

string toString(DetectorKind kind)
{
    return kind == DetectorKind::PRIMARY ? "primary" : "fallback";
}
