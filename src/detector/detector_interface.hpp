#pragma once
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include "config/region.hpp"
#include "state/game_models.hpp"

using namespace cv;
using namespace std;

enum class DetectionStatus
{
    DETECTED,     // At least one card found
    NO_DETECTION, // Detector ran and found nothing, a valid empty result
    UNAVAILABLE,  // Detector not usable (model missing, not initialized)
    FAILED        // Detector ran and threw
};

enum class DetectorKind
{
    PRIMARY,
    FALLBACK
};

string toString(DetectionStatus status);
string toString(DetectorKind kind);

// Result structure with all detection data
struct DetectionResult
{
    DetectionStatus status = DetectionStatus::NO_DETECTION;
    vector<Card> cards; // Frame coordinates, left to right
    DetectorKind source = DetectorKind::PRIMARY;
    string error;         // Why the producing detector failed, if it did
    string primary_error; // Set when a primary failure was replaced by the fallback
    int processing_time_ms = 0;

    // Easy boolean check
    operator bool() const { return status == DetectionStatus::DETECTED; }
};

// Abstract interface for any card detection method
class CardDetectorInterface
{
public:
    virtual ~CardDetectorInterface() = default;

    // Probe and load resources. false = unavailable
    virtual bool initialize() = 0;

    // Whether the detector is ready
    virtual bool isInitialized() const = 0;

    virtual DetectorKind kind() const = 0;
    virtual string name() const = 0;

    // Find cards inside one region of the frame
    virtual DetectionResult detect(const Mat &frame, const Region &region) = 0;
};
