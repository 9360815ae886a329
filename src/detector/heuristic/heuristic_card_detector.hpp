#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include "../detector_interface.hpp"

using namespace cv;
using namespace std;

namespace heuristic_processing
{
    struct CardShapeParams
    {
        int brightness_threshold = 180;  // Card faces are near white
        double min_area_ratio = 0.02;    // Of the region area
        double max_area_ratio = 0.6;
        double min_aspect = 1.1;         // height / width of an upright card
        double max_aspect = 1.9;
        int morph_kernel_size = 3;
        float confidence = 0.5f;         // Fixed, shapes carry no rank/suit evidence
    };

    // Bounding boxes of card-shaped bright blobs, in the image's own coordinates
    vector<Rect> findCardShapes(const Mat &image, const CardShapeParams &params = CardShapeParams());

} // namespace heuristic_processing

// Fallback detector: counts card-shaped bright blobs. Rank and suit are reported as "?"
class HeuristicCardDetector : public CardDetectorInterface
{
public:
    explicit HeuristicCardDetector(const heuristic_processing::CardShapeParams &params = heuristic_processing::CardShapeParams());
    virtual ~HeuristicCardDetector() = default;

    virtual bool initialize() override { return true; }
    virtual bool isInitialized() const override { return true; }
    virtual DetectorKind kind() const override { return DetectorKind::FALLBACK; }
    virtual string name() const override { return "heuristic"; }

    virtual DetectionResult detect(const Mat &frame, const Region &region) override;

protected:
    heuristic_processing::CardShapeParams params;
};
