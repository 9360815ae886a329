#pragma once

#include <opencv2/opencv.hpp>
#include <opencv2/dnn.hpp>
#include <string>
#include <vector>
#include "../detector_interface.hpp"

using namespace cv;
using namespace std;

namespace yolo_processing
{
    struct YoloParams
    {
        int input_size = 640;              // Square network input
        float confidence_threshold = 0.25f; // Minimum class score
        float nms_threshold = 0.45f;        // IoU for non-maximum suppression
        int pad_value = 114;                // Letterbox border grey
    };

    struct Letterbox
    {
        Mat image;
        float scale = 1.0f;
        int pad_x = 0;
        int pad_y = 0;
    };

    Letterbox letterbox(const Mat &image, int input_size, int pad_value);

    struct RawDetection
    {
        int class_id = -1;
        float score = 0.0f;
        Rect2f box; // Network input coordinates
    };

    // Accepts [1, N, 4+C], [1, 4+C, N] (v8 style) and [1, N, 5+C] (v5 style with objectness)
    vector<RawDetection> decodeOutput(const Mat &output, int num_classes, float confidence_threshold);

} // namespace yolo_processing

class YoloCardDetector : public CardDetectorInterface
{
public:
    YoloCardDetector(const string &model_path, const string &labels_path,
                     const yolo_processing::YoloParams &params = yolo_processing::YoloParams());
    virtual ~YoloCardDetector() = default;

    virtual bool initialize() override;
    virtual bool isInitialized() const override { return initialized; }
    virtual DetectorKind kind() const override { return DetectorKind::PRIMARY; }
    virtual string name() const override { return "yolo"; }

    virtual DetectionResult detect(const Mat &frame, const Region &region) override;

protected:
    bool initialized;
    string model_path;
    string labels_path;
    yolo_processing::YoloParams params;
    vector<string> labels;
    dnn::Net net;
};
