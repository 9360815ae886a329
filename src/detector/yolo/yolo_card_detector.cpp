#include <algorithm>
#include <filesystem>

#include "yolo_card_detector.hpp"
#include "../card_labels.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

namespace yolo_processing
{
    Letterbox letterbox(const Mat &image, int input_size, int pad_value)
    {
        Letterbox result;
        result.scale = min(static_cast<float>(input_size) / image.cols, static_cast<float>(input_size) / image.rows);

        int new_w = max(1, static_cast<int>(image.cols * result.scale));
        int new_h = max(1, static_cast<int>(image.rows * result.scale));

        Mat resized;
        resize(image, resized, Size(new_w, new_h));

        result.pad_x = (input_size - new_w) / 2;
        result.pad_y = (input_size - new_h) / 2;

        result.image = Mat(input_size, input_size, image.type(), Scalar(pad_value, pad_value, pad_value));
        resized.copyTo(result.image(Rect(result.pad_x, result.pad_y, new_w, new_h)));
        return result;
    }

    vector<RawDetection> decodeOutput(const Mat &output, int num_classes, float confidence_threshold)
    {
        vector<RawDetection> detections;

        int rows = 0;
        int dims = 0;
        bool channel_first = false;
        if (output.dims == 3)
        {
            rows = output.size[1];
            dims = output.size[2];
            if (output.size[2] > output.size[1])
            {
                rows = output.size[2];
                dims = output.size[1];
                channel_first = true;
            }
        }
        else if (output.dims == 2)
        {
            rows = output.size[0];
            dims = output.size[1];
        }
        else
        {
            return detections;
        }

        // v5 heads carry an objectness score before the class scores
        bool has_objectness = dims == num_classes + 5;
        int class_start = has_objectness ? 5 : 4;
        int classes = min(num_classes, dims - class_start);

        const float *data = reinterpret_cast<const float *>(output.data);
        for (int i = 0; i < rows; i++)
        {
            const float *ptr = channel_first ? (data + i) : (data + i * dims);
            auto item = [&](int idx) -> float
            {
                return channel_first ? ptr[idx * rows] : ptr[idx];
            };

            float objectness = has_objectness ? item(4) : 1.0f;

            RawDetection best;
            for (int c = 0; c < classes; c++)
            {
                float score = objectness * item(class_start + c);
                if (score > best.score)
                {
                    best.score = score;
                    best.class_id = c;
                }
            }

            if (best.class_id < 0 || best.score < confidence_threshold)
                continue;

            float cx = item(0), cy = item(1), w = item(2), h = item(3);
            best.box = Rect2f(cx - 0.5f * w, cy - 0.5f * h, w, h);
            detections.push_back(best);
        }

        return detections;
    }

} // namespace yolo_processing

YoloCardDetector::YoloCardDetector(const string &model_path, const string &labels_path, const yolo_processing::YoloParams &params)
    : initialized(false), model_path(model_path), labels_path(labels_path), params(params)
{
}

bool YoloCardDetector::initialize()
{
    initialized = false;

    if (!filesystem::exists(model_path))
    {
        log_warning("Card model not found: " + model_path);
        return false;
    }

    try
    {
        labels = card_labels::load(labels_path);
        if (labels.empty())
        {
            log_warning("Labels file " + labels_path + " is empty");
            return false;
        }

        net = dnn::readNet(model_path);
        net.setPreferableBackend(dnn::DNN_BACKEND_OPENCV);
        net.setPreferableTarget(dnn::DNN_TARGET_CPU);
    }
    catch (const cv::Exception &e)
    {
        log_error("Failed to load card model " + model_path + ": " + e.what());
        return false;
    }
    catch (const runtime_error &e)
    {
        log_error(e.what());
        return false;
    }

    if (net.empty())
    {
        log_error("Card model " + model_path + " loaded empty");
        return false;
    }

    initialized = true;
    log_info("YOLO card detector loaded " + log_string(labels.size()) + " classes from " + model_path);
    return true;
}

DetectionResult YoloCardDetector::detect(const Mat &frame, const Region &region)
{
    DetectionResult result;
    result.source = DetectorKind::PRIMARY;

    if (!initialized)
    {
        result.status = DetectionStatus::UNAVAILABLE;
        result.error = "model not loaded";
        return result;
    }

    auto start_time = chrono::steady_clock::now();

    Region clipped = region.clippedTo(frame.size());
    if (clipped.empty())
    {
        result.status = DetectionStatus::NO_DETECTION;
        return result;
    }

    try
    {
        Mat crop = frame(clipped.toRect());
        if (crop.channels() == 4)
            cvtColor(crop, crop, COLOR_BGRA2BGR);

        yolo_processing::Letterbox input = yolo_processing::letterbox(crop, params.input_size, params.pad_value);
        Mat blob = dnn::blobFromImage(input.image, 1.0 / 255.0, Size(params.input_size, params.input_size), Scalar(), true, false);
        net.setInput(blob);
        Mat output = net.forward();

        vector<yolo_processing::RawDetection> raw =
            yolo_processing::decodeOutput(output, static_cast<int>(labels.size()), params.confidence_threshold);

        vector<Rect> boxes;
        vector<float> scores;
        for (const auto &d : raw)
        {
            boxes.push_back(Rect(d.box));
            scores.push_back(d.score);
        }

        vector<int> keep;
        dnn::NMSBoxes(boxes, scores, params.confidence_threshold, params.nms_threshold, keep);

        for (int index : keep)
        {
            const auto &d = raw[index];
            auto parsed = card_labels::parse(labels[d.class_id]);
            if (!parsed)
            {
                log_debug("Ignoring non-card class " + labels[d.class_id]);
                continue;
            }

            // Letterbox -> crop -> frame coordinates
            float cx = (d.box.x + d.box.width / 2.0f - input.pad_x) / input.scale + clipped.x;
            float cy = (d.box.y + d.box.height / 2.0f - input.pad_y) / input.scale + clipped.y;

            Card card;
            card.rank = parsed->first;
            card.suit = parsed->second;
            card.confidence = min(1.0f, max(0.0f, d.score));
            card.position = Point2f(cx, cy);
            result.cards.push_back(card);
        }
    }
    catch (const cv::Exception &e)
    {
        result.status = DetectionStatus::FAILED;
        result.error = e.what();
        return result;
    }

    sort(result.cards.begin(), result.cards.end(), [](const Card &a, const Card &b)
         { return a.position.x < b.position.x; });

    result.status = result.cards.empty() ? DetectionStatus::NO_DETECTION : DetectionStatus::DETECTED;
    result.processing_time_ms = static_cast<int>(chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start_time).count());
    return result;
}
