#include <algorithm>

#include "heuristic_card_detector.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

namespace heuristic_processing
{
    vector<Rect> findCardShapes(const Mat &image, const CardShapeParams &params)
    {
        vector<Rect> shapes;
        if (image.empty())
            return shapes;

        Mat gray;
        if (image.channels() == 3)
            cvtColor(image, gray, COLOR_BGR2GRAY);
        else if (image.channels() == 4)
            cvtColor(image, gray, COLOR_BGRA2GRAY);
        else
            gray = image;

        Mat mask;
        threshold(gray, mask, params.brightness_threshold, 255, THRESH_BINARY);

        Mat kernel = getStructuringElement(MORPH_RECT, Size(params.morph_kernel_size, params.morph_kernel_size));
        morphologyEx(mask, mask, MORPH_OPEN, kernel);

        vector<vector<Point>> contours;
        findContours(mask, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

        double region_area = static_cast<double>(image.cols) * image.rows;
        for (const auto &contour : contours)
        {
            Rect box = boundingRect(contour);
            double area_ratio = box.area() / region_area;
            double aspect = box.width > 0 ? static_cast<double>(box.height) / box.width : 0.0;

            if (area_ratio < params.min_area_ratio || area_ratio > params.max_area_ratio)
                continue;
            if (aspect < params.min_aspect || aspect > params.max_aspect)
                continue;

            shapes.push_back(box);
        }

        sort(shapes.begin(), shapes.end(), [](const Rect &a, const Rect &b)
             { return a.x < b.x; });
        return shapes;
    }

} // namespace heuristic_processing

HeuristicCardDetector::HeuristicCardDetector(const heuristic_processing::CardShapeParams &params)
    : params(params)
{
}

DetectionResult HeuristicCardDetector::detect(const Mat &frame, const Region &region)
{
    DetectionResult result;
    result.source = DetectorKind::FALLBACK;

    Region clipped = region.clippedTo(frame.size());
    if (clipped.empty())
    {
        result.status = DetectionStatus::NO_DETECTION;
        return result;
    }

    try
    {
        for (const Rect &box : heuristic_processing::findCardShapes(frame(clipped.toRect()), params))
        {
            Card card;
            card.rank = "?";
            card.suit = "?";
            card.confidence = params.confidence;
            card.position = Point2f(clipped.x + box.x + box.width / 2.0f, clipped.y + box.y + box.height / 2.0f);
            card.from_fallback = true;
            result.cards.push_back(card);
        }
    }
    catch (const cv::Exception &e)
    {
        result.status = DetectionStatus::FAILED;
        result.error = e.what();
        return result;
    }

    result.status = result.cards.empty() ? DetectionStatus::NO_DETECTION : DetectionStatus::DETECTED;
    return result;
}
