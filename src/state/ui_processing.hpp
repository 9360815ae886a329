#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

using namespace cv;
using namespace std;

namespace ui_processing
{
    struct ButtonParams
    {
        // HSV ranges of the action buttons
        Scalar fold_low{0, 50, 50};   // Red
        Scalar fold_high{10, 255, 255};
        Scalar call_low{40, 50, 50};  // Green
        Scalar call_high{80, 255, 255};
        Scalar raise_low{20, 100, 100}; // Yellow
        Scalar raise_high{30, 255, 255};
        double min_area = 500.0;        // Smallest contour that counts as a button
    };

    struct StatusParams
    {
        Scalar highlight_low{20, 100, 100}; // Yellow turn highlight
        Scalar highlight_high{30, 255, 255};
        int highlight_min_pixels = 4;              // Mask sum above 1000 at 255 per pixel
        double active_min_brightness = 50.0;       // Mean gray level of a seated, non-folded player
    };

    struct PlayerStatus
    {
        bool is_active = false;
        bool is_current = false;
    };

    // "fold", "check_call", "bet_raise" in that order, for each colour found
    vector<string> detectActionButtons(const Mat &region_bgr, const ButtonParams &params = ButtonParams());

    PlayerStatus detectPlayerStatus(const Mat &seat_bgr, const StatusParams &params = StatusParams());

    // Betting option labels such as "1/2 pot", "pot", "all-in" from OCR words
    vector<string> parseBettingOptions(const vector<string> &words);

} // namespace ui_processing
