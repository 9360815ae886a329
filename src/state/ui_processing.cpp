#include "ui_processing.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>

namespace ui_processing
{
    static bool hasButton(const Mat &hsv, const Scalar &low, const Scalar &high, double min_area)
    {
        Mat mask;
        inRange(hsv, low, high, mask);

        vector<vector<Point>> contours;
        findContours(mask, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

        for (const auto &contour : contours)
        {
            if (contourArea(contour) > min_area)
                return true;
        }
        return false;
    }

    vector<string> detectActionButtons(const Mat &region_bgr, const ButtonParams &params)
    {
        vector<string> actions;
        if (region_bgr.empty() || region_bgr.channels() != 3)
            return actions;

        Mat hsv;
        cvtColor(region_bgr, hsv, COLOR_BGR2HSV);

        if (hasButton(hsv, params.fold_low, params.fold_high, params.min_area))
            actions.push_back("fold");
        if (hasButton(hsv, params.call_low, params.call_high, params.min_area))
            actions.push_back("check_call");
        if (hasButton(hsv, params.raise_low, params.raise_high, params.min_area))
            actions.push_back("bet_raise");

        log_debug("Detected " + log_string(actions.size()) + " action buttons");
        return actions;
    }

    PlayerStatus detectPlayerStatus(const Mat &seat_bgr, const StatusParams &params)
    {
        PlayerStatus status;
        if (seat_bgr.empty())
            return status;

        Mat gray;
        if (seat_bgr.channels() == 3)
        {
            Mat hsv, highlight;
            cvtColor(seat_bgr, hsv, COLOR_BGR2HSV);
            inRange(hsv, params.highlight_low, params.highlight_high, highlight);
            status.is_current = countNonZero(highlight) >= params.highlight_min_pixels;

            cvtColor(seat_bgr, gray, COLOR_BGR2GRAY);
        }
        else
        {
            gray = seat_bgr;
        }

        status.is_active = mean(gray)[0] > params.active_min_brightness;
        return status;
    }

    vector<string> parseBettingOptions(const vector<string> &words)
    {
        static const vector<pair<string, string>> known = {
            {"1/3", "1/3 pot"}, {"1/2", "1/2 pot"}, {"2/3", "2/3 pot"}, {"3/4", "3/4 pot"},
            {"pot", "pot"}, {"all-in", "all-in"}, {"allin", "all-in"}, {"max", "all-in"}, {"min", "min"}};

        vector<string> options;
        for (const auto &word : words)
        {
            string lower = word;
            transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

            for (const auto &[token, label] : known)
            {
                if (lower == token && find(options.begin(), options.end(), label) == options.end())
                {
                    options.push_back(label);
                    break;
                }
            }
        }
        return options;
    }

} // namespace ui_processing
