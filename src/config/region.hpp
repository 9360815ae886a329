#pragma once

#include <map>
#include <string>
#include <opencv2/core.hpp>

// Named rectangle in source-image pixel coordinates
struct Region
{
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const Region &other) const
    {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }

    bool operator!=(const Region &other) const { return !(*this == other); }

    // Half-open containment: [x, x+width) x [y, y+height)
    bool contains(const cv::Point2f &point) const
    {
        return point.x >= x && point.x < x + width && point.y >= y && point.y < y + height;
    }

    bool empty() const { return width <= 0 || height <= 0; }

    int area() const { return width * height; }

    cv::Rect toRect() const { return cv::Rect(x, y, width, height); }

    static Region fromRect(const cv::Rect &rect) { return Region{rect.x, rect.y, rect.width, rect.height}; }

    // Intersect with the frame bounds
    Region clippedTo(const cv::Size &frame_size) const
    {
        cv::Rect clipped = toRect() & cv::Rect(0, 0, frame_size.width, frame_size.height);
        return fromRect(clipped);
    }

    std::string toString() const
    {
        return "(" + std::to_string(x) + "," + std::to_string(y) + " " + std::to_string(width) + "x" + std::to_string(height) + ")";
    }
};

using RegionMap = std::map<std::string, Region>;
