#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

using namespace cv;
using namespace std;

// One recognised word
struct TextElement
{
    string text;
    float confidence = 0.0f; // [0,1]
    Rect bbox;               // In the coordinates of the image it was read from
    bool from_fallback = false;

    Point2f center() const { return Point2f(bbox.x + bbox.width / 2.0f, bbox.y + bbox.height / 2.0f); }
};

// Abstract interface for any text recognition backend
class TextEngine
{
public:
    virtual ~TextEngine() = default;

    // Load models / language data
    virtual bool initialize() = 0;

    // Whether the engine is ready
    virtual bool isInitialized() const = 0;

    // Recognise all words in a single image. Throws on backend failure
    virtual vector<TextElement> recognize(const Mat &image) = 0;

    virtual string name() const = 0;
};
