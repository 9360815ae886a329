#pragma once
#include <string>
#include <opencv2/opencv.hpp>

using namespace cv;
using namespace std;

// Abstract acquisition resource, used only by the capture loop
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    // (Re)open the underlying device or file
    virtual bool open() = 0;

    // Grab one frame. false on failure or empty frame
    virtual bool read(Mat &frame) = 0;

    virtual void release() = 0;

    virtual bool isOpened() const = 0;

    virtual string describe() const = 0;
};
