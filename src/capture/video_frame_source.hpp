#pragma once
#include <string>
#include <opencv2/opencv.hpp>
#include "frame_source.hpp"
#include "config/app_config.hpp"

namespace camera
{
    // Determine if a given path is a video file based on its extension
    bool isVideoFile(const string &path);

    // printf-style image sequence such as "frames/table_%04d.png"
    bool isImageSequence(const string &path);

    // Decode a fourcc code into a human-readable string
    string decodeFourCC(int fourcc);
}

// cv::VideoCapture backed source: V4L2 device (capture card or v4l2loopback
// screen feed), video file or image sequence. Frames are cropped to the
// configured capture region when one is set.
class VideoFrameSource : public FrameSource
{
public:
    explicit VideoFrameSource(const CaptureConfig &config);
    virtual ~VideoFrameSource();

    virtual bool open() override;
    virtual bool read(Mat &frame) override;
    virtual void release() override;
    virtual bool isOpened() const override { return cap.isOpened(); }
    virtual string describe() const override;

protected:
    CaptureConfig config;
    VideoCapture cap;
};
