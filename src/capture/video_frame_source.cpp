#include "video_frame_source.hpp"
#include "utils.hpp"

#include <algorithm>

using namespace cv;
using namespace std;

namespace camera
{
    bool isVideoFile(const string &path)
    {
        string lower_path = path;
        transform(lower_path.begin(), lower_path.end(), lower_path.begin(), ::tolower);

        const vector<string> video_extensions = {".mp4", ".avi", ".mkv", ".mov", ".wmv", ".webm"};
        for (const auto &ext : video_extensions)
        {
            if (lower_path.length() >= ext.length() &&
                lower_path.substr(lower_path.length() - ext.length()) == ext)
            {
                return true;
            }
        }
        return false;
    }

    bool isImageSequence(const string &path)
    {
        return path.find('%') != string::npos;
    }

    string decodeFourCC(int fourcc)
    {
        char code[5];
        code[0] = (fourcc & 0xFF);
        code[1] = (fourcc >> 8) & 0xFF;
        code[2] = (fourcc >> 16) & 0xFF;
        code[3] = (fourcc >> 24) & 0xFF;
        code[4] = '\0';
        return string(code);
    }
}

VideoFrameSource::VideoFrameSource(const CaptureConfig &config) : config(config)
{
}

VideoFrameSource::~VideoFrameSource()
{
    release();
}

string VideoFrameSource::describe() const
{
    string kind = camera::isVideoFile(config.source)       ? "video"
                  : camera::isImageSequence(config.source) ? "image sequence"
                                                           : "device";
    return kind + " " + config.source;
}

bool VideoFrameSource::open()
{
    release();
    log_debug("Opening " + describe());

    if (camera::isVideoFile(config.source) || camera::isImageSequence(config.source))
    {
        cap.open(config.source);
    }
    else
    {
        cap.open(config.source, CAP_V4L2);
        cap.set(CAP_PROP_FRAME_WIDTH, config.width);
        cap.set(CAP_PROP_FRAME_HEIGHT, config.height);
        cap.set(CAP_PROP_FPS, config.fps);
        // Set MJPEG codec for better throughput at full HD
        int fourcc = VideoWriter::fourcc('M', 'J', 'P', 'G');
        cap.set(CAP_PROP_FOURCC, fourcc);

        log_debug("Requested " + log_string(config.width) + "x" + log_string(config.height) + " @ " + log_string(config.fps) + " FPS" +
                  " (FOURCC: " + log_string_src(camera::decodeFourCC(fourcc)) + ")");
    }

    if (!cap.isOpened())
    {
        log_error("Failed to open " + describe());
        return false;
    }

    if (!camera::isVideoFile(config.source) && !camera::isImageSequence(config.source))
    {
        double actual_width = cap.get(CAP_PROP_FRAME_WIDTH);
        double actual_height = cap.get(CAP_PROP_FRAME_HEIGHT);
        double actual_fps = cap.get(CAP_PROP_FPS);

        log_debug("Device verification:");
        log_debug("  Resolution: " + log_string((int)actual_width) + "x" + log_string((int)actual_height) + " (expected: " + log_string(config.width) + "x" + log_string(config.height) + ")");
        log_debug("  FPS: " + log_string((int)actual_fps) + " (expected: " + log_string(config.fps) + ")");
        log_debug("  FOURCC: " + log_string_src(camera::decodeFourCC((int)cap.get(CAP_PROP_FOURCC))));
        log_debug("  Backend: " + log_string_src(cap.getBackendName()));
    }

    log_info("Frame source ready: " + describe());
    return true;
}

bool VideoFrameSource::read(Mat &frame)
{
    if (!cap.isOpened())
        return false;

    Mat raw;
    if (!cap.read(raw) || raw.empty())
        return false;

    if (config.crop.empty())
    {
        frame = raw;
        return true;
    }

    Region clipped = config.crop.clippedTo(raw.size());
    if (clipped.empty())
    {
        log_warning("Capture crop " + config.crop.toString() + " lies outside the " +
                    to_string(raw.cols) + "x" + to_string(raw.rows) + " frame");
        return false;
    }

    frame = raw(clipped.toRect()).clone();
    return true;
}

void VideoFrameSource::release()
{
    if (cap.isOpened())
    {
        cap.release();
        log_debug("Released " + describe());
    }
}
