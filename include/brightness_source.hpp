#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <string>
#include <vector>

struct BrightnessSeries {
  std::vector<double> values;
  double fps{0.0};  // 0 when the source carries no frame rate
};

// Mean grayscale level of a frame (BGR and BGRA are converted first); 0 for empty frames.
double frame_brightness(const cv::Mat& frame);

// Text/CSV with one sample per line; the last comma-separated column is the
// brightness. Lines that do not parse (headers, blanks) are skipped.
bool load_brightness_series(const std::string& path, BrightnessSeries& out);

// Called once per decoded frame with its brightness and a monotonic capture
// timestamp; returning false stops the stream.
using FrameCallback = std::function<bool(double brightness, int64_t timestamp_ns)>;

// Opens a video file, or camera 0 when uri == "0".
bool open_video_source(const std::string& uri, cv::VideoCapture& cap);

// Pulls frames one at a time until the stream ends or on_frame returns false.
// Frames are stamped with the backend's capture time (CAP_PROP_POS_MSEC) when
// the first frame reports a positive one, with the steady clock at grab time
// otherwise. Returns frames delivered.
size_t stream_brightness(cv::VideoCapture& cap, const FrameCallback& on_frame);

// Buffers every frame of a video file until max_frames (0 = until end of
// stream). Live devices never end; stream them with stream_brightness instead.
bool read_video_brightness(const std::string& uri, BrightnessSeries& out, size_t max_frames = 0);

bool is_video_uri(const std::string& uri);

// Camera index rather than a recorded file.
bool is_live_uri(const std::string& uri);
