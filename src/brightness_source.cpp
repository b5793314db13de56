#include "brightness_source.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <optional>

#include "types.hpp"

double frame_brightness(const cv::Mat& frame) {
  if (frame.empty()) return 0.0;
  if (frame.channels() == 1) return cv::mean(frame)[0];

  cv::Mat gray;
  cv::cvtColor(frame, gray, frame.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
  return cv::mean(gray)[0];
}

bool load_brightness_series(const std::string& path, BrightnessSeries& out) {
  std::ifstream in(path);
  if (!in.is_open()) {
    spdlog::error("Failed to open brightness series: {}", path);
    return false;
  }

  out.values.clear();
  std::string line;
  size_t skipped = 0;
  while (std::getline(in, line)) {
    const auto comma = line.find_last_of(',');
    std::string field = comma == std::string::npos ? line : line.substr(comma + 1);
    field.erase(std::remove_if(field.begin(), field.end(),
                               [](unsigned char c) { return std::isspace(c); }),
                field.end());
    if (field.empty()) continue;

    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(field.c_str(), &end);
    if (errno != 0 || end != field.c_str() + field.size()) {
      skipped++;
      continue;
    }
    out.values.push_back(v);
  }

  spdlog::info("Loaded {} samples from {} ({} lines skipped)", out.values.size(), path, skipped);
  return true;
}

bool open_video_source(const std::string& uri, cv::VideoCapture& cap) {
  const bool opened = is_live_uri(uri) ? cap.open(0) : cap.open(uri);
  if (!opened || !cap.isOpened()) {
    spdlog::error("Failed to open input: {}", uri);
    return false;
  }
  return true;
}

size_t stream_brightness(cv::VideoCapture& cap, const FrameCallback& on_frame) {
  size_t delivered = 0;
  std::optional<bool> device_clock;
  cv::Mat frame;
  while (cap.read(frame) && !frame.empty()) {
    const double pos_ms = cap.get(cv::CAP_PROP_POS_MSEC);
    if (!device_clock) {
      device_clock = pos_ms > 0.0;
      spdlog::debug("Frame timestamps from the {} clock", *device_clock ? "capture" : "host");
    }

    int64_t ts = 0;
    if (*device_clock) {
      ts = static_cast<int64_t>(std::llround(pos_ms * 1e6));
    } else {
      ts = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now().time_since_epoch())
               .count();
    }
    delivered++;
    if (!on_frame(frame_brightness(frame), ts)) break;
  }
  return delivered;
}

bool read_video_brightness(const std::string& uri, BrightnessSeries& out, size_t max_frames) {
  cv::VideoCapture cap;
  if (!open_video_source(uri, cap)) return false;

  out.values.clear();
  out.fps = cap.get(cv::CAP_PROP_FPS);
  spdlog::info("Reading brightness from '{}' (~{:.1f} fps)", uri, out.fps);

  stream_brightness(cap, [&](double brightness, int64_t) {
    out.values.push_back(brightness);
    if (out.values.size() % 1000 == 0) spdlog::debug("Read {} frames", out.values.size());
    return max_frames == 0 || out.values.size() < max_frames;
  });

  spdlog::info("End of stream after {} frames", out.values.size());
  return true;
}

bool is_live_uri(const std::string& uri) { return uri == "0"; }

bool is_video_uri(const std::string& uri) {
  if (is_live_uri(uri)) return true;
  const auto dot = uri.find_last_of('.');
  if (dot == std::string::npos) return false;
  std::string ext = uri.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == "mp4" || ext == "mov" || ext == "avi" || ext == "mkv" || ext == "m4v";
}
