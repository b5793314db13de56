#include "types.hpp"

#include <algorithm>
#include <cctype>

#include "baseline_statistics.hpp"
#include "weighted_duration.hpp"

double ShutterEvent::weighted_duration_frames() const {
  if (!baseline_brightness) return static_cast<double>(duration_frames());
  return ::weighted_duration_frames(brightness_values, *baseline_brightness, duration_frames());
}

double ShutterEvent::max_brightness() const { return baseline_stats::max_value(brightness_values); }

double ShutterEvent::avg_brightness() const { return baseline_stats::mean(brightness_values); }

std::string to_string(ThresholdMethod method) {
  switch (method) {
    case ThresholdMethod::PERCENTILE_MARGIN:
      return "percentile";
    case ThresholdMethod::ZSCORE:
      return "zscore";
    case ThresholdMethod::CLUSTERING:
      return "clustering";
  }
  return "unknown";
}

std::optional<ThresholdMethod> parse_threshold_method(const std::string& name) {
  std::string n(name);
  std::transform(n.begin(), n.end(), n.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (n == "percentile" || n == "percentile_margin" || n == "margin")
    return ThresholdMethod::PERCENTILE_MARGIN;
  if (n == "zscore" || n == "z-score") return ThresholdMethod::ZSCORE;
  if (n == "clustering" || n == "kmeans") return ThresholdMethod::CLUSTERING;
  return std::nullopt;
}

std::string to_string(AnalysisStatus status) {
  switch (status) {
    case AnalysisStatus::OK:
      return "ok";
    case AnalysisStatus::MISSING_EXPECTED_COUNT:
      return "missing_expected_count";
    case AnalysisStatus::INVALID_EXPECTED_COUNT:
      return "invalid_expected_count";
    case AnalysisStatus::INVALID_FRAME_RATE:
      return "invalid_frame_rate";
  }
  return "unknown";
}

std::string to_string(CalibrationState state) {
  switch (state) {
    case CalibrationState::IDLE:
      return "idle";
    case CalibrationState::COLLECTING_BASELINE:
      return "collecting_baseline";
    case CalibrationState::AWAITING_CALIBRATION_SHUTTER:
      return "awaiting_calibration_shutter";
    case CalibrationState::CAPTURING_CALIBRATION_EVENT:
      return "capturing_calibration_event";
    case CalibrationState::ARMED:
      return "armed";
  }
  return "unknown";
}
