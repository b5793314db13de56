#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using Clock = std::chrono::steady_clock;

struct BrightnessSample {
  double value{0.0};
  int64_t frame_index{0};
  int64_t timestamp_ns{0};
};

struct ThresholdModel {
  double baseline{0.0};
  double threshold{0.0};
  std::optional<double> peak;
  std::optional<double> std_dev;
};

enum class ThresholdMethod { PERCENTILE_MARGIN, ZSCORE, CLUSTERING };

enum class AnalysisStatus {
  OK,
  MISSING_EXPECTED_COUNT,
  INVALID_EXPECTED_COUNT,
  INVALID_FRAME_RATE
};

enum class CalibrationState {
  IDLE,
  COLLECTING_BASELINE,
  AWAITING_CALIBRATION_SHUTTER,
  CAPTURING_CALIBRATION_EVENT,
  ARMED
};

// One maximal run of above-threshold frames.
struct ShutterEvent {
  int64_t start_frame{0};
  int64_t end_frame{0};
  std::vector<double> brightness_values;
  std::optional<double> baseline_brightness;
  std::optional<double> peak_brightness;
  bool unterminated{false};  // recording ended while the run was open

  int64_t duration_frames() const { return end_frame - start_frame + 1; }
  double weighted_duration_frames() const;
  double max_brightness() const;
  double avg_brightness() const;
};

struct SpeedResult {
  double measured_speed_denominator{0.0};
  double measured_duration_s{0.0};
  std::optional<std::string> expected_speed;
  std::optional<double> expected_duration_s;
  std::optional<double> deviation_percent;
};

// Live-mode results, one per processed frame at most.
struct BaselineProgress {
  float fraction{0.0f};
};

struct CalibrationComplete {
  ThresholdModel model;
};

struct EventDetected {
  ShutterEvent event;
};

using EventResult = std::variant<BaselineProgress, CalibrationComplete, EventDetected>;

std::string to_string(ThresholdMethod method);
std::optional<ThresholdMethod> parse_threshold_method(const std::string& name);
std::string to_string(AnalysisStatus status);
std::string to_string(CalibrationState state);
