#include "calibration_controller.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "baseline_statistics.hpp"
#include "threshold_calculator.hpp"

CalibrationController::CalibrationController(CalibrationConfig cfg) : cfg_(cfg) {
  if (cfg_.baseline_frames < 1) {
    spdlog::warn("baseline_frames={} is not usable; collecting 1 frame", cfg_.baseline_frames);
    cfg_.baseline_frames = 1;
  }
}

bool CalibrationController::start() {
  if (state_ != CalibrationState::IDLE) return false;
  baseline_samples_.clear();
  baseline_samples_.reserve(static_cast<size_t>(cfg_.baseline_frames));
  state_ = CalibrationState::COLLECTING_BASELINE;
  spdlog::info("Calibration started: collecting {} baseline frames", cfg_.baseline_frames);
  return true;
}

std::optional<EventResult> CalibrationController::process_frame(double brightness,
                                                                int64_t timestamp_ns) {
  switch (state_) {
    case CalibrationState::IDLE:
    case CalibrationState::ARMED:
      return std::nullopt;

    case CalibrationState::COLLECTING_BASELINE:
      baseline_samples_.push_back(brightness);
      if (static_cast<int>(baseline_samples_.size()) >= cfg_.baseline_frames) {
        finish_baseline();
        return BaselineProgress{1.0f};
      }
      return BaselineProgress{baseline_progress()};

    case CalibrationState::AWAITING_CALIBRATION_SHUTTER:
      if (brightness > preliminary_threshold_) {
        state_ = CalibrationState::CAPTURING_CALIBRATION_EVENT;
        calibration_peak_ = brightness;
        calibration_frames_ = 1;
        calibration_start_ns_ = timestamp_ns;
        spdlog::debug("Calibration shutter opened at {:.2f}", brightness);
      }
      return std::nullopt;

    case CalibrationState::CAPTURING_CALIBRATION_EVENT:
      if (brightness > preliminary_threshold_) {
        calibration_peak_ = std::max(calibration_peak_, brightness);
        calibration_frames_++;
        return std::nullopt;
      }
      closing_frame_ = brightness;
      return finish_calibration(timestamp_ns);
  }
  return std::nullopt;
}

void CalibrationController::reset() {
  state_ = CalibrationState::IDLE;
  baseline_samples_.clear();
  baseline_samples_.shrink_to_fit();
  baseline_ = 0.0;
  std_dev_ = 0.0;
  preliminary_threshold_ = 0.0;
  calibration_peak_ = 0.0;
  calibration_frames_ = 0;
  calibration_start_ns_ = 0;
  closing_frame_.reset();
  model_.reset();
}

float CalibrationController::baseline_progress() const {
  switch (state_) {
    case CalibrationState::IDLE:
      return 0.0f;
    case CalibrationState::COLLECTING_BASELINE:
      return static_cast<float>(baseline_samples_.size()) /
             static_cast<float>(cfg_.baseline_frames);
    default:
      return 1.0f;
  }
}

void CalibrationController::finish_baseline() {
  baseline_ = baseline_stats::percentile(baseline_samples_, cfg_.baseline_percentile);
  std_dev_ = baseline_stats::std_dev(baseline_samples_);
  const double max_seen = baseline_stats::max_value(baseline_samples_);

  preliminary_threshold_ = std::max({baseline_ + cfg_.stddev_multiplier * std_dev_,
                                     baseline_ + cfg_.absolute_floor,
                                     max_seen * cfg_.max_seen_multiplier});

  baseline_samples_.clear();
  baseline_samples_.shrink_to_fit();
  state_ = CalibrationState::AWAITING_CALIBRATION_SHUTTER;
  spdlog::info("Baseline complete: baseline={:.2f} stddev={:.2f} max={:.2f} preliminary={:.2f}",
               baseline_, std_dev_, max_seen, preliminary_threshold_);
}

CalibrationComplete CalibrationController::finish_calibration(int64_t timestamp_ns) {
  ThresholdModel m;
  m.baseline = baseline_;
  m.peak = calibration_peak_;
  m.std_dev = std_dev_;
  m.threshold = ThresholdCalculator::ensure_above_baseline(
      baseline_ + (calibration_peak_ - baseline_) * cfg_.final_threshold_fraction, baseline_,
      calibration_peak_, cfg_.absolute_floor);
  model_ = m;

  state_ = CalibrationState::ARMED;
  spdlog::info("Calibration armed: peak={:.2f} threshold={:.2f} ({} frames, {:.1f} ms)",
               calibration_peak_, m.threshold, calibration_frames_,
               static_cast<double>(timestamp_ns - calibration_start_ns_) / 1e6);
  return CalibrationComplete{m};
}
