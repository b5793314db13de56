#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "types.hpp"

struct CalibrationConfig {
  int baseline_frames{60};
  double baseline_percentile{25.0};

  // Preliminary threshold = max(baseline + stddev_multiplier * stdDev,
  //                             baseline + absolute_floor,
  //                             max_seen * max_seen_multiplier)
  double stddev_multiplier{5.0};
  double absolute_floor{50.0};
  double max_seen_multiplier{2.0};

  // Final threshold = baseline + (peak - baseline) * final_threshold_fraction
  double final_threshold_fraction{0.8};
};

// Two-phase live calibration:
//   IDLE -> COLLECTING_BASELINE            start()
//   COLLECTING_BASELINE -> AWAITING_...    after baseline_frames dark frames
//   AWAITING_... -> CAPTURING_...          first frame above the preliminary threshold
//   CAPTURING_... -> ARMED                 first frame back at or below it
// The calibration excursion itself is never reported as an event.
// Frames must be delivered from a single thread.
class CalibrationController {
public:
  explicit CalibrationController(CalibrationConfig cfg = {});

  // IDLE -> COLLECTING_BASELINE. Returns false in any other state.
  bool start();

  // BaselineProgress for every baseline frame, CalibrationComplete on arming,
  // nothing otherwise (including frames delivered while IDLE or ARMED).
  std::optional<EventResult> process_frame(double brightness, int64_t timestamp_ns);

  // Back to IDLE; drops every buffered sample and the threshold model.
  void reset();

  CalibrationState state() const { return state_; }
  bool armed() const { return state_ == CalibrationState::ARMED; }
  float baseline_progress() const;

  double baseline() const { return baseline_; }
  double preliminary_threshold() const { return preliminary_threshold_; }
  std::optional<ThresholdModel> model() const { return model_; }

  // Brightness of the frame that closed the calibration excursion.
  std::optional<double> last_calibration_frame() const { return closing_frame_; }

  const CalibrationConfig& config() const { return cfg_; }

private:
  CalibrationConfig cfg_;
  CalibrationState state_{CalibrationState::IDLE};

  std::vector<double> baseline_samples_;
  double baseline_{0.0};
  double std_dev_{0.0};
  double preliminary_threshold_{0.0};

  double calibration_peak_{0.0};
  int calibration_frames_{0};
  int64_t calibration_start_ns_{0};
  std::optional<double> closing_frame_;

  std::optional<ThresholdModel> model_;

  void finish_baseline();
  CalibrationComplete finish_calibration(int64_t timestamp_ns);
};
