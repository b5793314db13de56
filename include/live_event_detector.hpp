#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "types.hpp"

// Per-frame open/closed classification once calibration has produced a
// threshold. There is no maximum event length: an open event waits for the
// brightness to drop however long that takes.
class LiveEventDetector {
public:
  enum class Phase { DISARMED, WAITING_FOR_EVENT, EVENT_IN_PROGRESS };

  // settle_first: ignore frames until one is at or below the threshold, so a
  // run already in progress when arming is never reported.
  void arm(const ThresholdModel& model, bool settle_first = false);
  void disarm();

  // Emits the completed event on the first frame back at or below the
  // threshold; end_frame is the index of the previous frame.
  std::optional<ShutterEvent> process_frame(double brightness, int64_t frame_index);

  // Closes an event still in progress at end of recording (unterminated = true).
  std::optional<ShutterEvent> flush();

  // Drops the in-progress run and the event count; the threshold stays armed.
  void reset_events();

  Phase phase() const { return phase_; }
  bool armed() const { return phase_ != Phase::DISARMED; }
  bool event_in_progress() const { return phase_ == Phase::EVENT_IN_PROGRESS; }
  bool settling() const { return settling_; }
  const std::optional<ThresholdModel>& model() const { return model_; }
  int detected_event_count() const { return event_count_; }

private:
  Phase phase_{Phase::DISARMED};
  std::optional<ThresholdModel> model_;
  bool settling_{false};

  int64_t start_frame_{0};
  int64_t last_frame_{0};
  std::vector<double> accumulator_;
  int event_count_{0};

  ShutterEvent close_event(int64_t end_frame, bool unterminated);
};
