#include "live_event_detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

void LiveEventDetector::arm(const ThresholdModel& model, bool settle_first) {
  model_ = model;
  phase_ = Phase::WAITING_FOR_EVENT;
  settling_ = settle_first;
  accumulator_.clear();
  event_count_ = 0;
}

void LiveEventDetector::disarm() {
  phase_ = Phase::DISARMED;
  model_.reset();
  settling_ = false;
  accumulator_.clear();
  event_count_ = 0;
}

std::optional<ShutterEvent> LiveEventDetector::process_frame(double brightness,
                                                             int64_t frame_index) {
  if (phase_ == Phase::DISARMED) return std::nullopt;

  const bool open = brightness > model_->threshold;
  std::optional<ShutterEvent> result;

  if (settling_) {
    if (!open) settling_ = false;
  } else if (phase_ == Phase::WAITING_FOR_EVENT) {
    if (open) {
      phase_ = Phase::EVENT_IN_PROGRESS;
      start_frame_ = frame_index;
      accumulator_.clear();
      accumulator_.push_back(brightness);
    }
  } else if (open) {
    accumulator_.push_back(brightness);
  } else {
    result = close_event(last_frame_, false);
  }

  last_frame_ = frame_index;
  return result;
}

std::optional<ShutterEvent> LiveEventDetector::flush() {
  if (phase_ != Phase::EVENT_IN_PROGRESS) return std::nullopt;
  return close_event(last_frame_, true);
}

void LiveEventDetector::reset_events() {
  if (phase_ == Phase::DISARMED) return;
  phase_ = Phase::WAITING_FOR_EVENT;
  accumulator_.clear();
  event_count_ = 0;
}

ShutterEvent LiveEventDetector::close_event(int64_t end_frame, bool unterminated) {
  ShutterEvent ev;
  ev.start_frame = start_frame_;
  ev.end_frame = std::max(end_frame, start_frame_);
  ev.brightness_values = std::move(accumulator_);
  ev.baseline_brightness = model_->baseline;
  ev.peak_brightness = ev.max_brightness();
  ev.unterminated = unterminated;
  accumulator_.clear();

  phase_ = Phase::WAITING_FOR_EVENT;
  event_count_++;
  spdlog::debug("Event {} detected: frames {}-{} ({} samples{})", event_count_, ev.start_frame,
                ev.end_frame, ev.brightness_values.size(), unterminated ? ", unterminated" : "");
  return ev;
}
