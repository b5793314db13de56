#include "live_session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>

LiveSession::LiveSession(LiveConfig cfg, CalibrationConfig cal_cfg, MetricsRegistry& metrics)
    : cfg_(cfg), calibration_(cal_cfg), metrics_(metrics),
      events_(std::make_shared<const std::vector<ShutterEvent>>()) {
  publish();
}

bool LiveSession::start() {
  if (!calibration_.start()) return false;
  reference_ns_.reset();
  frames_processed_ = 0;
  publish();
  return true;
}

std::optional<EventResult> LiveSession::process_frame(double brightness, int64_t timestamp_ns) {
  if (calibration_.state() == CalibrationState::IDLE) return std::nullopt;

  const auto t0 = Clock::now();
  if (!reference_ns_) reference_ns_ = timestamp_ns;

  const int64_t frame_index =
      cfg_.recording_fps > 0.0
          ? timestamp_to_frame(timestamp_ns, *reference_ns_, cfg_.recording_fps)
          : static_cast<int64_t>(frames_processed_);

  std::optional<EventResult> result;
  if (!calibration_.armed()) {
    result = calibration_.process_frame(brightness, timestamp_ns);
    if (result && std::holds_alternative<CalibrationComplete>(*result)) {
      const auto& model = std::get<CalibrationComplete>(*result).model;
      const bool tail = calibration_.last_calibration_frame().value_or(model.baseline) >
                        model.threshold;
      detector_.arm(model, tail);
    }
  } else if (auto ev = detector_.process_frame(brightness, frame_index)) {
    append_event(*ev);
    result = EventDetected{std::move(*ev)};
  }

  last_sample_ = BrightnessSample{brightness, frame_index, timestamp_ns};
  frames_processed_++;
  const double us = std::chrono::duration<double, std::micro>(Clock::now() - t0).count();
  metrics_.add_frame_time(us);
  publish();
  return result;
}

std::optional<EventResult> LiveSession::finish() {
  auto ev = detector_.flush();
  if (!ev) return std::nullopt;
  spdlog::warn("Recording stopped with shutter open; reporting frames {}-{} as unterminated",
               ev->start_frame, ev->end_frame);
  append_event(*ev);
  publish();
  return EventDetected{std::move(*ev)};
}

void LiveSession::reset() {
  calibration_.reset();
  detector_.disarm();
  reference_ns_.reset();
  frames_processed_ = 0;
  last_sample_.reset();
  events_ = std::make_shared<const std::vector<ShutterEvent>>();
  publish();
  spdlog::info("Live session reset");
}

void LiveSession::reset_events() {
  detector_.reset_events();
  events_ = std::make_shared<const std::vector<ShutterEvent>>();
  publish();
}

std::shared_ptr<const SessionSnapshot> LiveSession::snapshot() const {
  std::lock_guard<std::mutex> g(snap_mu_);
  return snapshot_;
}

int64_t LiveSession::timestamp_to_frame(int64_t timestamp_ns, int64_t reference_ns, double fps) {
  const double elapsed_s = static_cast<double>(timestamp_ns - reference_ns) / 1e9;
  return std::max<int64_t>(0, static_cast<int64_t>(std::llround(elapsed_s * fps)));
}

void LiveSession::append_event(const ShutterEvent& ev) {
  auto next = std::make_shared<std::vector<ShutterEvent>>(*events_);
  next->push_back(ev);
  events_ = std::move(next);
  metrics_.inc_event();
}

void LiveSession::publish() {
  auto s = std::make_shared<SessionSnapshot>();
  s->state = calibration_.state();
  s->baseline_progress = calibration_.baseline_progress();
  s->preliminary_threshold = calibration_.preliminary_threshold();
  s->model = calibration_.model();
  s->event_in_progress = detector_.event_in_progress();
  s->frames_processed = frames_processed_;
  s->last_sample = last_sample_;
  s->events = events_;

  std::lock_guard<std::mutex> g(snap_mu_);
  snapshot_ = std::move(s);
}
