#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "calibration_controller.hpp"
#include "live_event_detector.hpp"
#include "metrics.hpp"
#include "types.hpp"

struct LiveConfig {
  double recording_fps{240.0};
  double frame_budget_us{1000.0};
};

// Immutable view of a live session for observer threads.
struct SessionSnapshot {
  CalibrationState state{CalibrationState::IDLE};
  float baseline_progress{0.0f};
  double preliminary_threshold{0.0};
  std::optional<ThresholdModel> model;
  bool event_in_progress{false};
  uint64_t frames_processed{0};
  std::optional<BrightnessSample> last_sample;
  std::shared_ptr<const std::vector<ShutterEvent>> events;  // never null
};

// One recording session: calibration first, then live detection with the
// calibrated threshold. process_frame/start/reset/finish belong to the single
// frame-producer thread; snapshot() may be called from any thread.
class LiveSession {
public:
  LiveSession(LiveConfig cfg, CalibrationConfig cal_cfg, MetricsRegistry& metrics);

  bool start();
  std::optional<EventResult> process_frame(double brightness, int64_t timestamp_ns);

  // Reports an event still open when the recording stops as unterminated.
  std::optional<EventResult> finish();

  // Full reset to IDLE: calibration, events and the time reference are dropped.
  void reset();

  // Clears detected events only. The armed threshold and the time reference
  // used for frame indices are kept.
  void reset_events();

  // New zero point for frame indices, e.g. when a new recording file starts.
  void mark_recording_start(int64_t timestamp_ns) { reference_ns_ = timestamp_ns; }

  std::shared_ptr<const SessionSnapshot> snapshot() const;

  CalibrationState state() const { return calibration_.state(); }
  const std::vector<ShutterEvent>& events() const { return *events_; }
  const LiveConfig& config() const { return cfg_; }

  // Nearest frame index of a timestamp relative to the recording start, clamped at 0.
  static int64_t timestamp_to_frame(int64_t timestamp_ns, int64_t reference_ns, double fps);

private:
  LiveConfig cfg_;
  CalibrationController calibration_;
  LiveEventDetector detector_;
  MetricsRegistry& metrics_;

  std::optional<int64_t> reference_ns_;
  uint64_t frames_processed_{0};
  std::optional<BrightnessSample> last_sample_;
  std::shared_ptr<const std::vector<ShutterEvent>> events_;

  mutable std::mutex snap_mu_;
  std::shared_ptr<const SessionSnapshot> snapshot_;

  void append_event(const ShutterEvent& ev);
  void publish();
};
