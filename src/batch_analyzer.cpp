#include "batch_analyzer.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

BatchAnalysis BatchAnalyzer::analyze(const std::vector<double>& series, double recording_fps,
                                     ThresholdMethod method,
                                     std::optional<int> expected_event_count) const {
  BatchAnalysis a;
  a.recording_fps = recording_fps;

  if (!(recording_fps > 0.0) || !std::isfinite(recording_fps)) {
    a.status = AnalysisStatus::INVALID_FRAME_RATE;
    a.reason = "recording fps must be a positive number";
    spdlog::error("Batch analysis rejected: {}", a.reason);
    return a;
  }

  ThresholdResult t = thresholds_.calculate(series, method, expected_event_count);
  if (!t.ok()) {
    a.status = t.status;
    a.reason = t.reason;
    spdlog::error("Batch analysis rejected: {}", a.reason);
    return a;
  }
  a.model = t.model;

  a.events = finder_.find_events(series, a.model);
  a.model.peak = BatchEventFinder::calculate_peak_brightness(a.events);
  for (auto& ev : a.events) ev.peak_brightness = a.model.peak;

  spdlog::info("Analyzed {} frames @ {:.1f} fps ({}): baseline={:.2f} threshold={:.2f} events={}",
               series.size(), recording_fps, to_string(method), a.model.baseline,
               a.model.threshold, a.events.size());
  return a;
}

std::vector<SpeedResult> BatchAnalyzer::evaluate(const BatchAnalysis& analysis,
                                                 const std::vector<std::string>& expected_speeds,
                                                 bool use_weighted,
                                                 std::optional<double> playback_fps) const {
  if (!analysis.ok()) return {};
  if (playback_fps) {
    return speeds_.group_events(analysis.events, expected_speeds, *playback_fps, use_weighted,
                                analysis.recording_fps);
  }
  return speeds_.group_events(analysis.events, expected_speeds, analysis.recording_fps,
                              use_weighted);
}
