#pragma once
#include <optional>
#include <string>
#include <vector>

#include "event_finder.hpp"
#include "speed_calculator.hpp"
#include "threshold_calculator.hpp"
#include "types.hpp"

struct BatchAnalysis {
  AnalysisStatus status{AnalysisStatus::OK};
  std::string reason;
  double recording_fps{0.0};
  ThresholdModel model;
  std::vector<ShutterEvent> events;

  bool ok() const { return status == AnalysisStatus::OK; }
};

// Offline re-analysis of a fully recorded brightness series: one threshold pass,
// one event scan, then plateau peak brightness over the events found.
class BatchAnalyzer {
public:
  explicit BatchAnalyzer(ThresholdConfig cfg = {}) : thresholds_(cfg) {}

  BatchAnalysis analyze(const std::vector<double>& series, double recording_fps,
                        ThresholdMethod method,
                        std::optional<int> expected_event_count = std::nullopt) const;

  BatchAnalysis analyze(const std::vector<double>& series, double recording_fps,
                        std::optional<int> expected_event_count = std::nullopt) const {
    return analyze(series, recording_fps, thresholds_.config().method, expected_event_count);
  }

  // Speed results for every event, paired positionally with expected_speeds.
  // playback_fps is the container rate of a slow-motion file whose frames were
  // captured at analysis.recording_fps.
  std::vector<SpeedResult> evaluate(const BatchAnalysis& analysis,
                                    const std::vector<std::string>& expected_speeds = {},
                                    bool use_weighted = true,
                                    std::optional<double> playback_fps = std::nullopt) const;

private:
  ThresholdCalculator thresholds_;
  BatchEventFinder finder_;
  SpeedCalculator speeds_;
};
