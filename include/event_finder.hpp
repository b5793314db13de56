#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "types.hpp"

// Offline scan of a complete brightness series. A frame is open iff its value is
// strictly above the threshold; every maximal open run becomes one ShutterEvent.
class BatchEventFinder {
public:
  // Events carry model.baseline as their baseline and model.peak as their peak.
  // A run still open at the last sample is reported with unterminated = true.
  std::vector<ShutterEvent> find_events(const std::vector<double>& series,
                                        const ThresholdModel& model) const;

  // Number of open runs find_events would report, without building them.
  static size_t count_events(const std::vector<double>& series, double threshold);

  // Plateau analysis: per event, frames >= max * plateau_fraction form the
  // plateau; events with at least min_plateau_frames plateau frames contribute
  // their plateau mean and the median of those means is returned. Without any
  // qualifying event, the 95th percentile of all event samples is used.
  static std::optional<double> calculate_peak_brightness(const std::vector<ShutterEvent>& events,
                                                         double plateau_fraction = 0.90,
                                                         int min_plateau_frames = 10);
};
