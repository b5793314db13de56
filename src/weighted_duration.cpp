#include "weighted_duration.hpp"

#include <algorithm>

#include "baseline_statistics.hpp"

double weighted_duration_frames(const std::vector<double>& brightness_values, double baseline,
                                int64_t duration_frames) {
  if (brightness_values.empty()) return static_cast<double>(duration_frames);

  const double event_peak = baseline_stats::median(brightness_values);
  if (event_peak <= baseline) return static_cast<double>(duration_frames);

  const double range = event_peak - baseline;
  double total = 0.0;
  for (double b : brightness_values) {
    total += std::clamp((b - baseline) / range, 0.0, 1.0);
  }
  return total;
}
