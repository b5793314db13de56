#include "event_finder.hpp"

#include <spdlog/spdlog.h>

#include "baseline_statistics.hpp"

std::vector<ShutterEvent> BatchEventFinder::find_events(const std::vector<double>& series,
                                                        const ThresholdModel& model) const {
  std::vector<ShutterEvent> events;
  std::optional<ShutterEvent> current;

  const int64_t n = static_cast<int64_t>(series.size());
  for (int64_t i = 0; i < n; ++i) {
    const double value = series[static_cast<size_t>(i)];
    const bool open = value > model.threshold;

    if (open && !current) {
      current.emplace();
      current->start_frame = i;
      current->baseline_brightness = model.baseline;
      current->peak_brightness = model.peak;
      current->brightness_values.push_back(value);
    } else if (open) {
      current->brightness_values.push_back(value);
    } else if (current) {
      current->end_frame = i - 1;
      events.push_back(std::move(*current));
      current.reset();
    }
  }

  if (current) {
    current->end_frame = n - 1;
    current->unterminated = true;
    spdlog::warn("Series ended with shutter open (event from frame {} is unterminated)",
                 current->start_frame);
    events.push_back(std::move(*current));
  }

  spdlog::debug("Found {} events above threshold {:.2f}", events.size(), model.threshold);
  return events;
}

size_t BatchEventFinder::count_events(const std::vector<double>& series, double threshold) {
  size_t count = 0;
  bool open = false;
  for (double value : series) {
    const bool now_open = value > threshold;
    if (now_open && !open) count++;
    open = now_open;
  }
  return count;
}

std::optional<double> BatchEventFinder::calculate_peak_brightness(
    const std::vector<ShutterEvent>& events, double plateau_fraction, int min_plateau_frames) {
  if (events.empty()) return std::nullopt;

  std::vector<double> plateau_means;
  std::vector<double> all_samples;
  for (const auto& ev : events) {
    if (ev.brightness_values.empty()) continue;
    all_samples.insert(all_samples.end(), ev.brightness_values.begin(),
                       ev.brightness_values.end());

    const double cutoff = ev.max_brightness() * plateau_fraction;
    std::vector<double> plateau;
    for (double b : ev.brightness_values) {
      if (b >= cutoff) plateau.push_back(b);
    }
    if (static_cast<int>(plateau.size()) >= min_plateau_frames) {
      plateau_means.push_back(baseline_stats::mean(plateau));
    }
  }

  if (!plateau_means.empty()) return baseline_stats::median(plateau_means);
  if (!all_samples.empty()) return baseline_stats::percentile(all_samples, 95);
  return std::nullopt;
}
