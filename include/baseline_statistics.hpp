#pragma once
#include <vector>

// Order statistics over a finite brightness window. Every function returns 0.0
// for an empty window; callers guard the thresholds they derive from it.
namespace baseline_stats {

double mean(const std::vector<double>& values);
double median(const std::vector<double>& values);

// Non-interpolated rank: sorted[floor(p / 100 * (n - 1))], p clamped to [0, 100].
double percentile(const std::vector<double>& values, double p);

// Population standard deviation.
double std_dev(const std::vector<double>& values);

double min_value(const std::vector<double>& values);
double max_value(const std::vector<double>& values);

}  // namespace baseline_stats
