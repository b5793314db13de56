#include "baseline_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace baseline_stats {

double mean(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  const double sum = std::accumulate(values.begin(), values.end(), 0.0);
  return sum / static_cast<double>(values.size());
}

double median(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  std::vector<double> v(values);
  std::sort(v.begin(), v.end());
  const size_t mid = v.size() / 2;
  if (v.size() % 2 == 0) return (v[mid - 1] + v[mid]) / 2.0;
  return v[mid];
}

double percentile(const std::vector<double>& values, double p) {
  if (values.empty()) return 0.0;
  std::vector<double> v(values);
  std::sort(v.begin(), v.end());
  p = std::clamp(p, 0.0, 100.0);
  const double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
  const size_t idx = std::min(v.size() - 1, static_cast<size_t>(std::floor(rank)));
  return v[idx];
}

double std_dev(const std::vector<double>& values) {
  if (values.size() < 2) return 0.0;
  const double m = mean(values);
  double acc = 0.0;
  for (double x : values) acc += (x - m) * (x - m);
  return std::sqrt(acc / static_cast<double>(values.size()));
}

double min_value(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  return *std::min_element(values.begin(), values.end());
}

double max_value(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  return *std::max_element(values.begin(), values.end());
}

}  // namespace baseline_stats
