#include "threshold_calculator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <opencv2/core.hpp>

#include "baseline_statistics.hpp"
#include "event_finder.hpp"

namespace {

// Sorted cluster means of a 1-D k-means partition; empty when OpenCV rejects the input.
std::vector<double> kmeans_1d_centers(const std::vector<double>& values, int clusters) {
  std::vector<double> result;
  if (values.size() < static_cast<size_t>(clusters) || clusters <= 0) return result;

  cv::Mat samples(static_cast<int>(values.size()), 1, CV_32F);
  for (size_t i = 0; i < values.size(); ++i) {
    samples.at<float>(static_cast<int>(i), 0) = static_cast<float>(values[i]);
  }

  // Seed from an equal-count split of the sorted values so the partition never
  // depends on cv::theRNG(); one attempt, since later attempts reseed randomly.
  std::vector<size_t> order(values.size());
  for (size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return values[a] < values[b]; });
  cv::Mat labels(static_cast<int>(values.size()), 1, CV_32S);
  for (size_t rank = 0; rank < order.size(); ++rank) {
    labels.at<int>(static_cast<int>(order[rank]), 0) =
        static_cast<int>(rank * static_cast<size_t>(clusters) / order.size());
  }

  cv::Mat centers;
  const cv::TermCriteria criteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER, 100, 1e-4);
  try {
    cv::kmeans(samples, clusters, labels, criteria, 1, cv::KMEANS_USE_INITIAL_LABELS, centers);
  } catch (const cv::Exception& e) {
    spdlog::warn("k-means with k={} failed: {}", clusters, e.what());
    return result;
  }
  if (centers.rows != clusters) return result;

  // Cluster means from the assignment rather than the float centers.
  std::vector<double> sums(static_cast<size_t>(clusters), 0.0);
  std::vector<int> counts(static_cast<size_t>(clusters), 0);
  for (int i = 0; i < labels.rows; ++i) {
    const int label = labels.at<int>(i, 0);
    sums[static_cast<size_t>(label)] += values[static_cast<size_t>(i)];
    counts[static_cast<size_t>(label)]++;
  }
  for (int k = 0; k < clusters; ++k) {
    if (counts[static_cast<size_t>(k)] > 0) {
      result.push_back(sums[static_cast<size_t>(k)] / counts[static_cast<size_t>(k)]);
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

}  // namespace

ThresholdResult ThresholdCalculator::calculate(const std::vector<double>& samples,
                                               std::optional<int> expected_event_count) const {
  return calculate(samples, cfg_.method, expected_event_count);
}

ThresholdResult ThresholdCalculator::calculate(const std::vector<double>& samples,
                                               ThresholdMethod method,
                                               std::optional<int> expected_event_count) const {
  ThresholdResult r;
  r.model.baseline = baseline_stats::percentile(samples, cfg_.baseline_percentile);
  r.model.std_dev = baseline_stats::std_dev(samples);

  if (method != ThresholdMethod::PERCENTILE_MARGIN) {
    if (!expected_event_count) {
      r.status = AnalysisStatus::MISSING_EXPECTED_COUNT;
      r.reason = to_string(method) + " threshold requires an expected event count";
      return r;
    }
    if (*expected_event_count < 1) {
      r.status = AnalysisStatus::INVALID_EXPECTED_COUNT;
      r.reason = "expected event count must be at least 1";
      return r;
    }
  }

  double threshold = 0.0;
  switch (method) {
    case ThresholdMethod::PERCENTILE_MARGIN:
      threshold = percentile_margin(samples, r.model.baseline);
      break;
    case ThresholdMethod::ZSCORE:
      threshold = zscore(samples, *expected_event_count);
      break;
    case ThresholdMethod::CLUSTERING:
      threshold = clustering(samples, *expected_event_count);
      break;
  }

  r.model.threshold = ensure_above_baseline(threshold, r.model.baseline,
                                            baseline_stats::max_value(samples),
                                            cfg_.fallback_offset);
  r.reason = to_string(method);
  spdlog::debug("Threshold ({}) baseline={:.2f} threshold={:.2f} over {} samples", r.reason,
                r.model.baseline, r.model.threshold, samples.size());
  return r;
}

double ThresholdCalculator::ensure_above_baseline(double threshold, double baseline,
                                                  double max_seen, double fallback_offset) {
  if (threshold > baseline) return threshold;

  double t = baseline + (max_seen - baseline) * 0.1;
  if (t > baseline) {
    spdlog::warn("Threshold collapsed onto baseline {:.2f}; using 10% of range ({:.2f})", baseline,
                 t);
    return t;
  }

  t = baseline + fallback_offset;
  spdlog::warn("Uniform brightness at {:.2f}; using fixed threshold {:.2f}", baseline, t);
  return t;
}

double ThresholdCalculator::percentile_margin(const std::vector<double>& samples,
                                              double baseline) const {
  const double med = baseline_stats::median(samples);
  return baseline + (med - baseline) * cfg_.margin_factor;
}

double ThresholdCalculator::zscore(const std::vector<double>& samples, int expected_events) const {
  const double m = baseline_stats::mean(samples);
  const double sd = baseline_stats::std_dev(samples);
  if (sd < 1e-6) return m + 0.1;

  double best_threshold = m;
  long best_diff = std::numeric_limits<long>::max();
  const int steps = std::max(2, cfg_.zscore_steps);
  for (int i = 0; i < steps; ++i) {
    const double z =
        cfg_.zscore_min + (cfg_.zscore_max - cfg_.zscore_min) * i / static_cast<double>(steps - 1);
    const double threshold = m + z * sd;
    const long count = static_cast<long>(BatchEventFinder::count_events(samples, threshold));
    const long diff = std::labs(count - expected_events);
    if (diff < best_diff) {
      best_diff = diff;
      best_threshold = threshold;
    }
  }
  return best_threshold;
}

double ThresholdCalculator::clustering(const std::vector<double>& samples,
                                       int expected_events) const {
  const double lo = baseline_stats::min_value(samples);
  const double hi = baseline_stats::max_value(samples);
  if (samples.empty() || hi - lo < 1e-6) {
    const double share =
        samples.empty() ? 0.0 : expected_events / static_cast<double>(samples.size()) * 100.0;
    return baseline_stats::percentile(samples, 100.0 - share);
  }

  std::optional<double> best_threshold;
  long best_diff = std::numeric_limits<long>::max();
  for (int k = 2; k <= std::max(2, cfg_.max_clusters); ++k) {
    const auto centers = kmeans_1d_centers(samples, k);
    for (size_t i = 0; i + 1 < centers.size(); ++i) {
      const double threshold = (centers[i] + centers[i + 1]) / 2.0;
      const long count = static_cast<long>(BatchEventFinder::count_events(samples, threshold));
      const long diff = std::labs(count - expected_events);
      if (diff < best_diff) {
        best_diff = diff;
        best_threshold = threshold;
      }
    }
  }

  if (!best_threshold) {
    spdlog::warn("Clustering found no brightness split; using percentile margin");
    return percentile_margin(samples, baseline_stats::percentile(samples, cfg_.baseline_percentile));
  }
  return *best_threshold;
}
