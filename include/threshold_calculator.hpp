#pragma once
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

struct ThresholdConfig {
  ThresholdMethod method{ThresholdMethod::PERCENTILE_MARGIN};
  double baseline_percentile{25.0};
  double margin_factor{1.5};

  // Z-score search range, inclusive at both ends.
  double zscore_min{1.0};
  double zscore_max{5.0};
  int zscore_steps{40};

  // Clustering tries k = 2..max_clusters.
  int max_clusters{4};

  // Last-resort gap above the baseline when the samples carry no spread at all.
  double fallback_offset{50.0};
};

struct ThresholdResult {
  AnalysisStatus status{AnalysisStatus::OK};
  ThresholdModel model;
  std::string reason;

  bool ok() const { return status == AnalysisStatus::OK; }
};

class ThresholdCalculator {
public:
  explicit ThresholdCalculator(ThresholdConfig cfg = {}) : cfg_(cfg) {}

  // Baseline and threshold for the configured method. Z-score and clustering
  // need expected_event_count and report MISSING_EXPECTED_COUNT without it.
  ThresholdResult calculate(const std::vector<double>& samples,
                            std::optional<int> expected_event_count = std::nullopt) const;

  ThresholdResult calculate(const std::vector<double>& samples, ThresholdMethod method,
                            std::optional<int> expected_event_count = std::nullopt) const;

  const ThresholdConfig& config() const { return cfg_; }

  // Degenerate-input policy shared by all methods: a threshold not above the
  // baseline moves to 10% of the way to the maximum, then to baseline + offset.
  static double ensure_above_baseline(double threshold, double baseline, double max_seen,
                                      double fallback_offset);

private:
  ThresholdConfig cfg_;

  double percentile_margin(const std::vector<double>& samples, double baseline) const;
  double zscore(const std::vector<double>& samples, int expected_events) const;
  double clustering(const std::vector<double>& samples, int expected_events) const;
};
