#pragma once
#include <optional>
#include <string>
#include <vector>

#include "calibration_controller.hpp"
#include "live_session.hpp"
#include "report_writer.hpp"
#include "threshold_calculator.hpp"

struct AnalysisConfig {
  double recording_fps{240.0};
  bool use_weighted{true};
  std::optional<int> expected_events;
  std::vector<std::string> expected_speeds;
};

struct AppConfig {
  CalibrationConfig calibration;
  ThresholdConfig threshold;
  LiveConfig live;
  AnalysisConfig analysis;
  OutputConfig output_config;
  int metrics_port{9090};
};

AppConfig load_config(const std::string& path);
