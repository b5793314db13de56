#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["calibration"]) {
    auto n = y["calibration"];
    if (n["baseline_frames"]) c.calibration.baseline_frames = n["baseline_frames"].as<int>();
    if (n["baseline_percentile"])
      c.calibration.baseline_percentile = n["baseline_percentile"].as<double>();
    if (n["stddev_multiplier"])
      c.calibration.stddev_multiplier = n["stddev_multiplier"].as<double>();
    if (n["absolute_floor"]) c.calibration.absolute_floor = n["absolute_floor"].as<double>();
    if (n["max_seen_multiplier"])
      c.calibration.max_seen_multiplier = n["max_seen_multiplier"].as<double>();
    if (n["final_threshold_fraction"])
      c.calibration.final_threshold_fraction = n["final_threshold_fraction"].as<double>();
  }

  if (y["threshold"]) {
    auto n = y["threshold"];
    if (n["method"]) {
      const auto name = n["method"].as<std::string>();
      auto method = parse_threshold_method(name);
      if (!method) throw std::runtime_error("Unknown threshold method: " + name);
      c.threshold.method = *method;
    }
    if (n["baseline_percentile"])
      c.threshold.baseline_percentile = n["baseline_percentile"].as<double>();
    if (n["margin_factor"]) c.threshold.margin_factor = n["margin_factor"].as<double>();
    if (n["zscore_min"]) c.threshold.zscore_min = n["zscore_min"].as<double>();
    if (n["zscore_max"]) c.threshold.zscore_max = n["zscore_max"].as<double>();
    if (n["zscore_steps"]) c.threshold.zscore_steps = n["zscore_steps"].as<int>();
    if (n["max_clusters"]) c.threshold.max_clusters = n["max_clusters"].as<int>();
    if (n["fallback_offset"]) c.threshold.fallback_offset = n["fallback_offset"].as<double>();
  }

  if (y["live"]) {
    auto n = y["live"];
    if (n["recording_fps"]) c.live.recording_fps = n["recording_fps"].as<double>();
    if (n["frame_budget_us"]) c.live.frame_budget_us = n["frame_budget_us"].as<double>();
  }

  if (y["analysis"]) {
    auto n = y["analysis"];
    if (n["recording_fps"]) c.analysis.recording_fps = n["recording_fps"].as<double>();
    if (n["use_weighted"]) c.analysis.use_weighted = n["use_weighted"].as<bool>();
    if (n["expected_events"]) c.analysis.expected_events = n["expected_events"].as<int>();
    if (n["expected_speeds"]) {
      c.analysis.expected_speeds.clear();
      for (const auto& speed : n["expected_speeds"]) {
        c.analysis.expected_speeds.push_back(speed.as<std::string>());
      }
    }
  }

  if (y["output"]) {
    auto output = y["output"];
    if (output["log_level"]) c.output_config.log_level = output["log_level"].as<std::string>();
    if (output["verbose_logging"])
      c.output_config.verbose_logging = output["verbose_logging"].as<bool>();

    if (output["json"]) {
      auto json = output["json"];
      if (json["enable"]) c.output_config.enable_json_report = json["enable"].as<bool>();
      if (json["path"]) c.output_config.json_output_path = json["path"].as<std::string>();
    }
    if (output["csv"]) {
      auto csv = output["csv"];
      if (csv["enable"]) c.output_config.enable_csv_report = csv["enable"].as<bool>();
      if (csv["path"]) c.output_config.csv_output_path = csv["path"].as<std::string>();
    }
  }

  if (y["telemetry"] && y["telemetry"]["metrics_port"])
    c.metrics_port = y["telemetry"]["metrics_port"].as<int>();

  spdlog::debug("Configuration loaded from {}", path);
  return c;
}
