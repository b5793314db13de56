#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "batch_analyzer.hpp"
#include "live_session.hpp"
#include "types.hpp"

struct OutputConfig {
  std::string log_level = "info";
  bool verbose_logging = false;  // log every event's samples

  bool enable_json_report = true;
  std::string json_output_path = "output/shutter_report.json";

  bool enable_csv_report = false;
  std::string csv_output_path = "output/shutter_events.csv";
};

void to_json(nlohmann::json& j, const ThresholdModel& m);
void to_json(nlohmann::json& j, const ShutterEvent& e);
void to_json(nlohmann::json& j, const SpeedResult& r);
void to_json(nlohmann::json& j, const SessionSnapshot& s);

// Applies output.log_level to the default spdlog logger. Called once at
// startup; ReportWriter itself never changes the process-wide level.
void apply_log_level(const std::string& level);

class ReportWriter {
public:
  explicit ReportWriter(const OutputConfig& config);

  // Results table on the log.
  void log_results(const std::vector<ShutterEvent>& events,
                   const std::vector<SpeedResult>& results) const;

  nlohmann::json build_report(const std::string& source, const BatchAnalysis& analysis,
                              const std::vector<SpeedResult>& results) const;

  // Writes whichever reports are enabled; false if any enabled report failed.
  bool write(const std::string& source, const BatchAnalysis& analysis,
             const std::vector<SpeedResult>& results) const;

  bool write_json(const nlohmann::json& report) const;
  bool write_csv(const std::vector<ShutterEvent>& events,
                 const std::vector<SpeedResult>& results) const;

private:
  OutputConfig config_;

  static void ensure_parent_directory(const std::string& path);
};
