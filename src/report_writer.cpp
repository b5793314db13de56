#include "report_writer.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

#include "speed_calculator.hpp"

void to_json(nlohmann::json& j, const ThresholdModel& m) {
  j = nlohmann::json{{"baseline", m.baseline}, {"threshold", m.threshold}};
  j["peak"] = m.peak ? nlohmann::json(*m.peak) : nlohmann::json(nullptr);
  j["std_dev"] = m.std_dev ? nlohmann::json(*m.std_dev) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const ShutterEvent& e) {
  j = nlohmann::json{{"start_frame", e.start_frame},
                     {"end_frame", e.end_frame},
                     {"duration_frames", e.duration_frames()},
                     {"weighted_duration_frames", e.weighted_duration_frames()},
                     {"max_brightness", e.max_brightness()},
                     {"avg_brightness", e.avg_brightness()},
                     {"unterminated", e.unterminated},
                     {"brightness_values", e.brightness_values}};
  j["baseline_brightness"] =
      e.baseline_brightness ? nlohmann::json(*e.baseline_brightness) : nlohmann::json(nullptr);
  j["peak_brightness"] =
      e.peak_brightness ? nlohmann::json(*e.peak_brightness) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const SpeedResult& r) {
  j = nlohmann::json{
      {"measured_speed", SpeedCalculator::format_shutter_speed(r.measured_speed_denominator)},
      {"measured_speed_denominator", r.measured_speed_denominator},
      {"measured_duration_s", r.measured_duration_s}};
  j["expected_speed"] =
      r.expected_speed ? nlohmann::json(*r.expected_speed) : nlohmann::json(nullptr);
  j["expected_duration_s"] =
      r.expected_duration_s ? nlohmann::json(*r.expected_duration_s) : nlohmann::json(nullptr);
  if (r.deviation_percent) {
    j["deviation_percent"] = *r.deviation_percent;
    j["accuracy"] = SpeedCalculator::accuracy_label(*r.deviation_percent);
  } else {
    j["deviation_percent"] = nullptr;
    j["accuracy"] = nullptr;
  }
}

void to_json(nlohmann::json& j, const SessionSnapshot& s) {
  j = nlohmann::json{{"state", to_string(s.state)},
                     {"baseline_progress", s.baseline_progress},
                     {"preliminary_threshold", s.preliminary_threshold},
                     {"event_in_progress", s.event_in_progress},
                     {"frames_processed", s.frames_processed}};
  j["model"] = s.model ? nlohmann::json(*s.model) : nlohmann::json(nullptr);
  if (s.last_sample) {
    j["last_sample"] = {{"value", s.last_sample->value},
                        {"frame_index", s.last_sample->frame_index},
                        {"timestamp_ns", s.last_sample->timestamp_ns}};
  } else {
    j["last_sample"] = nullptr;
  }
  j["events"] = s.events ? nlohmann::json(*s.events) : nlohmann::json::array();
}

void apply_log_level(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    spdlog::warn("Unknown log level '{}', keeping current level", level);
  }
}

ReportWriter::ReportWriter(const OutputConfig& config) : config_(config) {}

void ReportWriter::log_results(const std::vector<ShutterEvent>& events,
                               const std::vector<SpeedResult>& results) const {
  spdlog::info("=== RESULTS ===");
  spdlog::info("{:>3}  {:>11}  {:>6}  {:>8}  {:>10}  {:>10}  {:>9}  {}", "#", "frames", "count",
               "weighted", "measured", "expected", "deviation", "accuracy");

  for (size_t i = 0; i < events.size() && i < results.size(); ++i) {
    const auto& ev = events[i];
    const auto& r = results[i];
    const std::string frames = fmt::format("{}-{}", ev.start_frame, ev.end_frame);
    const std::string deviation =
        r.deviation_percent ? fmt::format("{:+.1f}%", *r.deviation_percent) : "-";
    const std::string accuracy =
        r.deviation_percent ? SpeedCalculator::accuracy_label(*r.deviation_percent) : "-";

    spdlog::info("{:>3}  {:>11}  {:>6}  {:>8.2f}  {:>10}  {:>10}  {:>9}  {}{}", i + 1, frames,
                 ev.duration_frames(), ev.weighted_duration_frames(),
                 SpeedCalculator::format_shutter_speed(r.measured_speed_denominator),
                 r.expected_speed.value_or("-"), deviation, accuracy,
                 ev.unterminated ? " (unterminated)" : "");

    if (config_.verbose_logging) {
      spdlog::info("     samples: [{:.1f}]", fmt::join(ev.brightness_values, ", "));
    }
  }

  if (auto avg = SpeedCalculator::average_abs_deviation(results)) {
    spdlog::info("Average |deviation|: {:.1f}% ({})", *avg, SpeedCalculator::accuracy_label(*avg));
  }
}

nlohmann::json ReportWriter::build_report(const std::string& source,
                                          const BatchAnalysis& analysis,
                                          const std::vector<SpeedResult>& results) const {
  nlohmann::json j;
  j["source"] = source;
  j["status"] = to_string(analysis.status);
  j["recording_fps"] = analysis.recording_fps;
  j["threshold_model"] = analysis.model;
  j["events"] = analysis.events;
  j["results"] = results;
  const auto avg = SpeedCalculator::average_abs_deviation(results);
  j["average_abs_deviation_percent"] = avg ? nlohmann::json(*avg) : nlohmann::json(nullptr);
  return j;
}

bool ReportWriter::write(const std::string& source, const BatchAnalysis& analysis,
                         const std::vector<SpeedResult>& results) const {
  bool ok = true;
  if (config_.enable_json_report) ok = write_json(build_report(source, analysis, results)) && ok;
  if (config_.enable_csv_report) ok = write_csv(analysis.events, results) && ok;
  return ok;
}

bool ReportWriter::write_json(const nlohmann::json& report) const {
  ensure_parent_directory(config_.json_output_path);
  std::ofstream out(config_.json_output_path);
  if (!out.is_open()) {
    spdlog::error("Failed to open JSON report: {}", config_.json_output_path);
    return false;
  }
  out << report.dump(2) << "\n";
  spdlog::info("JSON report written to {}", config_.json_output_path);
  return true;
}

bool ReportWriter::write_csv(const std::vector<ShutterEvent>& events,
                             const std::vector<SpeedResult>& results) const {
  ensure_parent_directory(config_.csv_output_path);
  std::ofstream out(config_.csv_output_path);
  if (!out.is_open()) {
    spdlog::error("Failed to open CSV report: {}", config_.csv_output_path);
    return false;
  }

  out << "index,start_frame,end_frame,duration_frames,weighted_duration_frames,"
         "measured_speed,measured_duration_s,expected_speed,deviation_percent,unterminated\n";
  for (size_t i = 0; i < events.size() && i < results.size(); ++i) {
    const auto& ev = events[i];
    const auto& r = results[i];
    out << fmt::format("{},{},{},{},{:.4f},{},{:.6f},{},{},{}\n", i + 1, ev.start_frame,
                       ev.end_frame, ev.duration_frames(), ev.weighted_duration_frames(),
                       SpeedCalculator::format_shutter_speed(r.measured_speed_denominator),
                       r.measured_duration_s, r.expected_speed.value_or(""),
                       r.deviation_percent ? fmt::format("{:.2f}", *r.deviation_percent) : "",
                       ev.unterminated ? 1 : 0);
  }
  spdlog::info("CSV report written to {}", config_.csv_output_path);
  return true;
}

void ReportWriter::ensure_parent_directory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) spdlog::warn("Cannot create directory {}: {}", parent.string(), ec.message());
}
