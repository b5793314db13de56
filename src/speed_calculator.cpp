#include "speed_calculator.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::optional<double> parse_number(const std::string& s) {
  if (s.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
  return v;
}

}  // namespace

double SpeedCalculator::calculate_shutter_speed(double duration_frames, double fps) {
  const double duration = duration_frames / fps;
  return 1.0 / duration;
}

double SpeedCalculator::measure(const ShutterEvent& event, double fps, bool use_weighted,
                                std::optional<double> recording_fps) {
  const double frames = (use_weighted && event.baseline_brightness)
                            ? event.weighted_duration_frames()
                            : static_cast<double>(event.duration_frames());
  if (!recording_fps) return calculate_shutter_speed(frames, fps);
  return 1.0 / duration_seconds(frames, fps, recording_fps);
}

double SpeedCalculator::duration_seconds(double duration_frames, double fps,
                                         std::optional<double> recording_fps) {
  const double playback_s = duration_frames / fps;
  if (recording_fps) return playback_s * (fps / *recording_fps);
  return playback_s;
}

std::optional<double> SpeedCalculator::parse_speed_seconds(const std::string& notation) {
  std::string s = trim(notation);
  if (!s.empty() && (s.back() == 's' || s.back() == 'S')) s = trim(s.substr(0, s.size() - 1));

  std::optional<double> seconds;
  const auto slash = s.find('/');
  if (slash == std::string::npos) {
    seconds = parse_number(s);
  } else {
    const auto num = parse_number(trim(s.substr(0, slash)));
    const auto den = parse_number(trim(s.substr(slash + 1)));
    if (num && den && *den != 0.0) seconds = *num / *den;
  }

  if (!seconds || *seconds <= 0.0) return std::nullopt;
  return seconds;
}

std::vector<std::string> SpeedCalculator::parse_speed_list(const std::string& input) {
  std::vector<std::string> out;
  std::stringstream ss(input);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

double SpeedCalculator::deviation_percent(double measured_seconds, double expected_seconds) {
  return (measured_seconds - expected_seconds) / expected_seconds * 100.0;
}

std::string SpeedCalculator::format_shutter_speed(double denominator) {
  if (denominator >= 1.0) return fmt::format("1/{}", std::llround(denominator));
  return fmt::format("{:.2f}s", 1.0 / denominator);
}

std::string SpeedCalculator::accuracy_label(double deviation_percent) {
  const double d = std::fabs(deviation_percent);
  if (d <= 5.0) return "Good";
  if (d <= 10.0) return "Fair";
  if (d <= 15.0) return "Poor";
  return "Bad";
}

SpeedResult SpeedCalculator::evaluate(const ShutterEvent& event, double fps,
                                      const std::optional<std::string>& expected_speed,
                                      bool use_weighted,
                                      std::optional<double> recording_fps) const {
  SpeedResult r;
  r.measured_speed_denominator = measure(event, fps, use_weighted, recording_fps);
  r.measured_duration_s = 1.0 / r.measured_speed_denominator;

  if (expected_speed) {
    r.expected_speed = expected_speed;
    r.expected_duration_s = parse_speed_seconds(*expected_speed);
    if (r.expected_duration_s) {
      r.deviation_percent = deviation_percent(r.measured_duration_s, *r.expected_duration_s);
    } else {
      spdlog::warn("Cannot parse expected speed '{}'; deviation left unknown", *expected_speed);
    }
  }
  return r;
}

std::vector<SpeedResult> SpeedCalculator::group_events(
    const std::vector<ShutterEvent>& events, const std::vector<std::string>& expected_speeds,
    double fps, bool use_weighted, std::optional<double> recording_fps) const {
  std::vector<SpeedResult> results;
  results.reserve(events.size());
  for (size_t i = 0; i < events.size(); ++i) {
    std::optional<std::string> expected;
    if (i < expected_speeds.size()) expected = expected_speeds[i];
    results.push_back(evaluate(events[i], fps, expected, use_weighted, recording_fps));
  }
  if (expected_speeds.size() != events.size() && !expected_speeds.empty()) {
    spdlog::warn("{} events detected for {} expected speeds", events.size(),
                 expected_speeds.size());
  }
  return results;
}

std::optional<double> SpeedCalculator::average_abs_deviation(
    const std::vector<SpeedResult>& results) {
  double sum = 0.0;
  int n = 0;
  for (const auto& r : results) {
    if (!r.deviation_percent) continue;
    sum += std::fabs(*r.deviation_percent);
    n++;
  }
  if (n == 0) return std::nullopt;
  return sum / n;
}
