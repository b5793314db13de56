#pragma once
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

class SpeedCalculator {
public:
  // 1 / (duration_frames / fps); 500.0 means 1/500 s.
  static double calculate_shutter_speed(double duration_frames, double fps);

  // Speed denominator for one event. The weighted duration is used when the
  // event has a baseline and use_weighted is set. fps is the rate frames were
  // indexed at; recording_fps, when set, is the capture rate of slow-motion
  // footage played back at fps.
  static double measure(const ShutterEvent& event, double fps, bool use_weighted = true,
                        std::optional<double> recording_fps = std::nullopt);

  // Real time covered by duration_frames frames: a 240 fps recording played
  // back at 30 fps still spans duration_frames / 240 seconds.
  static double duration_seconds(double duration_frames, double fps,
                                 std::optional<double> recording_fps = std::nullopt);

  // "1/500" -> 0.002, "2" -> 2.0, "0.5" -> 0.5, "1s" -> 1.0. Anything not
  // strictly positive and fully numeric yields nullopt.
  static std::optional<double> parse_speed_seconds(const std::string& notation);

  // Comma-separated notations, trimmed; empty items dropped.
  static std::vector<std::string> parse_speed_list(const std::string& input);

  // Positive when the shutter stayed open longer than nominal.
  static double deviation_percent(double measured_seconds, double expected_seconds);

  static std::string format_shutter_speed(double denominator);

  // Good / Fair / Poor / Bad on |deviation|.
  static std::string accuracy_label(double deviation_percent);

  SpeedResult evaluate(const ShutterEvent& event, double fps,
                       const std::optional<std::string>& expected_speed = std::nullopt,
                       bool use_weighted = true,
                       std::optional<double> recording_fps = std::nullopt) const;

  // Pairs events with expected speeds in detection order: event i gets
  // expected_speeds[i]. Events past the end of the list get no expectation,
  // and surplus expected speeds are ignored.
  std::vector<SpeedResult> group_events(const std::vector<ShutterEvent>& events,
                                        const std::vector<std::string>& expected_speeds,
                                        double fps, bool use_weighted = true,
                                        std::optional<double> recording_fps = std::nullopt) const;

  // Mean of |deviation| over results that have one; nullopt if none do.
  static std::optional<double> average_abs_deviation(const std::vector<SpeedResult>& results);
};
