#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <cmath>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>
#include <opencv2/videoio.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "batch_analyzer.hpp"
#include "brightness_source.hpp"
#include "live_session.hpp"
#include "metrics.hpp"
#include "report_writer.hpp"
#include "speed_calculator.hpp"
#include "util.hpp"

namespace {

bool load_input(const std::string& input, BrightnessSeries& series) {
  if (is_video_uri(input)) return read_video_brightness(input, series);
  return load_brightness_series(input, series);
}

int run_analyze(const AppConfig& app, const std::string& input, std::optional<double> fps_override,
                const std::string& method_name, std::optional<int> events_override,
                const std::string& speeds_override) {
  BrightnessSeries series;
  if (!load_input(input, series)) {
    spdlog::error("Failed to read brightness from {}", input);
    return 1;
  }

  // --fps names the capture rate; a container reporting another rate is a
  // slow-motion file played back at that rate.
  double fps = app.analysis.recording_fps;
  std::optional<double> playback_fps;
  if (series.fps > 0.0) fps = series.fps;
  if (fps_override) {
    if (series.fps > 0.0 && std::fabs(series.fps - *fps_override) > 1e-6) {
      playback_fps = series.fps;
      spdlog::info("Slow-motion input: {:.1f} fps playback of a {:.1f} fps recording", series.fps,
                   *fps_override);
    }
    fps = *fps_override;
  }

  ThresholdConfig tcfg = app.threshold;
  if (!method_name.empty()) {
    auto method = parse_threshold_method(method_name);
    if (!method) {
      spdlog::error("Unknown threshold method '{}'", method_name);
      return 2;
    }
    tcfg.method = *method;
  }

  std::optional<int> expected = events_override ? events_override : app.analysis.expected_events;
  std::vector<std::string> speeds = app.analysis.expected_speeds;
  if (!speeds_override.empty()) speeds = SpeedCalculator::parse_speed_list(speeds_override);
  if (!expected && !speeds.empty() && tcfg.method != ThresholdMethod::PERCENTILE_MARGIN) {
    expected = static_cast<int>(speeds.size());
    spdlog::debug("Expected event count taken from the speed list: {}", *expected);
  }

  spdlog::info("Analyzing {} samples from {} at {:.1f} fps ({})", series.values.size(), input, fps,
               to_string(tcfg.method));

  BatchAnalyzer analyzer(tcfg);
  BatchAnalysis analysis = analyzer.analyze(series.values, fps, expected);
  if (!analysis.ok()) {
    spdlog::error("Analysis failed: {} ({})", to_string(analysis.status), analysis.reason);
    return 2;
  }

  auto results = analyzer.evaluate(analysis, speeds, app.analysis.use_weighted, playback_fps);

  ReportWriter writer(app.output_config);
  writer.log_results(analysis.events, results);
  return writer.write(input, analysis, results) ? 0 : 1;
}

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop = true; }

int run_live(const AppConfig& app, const std::string& input, std::optional<double> fps_override,
             bool serve) {
  const bool camera = is_live_uri(input);
  cv::VideoCapture cap;
  BrightnessSeries series;
  if (camera) {
    if (!open_video_source(input, cap)) return 1;
    series.fps = cap.get(cv::CAP_PROP_FPS);
  } else if (!load_input(input, series)) {
    spdlog::error("Failed to read brightness from {}", input);
    return 1;
  }

  LiveConfig lcfg = app.live;
  if (series.fps > 0.0) lcfg.recording_fps = series.fps;
  if (fps_override) lcfg.recording_fps = *fps_override;

  MetricsRegistry metrics(lcfg.frame_budget_us);
  LiveSession session(lcfg, app.calibration, metrics);

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/session/state", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j = *session.snapshot();
    res.set_content(j.dump(2), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    auto s = metrics.snapshot();
    res.set_content(metrics.prometheus_text(s), "text/plain; version=0.0.4");
  });

  std::thread http_thread;
  if (svr.bind_to_port("0.0.0.0", app.metrics_port)) {
    http_thread = std::thread([&] { svr.listen_after_bind(); });
    svr.wait_until_ready();
    spdlog::info("HTTP server listening on 0.0.0.0:{}", app.metrics_port);
  } else {
    spdlog::warn("HTTP server could not bind port {}", app.metrics_port);
  }

  auto stop_http = [&] {
    if (!http_thread.joinable()) return;
    svr.stop();
    http_thread.join();
  };

  if (!session.start()) {
    spdlog::error("Live session could not start");
    stop_http();
    return 1;
  }

  const double fps = lcfg.recording_fps > 0.0 ? lcfg.recording_fps : 240.0;
  if (camera) {
    // Frames are classified as they are grabbed; SIGINT/SIGTERM end the recording.
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    spdlog::info("Capturing from camera at ~{:.1f} fps, Ctrl-C to stop", fps);
    stream_brightness(cap, [&](double brightness, int64_t timestamp_ns) {
      session.process_frame(brightness, timestamp_ns);
      return !g_stop.load();
    });
    cap.release();
  } else {
    // Frames are replayed on the capture clock: frame i arrives at i / fps.
    for (size_t i = 0; i < series.values.size(); ++i) {
      const auto ts = static_cast<int64_t>(static_cast<double>(i) * 1e9 / fps);
      session.process_frame(series.values[i], ts);
    }
  }
  session.finish();

  const auto snap = session.snapshot();
  spdlog::info("{} finished: state={}, {} frames, {} events", camera ? "Capture" : "Replay",
               to_string(snap->state), snap->frames_processed, snap->events->size());

  SpeedCalculator speeds;
  auto results =
      speeds.group_events(*snap->events, app.analysis.expected_speeds, fps, app.analysis.use_weighted);
  ReportWriter(app.output_config).log_results(*snap->events, results);

  if (serve && http_thread.joinable()) {
    http_thread.join();
  } else {
    stop_http();
  }
  spdlog::info("Shutdown complete.");
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"ShutterScope: camera shutter speed measurement from frame brightness"};

  std::string cfg_path;
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  auto* analyze = cli_app.add_subcommand("analyze", "Analyze a recorded brightness series");
  std::string analyze_input;
  std::optional<double> analyze_fps;
  std::string method_name;
  std::optional<int> expected_events;
  std::string expected_speeds;
  analyze->add_option("-i,--input", analyze_input, "Brightness CSV or video file")->required();
  analyze->add_option("--fps", analyze_fps,
                      "Capture frame rate (overrides the container rate of slow-motion files)");
  analyze->add_option("--method", method_name, "percentile | zscore | clustering");
  analyze->add_option("--events", expected_events, "Expected number of shutter events");
  analyze->add_option("--speeds", expected_speeds, "Expected speeds, e.g. \"1/500,1/250\"");

  auto* live = cli_app.add_subcommand("live", "Run live calibration and detection on a camera or recording");
  std::string live_input;
  std::optional<double> live_fps;
  bool serve = false;
  live->add_option("-i,--input", live_input, "Brightness CSV, video file or 0 for camera")
      ->required();
  live->add_option("--fps", live_fps, "Recording frame rate");
  live->add_flag("--serve", serve, "Keep the HTTP endpoints up after the input ends");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "ShutterScope v1.0.0" << std::endl;
    std::cout << "Shutter speed measurement from high frame rate video" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app;
  if (!cfg_path.empty()) {
    try {
      app = load_config(cfg_path);
    } catch (const std::exception& e) {
      spdlog::error("Invalid configuration {}: {}", cfg_path, e.what());
      return 2;
    }
  }
  apply_log_level(app.output_config.log_level);
  spdlog::info("ShutterScope starting (config: {})", cfg_path.empty() ? "defaults" : cfg_path);

  if (*analyze) {
    return run_analyze(app, analyze_input, analyze_fps, method_name, expected_events,
                       expected_speeds);
  }
  if (*live) return run_live(app, live_input, live_fps, serve);

  std::cout << cli_app.help() << std::endl;
  return 1;
}
