#include "metrics.hpp"
#include <sstream>

StatSnapshot MetricsRegistry::snapshot() const {
  StatSnapshot s{};
  s.frame_p50_us = frame_us_.perc(50);
  s.frame_p95_us = frame_us_.perc(95);
  s.frame_p99_us = frame_us_.perc(99);
  s.frames_total = frames_total_.load();
  s.over_budget_total = over_budget_total_.load();
  s.events_total = events_total_.load();
  s.over_budget_rate = s.frames_total ? (static_cast<double>(s.over_budget_total) /
                                         static_cast<double>(s.frames_total))
                                      : 0.0;
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "shutterscope_frame_classify_us{quantile=\"0.5\"} "  << s.frame_p50_us << "\n";
  os << "shutterscope_frame_classify_us{quantile=\"0.95\"} " << s.frame_p95_us << "\n";
  os << "shutterscope_frame_classify_us{quantile=\"0.99\"} " << s.frame_p99_us << "\n";

  os << "shutterscope_frames_total " << s.frames_total << "\n";
  os << "shutterscope_frame_over_budget_total " << s.over_budget_total << "\n";
  os << "shutterscope_frame_over_budget_rate " << s.over_budget_rate << "\n";

  os << "shutterscope_shutter_events_total " << s.events_total << "\n";
  return os.str();
}
