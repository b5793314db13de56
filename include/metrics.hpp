#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100], interpolated between neighbouring ranks
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct StatSnapshot {
  double frame_p50_us{0}, frame_p95_us{0}, frame_p99_us{0};
  uint64_t frames_total{0};
  uint64_t over_budget_total{0};
  uint64_t events_total{0};
  double over_budget_rate{0};
};

// Per-frame classification cost of the live session.
class MetricsRegistry {
public:
  explicit MetricsRegistry(double frame_budget_us = 1000.0) : frame_budget_us_(frame_budget_us) {}

  void add_frame_time(double us) {
    frame_us_.add(us);
    frames_total_.fetch_add(1, std::memory_order_relaxed);
    if (us > frame_budget_us_) over_budget_total_.fetch_add(1, std::memory_order_relaxed);
  }
  void inc_event() { events_total_.fetch_add(1, std::memory_order_relaxed); }

  uint64_t frames_total() const { return frames_total_.load(std::memory_order_relaxed); }
  uint64_t over_budget_total() const {
    return over_budget_total_.load(std::memory_order_relaxed);
  }
  uint64_t events_total() const { return events_total_.load(std::memory_order_relaxed); }
  double frame_budget_us() const { return frame_budget_us_; }

  StatSnapshot snapshot() const;
  std::string prometheus_text(const StatSnapshot& s) const;

private:
  double frame_budget_us_;
  RollingHist frame_us_;
  std::atomic<uint64_t> frames_total_{0};
  std::atomic<uint64_t> over_budget_total_{0};
  std::atomic<uint64_t> events_total_{0};
};
