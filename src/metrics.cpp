#include "metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <vector>

PerformanceTracker::PerformanceTracker(size_t cap) : cap_(cap) {
  if (cap_ == 0) throw std::invalid_argument("performance window capacity must be positive");
}

void PerformanceTracker::record(double elapsed_seconds) {
  if (!std::isfinite(elapsed_seconds) || elapsed_seconds < 0.0) {
    throw std::invalid_argument("latency sample must be a finite, non-negative duration");
  }
  if (vals_.size() == cap_) vals_.pop_front();
  vals_.push_back(elapsed_seconds);
  total_++;
}

std::optional<double> PerformanceTracker::meanMillis() const {
  if (vals_.empty()) return std::nullopt;
  double sum = std::accumulate(vals_.begin(), vals_.end(), 0.0);
  return sum / static_cast<double>(vals_.size()) * 1000.0;
}

std::optional<double> PerformanceTracker::fps() const {
  auto mean = meanMillis();
  if (!mean || *mean <= 0.0) return std::nullopt;
  return 1000.0 / *mean;
}

double PerformanceTracker::percentileMillis(double p) const {
  if (vals_.empty()) return 0.0;
  std::vector<double> v(vals_.begin(), vals_.end());
  std::sort(v.begin(), v.end());
  p = std::clamp(p, 0.0, 100.0);
  double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
  size_t lo = static_cast<size_t>(rank);
  size_t hi = std::min(v.size() - 1, lo + 1);
  double frac = rank - static_cast<double>(lo);
  return (v[lo] + (v[hi] - v[lo]) * frac) * 1000.0;
}

StatSnapshot PerformanceTracker::snapshot() const {
  StatSnapshot s{};
  s.frames_total = total_;
  s.window_size = vals_.size();
  auto mean = meanMillis();
  auto rate = fps();
  s.valid = mean.has_value() && rate.has_value();
  s.mean_ms = mean.value_or(0.0);
  s.fps = rate.value_or(0.0);
  s.p50_ms = percentileMillis(50);
  s.p95_ms = percentileMillis(95);
  s.p99_ms = percentileMillis(99);
  return s;
}

std::string prometheus_text(const StatSnapshot& s) {
  std::ostringstream os;
  os << "# TYPE stylestream_frames_processed_total counter\n";
  os << "stylestream_frames_processed_total " << s.frames_total << "\n";
  os << "# TYPE stylestream_inference_ms summary\n";
  os << "stylestream_inference_ms{quantile=\"0.5\"} " << s.p50_ms << "\n";
  os << "stylestream_inference_ms{quantile=\"0.95\"} " << s.p95_ms << "\n";
  os << "stylestream_inference_ms{quantile=\"0.99\"} " << s.p99_ms << "\n";
  os << "stylestream_inference_mean_ms " << s.mean_ms << "\n";
  os << "stylestream_fps " << s.fps << "\n";
  os << "stylestream_window_samples " << s.window_size << "\n";
  return os.str();
}
