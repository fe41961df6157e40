#pragma once
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

// Rolling window of per-frame inference latencies (seconds).
class PerformanceTracker {
public:
  static constexpr size_t kDefaultCapacity = 200;

  explicit PerformanceTracker(size_t cap = kDefaultCapacity);

  // Append a sample, evicting the oldest once the window is full.
  void record(double elapsed_seconds);

  // Mean of the window in milliseconds; nullopt when empty.
  std::optional<double> meanMillis() const;
  // 1000 / meanMillis(); nullopt when the mean is undefined or zero.
  std::optional<double> fps() const;
  // Percentile p in [0,100], in milliseconds
  double percentileMillis(double p) const;

  size_t size() const { return vals_.size(); }
  size_t capacity() const { return cap_; }
  uint64_t total() const { return total_; }

  struct Snapshot {
    uint64_t frames_total{0};
    size_t window_size{0};
    double mean_ms{0};
    double fps{0};
    double p50_ms{0}, p95_ms{0}, p99_ms{0};
    bool valid{false};
  };

  Snapshot snapshot() const;

private:
  size_t cap_;
  std::deque<double> vals_;
  uint64_t total_{0};
};

using StatSnapshot = PerformanceTracker::Snapshot;

std::string prometheus_text(const StatSnapshot& s);
