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
  // Percentile p in [0,100]
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
  double publish_p50{0}, publish_p95{0}, publish_p99{0};
  double detect_p50{0}, detect_p95{0}, detect_p99{0};
  double e2e_p50{0}, e2e_p95{0}, e2e_p99{0};

  uint64_t frames_captured{0};
  uint64_t frames_published{0};
  uint64_t frames_dropped{0};  // backpressure + publish failures + shutdown discards
  uint64_t deliveries_received{0};
  uint64_t acked{0};
  uint64_t requeued{0};
  uint64_t dead_lettered{0};
  uint64_t detections_emitted{0};

  double drop_rate{0};
  double dead_letter_rate{0};
};

// Counters are relaxed atomics; each one is an independent event count.
class MetricsRegistry {
public:
  enum class Counter {
    FramesCaptured,
    FramesPublished,
    FramesDroppedBackpressure,
    FramesPublishFailed,
    FramesDiscardedOnShutdown,
    FramesSuperseded,
    PublishRetries,
    CaptureErrors,
    DeliveriesReceived,
    Acked,
    Requeued,
    DeadLettered,
    DecodeFailures,
    DetectionFailures,
    DetectionsEmitted,
    StaleAcks,
    SequenceGaps,
    ProtocolViolations,
    Reconnects,
    kCount
  };

  void inc(Counter c, uint64_t n = 1) {
    counters_[static_cast<size_t>(c)].fetch_add(n, std::memory_order_relaxed);
  }
  uint64_t get(Counter c) const {
    return counters_[static_cast<size_t>(c)].load(std::memory_order_relaxed);
  }

  void add_publish(double ms) { publish_.add(ms); }
  void add_detect(double ms) { detect_.add(ms); }
  void add_e2e(double ms) { e2e_.add(ms); }

  StatSnapshot snapshot() const;
  std::string prometheus_text(const StatSnapshot& s) const;

  static const char* name(Counter c);

private:
  RollingHist publish_, detect_, e2e_;
  std::atomic<uint64_t> counters_[static_cast<size_t>(Counter::kCount)]{};
};
