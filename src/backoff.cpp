#include "backoff.hpp"

#include <algorithm>
#include <cmath>

Backoff::Backoff(BackoffConfig cfg, uint64_t seed) : cfg_(cfg), rng_(seed) {
  cfg_.base_ms = std::max(0, cfg_.base_ms);
  cfg_.max_ms = std::max(cfg_.base_ms, cfg_.max_ms);
  cfg_.multiplier = std::max(1.0, cfg_.multiplier);
  cfg_.jitter = std::clamp(cfg_.jitter, 0.0, 1.0);
}

std::chrono::milliseconds Backoff::next() {
  if (cfg_.base_ms == 0) {
    attempt_++;
    return std::chrono::milliseconds(0);
  }
  // pow() saturates to inf for large exponents, which the cap absorbs.
  double nominal = static_cast<double>(cfg_.base_ms) * std::pow(cfg_.multiplier, attempt_);
  nominal = std::min(nominal, static_cast<double>(cfg_.max_ms));
  attempt_++;

  double delay = nominal;
  if (cfg_.jitter > 0.0) {
    std::uniform_real_distribution<double> dist(-cfg_.jitter, cfg_.jitter);
    delay = nominal * (1.0 + dist(rng_));
  }
  delay = std::clamp(delay, 0.0, static_cast<double>(cfg_.max_ms));
  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}
