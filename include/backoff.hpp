#pragma once
#include <chrono>
#include <cstdint>
#include <random>

struct BackoffConfig {
  int base_ms{200};
  int max_ms{10000};
  double multiplier{2.0};
  double jitter{0.2};  // fraction of the nominal delay, applied as +/-
};

// Exponential backoff with a cap and symmetric jitter. Not thread-safe; each
// retrying flow owns its own instance.
class Backoff {
public:
  explicit Backoff(BackoffConfig cfg, uint64_t seed = std::random_device{}());

  std::chrono::milliseconds next();
  void reset() { attempt_ = 0; }
  int attempts() const { return attempt_; }
  const BackoffConfig& config() const { return cfg_; }

private:
  BackoffConfig cfg_;
  int attempt_{0};
  std::mt19937_64 rng_;
};
