#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "consumer.hpp"
#include "producer.hpp"
#include "types.hpp"

struct SupervisorConfig {
  size_t max_recent_failures{64};
};

struct FailureReport {
  std::string component;
  std::string message;
  WallTime at{};
};

// Owns the lifecycle of the pipelines a role runs. Pipelines are not owned;
// they must outlive the supervisor's shutdown().
class Supervisor {
public:
  explicit Supervisor(SupervisorConfig cfg = {});
  ~Supervisor();

  void attach_producer(ProducerPipeline* producer);
  void attach_consumer(ConsumerPipeline* consumer);

  // Starts every attached pipeline. Each connects on its own threads, so this
  // returns without waiting for the broker.
  void start();

  // True when every attached pipeline holds a broker connection.
  bool alive() const;

  void report_failure(const std::string& component, const std::string& message);
  std::vector<FailureReport> failures() const;
  uint64_t failure_count() const;

  // Producer first (drain or timeout), then consumer. Safe to call more than once.
  void shutdown();

  // Waits until the producer reached end of stream and drained. Returns false
  // on timeout or when no producer is attached.
  bool wait_until_idle(std::chrono::milliseconds timeout);

  bool started() const;

private:
  SupervisorConfig cfg_;
  ProducerPipeline* producer_{nullptr};
  ConsumerPipeline* consumer_{nullptr};

  mutable std::mutex mu_;
  bool started_{false};
  bool shut_down_{false};
  std::deque<FailureReport> recent_;
  uint64_t failure_count_{0};
};
