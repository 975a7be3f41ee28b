#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "backoff.hpp"
#include "cancellation.hpp"
#include "capture.hpp"
#include "channel_client.hpp"
#include "drop_ring.hpp"
#include "metrics.hpp"
#include "types.hpp"

struct ProducerConfig {
  std::string source_id{"cam0"};
  std::string channel{"frames"};
  int queue_capacity{8};
  int max_publish_retries{5};
  int max_capture_restarts{-1};  // -1 = unlimited
  std::chrono::milliseconds drain_timeout{5000};
  BackoffConfig publish_backoff{};
  BackoffConfig capture_backoff{};
};

// Capture thread -> drop-oldest ring -> publish thread -> broker.
// Capture never waits on the broker: while the publisher is stalled the ring
// keeps the most recent queue_capacity frames and counts what it evicts. The
// frame being published keeps its ring slot until the publish finishes, so it
// counts against capacity and can be evicted by newer captures. An evicted
// frame whose publish was already under way is counted as a backpressure drop
// (and as superseded if the broker confirmed it anyway).
class ProducerPipeline {
public:
  ProducerPipeline(ProducerConfig cfg, FrameSource& source, ChannelClient& client,
                   MetricsRegistry& m);
  ~ProducerPipeline();

  void start();
  // Stops capture, drains the ring for up to drain_timeout, discards the rest.
  void stop();

  ProducerState state() const;
  bool running() const { return running_.load(); }
  bool connected() const { return client_.connected(); }
  // True once the publish flow has ended (end of stream or stop()).
  bool finished() const;
  // Blocks until finished() or the timeout expires.
  bool wait_finished(std::chrono::milliseconds timeout) const;

  uint64_t frames_captured() const { return captured_.load(); }
  size_t buffered() const { return ring_.size(); }
  size_t high_water() const { return ring_.high_water(); }

  void set_failure_handler(FailureHandler h) { on_failure_ = std::move(h); }

private:
  enum class PublishResult { Published, Failed, Superseded, Cancelled };

  void capture_loop();
  void publish_loop();
  PublishResult publish_with_retries(const Frame& frame);
  bool restart_capture(Backoff& backoff, int& restarts);

  void set_state(ProducerState s);
  void report(const std::string& message);
  void mark_finished();

  ProducerConfig cfg_;
  FrameSource& source_;
  ChannelClient& client_;
  MetricsRegistry& metrics_;
  FailureHandler on_failure_;

  DropOldestRing<Frame> ring_;
  CancellationToken capture_cancel_;
  CancellationToken publish_cancel_;

  mutable std::mutex state_mu_;
  mutable std::condition_variable state_cv_;
  ProducerState state_{ProducerState::Idle};
  bool finished_{false};

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> captured_{0};
  uint64_t next_sequence_{0};  // capture thread only
  std::thread capture_thread_;
  std::thread publish_thread_;
};
