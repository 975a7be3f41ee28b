#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "cancellation.hpp"
#include "channel_client.hpp"
#include "detector.hpp"
#include "metrics.hpp"
#include "result_sink.hpp"
#include "types.hpp"

struct ConsumerConfig {
  std::string channel{"frames"};
  int prefetch_limit{1};
  int max_attempts{3};
  std::chrono::milliseconds poll_interval{200};
  std::chrono::milliseconds shutdown_deadline{5000};
};

// Per-source ordering check on first deliveries, fed in receive order.
// Redeliveries are expected to arrive out of order and are not tracked.
class SequenceTracker {
public:
  enum class Result { First, InOrder, Gap, Violation };

  Result observe(const std::string& source_id, uint64_t seq);

  uint64_t gaps() const;
  uint64_t violations() const;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, uint64_t> last_;
  uint64_t gaps_{0};
  uint64_t violations_{0};
};

// prefetch_limit worker threads share one subscription. Each worker takes one
// delivery at a time and runs it to a terminal outcome: decode, detect, emit,
// then ack. A delivery is acked only after the sink accepted its Detection.
class ConsumerPipeline {
public:
  ConsumerPipeline(ConsumerConfig cfg, ChannelClient& client, Detector& detector, ResultSink& sink,
                   MetricsRegistry& m);
  ~ConsumerPipeline();

  void start();
  // Cancels workers, waits up to shutdown_deadline, then closes the connection
  // so unacknowledged deliveries return to the broker.
  void stop();

  bool running() const { return running_.load(); }
  bool connected() const { return client_.connected(); }

  // Runs one delivery to completion and finalizes it with the broker.
  DeliveryOutcome process(const Delivery& delivery);

  size_t max_concurrent() const { return max_in_flight_.load(); }
  const SequenceTracker& sequence_tracker() const { return tracker_; }

  void set_failure_handler(FailureHandler h) { on_failure_ = std::move(h); }

private:
  void worker_loop(int index);
  // Decodes the delivery and runs the sequence check for first attempts.
  std::optional<Frame> admit(const Delivery& d, std::string& decode_error);
  DeliveryOutcome handle(const Delivery& d, const std::optional<Frame>& decoded,
                         const std::string& decode_error);
  DeliveryOutcome retry_or_dead_letter(const Delivery& d, const std::string& reason);
  DeliveryOutcome dead_letter(const Delivery& d, const std::string& reason, bool report_failure);
  DeliveryOutcome finish_nack(const Delivery& d, bool requeue);

  ConsumerConfig cfg_;
  ChannelClient& client_;
  Detector& detector_;
  ResultSink& sink_;
  MetricsRegistry& metrics_;
  FailureHandler on_failure_;

  SequenceTracker tracker_;
  std::mutex receive_mu_;
  CancellationToken cancel_;

  std::mutex workers_mu_;
  std::condition_variable workers_cv_;
  int active_workers_{0};

  std::atomic<bool> running_{false};
  std::atomic<size_t> in_flight_{0};
  std::atomic<size_t> max_in_flight_{0};
  std::vector<std::thread> workers_;
};
