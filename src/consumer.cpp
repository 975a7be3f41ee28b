#include "consumer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "frame_codec.hpp"

using namespace std::chrono;

SequenceTracker::Result SequenceTracker::observe(const std::string& source_id, uint64_t seq) {
  std::lock_guard<std::mutex> g(mu_);
  auto it = last_.find(source_id);
  if (it == last_.end()) {
    last_.emplace(source_id, seq);
    return Result::First;
  }
  const uint64_t last = it->second;
  if (seq <= last) {
    violations_++;
    return Result::Violation;
  }
  it->second = seq;
  if (seq > last + 1) {
    gaps_ += seq - last - 1;
    return Result::Gap;
  }
  return Result::InOrder;
}

uint64_t SequenceTracker::gaps() const {
  std::lock_guard<std::mutex> g(mu_);
  return gaps_;
}

uint64_t SequenceTracker::violations() const {
  std::lock_guard<std::mutex> g(mu_);
  return violations_;
}

ConsumerPipeline::ConsumerPipeline(ConsumerConfig cfg, ChannelClient& client, Detector& detector,
                                   ResultSink& sink, MetricsRegistry& m)
    : cfg_(std::move(cfg)), client_(client), detector_(detector), sink_(sink), metrics_(m) {
  cfg_.prefetch_limit = std::max(1, cfg_.prefetch_limit);
  cfg_.max_attempts = std::max(1, cfg_.max_attempts);
}

ConsumerPipeline::~ConsumerPipeline() { stop(); }

void ConsumerPipeline::start() {
  if (running_.exchange(true)) return;
  spdlog::info("Consumer starting on '{}' ({} worker(s), max {} attempt(s))", cfg_.channel,
               cfg_.prefetch_limit, cfg_.max_attempts);

  // Only records the subscription while disconnected; reconnect() issues it.
  try {
    client_.subscribe(cfg_.channel, cfg_.prefetch_limit);
  } catch (const ConnectError& e) {
    spdlog::warn("Subscribe to '{}' deferred: {}", cfg_.channel, e.what());
  }

  {
    std::lock_guard<std::mutex> g(workers_mu_);
    active_workers_ = cfg_.prefetch_limit;
  }
  for (int i = 0; i < cfg_.prefetch_limit; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
}

void ConsumerPipeline::stop() {
  if (!running_.exchange(false)) return;
  spdlog::info("Stopping consumer on '{}'", cfg_.channel);
  cancel_.cancel();

  {
    std::unique_lock<std::mutex> lk(workers_mu_);
    if (!workers_cv_.wait_for(lk, cfg_.shutdown_deadline, [this] { return active_workers_ == 0; })) {
      spdlog::warn("Consumer shutdown deadline ({} ms) passed with {} worker(s) busy",
                   cfg_.shutdown_deadline.count(), active_workers_);
    }
  }
  // Unacknowledged deliveries go back to the broker with the connection.
  client_.close();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();
  spdlog::info("Consumer stopped: {} acked, {} requeued, {} dead-lettered",
               metrics_.get(MetricsRegistry::Counter::Acked),
               metrics_.get(MetricsRegistry::Counter::Requeued),
               metrics_.get(MetricsRegistry::Counter::DeadLettered));
}

void ConsumerPipeline::worker_loop(int index) {
  bool had_session = false;
  while (!cancel_.cancelled()) {
    if (!client_.connected()) {
      if (had_session) {
        spdlog::warn("Consumer worker {} lost its broker session, reconnecting", index);
        metrics_.inc(MetricsRegistry::Counter::Reconnects);
      }
      if (!client_.reconnect(cancel_)) break;
    }
    had_session = true;

    std::optional<Delivery> d;
    std::optional<Frame> frame;
    std::string decode_error;
    {
      // Receive and sequence-check under one lock so the tracker sees frames in
      // the order the broker handed them out, not the order workers finish
      // decoding.
      std::lock_guard<std::mutex> g(receive_mu_);
      if (cancel_.cancelled()) break;
      try {
        d = client_.next_delivery(cfg_.poll_interval);
      } catch (const ConnectError& e) {
        spdlog::warn("Consumer worker {}: {}", index, e.what());
        continue;
      }
      if (d) frame = admit(*d, decode_error);
    }
    if (!d) continue;
    DeliveryOutcome outcome = handle(*d, frame, decode_error);
    spdlog::debug("Worker {}: delivery {} {}", index, d->delivery_id, to_string(outcome));
  }

  {
    std::lock_guard<std::mutex> g(workers_mu_);
    active_workers_--;
  }
  workers_cv_.notify_all();
}

DeliveryOutcome ConsumerPipeline::process(const Delivery& d) {
  std::string decode_error;
  std::optional<Frame> frame = admit(d, decode_error);
  return handle(d, frame, decode_error);
}

std::optional<Frame> ConsumerPipeline::admit(const Delivery& d, std::string& decode_error) {
  Frame frame;
  try {
    frame = decode_frame(d.body);
  } catch (const DecodeError& e) {
    metrics_.inc(MetricsRegistry::Counter::DecodeFailures);
    decode_error = e.what();
    return std::nullopt;
  }

  if (d.attempt_count == 1) {
    switch (tracker_.observe(frame.source_id, frame.sequence_number)) {
      case SequenceTracker::Result::Gap:
        metrics_.inc(MetricsRegistry::Counter::SequenceGaps);
        spdlog::debug("Sequence gap on '{}' before #{}", frame.source_id, frame.sequence_number);
        break;
      case SequenceTracker::Result::Violation:
        metrics_.inc(MetricsRegistry::Counter::ProtocolViolations);
        spdlog::warn("Sequence went backwards on '{}' at #{}", frame.source_id,
                     frame.sequence_number);
        break;
      default:
        break;
    }
  }
  return frame;
}

DeliveryOutcome ConsumerPipeline::handle(const Delivery& d, const std::optional<Frame>& decoded,
                                         const std::string& decode_error) {
  metrics_.inc(MetricsRegistry::Counter::DeliveriesReceived);
  const size_t now_in_flight = ++in_flight_;
  size_t prev_max = max_in_flight_.load();
  while (now_in_flight > prev_max && !max_in_flight_.compare_exchange_weak(prev_max, now_in_flight)) {
  }
  struct InFlightGuard {
    std::atomic<size_t>& n;
    ~InFlightGuard() { n--; }
  } guard{in_flight_};

  if (cancel_.cancelled()) return finish_nack(d, true);
  if (!decoded) return dead_letter(d, "undecodable frame: " + decode_error, false);
  const Frame& frame = *decoded;

  std::vector<BoundingBox> boxes;
  try {
    auto t0 = Clock::now();
    boxes = detector_.detect(frame);
    metrics_.add_detect(duration<double, std::milli>(Clock::now() - t0).count());
  } catch (const DetectionError& e) {
    metrics_.inc(MetricsRegistry::Counter::DetectionFailures);
    if (!e.transient()) {
      return dead_letter(d, "detection failed permanently: " + std::string(e.what()), true);
    }
    return retry_or_dead_letter(d, e.what());
  } catch (const std::exception& e) {
    metrics_.inc(MetricsRegistry::Counter::DetectionFailures);
    return retry_or_dead_letter(d, e.what());
  }

  Detection det;
  det.source_id = frame.source_id;
  det.frame_sequence_number = frame.sequence_number;
  det.attempt_count = d.attempt_count;
  det.boxes = std::move(boxes);
  det.captured_at = frame.captured_at;
  det.processed_at = WallClock::now();

  try {
    sink_.emit(det);
  } catch (const std::exception& e) {
    spdlog::warn("Result sink rejected {}#{}: {}", det.source_id, det.frame_sequence_number,
                 e.what());
    return retry_or_dead_letter(d, std::string("sink: ") + e.what());
  }
  metrics_.inc(MetricsRegistry::Counter::DetectionsEmitted);
  metrics_.add_e2e(duration<double, std::milli>(det.processed_at - det.captured_at).count());

  if (!client_.ack(d.handle)) {
    // The broker already took the delivery back and will offer it again.
    metrics_.inc(MetricsRegistry::Counter::StaleAcks);
    spdlog::warn("Ack for {}#{} was stale; expecting redelivery", det.source_id,
                 det.frame_sequence_number);
    return DeliveryOutcome::Abandoned;
  }
  metrics_.inc(MetricsRegistry::Counter::Acked);
  spdlog::debug("Acked {}#{} (attempt {}, {} box(es))", det.source_id, det.frame_sequence_number,
                det.attempt_count, det.boxes.size());
  return DeliveryOutcome::Acked;
}

DeliveryOutcome ConsumerPipeline::retry_or_dead_letter(const Delivery& d, const std::string& reason) {
  if (d.attempt_count < static_cast<uint32_t>(cfg_.max_attempts)) {
    spdlog::warn("Delivery {} failed on attempt {}/{}: {} (requeueing)", d.delivery_id,
                 d.attempt_count, cfg_.max_attempts, reason);
    return finish_nack(d, true);
  }
  return dead_letter(d, "attempts exhausted: " + reason, true);
}

DeliveryOutcome ConsumerPipeline::dead_letter(const Delivery& d, const std::string& reason,
                                              bool report_failure) {
  spdlog::warn("Dead-lettering delivery {} (attempt {}): {}", d.delivery_id, d.attempt_count,
               reason);
  if (report_failure && on_failure_) on_failure_("consumer:" + cfg_.channel, reason);
  return finish_nack(d, false);
}

DeliveryOutcome ConsumerPipeline::finish_nack(const Delivery& d, bool requeue) {
  if (!client_.nack(d.handle, requeue)) {
    metrics_.inc(MetricsRegistry::Counter::StaleAcks);
    spdlog::warn("Nack for delivery {} was stale; expecting redelivery", d.delivery_id);
    return DeliveryOutcome::Abandoned;
  }
  if (requeue) {
    metrics_.inc(MetricsRegistry::Counter::Requeued);
    return DeliveryOutcome::Requeued;
  }
  metrics_.inc(MetricsRegistry::Counter::DeadLettered);
  return DeliveryOutcome::DeadLettered;
}
