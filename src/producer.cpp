#include "producer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "frame_codec.hpp"

using namespace std::chrono;

namespace {
constexpr milliseconds kPopSlice{50};
}

ProducerPipeline::ProducerPipeline(ProducerConfig cfg, FrameSource& source, ChannelClient& client,
                                   MetricsRegistry& m)
    : cfg_(std::move(cfg)),
      source_(source),
      client_(client),
      metrics_(m),
      ring_(static_cast<size_t>(std::max(1, cfg_.queue_capacity))) {}

ProducerPipeline::~ProducerPipeline() { stop(); }

void ProducerPipeline::start() {
  if (running_.exchange(true)) return;
  set_state(ProducerState::Capturing);
  spdlog::info("Producer '{}' starting (channel '{}', ring capacity {})", cfg_.source_id,
               cfg_.channel, ring_.capacity());
  publish_thread_ = std::thread([this] { publish_loop(); });
  capture_thread_ = std::thread([this] { capture_loop(); });
}

void ProducerPipeline::stop() {
  if (!running_.exchange(false)) return;
  spdlog::info("Stopping producer '{}'", cfg_.source_id);

  capture_cancel_.cancel();
  if (capture_thread_.joinable()) capture_thread_.join();

  if (!wait_finished(cfg_.drain_timeout)) {
    spdlog::warn("Producer '{}' drain timed out after {} ms with {} frame(s) buffered",
                 cfg_.source_id, cfg_.drain_timeout.count(), ring_.size());
    publish_cancel_.cancel();
  }
  if (publish_thread_.joinable()) publish_thread_.join();
  spdlog::info("Producer '{}' stopped: {} captured, {} published", cfg_.source_id,
               captured_.load(), metrics_.get(MetricsRegistry::Counter::FramesPublished));
}

ProducerState ProducerPipeline::state() const {
  std::lock_guard<std::mutex> g(state_mu_);
  return state_;
}

bool ProducerPipeline::finished() const {
  std::lock_guard<std::mutex> g(state_mu_);
  return finished_;
}

bool ProducerPipeline::wait_finished(milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(state_mu_);
  return state_cv_.wait_for(lk, timeout, [this] { return finished_; });
}

void ProducerPipeline::set_state(ProducerState s) {
  {
    std::lock_guard<std::mutex> g(state_mu_);
    // Draining only moves forward to Stopped; Stopped is terminal.
    if (state_ == ProducerState::Stopped) return;
    if (state_ == ProducerState::Draining && s != ProducerState::Stopped) return;
    state_ = s;
  }
  state_cv_.notify_all();
}

void ProducerPipeline::mark_finished() {
  {
    std::lock_guard<std::mutex> g(state_mu_);
    state_ = ProducerState::Stopped;
    finished_ = true;
  }
  state_cv_.notify_all();
}

void ProducerPipeline::report(const std::string& message) {
  if (on_failure_) on_failure_("producer:" + cfg_.source_id, message);
}

void ProducerPipeline::capture_loop() {
  Backoff backoff(cfg_.capture_backoff);
  int restarts = 0;

  bool open = true;
  try {
    source_.open();
  } catch (const CaptureError& e) {
    metrics_.inc(MetricsRegistry::Counter::CaptureErrors);
    spdlog::error("Capture open failed for '{}': {}", cfg_.source_id, e.what());
    report(e.what());
    open = restart_capture(backoff, restarts);
  }

  while (open && !capture_cancel_.cancelled()) {
    std::optional<RawFrame> raw;
    try {
      raw = source_.next_frame();
    } catch (const CaptureError& e) {
      metrics_.inc(MetricsRegistry::Counter::CaptureErrors);
      spdlog::error("Capture error on '{}': {}", cfg_.source_id, e.what());
      report(e.what());
      if (!restart_capture(backoff, restarts)) break;
      continue;
    }
    if (!raw) {
      spdlog::info("End of stream on '{}' after {} frame(s)", cfg_.source_id, next_sequence_);
      break;
    }
    backoff.reset();

    Frame f;
    f.source_id = cfg_.source_id;
    f.sequence_number = ++next_sequence_;
    f.captured_at = raw->captured_at;
    f.payload = std::move(raw->payload);
    captured_.fetch_add(1);
    metrics_.inc(MetricsRegistry::Counter::FramesCaptured);

    if (ring_.push(std::move(f))) {
      metrics_.inc(MetricsRegistry::Counter::FramesDroppedBackpressure);
      spdlog::warn("Ring full on '{}': dropped oldest buffered frame (now at #{})",
                   cfg_.source_id, next_sequence_);
    }
  }

  source_.close();
  ring_.close();
  set_state(ProducerState::Draining);
}

bool ProducerPipeline::restart_capture(Backoff& backoff, int& restarts) {
  while (!capture_cancel_.cancelled()) {
    if (cfg_.max_capture_restarts >= 0 && restarts >= cfg_.max_capture_restarts) {
      spdlog::error("Giving up on '{}' after {} capture restart(s)", cfg_.source_id, restarts);
      report("capture restarts exhausted");
      return false;
    }
    restarts++;
    source_.close();
    auto delay = backoff.next();
    spdlog::info("Reopening capture for '{}' in {} ms (restart {})", cfg_.source_id,
                 delay.count(), restarts);
    if (!capture_cancel_.wait_for(delay)) return false;
    try {
      source_.open();
      return true;
    } catch (const CaptureError& e) {
      metrics_.inc(MetricsRegistry::Counter::CaptureErrors);
      spdlog::error("Capture reopen failed for '{}': {}", cfg_.source_id, e.what());
      report(e.what());
    }
  }
  return false;
}

void ProducerPipeline::publish_loop() {
  bool had_session = false;
  while (true) {
    // Reconnect before taking a frame: while the broker is away the ring keeps
    // absorbing captures and evicting the oldest.
    if (!client_.connected()) {
      if (had_session) {
        spdlog::warn("Producer '{}' lost its broker session, reconnecting", cfg_.source_id);
        metrics_.inc(MetricsRegistry::Counter::Reconnects);
      }
      if (!client_.reconnect(publish_cancel_)) break;
    }
    had_session = true;

    Frame f;
    if (!ring_.lease_for(f, kPopSlice)) {
      if (ring_.closed() && ring_.size() == 0) break;
      continue;
    }

    set_state(ProducerState::Publishing);
    PublishResult r = publish_with_retries(f);
    set_state(ProducerState::Capturing);
    // False when capture overran the ring meanwhile; the ring already counted
    // this frame as a backpressure drop.
    const bool owned = ring_.release();

    if (r == PublishResult::Published) {
      if (owned) {
        metrics_.inc(MetricsRegistry::Counter::FramesPublished);
      } else {
        metrics_.inc(MetricsRegistry::Counter::FramesSuperseded);
        spdlog::debug("Frame {}#{} was evicted while its publish was in flight", f.source_id,
                      f.sequence_number);
      }
    } else if (r == PublishResult::Failed && owned) {
      metrics_.inc(MetricsRegistry::Counter::FramesPublishFailed);
      report("publish failed for frame " + std::to_string(f.sequence_number));
    } else if (r == PublishResult::Cancelled) {
      if (owned) metrics_.inc(MetricsRegistry::Counter::FramesDiscardedOnShutdown);
      break;
    }
  }

  size_t left = ring_.clear();
  if (left > 0) {
    metrics_.inc(MetricsRegistry::Counter::FramesDiscardedOnShutdown, left);
    spdlog::warn("Producer '{}' discarded {} unpublished frame(s) on shutdown", cfg_.source_id,
                 left);
  }
  mark_finished();
}

ProducerPipeline::PublishResult ProducerPipeline::publish_with_retries(const Frame& frame) {
  const Bytes body = encode_frame(frame);
  Backoff backoff(cfg_.publish_backoff);

  for (int attempt = 0;; ++attempt) {
    if (!client_.connected() && !client_.reconnect(publish_cancel_)) return PublishResult::Cancelled;
    if (attempt > 0 && !ring_.lease_held()) {
      spdlog::warn("Giving up on frame {}#{}: evicted by newer captures during retry",
                   frame.source_id, frame.sequence_number);
      return PublishResult::Superseded;
    }
    try {
      auto t0 = Clock::now();
      client_.publish(cfg_.channel, body);
      metrics_.add_publish(duration<double, std::milli>(Clock::now() - t0).count());
      spdlog::debug("Published {}#{} ({} bytes)", frame.source_id, frame.sequence_number,
                    body.size());
      return PublishResult::Published;
    } catch (const PublishError& e) {
      if (attempt >= cfg_.max_publish_retries) {
        spdlog::warn("Dropping frame {}#{} after {} publish attempt(s): {}", frame.source_id,
                     frame.sequence_number, attempt + 1, e.what());
        return PublishResult::Failed;
      }
      metrics_.inc(MetricsRegistry::Counter::PublishRetries);
      auto delay = backoff.next();
      spdlog::warn("Publish of {}#{} failed: {} (retry {}/{} in {} ms)", frame.source_id,
                   frame.sequence_number, e.what(), attempt + 1, cfg_.max_publish_retries,
                   delay.count());
      if (!publish_cancel_.wait_for(delay)) return PublishResult::Cancelled;
    }
  }
}
