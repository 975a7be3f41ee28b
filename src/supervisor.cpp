#include "supervisor.hpp"

#include <spdlog/spdlog.h>

Supervisor::Supervisor(SupervisorConfig cfg) : cfg_(cfg) {
  if (cfg_.max_recent_failures == 0) cfg_.max_recent_failures = 1;
}

Supervisor::~Supervisor() { shutdown(); }

void Supervisor::attach_producer(ProducerPipeline* producer) {
  producer_ = producer;
  if (producer_) {
    producer_->set_failure_handler(
        [this](const std::string& c, const std::string& m) { report_failure(c, m); });
  }
}

void Supervisor::attach_consumer(ConsumerPipeline* consumer) {
  consumer_ = consumer;
  if (consumer_) {
    consumer_->set_failure_handler(
        [this](const std::string& c, const std::string& m) { report_failure(c, m); });
  }
}

void Supervisor::start() {
  {
    std::lock_guard<std::mutex> g(mu_);
    if (started_) return;
    started_ = true;
  }
  spdlog::info("Supervisor starting ({}{})", producer_ ? "producer" : "",
               consumer_ ? (producer_ ? " + consumer" : "consumer") : "");
  if (consumer_) consumer_->start();
  if (producer_) producer_->start();
}

bool Supervisor::started() const {
  std::lock_guard<std::mutex> g(mu_);
  return started_;
}

bool Supervisor::alive() const {
  if (!producer_ && !consumer_) return false;
  if (producer_ && !producer_->connected()) return false;
  if (consumer_ && !consumer_->connected()) return false;
  return true;
}

void Supervisor::report_failure(const std::string& component, const std::string& message) {
  spdlog::error("[{}] {}", component, message);
  std::lock_guard<std::mutex> g(mu_);
  failure_count_++;
  recent_.push_back(FailureReport{component, message, WallClock::now()});
  while (recent_.size() > cfg_.max_recent_failures) recent_.pop_front();
}

std::vector<FailureReport> Supervisor::failures() const {
  std::lock_guard<std::mutex> g(mu_);
  return std::vector<FailureReport>(recent_.begin(), recent_.end());
}

uint64_t Supervisor::failure_count() const {
  std::lock_guard<std::mutex> g(mu_);
  return failure_count_;
}

void Supervisor::shutdown() {
  {
    std::lock_guard<std::mutex> g(mu_);
    if (shut_down_) return;
    shut_down_ = true;
    if (!started_) return;
  }
  spdlog::info("Supervisor shutting down");
  if (producer_) producer_->stop();
  if (consumer_) consumer_->stop();
  spdlog::info("Supervisor shutdown complete ({} failure(s) reported)", failure_count());
}

bool Supervisor::wait_until_idle(std::chrono::milliseconds timeout) {
  if (!producer_) return false;
  return producer_->wait_finished(timeout);
}
