#pragma once
#include <string>

#include "backoff.hpp"
#include "capture.hpp"
#include "channel_client.hpp"
#include "consumer.hpp"
#include "detector.hpp"
#include "producer.hpp"
#include "result_sink.hpp"
#include "types.hpp"

struct StreamerConfig {
  CaptureConfig capture;
  std::string source_id{"cam0"};
  int queue_capacity{8};
  int max_publish_retries{5};
  int max_capture_restarts{-1};
  int drain_timeout_ms{5000};
};

struct DetectorSettings {
  int prefetch_limit{1};
  int max_attempts{3};
  int poll_interval_ms{200};
  int shutdown_deadline_ms{5000};
  DetectorConfig model;
};

struct OutputConfig {
  bool publish_detections{true};
  bool enable_csv_logging{false};
  std::string csv_output_path{"output/detections.csv"};
  size_t dedup_window{4096};
};

struct AppConfig {
  BrokerConfig broker;
  BackoffConfig backoff;
  StreamerConfig streamer;
  DetectorSettings detector;
  OutputConfig output;
  std::string log_level{"info"};
  int metrics_port{9090};
};

// Missing keys keep their defaults. RABBITMQ_USER / RABBITMQ_PASS override the
// broker credentials. Throws ConfigError on unreadable files or bad values.
AppConfig load_config(const std::string& path);
AppConfig load_config_string(const std::string& yaml);
void apply_env_overrides(AppConfig& c);
void validate_config(const AppConfig& c);

ProducerConfig producer_config(const AppConfig& c);
ConsumerConfig consumer_config(const AppConfig& c);
