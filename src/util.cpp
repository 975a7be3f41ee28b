#include "util.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <iterator>

namespace {

AppConfig parse(const YAML::Node& y) {
  AppConfig c{};

  if (y["broker"]) {
    auto b = y["broker"];
    if (b["transport"]) c.broker.transport = b["transport"].as<std::string>();
    if (b["host"]) c.broker.host = b["host"].as<std::string>();
    if (b["port"]) c.broker.port = b["port"].as<int>();
    if (b["vhost"]) c.broker.vhost = b["vhost"].as<std::string>();
    if (b["user"]) c.broker.user = b["user"].as<std::string>();
    if (b["password"]) c.broker.password = b["password"].as<std::string>();
    if (b["frames_channel"]) c.broker.frames_channel = b["frames_channel"].as<std::string>();
    if (b["detections_channel"])
      c.broker.detections_channel = b["detections_channel"].as<std::string>();
    if (b["dead_letter_suffix"])
      c.broker.dead_letter_suffix = b["dead_letter_suffix"].as<std::string>();
    if (b["queue_type"]) c.broker.queue_type = b["queue_type"].as<std::string>();
    if (b["heartbeat_s"]) c.broker.heartbeat_s = b["heartbeat_s"].as<int>();
    if (b["connect_timeout_ms"]) c.broker.connect_timeout_ms = b["connect_timeout_ms"].as<int>();
    if (b["confirm_timeout_ms"]) c.broker.confirm_timeout_ms = b["confirm_timeout_ms"].as<int>();
  }

  if (y["backoff"]) {
    auto n = y["backoff"];
    if (n["base_ms"]) c.backoff.base_ms = n["base_ms"].as<int>();
    if (n["max_ms"]) c.backoff.max_ms = n["max_ms"].as<int>();
    if (n["multiplier"]) c.backoff.multiplier = n["multiplier"].as<double>();
    if (n["jitter"]) c.backoff.jitter = n["jitter"].as<double>();
  }
  c.broker.reconnect_backoff = c.backoff;

  if (y["streamer"]) {
    auto s = y["streamer"];
    if (s["source_id"]) c.streamer.source_id = s["source_id"].as<std::string>();
    if (s["uri"]) c.streamer.capture.uri = s["uri"].as<std::string>();
    if (s["width"]) c.streamer.capture.width = s["width"].as<int>();
    if (s["height"]) c.streamer.capture.height = s["height"].as<int>();
    if (s["fps"]) c.streamer.capture.fps = s["fps"].as<int>();
    if (s["pace"]) c.streamer.capture.pace = s["pace"].as<bool>();
    if (s["jpeg_quality"]) c.streamer.capture.jpeg_quality = s["jpeg_quality"].as<int>();
    if (s["queue_capacity"]) c.streamer.queue_capacity = s["queue_capacity"].as<int>();
    if (s["max_publish_retries"])
      c.streamer.max_publish_retries = s["max_publish_retries"].as<int>();
    if (s["max_capture_restarts"])
      c.streamer.max_capture_restarts = s["max_capture_restarts"].as<int>();
    if (s["drain_timeout_ms"]) c.streamer.drain_timeout_ms = s["drain_timeout_ms"].as<int>();
  }

  if (y["detector"]) {
    auto d = y["detector"];
    if (d["prefetch_limit"]) c.detector.prefetch_limit = d["prefetch_limit"].as<int>();
    if (d["max_attempts"]) c.detector.max_attempts = d["max_attempts"].as<int>();
    if (d["poll_interval_ms"]) c.detector.poll_interval_ms = d["poll_interval_ms"].as<int>();
    if (d["shutdown_deadline_ms"])
      c.detector.shutdown_deadline_ms = d["shutdown_deadline_ms"].as<int>();
    if (d["model_path"]) c.detector.model.model_path = d["model_path"].as<std::string>();
    if (d["input_width"] && d["input_height"]) {
      c.detector.model.input_size =
          cv::Size(d["input_width"].as<int>(), d["input_height"].as<int>());
    }
    if (d["detection_threshold"])
      c.detector.model.detection_threshold = d["detection_threshold"].as<float>();
    if (d["nms_threshold"]) c.detector.model.nms_threshold = d["nms_threshold"].as<float>();
    if (d["max_detections"]) c.detector.model.max_detections = d["max_detections"].as<int>();
  }

  if (y["output"]) {
    auto o = y["output"];
    if (o["publish_detections"]) c.output.publish_detections = o["publish_detections"].as<bool>();
    if (o["enable_csv_logging"]) c.output.enable_csv_logging = o["enable_csv_logging"].as<bool>();
    if (o["csv_output_path"]) c.output.csv_output_path = o["csv_output_path"].as<std::string>();
    if (o["dedup_window"]) c.output.dedup_window = o["dedup_window"].as<size_t>();
  }

  if (y["logging"] && y["logging"]["level"]) c.log_level = y["logging"]["level"].as<std::string>();
  if (y["telemetry"] && y["telemetry"]["metrics_port"])
    c.metrics_port = y["telemetry"]["metrics_port"].as<int>();

  return c;
}

}  // namespace

AppConfig load_config(const std::string& path) {
  YAML::Node y;
  try {
    y = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("cannot load " + path + ": " + e.what());
  }
  AppConfig c;
  try {
    c = parse(y);
  } catch (const YAML::Exception& e) {
    throw ConfigError("invalid value in " + path + ": " + e.what());
  }
  apply_env_overrides(c);
  validate_config(c);
  return c;
}

AppConfig load_config_string(const std::string& yaml) {
  AppConfig c;
  try {
    c = parse(YAML::Load(yaml));
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }
  apply_env_overrides(c);
  validate_config(c);
  return c;
}

void apply_env_overrides(AppConfig& c) {
  if (const char* u = std::getenv("RABBITMQ_USER"); u && *u) c.broker.user = u;
  if (const char* p = std::getenv("RABBITMQ_PASS"); p && *p) c.broker.password = p;
}

void validate_config(const AppConfig& c) {
  if (c.broker.transport != "amqp" && c.broker.transport != "memory")
    throw ConfigError("broker.transport must be 'amqp' or 'memory', got '" + c.broker.transport +
                      "'");
  if (c.broker.queue_type != "quorum" && c.broker.queue_type != "classic")
    throw ConfigError("broker.queue_type must be 'quorum' or 'classic'");
  if (c.broker.frames_channel.empty() || c.broker.detections_channel.empty())
    throw ConfigError("broker channel names must not be empty");
  if (c.broker.dead_letter_suffix.empty())
    throw ConfigError("broker.dead_letter_suffix must not be empty");
  if (c.broker.port <= 0 || c.broker.port > 65535) throw ConfigError("broker.port out of range");

  if (c.backoff.base_ms < 0 || c.backoff.max_ms < c.backoff.base_ms)
    throw ConfigError("backoff requires 0 <= base_ms <= max_ms");
  if (c.backoff.multiplier < 1.0) throw ConfigError("backoff.multiplier must be >= 1");
  if (c.backoff.jitter < 0.0 || c.backoff.jitter > 1.0)
    throw ConfigError("backoff.jitter must be in [0, 1]");

  if (c.streamer.source_id.empty()) throw ConfigError("streamer.source_id must not be empty");
  if (c.streamer.queue_capacity < 1) throw ConfigError("streamer.queue_capacity must be >= 1");
  if (c.streamer.max_publish_retries < 0)
    throw ConfigError("streamer.max_publish_retries must be >= 0");
  if (c.streamer.max_capture_restarts < -1)
    throw ConfigError("streamer.max_capture_restarts must be >= -1");
  if (c.streamer.drain_timeout_ms < 0) throw ConfigError("streamer.drain_timeout_ms must be >= 0");

  if (c.detector.prefetch_limit < 1) throw ConfigError("detector.prefetch_limit must be >= 1");
  if (c.detector.max_attempts < 1) throw ConfigError("detector.max_attempts must be >= 1");
  // Classic queues only report "redelivered", so attempt counts there never pass 2
  // and a larger limit would requeue a failing frame forever.
  if (c.broker.queue_type == "classic" && c.detector.max_attempts > 2)
    throw ConfigError("detector.max_attempts above 2 needs broker.queue_type 'quorum'");
  if (c.detector.poll_interval_ms < 1) throw ConfigError("detector.poll_interval_ms must be >= 1");
  if (c.detector.shutdown_deadline_ms < 0)
    throw ConfigError("detector.shutdown_deadline_ms must be >= 0");

  static const char* kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
  if (std::find(std::begin(kLevels), std::end(kLevels), c.log_level) == std::end(kLevels))
    throw ConfigError("logging.level '" + c.log_level + "' is not a known level");

  if (c.metrics_port < 0 || c.metrics_port > 65535)
    throw ConfigError("telemetry.metrics_port out of range");
}

ProducerConfig producer_config(const AppConfig& c) {
  ProducerConfig p;
  p.source_id = c.streamer.source_id;
  p.channel = c.broker.frames_channel;
  p.queue_capacity = c.streamer.queue_capacity;
  p.max_publish_retries = c.streamer.max_publish_retries;
  p.max_capture_restarts = c.streamer.max_capture_restarts;
  p.drain_timeout = std::chrono::milliseconds(c.streamer.drain_timeout_ms);
  p.publish_backoff = c.backoff;
  p.capture_backoff = c.backoff;
  return p;
}

ConsumerConfig consumer_config(const AppConfig& c) {
  ConsumerConfig k;
  k.channel = c.broker.frames_channel;
  k.prefetch_limit = c.detector.prefetch_limit;
  k.max_attempts = c.detector.max_attempts;
  k.poll_interval = std::chrono::milliseconds(c.detector.poll_interval_ms);
  k.shutdown_deadline = std::chrono::milliseconds(c.detector.shutdown_deadline_ms);
  return k;
}
