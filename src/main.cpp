#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "amqp_channel.hpp"
#include "capture.hpp"
#include "consumer.hpp"
#include "detector.hpp"
#include "memory_channel.hpp"
#include "metrics.hpp"
#include "producer.hpp"
#include "result_sink.hpp"
#include "supervisor.hpp"
#include "util.hpp"

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop = true; }

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"FrameRelay: video frame capture and object detection over a message broker"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  std::string role = "all";
  cli_app.add_option("-r,--role", role, "Pipelines to run in this process")
      ->check(CLI::IsMember({"streamer", "detector", "all"}));

  std::string video_uri;
  cli_app.add_option("--video", video_uri, "Video input (file, webcam index, https:// or rtsp://)");

  std::string source_id;
  cli_app.add_option("--source-id", source_id, "Source id stamped on captured frames");

  std::string log_level;
  cli_app.add_option("--log-level", log_level, "trace|debug|info|warn|error");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "FrameRelay v1.0.0" << std::endl;
    std::cout << "Broker-decoupled frame streaming with YOLO detection (OpenCV DNN)" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app;
  try {
    app = load_config(cfg_path);
    if (!video_uri.empty()) {
      if (!is_valid_video_uri(video_uri)) throw ConfigError("invalid video URI: " + video_uri);
      app.streamer.capture.uri = video_uri;
    }
    if (!source_id.empty()) app.streamer.source_id = source_id;
    if (!log_level.empty()) app.log_level = log_level;
    validate_config(app);
  } catch (const ConfigError& e) {
    spdlog::error("Configuration error: {}", e.what());
    return 2;
  }
  spdlog::set_level(spdlog::level::from_str(app.log_level));
  spdlog::info("FrameRelay starting (config: {}, role: {}, transport: {})", cfg_path, role,
               app.broker.transport);

  const bool run_streamer = role != "detector";
  const bool run_detector = role != "streamer";

  MetricsRegistry metrics;

  std::unique_ptr<MemoryBroker> memory;
  if (app.broker.transport == "memory") {
    memory = std::make_unique<MemoryBroker>(app.broker.dead_letter_suffix);
    if (role != "all") {
      spdlog::warn("Memory transport only connects pipelines inside this process");
    }
  }
  auto make_client = [&]() -> std::unique_ptr<ChannelClient> {
    if (memory) return std::make_unique<MemoryChannelClient>(*memory, app.broker.reconnect_backoff);
    return std::make_unique<AmqpChannelClient>(app.broker);
  };

  std::unique_ptr<ChannelClient> producer_client;
  std::unique_ptr<ChannelClient> consumer_client;
  std::unique_ptr<ChannelClient> output_client;
  std::unique_ptr<VideoFrameSource> source;
  std::unique_ptr<Detector> detector;
  FanoutResultSink outputs;
  std::unique_ptr<DedupingResultSink> sink;
  std::unique_ptr<ProducerPipeline> producer;
  std::unique_ptr<ConsumerPipeline> consumer;

  try {
    if (run_streamer) {
      if (!is_valid_video_uri(app.streamer.capture.uri)) {
        throw ConfigError("invalid video URI: " + app.streamer.capture.uri);
      }
      producer_client = make_client();
      source = std::make_unique<VideoFrameSource>(app.streamer.capture);
      producer = std::make_unique<ProducerPipeline>(producer_config(app), *source,
                                                    *producer_client, metrics);
    }
    if (run_detector) {
      detector = createDetector(app.detector.model, static_cast<size_t>(app.detector.prefetch_limit));
      if (app.output.publish_detections) {
        output_client = make_client();
        outputs.add(std::make_unique<ChannelResultSink>(*output_client,
                                                        app.broker.detections_channel));
      }
      if (app.output.enable_csv_logging) {
        CsvSinkConfig csv;
        csv.csv_output_path = app.output.csv_output_path;
        outputs.add(std::make_unique<CsvResultSink>(csv));
      }
      if (outputs.empty()) spdlog::warn("No detection outputs enabled; results are discarded");
      sink = std::make_unique<DedupingResultSink>(outputs, app.output.dedup_window);
      consumer_client = make_client();
      consumer = std::make_unique<ConsumerPipeline>(consumer_config(app), *consumer_client,
                                                    *detector, *sink, metrics);
    }
  } catch (const std::exception& e) {
    spdlog::error("Startup failed: {}", e.what());
    return 1;
  }

  Supervisor supervisor;
  if (producer) supervisor.attach_producer(producer.get());
  if (consumer) supervisor.attach_consumer(consumer.get());

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/readyz", [&](const httplib::Request&, httplib::Response& res) {
    const bool ready = supervisor.alive();
    res.status = ready ? 200 : 503;
    res.set_content(std::string("{\"ready\":") + (ready ? "true" : "false") + "}",
                    "application/json");
  });

  svr.Get("/stats", [&](const httplib::Request&, httplib::Response& res) {
    auto s = metrics.snapshot();
    nlohmann::json j{{"role", role},
                     {"alive", supervisor.alive()},
                     {"frames_captured", s.frames_captured},
                     {"frames_published", s.frames_published},
                     {"frames_dropped", s.frames_dropped},
                     {"deliveries_received", s.deliveries_received},
                     {"acked", s.acked},
                     {"requeued", s.requeued},
                     {"dead_lettered", s.dead_lettered},
                     {"detections_emitted", s.detections_emitted},
                     {"drop_rate", s.drop_rate},
                     {"dead_letter_rate", s.dead_letter_rate},
                     {"publish_p95_ms", s.publish_p95},
                     {"detect_p95_ms", s.detect_p95},
                     {"e2e_p50_ms", s.e2e_p50},
                     {"e2e_p95_ms", s.e2e_p95},
                     {"e2e_p99_ms", s.e2e_p99},
                     {"failures", supervisor.failure_count()}};
    if (producer) {
      j["producer"] = {{"state", to_string(producer->state())},
                       {"buffered", producer->buffered()},
                       {"high_water", producer->high_water()}};
    }
    auto recent = nlohmann::json::array();
    for (const auto& f : supervisor.failures()) {
      recent.push_back(nlohmann::json{{"component", f.component}, {"message", f.message}});
    }
    j["recent_failures"] = recent;
    res.set_content(j.dump(2), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    auto s = metrics.snapshot();
    res.set_content(metrics.prometheus_text(s), "text/plain; version=0.0.4");
  });

  std::thread http_thread;
  if (app.metrics_port > 0) {
    if (svr.bind_to_port("0.0.0.0", app.metrics_port)) {
      spdlog::info("HTTP server listening on 0.0.0.0:{}", app.metrics_port);
      http_thread = std::thread([&] { svr.listen_after_bind(); });
    } else {
      spdlog::error("Cannot bind HTTP server to port {}; continuing without it", app.metrics_port);
    }
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  supervisor.start();

  // A streamer reading a finite file exits once everything it captured is published.
  const bool one_shot = run_streamer && !run_detector && !is_live_uri(app.streamer.capture.uri);
  while (!g_stop) {
    if (one_shot && supervisor.wait_until_idle(std::chrono::milliseconds(100))) {
      spdlog::info("Input exhausted; shutting down");
      break;
    }
    if (!one_shot) std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  supervisor.shutdown();
  if (http_thread.joinable()) {
    svr.stop();
    http_thread.join();
  }

  auto s = metrics.snapshot();
  spdlog::info("Shutdown complete. captured={} published={} dropped={} acked={} dead-lettered={}",
               s.frames_captured, s.frames_published, s.frames_dropped, s.acked, s.dead_lettered);
  return 0;
}
