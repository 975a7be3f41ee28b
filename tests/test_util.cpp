#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include "util.hpp"

class ConfigLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "framerelay_tests";
        std::filesystem::create_directories(test_dir);
        unsetenv("RABBITMQ_USER");
        unsetenv("RABBITMQ_PASS");
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
        unsetenv("RABBITMQ_USER");
        unsetenv("RABBITMQ_PASS");
    }

    void createTestConfig(const std::string& filename, const std::string& content) {
        std::ofstream file(test_dir / filename);
        file << content;
        file.close();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigLoadTest, BasicConfigLoad) {
    const std::string config_content = R"(
broker:
  transport: amqp
  host: rabbit.local
  port: 5673
  vhost: /video
  frames_channel: cams
  queue_type: classic

backoff:
  base_ms: 100
  max_ms: 2000
  multiplier: 1.5
  jitter: 0.1

streamer:
  source_id: lobby
  uri: "0"
  width: 1280
  height: 720
  fps: 15
  queue_capacity: 16
  max_publish_retries: 3

detector:
  prefetch_limit: 4
  max_attempts: 2
  model_path: models/custom.onnx
  input_width: 320
  input_height: 320
  detection_threshold: 0.35

output:
  enable_csv_logging: true
  csv_output_path: out/d.csv

logging:
  level: debug

telemetry:
  metrics_port: 9191
)";

    createTestConfig("basic_config.yaml", config_content);
    AppConfig config = load_config((test_dir / "basic_config.yaml").string());

    EXPECT_EQ(config.broker.host, "rabbit.local");
    EXPECT_EQ(config.broker.port, 5673);
    EXPECT_EQ(config.broker.vhost, "/video");
    EXPECT_EQ(config.broker.frames_channel, "cams");
    EXPECT_EQ(config.broker.queue_type, "classic");

    EXPECT_EQ(config.backoff.base_ms, 100);
    EXPECT_DOUBLE_EQ(config.backoff.multiplier, 1.5);
    EXPECT_EQ(config.broker.reconnect_backoff.max_ms, 2000);

    EXPECT_EQ(config.streamer.source_id, "lobby");
    EXPECT_EQ(config.streamer.capture.uri, "0");
    EXPECT_EQ(config.streamer.capture.width, 1280);
    EXPECT_EQ(config.streamer.capture.fps, 15);
    EXPECT_EQ(config.streamer.queue_capacity, 16);
    EXPECT_EQ(config.streamer.max_publish_retries, 3);

    EXPECT_EQ(config.detector.prefetch_limit, 4);
    EXPECT_EQ(config.detector.max_attempts, 2);
    EXPECT_EQ(config.detector.model.model_path, "models/custom.onnx");
    EXPECT_EQ(config.detector.model.input_size, cv::Size(320, 320));
    EXPECT_FLOAT_EQ(config.detector.model.detection_threshold, 0.35f);

    EXPECT_TRUE(config.output.enable_csv_logging);
    EXPECT_EQ(config.output.csv_output_path, "out/d.csv");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.metrics_port, 9191);
}

TEST_F(ConfigLoadTest, MissingKeysKeepDefaults) {
    AppConfig config = load_config_string("streamer:\n  source_id: cam7\n");

    EXPECT_EQ(config.streamer.source_id, "cam7");
    EXPECT_EQ(config.broker.transport, "amqp");
    EXPECT_EQ(config.broker.host, "localhost");
    EXPECT_EQ(config.broker.port, 5672);
    EXPECT_EQ(config.broker.user, "guest");
    EXPECT_EQ(config.broker.dead_letter_suffix, ".dead");
    EXPECT_EQ(config.streamer.queue_capacity, 8);
    EXPECT_EQ(config.streamer.max_capture_restarts, -1);
    EXPECT_EQ(config.detector.prefetch_limit, 1);
    EXPECT_EQ(config.detector.max_attempts, 3);
    EXPECT_TRUE(config.output.publish_detections);
    EXPECT_FALSE(config.output.enable_csv_logging);
    EXPECT_EQ(config.output.dedup_window, 4096u);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.metrics_port, 9090);
}

TEST_F(ConfigLoadTest, EmptyDocumentIsAllDefaults) {
    AppConfig config = load_config_string("");
    EXPECT_EQ(config.streamer.source_id, "cam0");
    EXPECT_EQ(config.broker.frames_channel, "frames");
}

TEST_F(ConfigLoadTest, EnvironmentOverridesCredentials) {
    setenv("RABBITMQ_USER", "relay", 1);
    setenv("RABBITMQ_PASS", "s3cret", 1);
    AppConfig config = load_config_string("broker:\n  user: fromfile\n  password: fromfile\n");
    EXPECT_EQ(config.broker.user, "relay");
    EXPECT_EQ(config.broker.password, "s3cret");
}

TEST_F(ConfigLoadTest, EmptyEnvironmentValueIsIgnored) {
    setenv("RABBITMQ_USER", "", 1);
    AppConfig config = load_config_string("broker:\n  user: fromfile\n");
    EXPECT_EQ(config.broker.user, "fromfile");
}

TEST_F(ConfigLoadTest, MissingFileIsConfigError) {
    EXPECT_THROW(load_config((test_dir / "nope.yaml").string()), ConfigError);
}

TEST_F(ConfigLoadTest, MalformedYamlIsConfigError) {
    createTestConfig("bad.yaml", "broker: [unclosed\n");
    EXPECT_THROW(load_config((test_dir / "bad.yaml").string()), ConfigError);
}

TEST_F(ConfigLoadTest, WrongValueTypeIsConfigError) {
    EXPECT_THROW(load_config_string("broker:\n  port: not_a_number\n"), ConfigError);
}

class ConfigValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("RABBITMQ_USER");
        unsetenv("RABBITMQ_PASS");
    }
};

TEST_F(ConfigValidationTest, DefaultsAreValid) {
    EXPECT_NO_THROW(validate_config(AppConfig{}));
}

TEST_F(ConfigValidationTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(load_config_string("broker:\n  transport: kafka\n"), ConfigError);
    EXPECT_THROW(load_config_string("broker:\n  queue_type: stream\n"), ConfigError);
    EXPECT_THROW(load_config_string("broker:\n  port: 70000\n"), ConfigError);
    EXPECT_THROW(load_config_string("broker:\n  dead_letter_suffix: \"\"\n"), ConfigError);
    EXPECT_THROW(load_config_string("backoff:\n  base_ms: 500\n  max_ms: 100\n"), ConfigError);
    EXPECT_THROW(load_config_string("backoff:\n  multiplier: 0.5\n"), ConfigError);
    EXPECT_THROW(load_config_string("backoff:\n  jitter: 2.0\n"), ConfigError);
    EXPECT_THROW(load_config_string("streamer:\n  queue_capacity: 0\n"), ConfigError);
    EXPECT_THROW(load_config_string("streamer:\n  source_id: \"\"\n"), ConfigError);
    EXPECT_THROW(load_config_string("streamer:\n  max_capture_restarts: -2\n"), ConfigError);
    EXPECT_THROW(load_config_string("detector:\n  prefetch_limit: 0\n"), ConfigError);
    EXPECT_THROW(load_config_string("detector:\n  max_attempts: 0\n"), ConfigError);
    EXPECT_THROW(load_config_string("logging:\n  level: verbose\n"), ConfigError);
    EXPECT_THROW(load_config_string("telemetry:\n  metrics_port: -1\n"), ConfigError);
}

TEST_F(ConfigValidationTest, ClassicQueuesCannotCountPastTwoAttempts) {
    EXPECT_THROW(load_config_string("broker:\n  queue_type: classic\n"), ConfigError);
    EXPECT_THROW(load_config_string("broker:\n  queue_type: classic\n"
                                    "detector:\n  max_attempts: 5\n"),
                 ConfigError);
    AppConfig config = load_config_string("broker:\n  queue_type: classic\n"
                                          "detector:\n  max_attempts: 2\n");
    EXPECT_EQ(config.detector.max_attempts, 2);
    EXPECT_NO_THROW(load_config_string("broker:\n  queue_type: quorum\n"
                                       "detector:\n  max_attempts: 10\n"));
}

TEST_F(ConfigValidationTest, MemoryTransportIsAccepted) {
    AppConfig config = load_config_string("broker:\n  transport: memory\n");
    EXPECT_EQ(config.broker.transport, "memory");
}

TEST(PipelineConfigTest, ProducerConfigMapping) {
    AppConfig app;
    app.streamer.source_id = "dock";
    app.broker.frames_channel = "video";
    app.streamer.queue_capacity = 3;
    app.streamer.max_publish_retries = 7;
    app.streamer.max_capture_restarts = 2;
    app.streamer.drain_timeout_ms = 1234;
    app.backoff.base_ms = 42;

    ProducerConfig p = producer_config(app);
    EXPECT_EQ(p.source_id, "dock");
    EXPECT_EQ(p.channel, "video");
    EXPECT_EQ(p.queue_capacity, 3);
    EXPECT_EQ(p.max_publish_retries, 7);
    EXPECT_EQ(p.max_capture_restarts, 2);
    EXPECT_EQ(p.drain_timeout, std::chrono::milliseconds(1234));
    EXPECT_EQ(p.publish_backoff.base_ms, 42);
    EXPECT_EQ(p.capture_backoff.base_ms, 42);
}

TEST(PipelineConfigTest, ConsumerConfigMapping) {
    AppConfig app;
    app.broker.frames_channel = "video";
    app.detector.prefetch_limit = 6;
    app.detector.max_attempts = 2;
    app.detector.poll_interval_ms = 50;
    app.detector.shutdown_deadline_ms = 900;

    ConsumerConfig k = consumer_config(app);
    EXPECT_EQ(k.channel, "video");
    EXPECT_EQ(k.prefetch_limit, 6);
    EXPECT_EQ(k.max_attempts, 2);
    EXPECT_EQ(k.poll_interval, std::chrono::milliseconds(50));
    EXPECT_EQ(k.shutdown_deadline, std::chrono::milliseconds(900));
}
