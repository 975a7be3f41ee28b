#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

// Frames carry producer wall-clock time so consumers on other hosts can compare.
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

using Bytes = std::vector<uint8_t>;

struct Frame {
  std::string source_id;
  uint64_t sequence_number{0};
  WallTime captured_at{};
  Bytes payload;

  bool operator==(const Frame& o) const {
    return source_id == o.source_id && sequence_number == o.sequence_number &&
           captured_at == o.captured_at && payload == o.payload;
  }
  bool operator!=(const Frame& o) const { return !(*this == o); }
};

// Output of the capture collaborator; the producer assigns the sequence number.
struct RawFrame {
  Bytes payload;
  WallTime captured_at{};
};

struct Envelope {
  Frame frame;
  uint64_t delivery_id{0};
  uint32_t attempt_count{1};
};

struct BoundingBox {
  std::string label;
  int class_id{-1};
  float confidence{0.0f};
  int x{0}, y{0}, width{0}, height{0};

  bool operator==(const BoundingBox& o) const {
    return label == o.label && class_id == o.class_id && confidence == o.confidence &&
           x == o.x && y == o.y && width == o.width && height == o.height;
  }
};

// A Detection with no boxes means "nothing found"; a failed detection produces no record.
struct Detection {
  std::string source_id;
  uint64_t frame_sequence_number{0};
  uint32_t attempt_count{1};
  std::vector<BoundingBox> boxes;
  WallTime captured_at{};
  WallTime processed_at{};
};

enum class ProducerState { Idle, Capturing, Publishing, Draining, Stopped };

inline const char* to_string(ProducerState s) {
  switch (s) {
    case ProducerState::Idle: return "idle";
    case ProducerState::Capturing: return "capturing";
    case ProducerState::Publishing: return "publishing";
    case ProducerState::Draining: return "draining";
    case ProducerState::Stopped: return "stopped";
  }
  return "unknown";
}

// Terminal outcome of one delivery in the consumer.
enum class DeliveryOutcome { Acked, Requeued, DeadLettered, Abandoned };

inline const char* to_string(DeliveryOutcome o) {
  switch (o) {
    case DeliveryOutcome::Acked: return "acked";
    case DeliveryOutcome::Requeued: return "requeued";
    case DeliveryOutcome::DeadLettered: return "dead-lettered";
    case DeliveryOutcome::Abandoned: return "abandoned";
  }
  return "unknown";
}

// Pipelines report failures they recovered from (or gave up on) through this hook.
using FailureHandler = std::function<void(const std::string& component, const std::string& message)>;
