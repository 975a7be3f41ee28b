#include "frame_codec.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace std::chrono;

int64_t to_unix_ns(WallTime t) {
  return duration_cast<nanoseconds>(t.time_since_epoch()).count();
}

WallTime from_unix_ns(int64_t ns) {
  return WallTime(duration_cast<WallClock::duration>(nanoseconds(ns)));
}

Bytes encode_frame(const Frame& frame) {
  json j;
  j["v"] = kFrameFormatVersion;
  j["src"] = frame.source_id;
  j["seq"] = frame.sequence_number;
  j["ts"] = to_unix_ns(frame.captured_at);
  j["img"] = json::binary(frame.payload);
  return json::to_msgpack(j);
}

Frame decode_frame(const Bytes& bytes) {
  if (bytes.empty()) throw DecodeError("empty payload");

  json j;
  try {
    j = json::from_msgpack(bytes);
  } catch (const json::exception& e) {
    throw DecodeError(std::string("malformed frame: ") + e.what());
  }

  if (!j.is_object()) throw DecodeError("frame is not a map");
  if (!j.contains("v") || !j["v"].is_number_integer()) throw DecodeError("missing format version");
  const auto version = j["v"].get<int64_t>();
  if (version != kFrameFormatVersion) {
    throw DecodeError("unsupported frame version " + std::to_string(version));
  }

  if (!j.contains("src") || !j["src"].is_string()) throw DecodeError("missing source id");
  if (!j.contains("seq") || !j["seq"].is_number_unsigned()) throw DecodeError("missing sequence number");
  if (!j.contains("ts") || !j["ts"].is_number_integer()) throw DecodeError("missing capture time");
  if (!j.contains("img") || !j["img"].is_binary()) throw DecodeError("missing image payload");

  Frame f;
  f.source_id = j["src"].get<std::string>();
  f.sequence_number = j["seq"].get<uint64_t>();
  f.captured_at = from_unix_ns(j["ts"].get<int64_t>());
  const auto& img = j["img"].get_binary();
  f.payload.assign(img.begin(), img.end());
  return f;
}

std::string encode_detection(const Detection& d) {
  json boxes = json::array();
  for (const auto& b : d.boxes) {
    boxes.push_back({{"label", b.label},
                     {"class_id", b.class_id},
                     {"confidence", b.confidence},
                     {"x", b.x},
                     {"y", b.y},
                     {"width", b.width},
                     {"height", b.height}});
  }
  json j{{"source_id", d.source_id},
         {"frame_sequence_number", d.frame_sequence_number},
         {"attempt_count", d.attempt_count},
         {"captured_at_ns", to_unix_ns(d.captured_at)},
         {"processed_at_ns", to_unix_ns(d.processed_at)},
         {"boxes", boxes}};
  return j.dump();
}

Detection decode_detection(const std::string& text) {
  try {
    json j = json::parse(text);
    Detection d;
    d.source_id = j.at("source_id").get<std::string>();
    d.frame_sequence_number = j.at("frame_sequence_number").get<uint64_t>();
    d.attempt_count = j.at("attempt_count").get<uint32_t>();
    d.captured_at = from_unix_ns(j.at("captured_at_ns").get<int64_t>());
    d.processed_at = from_unix_ns(j.at("processed_at_ns").get<int64_t>());
    for (const auto& b : j.at("boxes")) {
      BoundingBox box;
      box.label = b.at("label").get<std::string>();
      box.class_id = b.at("class_id").get<int>();
      box.confidence = b.at("confidence").get<float>();
      box.x = b.at("x").get<int>();
      box.y = b.at("y").get<int>();
      box.width = b.at("width").get<int>();
      box.height = b.at("height").get<int>();
      d.boxes.push_back(std::move(box));
    }
    return d;
  } catch (const json::exception& e) {
    throw DecodeError(std::string("malformed detection: ") + e.what());
  }
}
