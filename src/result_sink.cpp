#include "result_sink.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iomanip>

#include "frame_codec.hpp"

DedupingResultSink::DedupingResultSink(ResultSink& inner, size_t window)
    : inner_(inner), window_(std::max<size_t>(1, window)) {}

void DedupingResultSink::emit(const Detection& d) {
  Key key{d.source_id, d.frame_sequence_number, d.attempt_count};
  {
    std::lock_guard<std::mutex> g(mu_);
    if (seen_.count(key)) {
      duplicates_++;
      spdlog::debug("Duplicate detection {}#{} (attempt {}) suppressed", d.source_id,
                    d.frame_sequence_number, d.attempt_count);
      return;
    }
  }

  inner_.emit(d);

  // Record only after the inner sink accepted it, so a failed emit can be retried.
  std::lock_guard<std::mutex> g(mu_);
  if (seen_.insert(key).second) {
    order_.push_back(std::move(key));
    if (order_.size() > window_) {
      seen_.erase(order_.front());
      order_.pop_front();
    }
  }
}

uint64_t DedupingResultSink::duplicates() const {
  std::lock_guard<std::mutex> g(mu_);
  return duplicates_;
}

ChannelResultSink::ChannelResultSink(ChannelClient& client, std::string channel)
    : client_(client), channel_(std::move(channel)) {}

void ChannelResultSink::emit(const Detection& d) {
  // One connect attempt only; a ConnectError sends the frame back for redelivery.
  {
    std::lock_guard<std::mutex> g(connect_mu_);
    if (!client_.connected()) client_.connect();
  }
  const std::string text = encode_detection(d);
  client_.publish(channel_, Bytes(text.begin(), text.end()));
}

CsvResultSink::CsvResultSink(const CsvSinkConfig& config) : config_(config) {
  std::filesystem::path csv_path(config_.csv_output_path);
  std::filesystem::path directory = csv_path.parent_path();
  if (!directory.empty() && !std::filesystem::exists(directory)) {
    std::filesystem::create_directories(directory);
    spdlog::info("Created CSV output directory: {}", directory.string());
  }

  csv_file_.open(config_.csv_output_path, std::ios::out | std::ios::trunc);
  if (!csv_file_.is_open()) {
    throw std::runtime_error("Failed to open CSV file for writing: " + config_.csv_output_path);
  }
  writeCSVHeader();
  spdlog::info("CSV logging initialized: {}", config_.csv_output_path);
}

CsvResultSink::~CsvResultSink() {
  if (csv_file_.is_open()) {
    csv_file_.flush();
    csv_file_.close();
  }
}

void CsvResultSink::writeCSVHeader() {
  csv_file_ << "source_id,frame_sequence_number,attempt_count,captured_at_ns,processed_at_ns,"
               "box_index,label,class_id,confidence,x,y,width,height\n";
  csv_file_.flush();
}

void CsvResultSink::emit(const Detection& d) {
  std::lock_guard<std::mutex> g(mu_);
  const auto prefix = [&] {
    csv_file_ << d.source_id << "," << d.frame_sequence_number << "," << d.attempt_count << ","
              << to_unix_ns(d.captured_at) << "," << to_unix_ns(d.processed_at);
  };

  if (d.boxes.empty()) {
    prefix();
    csv_file_ << ",-1,,,,,,,\n";
  }
  for (size_t i = 0; i < d.boxes.size(); ++i) {
    const auto& b = d.boxes[i];
    prefix();
    csv_file_ << "," << i << "," << b.label << "," << b.class_id << "," << std::fixed
              << std::setprecision(4) << b.confidence << std::defaultfloat << "," << b.x << ","
              << b.y << "," << b.width << "," << b.height << "\n";
  }
  if (config_.flush_each_row) csv_file_.flush();
  if (!csv_file_) throw std::runtime_error("CSV write failed: " + config_.csv_output_path);
}

void FanoutResultSink::emit(const Detection& d) {
  for (auto& s : sinks_) s->emit(d);
}
