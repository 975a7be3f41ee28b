#pragma once
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "channel_client.hpp"
#include "types.hpp"

// Receives Detection records from the consumer. emit() returning normally means
// the sink has taken ownership; the consumer acks only after that. Throwing
// makes the consumer requeue the frame.
class ResultSink {
public:
  virtual ~ResultSink() = default;
  virtual void emit(const Detection& detection) = 0;
};

// Drops repeats of (source_id, frame_sequence_number, attempt_count) inside a
// bounded window of recently seen keys before forwarding to the wrapped sink.
class DedupingResultSink : public ResultSink {
public:
  DedupingResultSink(ResultSink& inner, size_t window = 4096);

  void emit(const Detection& detection) override;

  uint64_t duplicates() const;

private:
  using Key = std::tuple<std::string, uint64_t, uint32_t>;

  ResultSink& inner_;
  size_t window_;
  mutable std::mutex mu_;
  std::set<Key> seen_;
  std::deque<Key> order_;
  uint64_t duplicates_{0};
};

// Publishes each Detection as JSON on a broker channel with a confirmed publish.
class ChannelResultSink : public ResultSink {
public:
  ChannelResultSink(ChannelClient& client, std::string channel);

  void emit(const Detection& detection) override;

private:
  ChannelClient& client_;
  std::string channel_;
  std::mutex connect_mu_;
};

struct CsvSinkConfig {
  std::string csv_output_path = "output/detections.csv";
  bool flush_each_row = true;
};

// One row per box (or one empty row for a frame with no boxes).
class CsvResultSink : public ResultSink {
public:
  explicit CsvResultSink(const CsvSinkConfig& config);
  ~CsvResultSink() override;

  void emit(const Detection& detection) override;

private:
  void writeCSVHeader();

  CsvSinkConfig config_;
  std::mutex mu_;
  std::ofstream csv_file_;
};

class FanoutResultSink : public ResultSink {
public:
  void add(std::unique_ptr<ResultSink> sink) { sinks_.push_back(std::move(sink)); }
  bool empty() const { return sinks_.empty(); }

  void emit(const Detection& detection) override;

private:
  std::vector<std::unique_ptr<ResultSink>> sinks_;
};
