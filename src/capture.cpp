#include "capture.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <regex>
#include <thread>

namespace {

bool is_webcam_index(const std::string& uri) {
  return !uri.empty() &&
         std::all_of(uri.begin(), uri.end(), [](unsigned char c) { return std::isdigit(c); });
}

}  // namespace

bool is_valid_video_uri(const std::string& uri) {
  static const std::regex kRemote(R"(^(https|rtsp)://\S+$)");
  if (std::regex_match(uri, kRemote)) return true;
  if (is_webcam_index(uri)) return true;
  std::error_code ec;
  return !uri.empty() && std::filesystem::is_regular_file(uri, ec);
}

bool is_live_uri(const std::string& uri) {
  return is_webcam_index(uri) || uri.rfind("rtsp://", 0) == 0 || uri.rfind("rtmp://", 0) == 0;
}

VideoFrameSource::VideoFrameSource(CaptureConfig cfg)
    : cfg_(std::move(cfg)), live_(is_live_uri(cfg_.uri)) {}

VideoFrameSource::~VideoFrameSource() { close(); }

void VideoFrameSource::open() {
  if (cfg_.uri.empty()) throw CaptureError("no input configured");
  bool ok = is_webcam_index(cfg_.uri) ? cap_.open(std::stoi(cfg_.uri)) : cap_.open(cfg_.uri);
  if (!ok || !cap_.isOpened()) throw CaptureError("cannot open input '" + cfg_.uri + "'");

  if (cfg_.width > 0) cap_.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
  if (cfg_.height > 0) cap_.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);
  spdlog::info("Opened input '{}' ({}, ~{} fps)", cfg_.uri, live_ ? "live" : "file", cfg_.fps);
  last_read_ = TimePoint{};
}

std::optional<RawFrame> VideoFrameSource::next_frame() {
  if (!cap_.isOpened()) throw CaptureError("input '" + cfg_.uri + "' is not open");

  if (cfg_.pace && cfg_.fps > 0 && last_read_ != TimePoint{}) {
    const auto period = std::chrono::microseconds(1000000 / cfg_.fps);
    const auto next_due = last_read_ + period;
    const auto now = Clock::now();
    if (next_due > now) std::this_thread::sleep_for(next_due - now);
  }

  cv::Mat raw;
  if (!cap_.read(raw) || raw.empty()) {
    if (live_) throw CaptureError("read failed on live input '" + cfg_.uri + "'");
    return std::nullopt;
  }
  last_read_ = Clock::now();

  RawFrame f;
  f.captured_at = WallClock::now();

  cv::Mat out = raw;
  if (cfg_.width > 0 && cfg_.height > 0 && (raw.cols != cfg_.width || raw.rows != cfg_.height)) {
    cv::resize(raw, out, cv::Size(cfg_.width, cfg_.height));
  }
  const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, std::clamp(cfg_.jpeg_quality, 0, 100)};
  if (!cv::imencode(".jpg", out, f.payload, params)) {
    throw CaptureError("JPEG encoding failed for input '" + cfg_.uri + "'");
  }
  return f;
}

void VideoFrameSource::close() {
  if (cap_.isOpened()) cap_.release();
}
