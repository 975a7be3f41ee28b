#pragma once
#include <opencv2/videoio.hpp>

#include <optional>
#include <string>

#include "errors.hpp"
#include "types.hpp"

// Capture collaborator. next_frame() returns std::nullopt at end of stream and
// throws CaptureError when the device or stream fails.
class FrameSource {
public:
  virtual ~FrameSource() = default;
  virtual void open() = 0;
  virtual std::optional<RawFrame> next_frame() = 0;
  virtual void close() = 0;
};

struct CaptureConfig {
  std::string uri{"0"};  // "0" = default webcam, otherwise file path or stream URL
  int width{0};          // 0 keeps the native size
  int height{0};
  int fps{25};
  bool pace{false};      // sleep to fps between reads; for file inputs
  int jpeg_quality{85};
};

// Accepted URIs: https:// or rtsp:// URLs, a webcam index, or an existing file.
bool is_valid_video_uri(const std::string& uri);
// Webcams and network streams never "end"; a failed read on them is an error.
bool is_live_uri(const std::string& uri);

class VideoFrameSource : public FrameSource {
public:
  explicit VideoFrameSource(CaptureConfig cfg);
  ~VideoFrameSource() override;

  void open() override;
  std::optional<RawFrame> next_frame() override;
  void close() override;

private:
  CaptureConfig cfg_;
  bool live_;
  cv::VideoCapture cap_;
  TimePoint last_read_{};
};
