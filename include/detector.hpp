#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/dnn.hpp>
#include <opencv2/opencv.hpp>

#include "errors.hpp"
#include "types.hpp"

// Detection collaborator. Must be a pure function of the frame content: the
// consumer may call it again for a redelivered frame. Failures are reported as
// DetectionError with a transient or permanent kind.
class Detector {
public:
  virtual ~Detector() = default;
  virtual std::vector<BoundingBox> detect(const Frame& frame) = 0;
};

struct DetectorConfig {
  std::string model_path = "models/yolov11n.onnx";
  cv::Size input_size{640, 640};

  float detection_threshold = 0.5f;
  float nms_threshold = 0.4f;
  int max_detections = 100;
};

// YOLO (v8/v11 ONNX export, [1, 4 + classes, anchors] output) through OpenCV DNN.
// cv::dnn::Net is not safe for concurrent forward(), so the detector keeps one
// replica per consumer worker and hands them out per call.
class DnnDetector : public Detector {
public:
  DnnDetector(const DetectorConfig& config, size_t replicas);

  std::vector<BoundingBox> detect(const Frame& frame) override;

  const DetectorConfig& getConfig() const { return config_; }

private:
  class NetLease;

  cv::dnn::Net acquire();
  void release(cv::dnn::Net net);

  DetectorConfig config_;
  std::mutex pool_mu_;
  std::condition_variable pool_cv_;
  std::vector<cv::dnn::Net> pool_;
};

// COCO labels, indexed by class id.
const std::vector<std::string>& cocoClassNames();

// Resizes keeping aspect ratio and pads to target. scale and offset map model
// coordinates back to the source image.
cv::Mat letterbox(const cv::Mat& frame, const cv::Size& target, float& scale, cv::Point& offset);

// Turns a [1, 4 + classes, anchors] YOLO output into boxes in source image
// coordinates: confidence threshold, NMS, max_detections.
std::vector<BoundingBox> decodeYoloOutput(const cv::Mat& output, const DetectorConfig& config,
                                          const cv::Size& original_size, float scale,
                                          const cv::Point& offset);

std::unique_ptr<Detector> createDetector(const DetectorConfig& config, size_t replicas);
