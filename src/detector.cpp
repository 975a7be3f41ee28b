#include "detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

class DnnDetector::NetLease {
public:
  explicit NetLease(DnnDetector& owner) : owner_(owner), net_(owner.acquire()) {}
  ~NetLease() { owner_.release(net_); }
  cv::dnn::Net& net() { return net_; }

private:
  DnnDetector& owner_;
  cv::dnn::Net net_;
};

DnnDetector::DnnDetector(const DetectorConfig& config, size_t replicas) : config_(config) {
  if (!std::filesystem::exists(config_.model_path)) {
    throw std::runtime_error("Detection model not found: " + config_.model_path);
  }
  replicas = std::max<size_t>(1, replicas);
  for (size_t i = 0; i < replicas; ++i) {
    try {
      pool_.push_back(cv::dnn::readNetFromONNX(config_.model_path));
    } catch (const cv::Exception& e) {
      throw std::runtime_error("Failed to load " + config_.model_path + ": " + e.what());
    }
  }
  spdlog::info("Detector initialized: {} ({} replica(s), input {}x{}, threshold {:.2f})",
               config_.model_path, replicas, config_.input_size.width, config_.input_size.height,
               config_.detection_threshold);
}

cv::dnn::Net DnnDetector::acquire() {
  std::unique_lock<std::mutex> lk(pool_mu_);
  pool_cv_.wait(lk, [this] { return !pool_.empty(); });
  cv::dnn::Net net = pool_.back();
  pool_.pop_back();
  return net;
}

void DnnDetector::release(cv::dnn::Net net) {
  {
    std::lock_guard<std::mutex> g(pool_mu_);
    pool_.push_back(std::move(net));
  }
  pool_cv_.notify_one();
}

std::vector<BoundingBox> DnnDetector::detect(const Frame& frame) {
  cv::Mat image = cv::imdecode(frame.payload, cv::IMREAD_COLOR);
  if (image.empty()) {
    throw DetectionError(DetectionError::Kind::Permanent,
                         "frame " + std::to_string(frame.sequence_number) +
                             " payload is not a decodable image");
  }

  float scale = 1.0f;
  cv::Point offset;
  cv::Mat input = letterbox(image, config_.input_size, scale, offset);
  cv::Mat blob;
  cv::dnn::blobFromImage(input, blob, 1.0 / 255.0, config_.input_size, cv::Scalar(), true, false);

  cv::Mat output;
  try {
    NetLease lease(*this);
    lease.net().setInput(blob);
    output = lease.net().forward();
  } catch (const cv::Exception& e) {
    // Allocation and backend failures; the same frame may succeed on another attempt.
    throw DetectionError(DetectionError::Kind::Transient, std::string("inference failed: ") + e.what());
  }

  return decodeYoloOutput(output, config_, image.size(), scale, offset);
}

cv::Mat letterbox(const cv::Mat& input, const cv::Size& target_size, float& scale, cv::Point& offset) {
  scale = std::min(static_cast<float>(target_size.width) / static_cast<float>(input.cols),
                   static_cast<float>(target_size.height) / static_cast<float>(input.rows));

  cv::Size new_size(static_cast<int>(static_cast<float>(input.cols) * scale),
                    static_cast<int>(static_cast<float>(input.rows) * scale));
  cv::Mat resized;
  cv::resize(input, resized, new_size);

  // Pad to target size
  cv::Mat padded = cv::Mat::zeros(target_size, input.type());
  offset.x = (target_size.width - new_size.width) / 2;
  offset.y = (target_size.height - new_size.height) / 2;
  resized.copyTo(padded(cv::Rect(offset.x, offset.y, new_size.width, new_size.height)));
  return padded;
}

std::vector<BoundingBox> decodeYoloOutput(const cv::Mat& output, const DetectorConfig& config,
                                          const cv::Size& original_size, float scale,
                                          const cv::Point& offset) {
  std::vector<BoundingBox> detections;

  // YOLO v8/v11 output format: [batch, 4 + classes, anchors]
  if (output.dims != 3 || output.size[1] < 5 || output.type() != CV_32F) {
    throw DetectionError(DetectionError::Kind::Permanent, "unexpected YOLO output shape");
  }
  const int attrs = output.size[1];
  const int anchors = output.size[2];
  const int num_classes = attrs - 4;
  const float* data = output.ptr<float>();

  std::vector<cv::Rect> boxes;
  std::vector<float> confidences;
  std::vector<int> class_ids;

  for (int i = 0; i < anchors; ++i) {
    float cx = data[0 * anchors + i];
    float cy = data[1 * anchors + i];
    float w = data[2 * anchors + i];
    float h = data[3 * anchors + i];

    // Find the class with maximum confidence
    float max_confidence = 0.0f;
    int best_class_id = -1;
    for (int c = 0; c < num_classes; ++c) {
      float class_conf = data[(4 + c) * anchors + i];
      if (class_conf > max_confidence) {
        max_confidence = class_conf;
        best_class_id = c;
      }
    }
    if (max_confidence < config.detection_threshold) continue;

    // Undo letterbox padding and scaling
    float x = (cx - w / 2.0f - static_cast<float>(offset.x)) / scale;
    float y = (cy - h / 2.0f - static_cast<float>(offset.y)) / scale;
    int bbox_x = static_cast<int>(x);
    int bbox_y = static_cast<int>(y);
    int bbox_w = static_cast<int>(w / scale);
    int bbox_h = static_cast<int>(h / scale);

    // Ensure coordinates are within image bounds
    bbox_x = std::max(0, std::min(bbox_x, original_size.width - 1));
    bbox_y = std::max(0, std::min(bbox_y, original_size.height - 1));
    bbox_w = std::min(bbox_w, original_size.width - bbox_x);
    bbox_h = std::min(bbox_h, original_size.height - bbox_y);

    if (bbox_w > 0 && bbox_h > 0) {
      boxes.emplace_back(bbox_x, bbox_y, bbox_w, bbox_h);
      confidences.push_back(std::min(1.0f, max_confidence));
      class_ids.push_back(best_class_id);
    }
  }

  std::vector<int> nms_indices;
  cv::dnn::NMSBoxes(boxes, confidences, config.detection_threshold, config.nms_threshold,
                    nms_indices);

  const auto& names = cocoClassNames();
  for (int idx : nms_indices) {
    BoundingBox det;
    det.x = boxes[idx].x;
    det.y = boxes[idx].y;
    det.width = boxes[idx].width;
    det.height = boxes[idx].height;
    det.confidence = confidences[idx];
    det.class_id = class_ids[idx];
    if (det.class_id >= 0 && det.class_id < static_cast<int>(names.size())) {
      det.label = names[det.class_id];
    } else {
      det.label = "class_" + std::to_string(det.class_id);
    }
    detections.push_back(std::move(det));

    if (static_cast<int>(detections.size()) >= config.max_detections) break;
  }

  return detections;
}

const std::vector<std::string>& cocoClassNames() {
  static const std::vector<std::string> names = {
      "person",        "bicycle",      "car",
      "motorcycle",    "airplane",     "bus",
      "train",         "truck",        "boat",
      "traffic light", "fire hydrant", "stop sign",
      "parking meter", "bench",        "bird",
      "cat",           "dog",          "horse",
      "sheep",         "cow",          "elephant",
      "bear",          "zebra",        "giraffe",
      "backpack",      "umbrella",     "handbag",
      "tie",           "suitcase",     "frisbee",
      "skis",          "snowboard",    "sports ball",
      "kite",          "baseball bat", "baseball glove",
      "skateboard",    "surfboard",    "tennis racket",
      "bottle",        "wine glass",   "cup",
      "fork",          "knife",        "spoon",
      "bowl",          "banana",       "apple",
      "sandwich",      "orange",       "broccoli",
      "carrot",        "hot dog",      "pizza",
      "donut",         "cake",         "chair",
      "couch",         "potted plant", "bed",
      "dining table",  "toilet",       "tv",
      "laptop",        "mouse",        "remote",
      "keyboard",      "cell phone",   "microwave",
      "oven",          "toaster",      "sink",
      "refrigerator",  "book",         "clock",
      "vase",          "scissors",     "teddy bear",
      "hair drier",    "toothbrush"};
  return names;
}

std::unique_ptr<Detector> createDetector(const DetectorConfig& config, size_t replicas) {
  return std::make_unique<DnnDetector>(config, replicas);
}
