#include "metrics.hpp"
#include <sstream>

const char* MetricsRegistry::name(Counter c) {
  switch (c) {
    case Counter::FramesCaptured: return "frames_captured_total";
    case Counter::FramesPublished: return "frames_published_total";
    case Counter::FramesDroppedBackpressure: return "frames_dropped_backpressure_total";
    case Counter::FramesPublishFailed: return "frames_publish_failed_total";
    case Counter::FramesDiscardedOnShutdown: return "frames_discarded_on_shutdown_total";
    case Counter::FramesSuperseded: return "frames_superseded_total";
    case Counter::PublishRetries: return "publish_retries_total";
    case Counter::CaptureErrors: return "capture_errors_total";
    case Counter::DeliveriesReceived: return "deliveries_received_total";
    case Counter::Acked: return "deliveries_acked_total";
    case Counter::Requeued: return "deliveries_requeued_total";
    case Counter::DeadLettered: return "deliveries_dead_lettered_total";
    case Counter::DecodeFailures: return "decode_failures_total";
    case Counter::DetectionFailures: return "detection_failures_total";
    case Counter::DetectionsEmitted: return "detections_emitted_total";
    case Counter::StaleAcks: return "stale_acks_total";
    case Counter::SequenceGaps: return "sequence_gaps_total";
    case Counter::ProtocolViolations: return "protocol_violations_total";
    case Counter::Reconnects: return "broker_reconnects_total";
    case Counter::kCount: break;
  }
  return "unknown";
}

StatSnapshot MetricsRegistry::snapshot() const {
  StatSnapshot s{};
  s.publish_p50 = publish_.perc(50); s.publish_p95 = publish_.perc(95); s.publish_p99 = publish_.perc(99);
  s.detect_p50 = detect_.perc(50);   s.detect_p95 = detect_.perc(95);   s.detect_p99 = detect_.perc(99);
  s.e2e_p50 = e2e_.perc(50);         s.e2e_p95 = e2e_.perc(95);         s.e2e_p99 = e2e_.perc(99);

  s.frames_captured = get(Counter::FramesCaptured);
  s.frames_published = get(Counter::FramesPublished);
  s.frames_dropped = get(Counter::FramesDroppedBackpressure) + get(Counter::FramesPublishFailed) +
                     get(Counter::FramesDiscardedOnShutdown);
  s.deliveries_received = get(Counter::DeliveriesReceived);
  s.acked = get(Counter::Acked);
  s.requeued = get(Counter::Requeued);
  s.dead_lettered = get(Counter::DeadLettered);
  s.detections_emitted = get(Counter::DetectionsEmitted);

  s.drop_rate = s.frames_captured
                    ? static_cast<double>(s.frames_dropped) / static_cast<double>(s.frames_captured)
                    : 0.0;
  s.dead_letter_rate = s.deliveries_received ? static_cast<double>(s.dead_lettered) /
                                                   static_cast<double>(s.deliveries_received)
                                             : 0.0;
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "publish_latency_ms{quantile=\"0.5\"} "  << s.publish_p50 << "\n";
  os << "publish_latency_ms{quantile=\"0.95\"} " << s.publish_p95 << "\n";
  os << "publish_latency_ms{quantile=\"0.99\"} " << s.publish_p99 << "\n";
  os << "detect_latency_ms{quantile=\"0.5\"} "  << s.detect_p50 << "\n";
  os << "detect_latency_ms{quantile=\"0.95\"} " << s.detect_p95 << "\n";
  os << "detect_latency_ms{quantile=\"0.99\"} " << s.detect_p99 << "\n";
  os << "frame_e2e_ms{quantile=\"0.5\"} "  << s.e2e_p50 << "\n";
  os << "frame_e2e_ms{quantile=\"0.95\"} " << s.e2e_p95 << "\n";
  os << "frame_e2e_ms{quantile=\"0.99\"} " << s.e2e_p99 << "\n";

  for (size_t i = 0; i < static_cast<size_t>(Counter::kCount); ++i) {
    auto c = static_cast<Counter>(i);
    os << name(c) << " " << get(c) << "\n";
  }

  os << "frame_drop_rate " << s.drop_rate << "\n";
  os << "dead_letter_rate " << s.dead_letter_rate << "\n";
  return os.str();
}
