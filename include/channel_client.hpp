#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "backoff.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "types.hpp"

struct BrokerConfig {
  std::string transport{"amqp"};  // amqp | memory
  std::string host{"localhost"};
  int port{5672};
  std::string vhost{"/"};
  std::string user{"guest"};
  std::string password{"guest"};
  std::string frames_channel{"frames"};
  std::string detections_channel{"detections"};
  std::string dead_letter_suffix{".dead"};
  std::string queue_type{"quorum"};  // quorum | classic
  int heartbeat_s{0};
  int connect_timeout_ms{3000};
  int confirm_timeout_ms{5000};
  BackoffConfig reconnect_backoff{};
};

// Identifies one delivery within one connection session. Handles from an older
// session are stale: the broker already took those deliveries back.
struct AckHandle {
  uint64_t delivery_id{0};
  uint64_t session{0};
};

struct Delivery {
  Bytes body;
  uint64_t delivery_id{0};
  uint32_t attempt_count{1};
  AckHandle handle;
};

// Durable publish/subscribe channel with confirmed publishes and per-message
// acknowledgment. Implementations serialize their own internal access, so one
// instance may be shared by several threads without external locking.
class ChannelClient {
public:
  virtual ~ChannelClient() = default;

  // Opens a session. Fails fast with ConnectError; retry policy is the caller's.
  virtual void connect() = 0;
  virtual bool connected() const = 0;
  virtual void close() = 0;

  // Returns once the broker confirmed the message into its durable store.
  // Throws PublishError otherwise.
  virtual uint64_t publish(const std::string& channel, const Bytes& body) = 0;

  // Registers a consumer bounded to prefetch_limit unacknowledged deliveries.
  // Re-issued automatically after reconnect().
  virtual void subscribe(const std::string& channel, int prefetch_limit) = 0;

  // Throws ConnectError when the session is lost.
  virtual std::optional<Delivery> next_delivery(std::chrono::milliseconds timeout) = 0;

  // Both return false for a stale handle; the broker redelivers that message.
  virtual bool ack(const AckHandle& handle) = 0;
  virtual bool nack(const AckHandle& handle, bool requeue) = 0;

  // Retries connect() with exponential backoff until it succeeds or the token is
  // cancelled. Concurrent callers wait for the one already reconnecting.
  // Returns whether the client is connected.
  bool reconnect(const CancellationToken& cancel);

  // Sessions opened through reconnect().
  uint64_t sessions_opened() const { return sessions_opened_.load(); }

protected:
  explicit ChannelClient(BackoffConfig reconnect_backoff) : reconnect_backoff_(reconnect_backoff) {}

private:
  BackoffConfig reconnect_backoff_;
  std::mutex reconnect_mu_;
  std::atomic<uint64_t> sessions_opened_{0};
};
