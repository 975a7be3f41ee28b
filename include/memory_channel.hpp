#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "channel_client.hpp"

// In-process broker with the delivery contract of a durable queue: confirmed
// publishes, per-session prefetch accounting, manual ack/nack, requeue of
// in-flight deliveries when a session is lost, and a dead-letter queue per
// channel. Used for single-process runs and tests; it also carries fault
// injection hooks for exercising reconnect and retry paths.
class MemoryBroker {
public:
  explicit MemoryBroker(std::string dead_letter_suffix = ".dead");

  // Unavailable brokers refuse new sessions and drop the existing ones.
  void set_available(bool up);
  bool available() const;
  // The next n publishes fail with PublishError without storing the message.
  void fail_next_publishes(int n);
  // Simulates a broker restart: every session is lost, in-flight deliveries return to their queues.
  void drop_connections();

  uint64_t open_session();
  void close_session(uint64_t session);
  bool session_alive(uint64_t session) const;

  uint64_t publish(uint64_t session, const std::string& channel, const Bytes& body);
  void consume(uint64_t session, const std::string& channel, int prefetch_limit);
  std::optional<Delivery> next(uint64_t session, std::chrono::milliseconds timeout);
  bool ack(uint64_t session, uint64_t delivery_id);
  bool nack(uint64_t session, uint64_t delivery_id, bool requeue);

  std::string dead_letter_channel(const std::string& channel) const {
    return channel + dead_letter_suffix_;
  }

  // Inspection
  size_t depth(const std::string& channel) const;
  size_t in_flight(const std::string& channel) const;
  std::vector<Bytes> ready_messages(const std::string& channel) const;
  uint64_t published_total() const;
  uint64_t acked_total() const;
  uint64_t requeued_total() const;
  uint64_t dead_lettered_total() const;

private:
  struct StoredMessage {
    uint64_t id{0};
    Bytes body;
    uint32_t deliveries{0};
  };
  struct InFlight {
    std::string channel;
    uint64_t session{0};
    StoredMessage msg;
  };
  struct Session {
    std::string channel;
    int prefetch{0};
    size_t unacked{0};
  };

  void drop_session_locked(uint64_t session);
  bool deliverable_locked(const Session& s) const;

  std::string dead_letter_suffix_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool available_{true};
  int fail_publishes_{0};
  uint64_t next_session_{1};
  uint64_t next_message_id_{1};
  uint64_t next_delivery_id_{1};
  std::unordered_map<uint64_t, Session> sessions_;
  std::unordered_map<std::string, std::deque<StoredMessage>> queues_;
  std::unordered_map<uint64_t, InFlight> in_flight_;

  uint64_t published_{0};
  uint64_t acked_{0};
  uint64_t requeued_{0};
  uint64_t dead_lettered_{0};
};

class MemoryChannelClient : public ChannelClient {
public:
  explicit MemoryChannelClient(MemoryBroker& broker, BackoffConfig reconnect_backoff = {});
  ~MemoryChannelClient() override;

  void connect() override;
  bool connected() const override;
  void close() override;

  uint64_t publish(const std::string& channel, const Bytes& body) override;
  void subscribe(const std::string& channel, int prefetch_limit) override;
  std::optional<Delivery> next_delivery(std::chrono::milliseconds timeout) override;
  bool ack(const AckHandle& handle) override;
  bool nack(const AckHandle& handle, bool requeue) override;

private:
  uint64_t current_session() const;

  MemoryBroker& broker_;
  mutable std::mutex mu_;
  uint64_t session_{0};
  std::string sub_channel_;
  int sub_prefetch_{0};
};
