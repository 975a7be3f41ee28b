#pragma once
#include <amqp.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "channel_client.hpp"

// ChannelClient over AMQP 0-9-1 (RabbitMQ) using rabbitmq-c. One connection and
// one AMQP channel per instance; every call on the connection runs under mu_.
// Publishes use publisher confirms, consumers use basic.qos + manual acks, and
// every declared queue dead-letters into "<name><dead_letter_suffix>".
class AmqpChannelClient : public ChannelClient {
public:
  explicit AmqpChannelClient(BrokerConfig cfg);
  ~AmqpChannelClient() override;

  AmqpChannelClient(const AmqpChannelClient&) = delete;
  AmqpChannelClient& operator=(const AmqpChannelClient&) = delete;

  void connect() override;
  bool connected() const override;
  void close() override;

  uint64_t publish(const std::string& channel, const Bytes& body) override;
  void subscribe(const std::string& channel, int prefetch_limit) override;
  std::optional<Delivery> next_delivery(std::chrono::milliseconds timeout) override;
  bool ack(const AckHandle& handle) override;
  bool nack(const AckHandle& handle, bool requeue) override;

private:
  void declare_locked(const std::string& channel);
  void start_consumer_locked();
  void wait_for_confirm_locked(uint64_t tag);
  Delivery make_delivery(uint64_t delivery_tag, bool redelivered,
                         const amqp_message_t& message) const;
  void teardown_locked();
  // Marks the session lost and returns the message for the caller to throw.
  std::string fail_locked(const std::string& what);

  BrokerConfig cfg_;

  mutable std::mutex mu_;
  amqp_connection_state_t conn_{nullptr};
  bool open_{false};
  uint64_t session_{0};
  uint64_t publish_seq_{0};
  std::set<std::string> declared_;
  std::string sub_channel_;
  int sub_prefetch_{0};
  // Deliveries that arrived while a publish was waiting for its confirm.
  std::deque<Delivery> pending_;
};
