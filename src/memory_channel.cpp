#include "memory_channel.hpp"

#include <spdlog/spdlog.h>

MemoryBroker::MemoryBroker(std::string dead_letter_suffix)
    : dead_letter_suffix_(std::move(dead_letter_suffix)) {}

void MemoryBroker::set_available(bool up) {
  {
    std::lock_guard<std::mutex> g(mu_);
    available_ = up;
    if (!up) {
      std::vector<uint64_t> ids;
      for (const auto& kv : sessions_) ids.push_back(kv.first);
      for (auto id : ids) drop_session_locked(id);
    }
  }
  cv_.notify_all();
}

bool MemoryBroker::available() const {
  std::lock_guard<std::mutex> g(mu_);
  return available_;
}

void MemoryBroker::fail_next_publishes(int n) {
  std::lock_guard<std::mutex> g(mu_);
  fail_publishes_ = n;
}

void MemoryBroker::drop_connections() {
  {
    std::lock_guard<std::mutex> g(mu_);
    std::vector<uint64_t> ids;
    for (const auto& kv : sessions_) ids.push_back(kv.first);
    for (auto id : ids) drop_session_locked(id);
  }
  cv_.notify_all();
}

uint64_t MemoryBroker::open_session() {
  std::lock_guard<std::mutex> g(mu_);
  if (!available_) throw ConnectError("memory broker unavailable");
  uint64_t id = next_session_++;
  sessions_.emplace(id, Session{});
  return id;
}

void MemoryBroker::close_session(uint64_t session) {
  {
    std::lock_guard<std::mutex> g(mu_);
    drop_session_locked(session);
  }
  cv_.notify_all();
}

bool MemoryBroker::session_alive(uint64_t session) const {
  std::lock_guard<std::mutex> g(mu_);
  return sessions_.count(session) > 0;
}

void MemoryBroker::drop_session_locked(uint64_t session) {
  if (sessions_.erase(session) == 0) return;
  // Unacknowledged deliveries go back to the head of their queue.
  for (auto it = in_flight_.begin(); it != in_flight_.end();) {
    if (it->second.session == session) {
      queues_[it->second.channel].push_front(std::move(it->second.msg));
      requeued_++;
      it = in_flight_.erase(it);
    } else {
      ++it;
    }
  }
}

uint64_t MemoryBroker::publish(uint64_t session, const std::string& channel, const Bytes& body) {
  uint64_t tag = 0;
  {
    std::lock_guard<std::mutex> g(mu_);
    if (sessions_.count(session) == 0) throw PublishError("session closed");
    if (fail_publishes_ > 0) {
      fail_publishes_--;
      throw PublishError("publish rejected by broker");
    }
    StoredMessage m;
    m.id = next_message_id_++;
    m.body = body;
    queues_[channel].push_back(std::move(m));
    tag = ++published_;
  }
  cv_.notify_all();
  return tag;
}

void MemoryBroker::consume(uint64_t session, const std::string& channel, int prefetch_limit) {
  {
    std::lock_guard<std::mutex> g(mu_);
    auto it = sessions_.find(session);
    if (it == sessions_.end()) throw ConnectError("session closed");
    it->second.channel = channel;
    it->second.prefetch = prefetch_limit;
  }
  cv_.notify_all();
}

bool MemoryBroker::deliverable_locked(const Session& s) const {
  if (s.channel.empty()) return false;
  if (s.prefetch > 0 && s.unacked >= static_cast<size_t>(s.prefetch)) return false;
  auto q = queues_.find(s.channel);
  return q != queues_.end() && !q->second.empty();
}

std::optional<Delivery> MemoryBroker::next(uint64_t session, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  bool ready = cv_.wait_for(lk, timeout, [&] {
    auto it = sessions_.find(session);
    return it == sessions_.end() || deliverable_locked(it->second);
  });
  auto it = sessions_.find(session);
  if (it == sessions_.end()) throw ConnectError("session closed");
  if (!ready) return std::nullopt;

  auto& q = queues_[it->second.channel];
  StoredMessage m = std::move(q.front());
  q.pop_front();
  m.deliveries++;

  Delivery d;
  d.body = m.body;
  d.delivery_id = next_delivery_id_++;
  d.attempt_count = m.deliveries;
  d.handle = AckHandle{d.delivery_id, session};

  it->second.unacked++;
  in_flight_.emplace(d.delivery_id, InFlight{it->second.channel, session, std::move(m)});
  return d;
}

bool MemoryBroker::ack(uint64_t session, uint64_t delivery_id) {
  {
    std::lock_guard<std::mutex> g(mu_);
    auto it = in_flight_.find(delivery_id);
    if (it == in_flight_.end() || it->second.session != session) return false;
    in_flight_.erase(it);
    auto s = sessions_.find(session);
    if (s != sessions_.end() && s->second.unacked > 0) s->second.unacked--;
    acked_++;
  }
  cv_.notify_all();
  return true;
}

bool MemoryBroker::nack(uint64_t session, uint64_t delivery_id, bool requeue) {
  {
    std::lock_guard<std::mutex> g(mu_);
    auto it = in_flight_.find(delivery_id);
    if (it == in_flight_.end() || it->second.session != session) return false;
    InFlight f = std::move(it->second);
    in_flight_.erase(it);
    auto s = sessions_.find(session);
    if (s != sessions_.end() && s->second.unacked > 0) s->second.unacked--;

    if (requeue) {
      queues_[f.channel].push_front(std::move(f.msg));
      requeued_++;
    } else {
      dead_lettered_++;
      // Messages rejected from a dead-letter queue are discarded.
      if (f.channel.size() < dead_letter_suffix_.size() ||
          f.channel.compare(f.channel.size() - dead_letter_suffix_.size(),
                            dead_letter_suffix_.size(), dead_letter_suffix_) != 0) {
        StoredMessage dead;
        dead.id = f.msg.id;
        dead.body = std::move(f.msg.body);
        queues_[dead_letter_channel(f.channel)].push_back(std::move(dead));
      }
    }
  }
  cv_.notify_all();
  return true;
}

size_t MemoryBroker::depth(const std::string& channel) const {
  std::lock_guard<std::mutex> g(mu_);
  auto it = queues_.find(channel);
  return it == queues_.end() ? 0 : it->second.size();
}

size_t MemoryBroker::in_flight(const std::string& channel) const {
  std::lock_guard<std::mutex> g(mu_);
  size_t n = 0;
  for (const auto& kv : in_flight_) {
    if (kv.second.channel == channel) n++;
  }
  return n;
}

std::vector<Bytes> MemoryBroker::ready_messages(const std::string& channel) const {
  std::lock_guard<std::mutex> g(mu_);
  std::vector<Bytes> out;
  auto it = queues_.find(channel);
  if (it == queues_.end()) return out;
  for (const auto& m : it->second) out.push_back(m.body);
  return out;
}

uint64_t MemoryBroker::published_total() const {
  std::lock_guard<std::mutex> g(mu_);
  return published_;
}

uint64_t MemoryBroker::acked_total() const {
  std::lock_guard<std::mutex> g(mu_);
  return acked_;
}

uint64_t MemoryBroker::requeued_total() const {
  std::lock_guard<std::mutex> g(mu_);
  return requeued_;
}

uint64_t MemoryBroker::dead_lettered_total() const {
  std::lock_guard<std::mutex> g(mu_);
  return dead_lettered_;
}

MemoryChannelClient::MemoryChannelClient(MemoryBroker& broker, BackoffConfig reconnect_backoff)
    : ChannelClient(reconnect_backoff), broker_(broker) {}

MemoryChannelClient::~MemoryChannelClient() { close(); }

void MemoryChannelClient::connect() {
  std::lock_guard<std::mutex> g(mu_);
  if (session_ != 0) broker_.close_session(session_);
  session_ = 0;
  uint64_t s = broker_.open_session();
  if (!sub_channel_.empty()) broker_.consume(s, sub_channel_, sub_prefetch_);
  session_ = s;
  spdlog::debug("Memory broker session {} opened", s);
}

bool MemoryChannelClient::connected() const {
  uint64_t s = current_session();
  return s != 0 && broker_.session_alive(s);
}

void MemoryChannelClient::close() {
  std::lock_guard<std::mutex> g(mu_);
  if (session_ == 0) return;
  broker_.close_session(session_);
  session_ = 0;
}

uint64_t MemoryChannelClient::current_session() const {
  std::lock_guard<std::mutex> g(mu_);
  return session_;
}

uint64_t MemoryChannelClient::publish(const std::string& channel, const Bytes& body) {
  uint64_t s = current_session();
  if (s == 0) throw PublishError("not connected");
  return broker_.publish(s, channel, body);
}

void MemoryChannelClient::subscribe(const std::string& channel, int prefetch_limit) {
  std::lock_guard<std::mutex> g(mu_);
  sub_channel_ = channel;
  sub_prefetch_ = prefetch_limit;
  if (session_ != 0 && broker_.session_alive(session_)) {
    broker_.consume(session_, channel, prefetch_limit);
  }
}

std::optional<Delivery> MemoryChannelClient::next_delivery(std::chrono::milliseconds timeout) {
  uint64_t s = current_session();
  if (s == 0) throw ConnectError("not connected");
  return broker_.next(s, timeout);
}

bool MemoryChannelClient::ack(const AckHandle& handle) {
  return broker_.ack(handle.session, handle.delivery_id);
}

bool MemoryChannelClient::nack(const AckHandle& handle, bool requeue) {
  return broker_.nack(handle.session, handle.delivery_id, requeue);
}
