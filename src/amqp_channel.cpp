#include "amqp_channel.hpp"

#include <amqp_tcp_socket.h>
#include <spdlog/spdlog.h>
#include <sys/time.h>

#include <algorithm>

using namespace std::chrono;

namespace {

constexpr amqp_channel_t kChannel = 1;
// Longest time a single consume poll holds the connection lock.
constexpr milliseconds kPollSlice{50};

timeval to_timeval(milliseconds d) {
  if (d.count() < 0) d = milliseconds(0);
  timeval tv;
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(d.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((d.count() % 1000) * 1000);
  return tv;
}

std::string to_string(amqp_bytes_t b) {
  if (b.len == 0 || b.bytes == nullptr) return {};
  return std::string(static_cast<const char*>(b.bytes), b.len);
}

std::string describe(const amqp_rpc_reply_t& r) {
  switch (r.reply_type) {
    case AMQP_RESPONSE_NORMAL:
      return "ok";
    case AMQP_RESPONSE_NONE:
      return "missing RPC reply";
    case AMQP_RESPONSE_LIBRARY_EXCEPTION:
      return amqp_error_string2(r.library_error);
    case AMQP_RESPONSE_SERVER_EXCEPTION:
      if (r.reply.id == AMQP_CONNECTION_CLOSE_METHOD) {
        auto* m = static_cast<amqp_connection_close_t*>(r.reply.decoded);
        return "server closed connection: " + std::to_string(m->reply_code) + " " +
               to_string(m->reply_text);
      }
      if (r.reply.id == AMQP_CHANNEL_CLOSE_METHOD) {
        auto* m = static_cast<amqp_channel_close_t*>(r.reply.decoded);
        return "server closed channel: " + std::to_string(m->reply_code) + " " +
               to_string(m->reply_text);
      }
      return "server exception";
  }
  return "unknown reply";
}

// Integer header lookup; RabbitMQ encodes x-delivery-count with varying widths.
bool header_count(const amqp_table_t& headers, const char* key, uint64_t& out) {
  for (int i = 0; i < headers.num_entries; ++i) {
    const amqp_table_entry_t& e = headers.entries[i];
    if (to_string(e.key) != key) continue;
    const amqp_field_value_t& v = e.value;
    switch (v.kind) {
      case AMQP_FIELD_KIND_I8: out = static_cast<uint64_t>(std::max<int8_t>(0, v.value.i8)); return true;
      case AMQP_FIELD_KIND_U8: out = v.value.u8; return true;
      case AMQP_FIELD_KIND_I16: out = static_cast<uint64_t>(std::max<int16_t>(0, v.value.i16)); return true;
      case AMQP_FIELD_KIND_U16: out = v.value.u16; return true;
      case AMQP_FIELD_KIND_I32: out = static_cast<uint64_t>(std::max<int32_t>(0, v.value.i32)); return true;
      case AMQP_FIELD_KIND_U32: out = v.value.u32; return true;
      case AMQP_FIELD_KIND_I64: out = static_cast<uint64_t>(std::max<int64_t>(0, v.value.i64)); return true;
      case AMQP_FIELD_KIND_U64: out = v.value.u64; return true;
      default: return false;
    }
  }
  return false;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return !suffix.empty() && s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

AmqpChannelClient::AmqpChannelClient(BrokerConfig cfg)
    : ChannelClient(cfg.reconnect_backoff), cfg_(std::move(cfg)) {}

AmqpChannelClient::~AmqpChannelClient() { close(); }

void AmqpChannelClient::connect() {
  std::lock_guard<std::mutex> g(mu_);
  teardown_locked();

  conn_ = amqp_new_connection();
  if (!conn_) throw ConnectError("cannot allocate AMQP connection");

  try {
    amqp_socket_t* socket = amqp_tcp_socket_new(conn_);
    if (!socket) throw ConnectError("cannot create TCP socket");

    timeval tv = to_timeval(milliseconds(cfg_.connect_timeout_ms));
    int rc = amqp_socket_open_noblock(socket, cfg_.host.c_str(), cfg_.port, &tv);
    if (rc != AMQP_STATUS_OK) {
      throw ConnectError("cannot reach " + cfg_.host + ":" + std::to_string(cfg_.port) + ": " +
                         amqp_error_string2(rc));
    }

    amqp_rpc_reply_t login =
        amqp_login(conn_, cfg_.vhost.c_str(), 0, 131072, cfg_.heartbeat_s,
                   AMQP_SASL_METHOD_PLAIN, cfg_.user.c_str(), cfg_.password.c_str());
    if (login.reply_type != AMQP_RESPONSE_NORMAL) throw ConnectError("login: " + describe(login));

    amqp_channel_open(conn_, kChannel);
    amqp_rpc_reply_t r = amqp_get_rpc_reply(conn_);
    if (r.reply_type != AMQP_RESPONSE_NORMAL) throw ConnectError("channel.open: " + describe(r));

    amqp_confirm_select(conn_, kChannel);
    r = amqp_get_rpc_reply(conn_);
    if (r.reply_type != AMQP_RESPONSE_NORMAL) throw ConnectError("confirm.select: " + describe(r));

    open_ = true;
    session_++;
    publish_seq_ = 0;
    if (!sub_channel_.empty()) start_consumer_locked();
  } catch (const ConnectError&) {
    open_ = false;
    teardown_locked();
    throw;
  }

  spdlog::info("AMQP session {} open to {}:{}{}", session_, cfg_.host, cfg_.port, cfg_.vhost);
}

bool AmqpChannelClient::connected() const {
  std::lock_guard<std::mutex> g(mu_);
  return open_;
}

void AmqpChannelClient::close() {
  std::lock_guard<std::mutex> g(mu_);
  teardown_locked();
}

void AmqpChannelClient::teardown_locked() {
  if (!conn_) return;
  if (open_) {
    amqp_rpc_reply_t r = amqp_channel_close(conn_, kChannel, AMQP_REPLY_SUCCESS);
    if (r.reply_type != AMQP_RESPONSE_NORMAL) spdlog::debug("channel.close: {}", describe(r));
    r = amqp_connection_close(conn_, AMQP_REPLY_SUCCESS);
    if (r.reply_type != AMQP_RESPONSE_NORMAL) spdlog::debug("connection.close: {}", describe(r));
  }
  int rc = amqp_destroy_connection(conn_);
  if (rc != AMQP_STATUS_OK) spdlog::debug("destroy connection: {}", amqp_error_string2(rc));
  conn_ = nullptr;
  open_ = false;
  declared_.clear();
  // Deliveries of the old session are requeued by the broker.
  pending_.clear();
}

std::string AmqpChannelClient::fail_locked(const std::string& what) {
  if (open_) spdlog::error("AMQP session {} lost: {}", session_, what);
  open_ = false;
  return what;
}

void AmqpChannelClient::declare_locked(const std::string& channel) {
  if (declared_.count(channel)) return;

  auto declare = [this](const std::string& name, amqp_table_t args) {
    amqp_queue_declare(conn_, kChannel, amqp_cstring_bytes(name.c_str()), 0, 1, 0, 0, args);
    amqp_rpc_reply_t r = amqp_get_rpc_reply(conn_);
    if (r.reply_type != AMQP_RESPONSE_NORMAL) {
      throw ConnectError(fail_locked("queue.declare " + name + ": " + describe(r)));
    }
    declared_.insert(name);
  };

  const std::string dead = channel + cfg_.dead_letter_suffix;
  amqp_table_entry_t entries[3];
  entries[0].key = amqp_cstring_bytes("x-queue-type");
  entries[0].value.kind = AMQP_FIELD_KIND_UTF8;
  entries[0].value.value.bytes = amqp_cstring_bytes(cfg_.queue_type.c_str());
  amqp_table_t plain_args{1, entries};

  if (ends_with(channel, cfg_.dead_letter_suffix)) {
    declare(channel, plain_args);
    return;
  }

  if (!declared_.count(dead)) declare(dead, plain_args);

  entries[1].key = amqp_cstring_bytes("x-dead-letter-exchange");
  entries[1].value.kind = AMQP_FIELD_KIND_UTF8;
  entries[1].value.value.bytes = amqp_cstring_bytes("");
  entries[2].key = amqp_cstring_bytes("x-dead-letter-routing-key");
  entries[2].value.kind = AMQP_FIELD_KIND_UTF8;
  entries[2].value.value.bytes = amqp_cstring_bytes(dead.c_str());
  amqp_table_t args{3, entries};
  declare(channel, args);
}

void AmqpChannelClient::start_consumer_locked() {
  declare_locked(sub_channel_);

  const auto prefetch = static_cast<uint16_t>(std::clamp(sub_prefetch_, 1, 65535));
  amqp_basic_qos(conn_, kChannel, 0, prefetch, 0);
  amqp_rpc_reply_t r = amqp_get_rpc_reply(conn_);
  if (r.reply_type != AMQP_RESPONSE_NORMAL) throw ConnectError(fail_locked("basic.qos: " + describe(r)));

  amqp_basic_consume(conn_, kChannel, amqp_cstring_bytes(sub_channel_.c_str()), amqp_empty_bytes,
                     0, 0, 0, amqp_empty_table);
  r = amqp_get_rpc_reply(conn_);
  if (r.reply_type != AMQP_RESPONSE_NORMAL) {
    throw ConnectError(fail_locked("basic.consume: " + describe(r)));
  }
  spdlog::info("Consuming '{}' with prefetch {}", sub_channel_, prefetch);
}

uint64_t AmqpChannelClient::publish(const std::string& channel, const Bytes& body) {
  std::lock_guard<std::mutex> g(mu_);
  if (!open_) throw PublishError("not connected");
  try {
    declare_locked(channel);
  } catch (const ConnectError& e) {
    throw PublishError(e.what());
  }

  amqp_basic_properties_t props;
  props._flags = AMQP_BASIC_CONTENT_TYPE_FLAG | AMQP_BASIC_DELIVERY_MODE_FLAG;
  props.content_type = amqp_cstring_bytes("application/octet-stream");
  props.delivery_mode = 2;  // persistent

  amqp_bytes_t payload;
  payload.len = body.size();
  payload.bytes = const_cast<uint8_t*>(body.data());

  int rc = amqp_basic_publish(conn_, kChannel, amqp_empty_bytes,
                              amqp_cstring_bytes(channel.c_str()), 0, 0, &props, payload);
  if (rc != AMQP_STATUS_OK) {
    throw PublishError(fail_locked(std::string("basic.publish: ") + amqp_error_string2(rc)));
  }
  const uint64_t tag = ++publish_seq_;
  wait_for_confirm_locked(tag);
  return tag;
}

void AmqpChannelClient::wait_for_confirm_locked(uint64_t tag) {
  const auto deadline = steady_clock::now() + milliseconds(cfg_.confirm_timeout_ms);
  while (true) {
    auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
    if (remaining.count() <= 0) throw PublishError("publish confirm timed out");

    timeval tv = to_timeval(remaining);
    amqp_frame_t frame;
    int rc = amqp_simple_wait_frame_noblock(conn_, &frame, &tv);
    if (rc == AMQP_STATUS_TIMEOUT) throw PublishError("publish confirm timed out");
    if (rc != AMQP_STATUS_OK) {
      throw PublishError(fail_locked(std::string("waiting for confirm: ") + amqp_error_string2(rc)));
    }
    if (frame.frame_type != AMQP_FRAME_METHOD) continue;

    switch (frame.payload.method.id) {
      case AMQP_BASIC_ACK_METHOD: {
        auto* a = static_cast<amqp_basic_ack_t*>(frame.payload.method.decoded);
        if (a->delivery_tag == tag || (a->multiple && a->delivery_tag >= tag)) return;
        break;  // confirm for an earlier, timed-out publish
      }
      case AMQP_BASIC_NACK_METHOD: {
        auto* n = static_cast<amqp_basic_nack_t*>(frame.payload.method.decoded);
        if (n->delivery_tag == tag || (n->multiple && n->delivery_tag >= tag)) {
          throw PublishError("broker rejected publish");
        }
        break;
      }
      case AMQP_BASIC_DELIVER_METHOD: {
        auto* d = static_cast<amqp_basic_deliver_t*>(frame.payload.method.decoded);
        const uint64_t delivery_tag = d->delivery_tag;
        const bool redelivered = d->redelivered != 0;
        amqp_message_t message;
        amqp_rpc_reply_t r = amqp_read_message(conn_, frame.channel, &message, 0);
        if (r.reply_type != AMQP_RESPONSE_NORMAL) {
          throw PublishError(fail_locked("reading delivery: " + describe(r)));
        }
        pending_.push_back(make_delivery(delivery_tag, redelivered, message));
        amqp_destroy_message(&message);
        break;
      }
      case AMQP_CHANNEL_CLOSE_METHOD:
      case AMQP_CONNECTION_CLOSE_METHOD:
        throw PublishError(fail_locked("broker closed the session"));
      default:
        break;
    }
  }
}

Delivery AmqpChannelClient::make_delivery(uint64_t delivery_tag, bool redelivered,
                                          const amqp_message_t& message) const {
  Delivery d;
  const auto* data = static_cast<const uint8_t*>(message.body.bytes);
  if (data) d.body.assign(data, data + message.body.len);
  d.delivery_id = delivery_tag;

  // Quorum queues count prior deliveries in x-delivery-count; classic queues
  // only expose the redelivered flag.
  uint64_t prior = 0;
  if ((message.properties._flags & AMQP_BASIC_HEADERS_FLAG) &&
      header_count(message.properties.headers, "x-delivery-count", prior)) {
    d.attempt_count = static_cast<uint32_t>(prior + 1);
  } else {
    d.attempt_count = redelivered ? 2 : 1;
  }
  d.handle = AckHandle{delivery_tag, session_};
  return d;
}

void AmqpChannelClient::subscribe(const std::string& channel, int prefetch_limit) {
  std::lock_guard<std::mutex> g(mu_);
  sub_channel_ = channel;
  sub_prefetch_ = prefetch_limit;
  if (open_) start_consumer_locked();
}

std::optional<Delivery> AmqpChannelClient::next_delivery(milliseconds timeout) {
  const auto deadline = steady_clock::now() + timeout;
  while (true) {
    {
      std::lock_guard<std::mutex> g(mu_);
      if (!open_) throw ConnectError("not connected");
      if (!pending_.empty()) {
        Delivery d = std::move(pending_.front());
        pending_.pop_front();
        return d;
      }

      auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
      timeval tv = to_timeval(std::min(remaining, kPollSlice));

      amqp_maybe_release_buffers(conn_);
      amqp_envelope_t envelope;
      amqp_rpc_reply_t r = amqp_consume_message(conn_, &envelope, &tv, 0);
      if (r.reply_type == AMQP_RESPONSE_NORMAL) {
        Delivery d = make_delivery(envelope.delivery_tag, envelope.redelivered != 0, envelope.message);
        amqp_destroy_envelope(&envelope);
        return d;
      }

      if (r.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION && r.library_error == AMQP_STATUS_TIMEOUT) {
        // nothing this slice
      } else if (r.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION &&
                 r.library_error == AMQP_STATUS_UNEXPECTED_STATE) {
        // A non-delivery frame is waiting: a late confirm or a close from the broker.
        amqp_frame_t frame;
        int rc = amqp_simple_wait_frame(conn_, &frame);
        if (rc != AMQP_STATUS_OK) throw ConnectError(fail_locked(amqp_error_string2(rc)));
        if (frame.frame_type == AMQP_FRAME_METHOD &&
            (frame.payload.method.id == AMQP_CHANNEL_CLOSE_METHOD ||
             frame.payload.method.id == AMQP_CONNECTION_CLOSE_METHOD)) {
          throw ConnectError(fail_locked("broker closed the session"));
        }
      } else {
        throw ConnectError(fail_locked("consume: " + describe(r)));
      }
    }
    if (steady_clock::now() >= deadline) return std::nullopt;
  }
}

bool AmqpChannelClient::ack(const AckHandle& handle) {
  std::lock_guard<std::mutex> g(mu_);
  if (!open_ || handle.session != session_) return false;
  int rc = amqp_basic_ack(conn_, kChannel, handle.delivery_id, 0);
  if (rc != AMQP_STATUS_OK) {
    fail_locked(std::string("basic.ack: ") + amqp_error_string2(rc));
    return false;
  }
  return true;
}

bool AmqpChannelClient::nack(const AckHandle& handle, bool requeue) {
  std::lock_guard<std::mutex> g(mu_);
  if (!open_ || handle.session != session_) return false;
  int rc = amqp_basic_nack(conn_, kChannel, handle.delivery_id, 0, requeue ? 1 : 0);
  if (rc != AMQP_STATUS_OK) {
    fail_locked(std::string("basic.nack: ") + amqp_error_string2(rc));
    return false;
  }
  return true;
}
